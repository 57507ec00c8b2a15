///////////////////////////////////////////////////////////////////////////////
///
///	\file    Units.h
///	\author  Paul Ullrich
///	\version October 19, 2026
///
///	<remarks>
///		Copyright 2000-2026 Paul Ullrich
///
///		This file is distributed as part of the ClimDiag source code package.
///		Permission is granted to use, copy, modify and distribute this
///		source code and its documentation under the terms of the GNU General
///		Public License.  This software is provided "as is" without express
///		or implied warranty.
///	</remarks>

#ifndef _UNITS_H_
#define _UNITS_H_

#include <string>
#include <cmath>

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Seconds per day, used for flux to daily accumulation conversion.
///	</summary>
static const double SecondsPerDay = 86400.0;

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Map the common spellings of a unit onto one canonical name.
///		Unrecognized units are returned unchanged.
///	</summary>
inline std::string CanonicalUnitName(
	const std::string & strUnit
) {
	if ((strUnit == "kg m-2 s-1") ||
	    (strUnit == "kg/m2/s") ||
	    (strUnit == "kg m^-2 s^-1") ||
	    (strUnit == "mm/s") ||
	    (strUnit == "mm s-1")
	) {
		return std::string("kg m-2 s-1");
	}
	if ((strUnit == "mm day-1") ||
	    (strUnit == "mm/day") ||
	    (strUnit == "mm d-1") ||
	    (strUnit == "kg m-2 day-1")
	) {
		return std::string("mm day-1");
	}
	if ((strUnit == "K") || (strUnit == "degK") || (strUnit == "kelvin")) {
		return std::string("K");
	}
	if ((strUnit == "degC") || (strUnit == "C") ||
	    (strUnit == "deg_C") || (strUnit == "celsius")
	) {
		return std::string("degC");
	}
	return strUnit;
}

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Convert a value from one unit to another.  Temperature offsets are
///		skipped when fIsDelta is set.
///	</summary>
///	<returns>
///		false if no conversion between the two units is known.
///	</returns>
template <typename T>
bool ConvertUnits(
	T & dValue,
	const std::string & strUnit,
	const std::string & strTargetUnit,
	bool fIsDelta = false
) {
	std::string strFrom = CanonicalUnitName(strUnit);
	std::string strTo = CanonicalUnitName(strTargetUnit);

	// Unit is equal to TargetUnit
	if (strFrom == strTo) {

	// Precipitation flux (1 kg m-2 of water is 1 mm of depth)
	} else if (strFrom == "kg m-2 s-1") {
		if (strTo == "mm day-1") {
			dValue *= SecondsPerDay;
		} else {
			return false;
		}

	} else if (strFrom == "mm day-1") {
		if (strTo == "kg m-2 s-1") {
			dValue /= SecondsPerDay;
		} else {
			return false;
		}

	// Temperature (K)
	} else if (strFrom == "K") {
		if (strTo == "degC") {
			if (!fIsDelta) {
				dValue -= 273.15;
			}
		} else {
			return false;
		}

	// Temperature (degC)
	} else if (strFrom == "degC") {
		if (strTo == "K") {
			if (!fIsDelta) {
				dValue += 273.15;
			}
		} else {
			return false;
		}

	} else {
		return false;
	}

	return true;
}

///////////////////////////////////////////////////////////////////////////////

#endif
