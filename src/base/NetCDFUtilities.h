///////////////////////////////////////////////////////////////////////////////
///
///	\file    NetCDFUtilities.h
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

#ifndef _NETCDFUTILITIES_H_
#define _NETCDFUTILITIES_H_

#include "netcdfcpp.h"
#include "TimeObj.h"

#include <string>
#include <vector>

////////////////////////////////////////////////////////////////////////////////

///	<summary>
///		A CF time axis: one Time per step together with the NetCDF type
///		and units string it was stored with.
///	</summary>
class NcTimeDimension : public std::vector<Time> {

public:
	///	<summary>
	///		Constructor.
	///	</summary>
	NcTimeDimension() :
		m_nctype(ncDouble),
		m_units("days since 1850-01-01 00:00:00")
	{ }

public:
	///	<summary>
	///		Get the type.
	///	</summary>
	NcType nctype() const {
		return m_nctype;
	}

	///	<summary>
	///		Get the units.
	///	</summary>
	const std::string & units() const {
		return m_units;
	}

public:
	///	<summary>
	///		Associated NcType.
	///	</summary>
	NcType m_nctype;

	///	<summary>
	///		Associated units.
	///	</summary>
	std::string m_units;
};

////////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Load one of several possible names for a given variable.
///	</summary>
///	<returns>
///		The index in the vecVarNames array of the variable found, or
///		vecVarNames.size() if not found.
///	</returns>
size_t NcGetVarFromList(
	NcFile & ncFile,
	const std::vector<std::string> & vecVarNames,
	NcVar ** pvar = NULL
);

////////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Get the latitude and longitude coordinate variables from a file.
///	</summary>
void NcGetLatitudeLongitudeVars(
	NcFile & ncFile,
	const std::string & strFilename,
	NcVar ** pvarLat,
	NcVar ** pvarLon
);

////////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Determine if a given NcDim is a time dimension.
///	</summary>
bool NcIsTimeDimension(
	NcDim * dim
);

////////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Get the time dimension from the NetCDF file.
///	</summary>
NcDim * NcGetTimeDimension(
	NcFile & ncFile
);

////////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Get the time variable from the NetCDF file.
///	</summary>
NcVar * NcGetTimeVariable(
	NcFile & ncFile
);

////////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Get a text attribute of a variable, or an empty string if the
///		attribute is not present.
///	</summary>
std::string NcGetVarAttString(
	NcVar * var,
	const std::string & strAttName
);

////////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Get the missing value marker of a variable from its "_FillValue"
///		or "missing_value" attribute.
///	</summary>
///	<returns>
///		true if the variable declares a missing value.
///	</returns>
bool NcGetVarMissingValue(
	NcVar * var,
	double & dMissingValue
);

////////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Insert a new dimension into the NcFile, or use existing.
///	</summary>
NcDim * AddNcDimOrUseExisting(
	NcFile & ncFile,
	const std::string & strDimName,
	long lDimSize
);

////////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Read the time data from a NetCDF file.
///	</summary>
void ReadCFTimeDataFromNcFile(
	NcFile * ncfile,
	const std::string & strFilename,
	NcTimeDimension & vecTimes,
	bool fWarnOnMissingCalendar
);

////////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Write the time data to a NetCDF file.
///	</summary>
void WriteCFTimeDataToNcFile(
	NcFile * ncfile,
	const std::string & strFilename,
	const NcTimeDimension & vecTimes,
	bool fRecordDim = true
);

////////////////////////////////////////////////////////////////////////////////

#endif
