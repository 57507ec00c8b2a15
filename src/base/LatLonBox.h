///////////////////////////////////////////////////////////////////////////////
///
///	\file    LatLonBox.h
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

#ifndef _LATLONBOX_H_
#define _LATLONBOX_H_

#include "Exception.h"

#include <cmath>

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		A structure for storing a bounding box in latitude / longitude space.
///		Longitudes are periodic with period 360; a box with lon[0] > lon[1]
///		crosses the prime meridian.  Endpoints are included.
///	</summary>
template <typename Type>
class LatLonBox {

public:
	///	<summary>
	///		Bounding longitudes in [0, 360).
	///	</summary>
	Type lon[2];

	///	<summary>
	///		Bounding latitudes.
	///	</summary>
	Type lat[2];

public:
	///	<summary>
	///		Constructor.
	///	</summary>
	LatLonBox() {
		lon[0] = static_cast<Type>(0);
		lon[1] = static_cast<Type>(360);
		lat[0] = static_cast<Type>(-90);
		lat[1] = static_cast<Type>(90);
	}

	///	<summary>
	///		Constructor with longitude-latitude coordinates.
	///	</summary>
	LatLonBox(
		Type a_lon0,
		Type a_lon1,
		Type a_lat0,
		Type a_lat1
	) {
		set(a_lon0, a_lon1, a_lat0, a_lat1);
	}

	///	<summary>
	///		Set the bounds of the box.
	///	</summary>
	void set(
		Type a_lon0,
		Type a_lon1,
		Type a_lat0,
		Type a_lat1
	) {
		if ((a_lat0 < static_cast<Type>(-90)) ||
		    (a_lat1 > static_cast<Type>(90)) ||
		    (a_lat0 > a_lat1)
		) {
			_EXCEPTION2("Invalid latitude bounds (%f, %f)",
				static_cast<double>(a_lat0),
				static_cast<double>(a_lat1));
		}

		// Full circle of longitudes
		if (a_lon1 - a_lon0 >= static_cast<Type>(360)) {
			lon[0] = static_cast<Type>(0);
			lon[1] = static_cast<Type>(360);
		} else {
			lon[0] = wrap(a_lon0);
			lon[1] = wrap(a_lon1);
		}
		lat[0] = a_lat0;
		lat[1] = a_lat1;
	}

	///	<summary>
	///		Map a longitude into [0, 360).
	///	</summary>
	static Type wrap(Type a_lon) {
		Type dLon = fmod(a_lon, static_cast<Type>(360));
		if (dLon < static_cast<Type>(0)) {
			dLon += static_cast<Type>(360);
		}
		return dLon;
	}

	///	<summary>
	///		Determine if the given point is contained in the box.
	///	</summary>
	bool contains(
		Type a_lat,
		Type a_lon
	) const {
		if ((a_lat < lat[0]) || (a_lat > lat[1])) {
			return false;
		}
		if (lon[1] == static_cast<Type>(360)) {
			return true;
		}

		Type dLon = wrap(a_lon);
		if (lon[0] <= lon[1]) {
			return ((dLon >= lon[0]) && (dLon <= lon[1]));
		}
		return ((dLon >= lon[0]) || (dLon <= lon[1]));
	}
};

///////////////////////////////////////////////////////////////////////////////

#endif
