///////////////////////////////////////////////////////////////////////////////
///
///	\file    Regrid.h
///	\author  ClimDiag Developers
///	\version October 19, 2026
///
///	<remarks>
///		Copyright 2026 ClimDiag Developers
///
///		This file is distributed as part of the ClimDiag source code package.
///		Permission is granted to use, copy, modify and distribute this
///		source code and its documentation under the terms of the GNU General
///		Public License.  This software is provided "as is" without express
///		or implied warranty.
///	</remarks>

#ifndef _REGRID_H_
#define _REGRID_H_

#include "TimeSeriesGrid.h"

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Generate the coordinates of a global regular grid with the given
///		resolution.  Longitudes start at 0 and latitudes are cell centers
///		starting at -90 + dResolution / 2.
///	</summary>
void GenerateRegularGlobalGrid(
	double dResolution,
	DataArray1D<double> & dLat,
	DataArray1D<double> & dLon
);

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Bilinearly interpolate a gridded time series onto a regular global
///		grid.  Longitude is periodic; targets poleward of the source
///		latitudes take the nearest source row.  Missing corners are dropped
///		and the remaining weights renormalized.
///	</summary>
void RegridBilinear(
	const TimeSeriesGrid & gridIn,
	double dResolution,
	TimeSeriesGrid & gridOut
);

///////////////////////////////////////////////////////////////////////////////

#endif
