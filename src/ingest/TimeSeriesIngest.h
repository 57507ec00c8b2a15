///////////////////////////////////////////////////////////////////////////////
///
///	\file    TimeSeriesIngest.h
///	\author  ClimDiag Developers
///	\version October 19, 2026
///
///	<summary>
///		Loading, concatenation, unit normalization and time selection of
///		gridded time series.
///	</summary>
///	<remarks>
///		Copyright 2026 ClimDiag Developers
///
///		This file is distributed as part of the ClimDiag source code package.
///		Permission is granted to use, copy, modify and distribute this
///		source code and its documentation under the terms of the GNU General
///		Public License.  This software is provided "as is" without express
///		or implied warranty.
///	</remarks>

#ifndef _TIMESERIESINGEST_H_
#define _TIMESERIESINGEST_H_

#include "TimeSeriesGrid.h"
#include "DiagnosticTypes.h"

#include <string>
#include <vector>

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Load a (time, lat, lon) variable from a NetCDF file.  Missing values
///		are replaced by NaN and a descending latitude axis is flipped.
///	</summary>
void LoadTimeSeriesGrid(
	const std::string & strFilename,
	const std::string & strVariableName,
	TimeSeriesGrid & grid
);

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Write a TimeSeriesGrid to a NetCDF file.
///	</summary>
void WriteTimeSeriesGrid(
	const std::string & strFilename,
	const TimeSeriesGrid & grid
);

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Concatenate gridded time series along the time axis.  The inputs
///		may be given in any order; they must share a spatial grid, units and
///		calendar and must together cover a contiguous span without gaps or
///		overlaps.
///	</summary>
void ConcatenateTimeSeries(
	const std::vector<TimeSeriesGrid> & vecGrids,
	TimeSeriesGrid & gridOut
);

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Load and concatenate a list of files.
///	</summary>
void LoadConcatenatedTimeSeries(
	const std::vector<std::string> & vecFilenames,
	const std::string & strVariableName,
	TimeSeriesGrid & gridOut
);

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Convert a precipitation flux (kg m-2 s-1) to a daily depth
///		(mm day-1) in place.
///	</summary>
void ConvertPrecipitationUnits(
	TimeSeriesGrid & grid
);

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Convert a temperature in K to degC in place.
///	</summary>
void ConvertTemperatureUnits(
	TimeSeriesGrid & grid
);

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Extract the time steps whose year lies in the given inclusive range.
///	</summary>
void SelectYearRange(
	const TimeSeriesGrid & gridIn,
	const YearRange & range,
	TimeSeriesGrid & gridOut
);

///////////////////////////////////////////////////////////////////////////////

#endif
