///////////////////////////////////////////////////////////////////////////////
///
///	\file    OceanIndex.h
///	\author  ClimDiag Developers
///	\version October 19, 2026
///
///	<summary>
///		Oceanic Nino Index analogue: box-averaged, detrended and smoothed
///		sea surface temperature anomalies relative to a monthly
///		climatology.
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

#ifndef _OCEANINDEX_H_
#define _OCEANINDEX_H_

#include "DataArray3D.h"
#include "DiagnosticArtifacts.h"
#include "DiagnosticTypes.h"
#include "LatLonBox.h"
#include "TimeSeriesGrid.h"

#include <string>
#include <vector>

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Region and baseline of the index.
///	</summary>
struct OceanIndexOptions {

	///	<summary>
	///		Constructor (Nino 3.4 box, 1981-2010 baseline).
	///	</summary>
	OceanIndexOptions() :
		m_box(190.0, 240.0, -5.0, 5.0),
		m_rangeBaseline(1981, 2010)
	{ }

	///	<summary>
	///		Averaging box.
	///	</summary>
	LatLonBox<double> m_box;

	///	<summary>
	///		Climatology baseline period.
	///	</summary>
	YearRange m_rangeBaseline;
};

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Extract the cells of a grid that lie inside a box (inclusive).
///	</summary>
void SubsetBox(
	const TimeSeriesGrid & gridIn,
	const LatLonBox<double> & box,
	TimeSeriesGrid & gridOut
);

///	<summary>
///		Remove a least-squares linear trend in the time index from each
///		cell.  Cells with fewer than 2 valid values are set to NaN.
///	</summary>
void DetrendLinear(
	const TimeSeriesGrid & gridIn,
	TimeSeriesGrid & gridOut
);

///	<summary>
///		Mean of each calendar month over the baseline years, stored as
///		(month, lat, lon).  Every month of the baseline must be present.
///	</summary>
void ComputeMonthlyClimatology(
	const TimeSeriesGrid & grid,
	const YearRange & rangeBaseline,
	DataArray3D<double> & dClimatology
);

///	<summary>
///		Subtract the matching calendar-month climatology from each step.
///	</summary>
void ComputeAnomaly(
	const TimeSeriesGrid & gridIn,
	const DataArray3D<double> & dClimatology,
	TimeSeriesGrid & gridOut
);

///	<summary>
///		Centered 3-point running mean.  At the two ends the window shrinks
///		to the 2 available points; NaN values are excluded from each window.
///	</summary>
void RunningMean3(
	const std::vector<double> & vecIn,
	std::vector<double> & vecOut
);

///	<summary>
///		Apply RunningMean3 along the time axis of every cell.
///	</summary>
void RunningMean3(
	const TimeSeriesGrid & gridIn,
	TimeSeriesGrid & gridOut
);

///	<summary>
///		Box subset, detrend, climatology and anomaly (steps before
///		smoothing).
///	</summary>
void ComputeBoxAnomaly(
	const TimeSeriesGrid & gridSST,
	const OceanIndexOptions & opts,
	TimeSeriesGrid & gridAnomaly
);

///	<summary>
///		Compute the monthly index series of one member.
///	</summary>
void ComputeOceanIndex(
	const std::string & strMember,
	const TimeSeriesGrid & gridSST,
	const OceanIndexOptions & opts,
	ClimateIndexSeries & series
);

///////////////////////////////////////////////////////////////////////////////

#endif
