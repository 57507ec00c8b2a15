///////////////////////////////////////////////////////////////////////////////
///
///	\file    ExceedanceFrequency.h
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

#ifndef _EXCEEDANCEFREQUENCY_H_
#define _EXCEEDANCEFREQUENCY_H_

#include "DataArray2D.h"
#include "DiagnosticArtifacts.h"
#include "TimeSeriesGrid.h"

#include <vector>

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Count, per year or per month, the time steps at which each cell is at
///		or above its threshold and reduce the per-cell frequency to an
///		area-weighted mean.  Cells with a NaN threshold or without valid
///		samples in an interval are excluded from that interval's mean.
///	</summary>
void ComputeExceedanceEntries(
	const TimeSeriesGrid & grid,
	const DataArray2D<double> & dThreshold,
	ExceedanceGranularity eGranularity,
	std::vector<ExceedanceEntry> & vecEntries
);

///////////////////////////////////////////////////////////////////////////////

#endif
