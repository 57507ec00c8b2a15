///////////////////////////////////////////////////////////////////////////////
///
///	\file    PercentileThreshold.h
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

#ifndef _PERCENTILETHRESHOLD_H_
#define _PERCENTILETHRESHOLD_H_

#include "DataArray2D.h"
#include "TimeSeriesGrid.h"

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Controls of the iterative percentile estimator.
///	</summary>
struct PercentileEstimatorOptions {

	///	<summary>
	///		Constructor.
	///	</summary>
	PercentileEstimatorOptions() :
		m_nBins(16),
		m_nIterations(8)
	{ }

	///	<summary>
	///		Number of bins the bracket is split into on each iteration.
	///	</summary>
	int m_nBins;

	///	<summary>
	///		Number of bracket refinement iterations.
	///	</summary>
	int m_nIterations;
};

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Rank of the p-th percentile among n sorted samples.
///	</summary>
inline int PercentileRank(
	int nSamples,
	double dPercentile
) {
	return static_cast<int>(
		static_cast<double>(nSamples - 1) * dPercentile / 100.0 + 0.5);
}

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Compute the p-th percentile of every grid cell over the time axis
///		of the given grid.
///	</summary>
///	<remarks>
///		The per-cell minimum and maximum bracket the percentile.  On each
///		iteration the bracket is split into bins, the samples in the
///		bracket are histogrammed and the bin containing the target rank
///		becomes the new bracket.  A final set of passes snaps the estimate
///		onto the smallest sample in the bracket with enough samples below
///		it, which is the exact order statistic.  Cells without samples are
///		set to NaN.  A cell with data whose minimum equals its maximum
///		raises a threshold degeneracy error.
///	</remarks>
void ComputePercentileThreshold(
	const TimeSeriesGrid & grid,
	double dPercentile,
	const PercentileEstimatorOptions & opts,
	DataArray2D<double> & dThreshold,
	DataArray2D<int> & nSampleCount
);

///////////////////////////////////////////////////////////////////////////////

#endif
