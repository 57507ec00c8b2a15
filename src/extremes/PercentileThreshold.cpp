///////////////////////////////////////////////////////////////////////////////
///
///	\file    PercentileThreshold.cpp
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

#include "PercentileThreshold.h"
#include "Announce.h"
#include "DataArray1D.h"
#include "PipelineError.h"

#include <algorithm>
#include <cmath>
#include <limits>

///////////////////////////////////////////////////////////////////////////////

void ComputePercentileThreshold(
	const TimeSeriesGrid & grid,
	double dPercentile,
	const PercentileEstimatorOptions & opts,
	DataArray2D<double> & dThreshold,
	DataArray2D<int> & nSampleCount
) {
	if ((dPercentile <= 0.0) || (dPercentile >= 100.0)) {
		_PIPELINEERROR1(PipelineErrorKind_Configuration,
			"Percentile level must be in the range (0, 100) (given %f)",
			dPercentile);
	}
	if (opts.m_nBins < 2) {
		_PIPELINEERRORT(PipelineErrorKind_Configuration,
			"Percentile estimator requires at least 2 bins");
	}
	if (opts.m_nIterations < 1) {
		_PIPELINEERRORT(PipelineErrorKind_Configuration,
			"Percentile estimator requires at least 1 iteration");
	}

	const size_t sTimes = grid.GetTimeCount();
	const size_t sLatCount = grid.GetLatCount();
	const size_t sLonCount = grid.GetLonCount();
	const size_t sCells = sLatCount * sLonCount;
	const int nBins = opts.m_nBins;

	dThreshold.Allocate(sLatCount, sLonCount);
	dThreshold.Fill(std::numeric_limits<double>::quiet_NaN());
	nSampleCount.Allocate(sLatCount, sLonCount);

	double * pThreshold = dThreshold.GetData();
	int * pSampleCount = nSampleCount.GetData();

	// Sample count, minimum and maximum of each cell
	DataArray1D<double> dMin(sCells);
	DataArray1D<double> dMax(sCells);

	for (size_t t = 0; t < sTimes; t++) {
		const float * data = grid.m_data(t);
		for (size_t i = 0; i < sCells; i++) {
			double dValue = static_cast<double>(data[i]);
			if (dValue != dValue) {
				continue;
			}
			if (pSampleCount[i] == 0) {
				dMin[i] = dValue;
				dMax[i] = dValue;
			} else if (dValue < dMin[i]) {
				dMin[i] = dValue;
			} else if (dValue > dMax[i]) {
				dMax[i] = dValue;
			}
			pSampleCount[i]++;
		}
	}

	// Target rank and initial bracket (lower bound exclusive)
	DataArray1D<int> nRank(sCells);
	DataArray1D<int> nCountBelow(sCells);
	DataArray1D<bool> fActive(sCells);
	DataArray2D<double> dBinEdges(sCells, nBins+1);

	size_t sActiveCells = 0;
	for (size_t i = 0; i < sCells; i++) {
		if (pSampleCount[i] == 0) {
			continue;
		}
		if (dMin[i] == dMax[i]) {
			size_t j = i / sLonCount;
			_PIPELINEERROR4(PipelineErrorKind_ThresholdDegeneracy,
				"Minimum equals maximum (%f) at cell (lat %f, lon %f)"
				" over %i samples",
				dMin[i],
				grid.m_dLat[j],
				grid.m_dLon[i - j * sLonCount],
				pSampleCount[i]);
		}

		nRank[i] = PercentileRank(pSampleCount[i], dPercentile);
		nCountBelow[i] = 0;
		fActive[i] = true;
		dBinEdges(i,0) = nextafter(dMin[i], -std::numeric_limits<double>::infinity());
		dBinEdges(i,nBins) = dMax[i];
		sActiveCells++;
	}

	// Refine the bracket
	DataArray2D<int> nBinCounts(sCells, nBins);

	for (int iter = 0; iter < opts.m_nIterations; iter++) {
		Announce(2, "Percentile iteration %i", iter);

		for (size_t i = 0; i < sCells; i++) {
			if (!fActive[i]) {
				continue;
			}
			for (int b = 1; b < nBins; b++) {
				double dAlpha = static_cast<double>(b) / static_cast<double>(nBins);
				dBinEdges(i,b) = (1.0 - dAlpha) * dBinEdges(i,0) + dAlpha * dBinEdges(i,nBins);
				if (dBinEdges(i,b) > dBinEdges(i,nBins)) {
					dBinEdges(i,b) = dBinEdges(i,nBins);
				}
			}
		}

		nBinCounts.Zero();

		// Sample in (e_b, e_{b+1}] falls in bin b
		for (size_t t = 0; t < sTimes; t++) {
			const float * data = grid.m_data(t);
			for (size_t i = 0; i < sCells; i++) {
				if (!fActive[i]) {
					continue;
				}
				double dValue = static_cast<double>(data[i]);
				if (dValue != dValue) {
					continue;
				}
				const double * pEdges = dBinEdges(i);
				if ((dValue <= pEdges[0]) || (dValue > pEdges[nBins])) {
					continue;
				}
				int b = static_cast<int>(
					std::lower_bound(pEdges + 1, pEdges + nBins + 1, dValue)
					- (pEdges + 1));
				nBinCounts(i,b)++;
			}
		}

		// Select the bin holding the target rank
		for (size_t i = 0; i < sCells; i++) {
			if (!fActive[i]) {
				continue;
			}
			int nAccumulated = nCountBelow[i];
			int b = 0;
			for (; b < nBins; b++) {
				nAccumulated += nBinCounts(i,b);
				if (nAccumulated > nRank[i]) {
					break;
				}
			}
			_ASSERT(b < nBins);

			nCountBelow[i] = nAccumulated - nBinCounts(i,b);
			double dNewLow = dBinEdges(i,b);
			double dNewHigh = dBinEdges(i,b+1);
			dBinEdges(i,0) = dNewLow;
			dBinEdges(i,nBins) = dNewHigh;
		}
	}

	// Snap onto the order statistic inside the final bracket
	DataArray1D<double> dSmallest(sCells);
	DataArray1D<int> nSmallestCount(sCells);

	int nSnapPass = 0;
	while (sActiveCells != 0) {
		for (size_t i = 0; i < sCells; i++) {
			dSmallest[i] = std::numeric_limits<double>::infinity();
			nSmallestCount[i] = 0;
		}

		for (size_t t = 0; t < sTimes; t++) {
			const float * data = grid.m_data(t);
			for (size_t i = 0; i < sCells; i++) {
				if (!fActive[i]) {
					continue;
				}
				double dValue = static_cast<double>(data[i]);
				if (dValue != dValue) {
					continue;
				}
				if ((dValue <= dBinEdges(i,0)) || (dValue > dBinEdges(i,nBins))) {
					continue;
				}
				if (dValue < dSmallest[i]) {
					dSmallest[i] = dValue;
					nSmallestCount[i] = 1;
				} else if (dValue == dSmallest[i]) {
					nSmallestCount[i]++;
				}
			}
		}

		for (size_t i = 0; i < sCells; i++) {
			if (!fActive[i]) {
				continue;
			}
			_ASSERT(nSmallestCount[i] != 0);

			if (nCountBelow[i] + nSmallestCount[i] > nRank[i]) {
				pThreshold[i] = dSmallest[i];
				fActive[i] = false;
				sActiveCells--;
			} else {
				dBinEdges(i,0) = dSmallest[i];
				nCountBelow[i] += nSmallestCount[i];
			}
		}
		nSnapPass++;
	}

	Announce(2, "Percentile %g resolved after %i iterations and %i snap passes",
		dPercentile, opts.m_nIterations, nSnapPass);
}

///////////////////////////////////////////////////////////////////////////////
