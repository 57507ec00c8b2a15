///////////////////////////////////////////////////////////////////////////////
///
///	\file    OceanIndex.cpp
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

#include "OceanIndex.h"
#include "Announce.h"
#include "GridStatistics.h"
#include "PipelineError.h"

#include <cmath>
#include <limits>
#include <set>

///////////////////////////////////////////////////////////////////////////////

void SubsetBox(
	const TimeSeriesGrid & gridIn,
	const LatLonBox<double> & box,
	TimeSeriesGrid & gridOut
) {
	std::vector<size_t> vecLat;
	for (size_t j = 0; j < gridIn.GetLatCount(); j++) {
		if ((gridIn.m_dLat[j] >= box.lat[0]) && (gridIn.m_dLat[j] <= box.lat[1])) {
			vecLat.push_back(j);
		}
	}

	std::vector<size_t> vecLon;
	for (size_t i = 0; i < gridIn.GetLonCount(); i++) {
		if (box.contains(box.lat[0], gridIn.m_dLon[i])) {
			vecLon.push_back(i);
		}
	}

	if ((vecLat.size() == 0) || (vecLon.size() == 0)) {
		_PIPELINEERROR3(PipelineErrorKind_Input,
			"No grid cells of \"%s\" inside box (lon %f to %f)",
			gridIn.m_strVariableName.c_str(),
			box.lon[0], box.lon[1]);
	}

	DataArray1D<double> dLat(vecLat.size());
	DataArray1D<double> dLon(vecLon.size());
	for (size_t j = 0; j < vecLat.size(); j++) {
		dLat[j] = gridIn.m_dLat[vecLat[j]];
	}
	for (size_t i = 0; i < vecLon.size(); i++) {
		dLon[i] = gridIn.m_dLon[vecLon[i]];
	}

	gridOut.Initialize(
		gridIn.m_strVariableName,
		gridIn.m_strUnits,
		gridIn.m_vecTime,
		dLat,
		dLon);

	for (size_t t = 0; t < gridIn.GetTimeCount(); t++) {
		for (size_t j = 0; j < vecLat.size(); j++) {
		for (size_t i = 0; i < vecLon.size(); i++) {
			gridOut.m_data(t,j,i) = gridIn.m_data(t,vecLat[j],vecLon[i]);
		}
		}
	}
}

///////////////////////////////////////////////////////////////////////////////

void DetrendLinear(
	const TimeSeriesGrid & gridIn,
	TimeSeriesGrid & gridOut
) {
	const size_t sTimes = gridIn.GetTimeCount();
	if (sTimes < 2) {
		_PIPELINEERROR1(PipelineErrorKind_TrendFit,
			"Linear trend requires at least 2 time points (%lu available)",
			sTimes);
	}

	gridOut.Initialize(
		gridIn.m_strVariableName,
		gridIn.m_strUnits,
		gridIn.m_vecTime,
		gridIn.m_dLat,
		gridIn.m_dLon);

	for (size_t j = 0; j < gridIn.GetLatCount(); j++) {
	for (size_t i = 0; i < gridIn.GetLonCount(); i++) {

		// Means of the valid samples
		int nValid = 0;
		double dTimeMean = 0.0;
		double dValueMean = 0.0;
		for (size_t t = 0; t < sTimes; t++) {
			float flValue = gridIn.m_data(t,j,i);
			if (flValue != flValue) {
				continue;
			}
			nValid++;
			dTimeMean += static_cast<double>(t);
			dValueMean += static_cast<double>(flValue);
		}
		if (nValid < 2) {
			continue;
		}
		dTimeMean /= static_cast<double>(nValid);
		dValueMean /= static_cast<double>(nValid);

		// Least squares slope
		double dCovariance = 0.0;
		double dVariance = 0.0;
		for (size_t t = 0; t < sTimes; t++) {
			float flValue = gridIn.m_data(t,j,i);
			if (flValue != flValue) {
				continue;
			}
			double dDeltaTime = static_cast<double>(t) - dTimeMean;
			dCovariance += dDeltaTime * (static_cast<double>(flValue) - dValueMean);
			dVariance += dDeltaTime * dDeltaTime;
		}
		double dSlope = dCovariance / dVariance;
		double dIntercept = dValueMean - dSlope * dTimeMean;

		for (size_t t = 0; t < sTimes; t++) {
			float flValue = gridIn.m_data(t,j,i);
			if (flValue != flValue) {
				continue;
			}
			gridOut.m_data(t,j,i) = static_cast<float>(
				static_cast<double>(flValue)
				- (dIntercept + dSlope * static_cast<double>(t)));
		}
	}
	}
}

///////////////////////////////////////////////////////////////////////////////

void ComputeMonthlyClimatology(
	const TimeSeriesGrid & grid,
	const YearRange & rangeBaseline,
	DataArray3D<double> & dClimatology
) {
	const size_t sLatCount = grid.GetLatCount();
	const size_t sLonCount = grid.GetLonCount();

	// Every month of the baseline must be present
	std::set<int> setMonthIndices;
	for (size_t t = 0; t < grid.GetTimeCount(); t++) {
		if (rangeBaseline.Contains(grid.m_vecTime[t].GetYear())) {
			setMonthIndices.insert(grid.m_vecTime[t].MonthIndex());
		}
	}

	int nMissing = 0;
	int iFirstMissingYear = 0;
	int iFirstMissingMonth = 0;
	for (int y = rangeBaseline.GetBegin(); y <= rangeBaseline.GetEnd(); y++) {
		for (int m = 0; m < 12; m++) {
			if (setMonthIndices.find(12 * y + m) == setMonthIndices.end()) {
				if (nMissing == 0) {
					iFirstMissingYear = y;
					iFirstMissingMonth = m + 1;
				}
				nMissing++;
			}
		}
	}
	if (nMissing != 0) {
		_PIPELINEERROR4(PipelineErrorKind_BaselineWindow,
			"Baseline %s is missing %i months (first missing %04i-%02i)",
			rangeBaseline.ToString().c_str(),
			nMissing,
			iFirstMissingYear,
			iFirstMissingMonth);
	}

	// Mean per calendar month
	dClimatology.Allocate(12, sLatCount, sLonCount);
	DataArray3D<int> nCount(12, sLatCount, sLonCount);

	for (size_t t = 0; t < grid.GetTimeCount(); t++) {
		if (!rangeBaseline.Contains(grid.m_vecTime[t].GetYear())) {
			continue;
		}
		int m = grid.m_vecTime[t].GetMonth() - 1;
		for (size_t j = 0; j < sLatCount; j++) {
		for (size_t i = 0; i < sLonCount; i++) {
			float flValue = grid.m_data(t,j,i);
			if (flValue != flValue) {
				continue;
			}
			dClimatology(m,j,i) += static_cast<double>(flValue);
			nCount(m,j,i)++;
		}
		}
	}

	for (int m = 0; m < 12; m++) {
		for (size_t j = 0; j < sLatCount; j++) {
		for (size_t i = 0; i < sLonCount; i++) {
			if (nCount(m,j,i) == 0) {
				dClimatology(m,j,i) = std::numeric_limits<double>::quiet_NaN();
			} else {
				dClimatology(m,j,i) /= static_cast<double>(nCount(m,j,i));
			}
		}
		}
	}
}

///////////////////////////////////////////////////////////////////////////////

void ComputeAnomaly(
	const TimeSeriesGrid & gridIn,
	const DataArray3D<double> & dClimatology,
	TimeSeriesGrid & gridOut
) {
	if ((dClimatology.GetSize(0) != 12) ||
	    (dClimatology.GetSize(1) != gridIn.GetLatCount()) ||
	    (dClimatology.GetSize(2) != gridIn.GetLonCount())
	) {
		_EXCEPTIONT("Climatology does not match grid");
	}

	gridOut.Initialize(
		gridIn.m_strVariableName,
		gridIn.m_strUnits,
		gridIn.m_vecTime,
		gridIn.m_dLat,
		gridIn.m_dLon);

	for (size_t t = 0; t < gridIn.GetTimeCount(); t++) {
		int m = gridIn.m_vecTime[t].GetMonth() - 1;
		for (size_t j = 0; j < gridIn.GetLatCount(); j++) {
		for (size_t i = 0; i < gridIn.GetLonCount(); i++) {
			gridOut.m_data(t,j,i) = static_cast<float>(
				static_cast<double>(gridIn.m_data(t,j,i))
				- dClimatology(m,j,i));
		}
		}
	}
}

///////////////////////////////////////////////////////////////////////////////

void RunningMean3(
	const std::vector<double> & vecIn,
	std::vector<double> & vecOut
) {
	const size_t sSize = vecIn.size();
	vecOut.resize(sSize);

	for (size_t t = 0; t < sSize; t++) {
		size_t tBegin = (t == 0)?(0):(t-1);
		size_t tEnd = (t+1 == sSize)?(t):(t+1);

		int nValid = 0;
		double dSum = 0.0;
		for (size_t s = tBegin; s <= tEnd; s++) {
			if (vecIn[s] != vecIn[s]) {
				continue;
			}
			dSum += vecIn[s];
			nValid++;
		}

		if (nValid == 0) {
			vecOut[t] = std::numeric_limits<double>::quiet_NaN();
		} else {
			vecOut[t] = dSum / static_cast<double>(nValid);
		}
	}
}

///////////////////////////////////////////////////////////////////////////////

void RunningMean3(
	const TimeSeriesGrid & gridIn,
	TimeSeriesGrid & gridOut
) {
	gridOut.Initialize(
		gridIn.m_strVariableName,
		gridIn.m_strUnits,
		gridIn.m_vecTime,
		gridIn.m_dLat,
		gridIn.m_dLon);

	const size_t sTimes = gridIn.GetTimeCount();
	std::vector<double> vecCell(sTimes);
	std::vector<double> vecSmoothed(sTimes);

	for (size_t j = 0; j < gridIn.GetLatCount(); j++) {
	for (size_t i = 0; i < gridIn.GetLonCount(); i++) {
		for (size_t t = 0; t < sTimes; t++) {
			vecCell[t] = static_cast<double>(gridIn.m_data(t,j,i));
		}
		RunningMean3(vecCell, vecSmoothed);
		for (size_t t = 0; t < sTimes; t++) {
			gridOut.m_data(t,j,i) = static_cast<float>(vecSmoothed[t]);
		}
	}
	}
}

///////////////////////////////////////////////////////////////////////////////

void ComputeBoxAnomaly(
	const TimeSeriesGrid & gridSST,
	const OceanIndexOptions & opts,
	TimeSeriesGrid & gridAnomaly
) {
	TimeSeriesGrid gridBox;
	SubsetBox(gridSST, opts.m_box, gridBox);
	Announce(1, "Box contains %lu x %lu cells",
		gridBox.GetLatCount(), gridBox.GetLonCount());

	TimeSeriesGrid gridDetrended;
	DetrendLinear(gridBox, gridDetrended);
	gridBox.Deallocate();

	DataArray3D<double> dClimatology;
	ComputeMonthlyClimatology(gridDetrended, opts.m_rangeBaseline, dClimatology);

	ComputeAnomaly(gridDetrended, dClimatology, gridAnomaly);
}

///////////////////////////////////////////////////////////////////////////////

void ComputeOceanIndex(
	const std::string & strMember,
	const TimeSeriesGrid & gridSST,
	const OceanIndexOptions & opts,
	ClimateIndexSeries & series
) {
	AnnounceStartBlock("Ocean index (baseline %s)",
		opts.m_rangeBaseline.ToString().c_str());

	TimeSeriesGrid gridAnomaly;
	ComputeBoxAnomaly(gridSST, opts, gridAnomaly);

	TimeSeriesGrid gridSmoothed;
	RunningMean3(gridAnomaly, gridSmoothed);
	gridAnomaly.Deallocate();

	DataArray1D<double> dWeights;
	ComputeLatitudeWeights(gridSmoothed.m_dLat, dWeights);

	series.m_strMember = strMember;
	series.m_eVariable = ClimateVariable_SeaSurfaceTemperature;
	series.m_period = AnalysisPeriod("all", gridSST.GetYearRange());
	series.m_rangeBaseline = opts.m_rangeBaseline;
	series.m_strUnits = gridSST.m_strUnits;
	series.m_vecTime = gridSmoothed.m_vecTime;
	series.m_vecIndex.resize(gridSmoothed.GetTimeCount());

	for (size_t t = 0; t < gridSmoothed.GetTimeCount(); t++) {
		series.m_vecIndex[t] = AreaWeightedMean(
			gridSmoothed.m_data(t), dWeights, gridSmoothed.GetLonCount());
	}
	gridSmoothed.Deallocate();

	AnnounceEndBlock("Done (%lu months)", series.m_vecIndex.size());
}

///////////////////////////////////////////////////////////////////////////////
