///////////////////////////////////////////////////////////////////////////////
///
///	\file    test_ocean_index.cpp
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

#include "SyntheticGrids.h"

#include "OceanIndex.h"
#include "PipelineError.h"

#include <limits>
#include <vector>

namespace
{

const char * const TestName = "ocean_index";

///	<summary>
///		Monthly SST with a warming trend and a seasonal cycle over a grid
///		that extends beyond the default averaging box.
///	</summary>
void make_sst_grid(
	int iFirstYear,
	int nYears,
	double dOffset,
	TimeSeriesGrid & grid
) {
	NcTimeDimension vecTime;
	make_monthly_axis(iFirstYear, 1, 12 * nYears, vecTime);

	DataArray1D<double> dLat;
	DataArray1D<double> dLon;
	make_axis(-10.0, 2.0, 11, dLat);
	make_axis(180.0, 5.0, 15, dLon);

	grid.Initialize("tos", "degC", vecTime, dLat, dLon);

	for (size_t t = 0; t < grid.GetTimeCount(); t++) {
		double dSeasonal = 1.5 * cos(2.0 * M_PI * static_cast<double>(t) / 12.0);
		for (size_t j = 0; j < grid.GetLatCount(); j++) {
		for (size_t i = 0; i < grid.GetLonCount(); i++) {
			grid.m_data(t,j,i) = static_cast<float>(
				dOffset + 26.0 + 0.01 * static_cast<double>(i)
				+ 0.002 * static_cast<double>(t) + dSeasonal);
		}
		}
	}
}

///	<summary>
///		Least squares slope of a series against its index.
///	</summary>
double series_slope(const std::vector<double> & vec) {
	double dTimeMean = 0.0;
	double dValueMean = 0.0;
	for (size_t t = 0; t < vec.size(); t++) {
		dTimeMean += static_cast<double>(t);
		dValueMean += vec[t];
	}
	dTimeMean /= static_cast<double>(vec.size());
	dValueMean /= static_cast<double>(vec.size());

	double dCovariance = 0.0;
	double dVariance = 0.0;
	for (size_t t = 0; t < vec.size(); t++) {
		dCovariance += (static_cast<double>(t) - dTimeMean) * (vec[t] - dValueMean);
		dVariance += (static_cast<double>(t) - dTimeMean) * (static_cast<double>(t) - dTimeMean);
	}
	return (dCovariance / dVariance);
}

int test_running_mean()
{
	int failures = 0;

	std::vector<double> vecIn;
	vecIn.push_back(1.0);
	vecIn.push_back(2.0);
	vecIn.push_back(3.0);
	vecIn.push_back(std::numeric_limits<double>::quiet_NaN());
	vecIn.push_back(5.0);

	std::vector<double> vecOut;
	RunningMean3(vecIn, vecOut);

	failures += expect_true(TestName, vecOut.size() == vecIn.size(),
		"running mean must preserve the series length");
	failures += expect_true(TestName, nearly_equal(vecOut[0], 1.5),
		"the first window must shrink to 2 points");
	failures += expect_true(TestName, nearly_equal(vecOut[1], 2.0),
		"interior windows must average 3 points");
	failures += expect_true(TestName, nearly_equal(vecOut[3], 4.0),
		"missing values must be excluded from the window");
	failures += expect_true(TestName, nearly_equal(vecOut[4], 5.0),
		"the last window must shrink to the available points");

	std::vector<double> vecConstant(7, 3.25);
	RunningMean3(vecConstant, vecOut);
	bool fConstant = true;
	for (size_t t = 0; t < vecOut.size(); t++) {
		if (!nearly_equal(vecOut[t], 3.25)) {
			fConstant = false;
		}
	}
	failures += expect_true(TestName, fConstant,
		"running mean of a constant must be the constant");

	return failures;
}

int test_subset_box()
{
	int failures = 0;

	TimeSeriesGrid grid;
	make_sst_grid(1990, 1, 0.0, grid);

	TimeSeriesGrid gridBox;
	SubsetBox(grid, LatLonBox<double>(190.0, 240.0, -5.0, 5.0), gridBox);

	failures += expect_true(TestName,
		(gridBox.GetLatCount() == 5) && (gridBox.GetLonCount() == 11),
		"box subset must keep the cells inside the box");
	failures += expect_true(TestName,
		nearly_equal(gridBox.m_dLat[0], -4.0) && nearly_equal(gridBox.m_dLon[0], 190.0),
		"box subset must start at the first cell inside the box");

	int iKind = -1;
	try {
		SubsetBox(grid, LatLonBox<double>(0.0, 20.0, -5.0, 5.0), gridBox);
	} catch(PipelineError & e) {
		iKind = e.GetKind();
	}
	failures += expect_true(TestName, iKind == PipelineErrorKind_Input,
		"a box without cells must raise an input error");

	return failures;
}

int test_index_removes_trend_and_seasonal_cycle()
{
	int failures = 0;

	// 1980-2011 covers the 1981-2010 baseline
	TimeSeriesGrid grid;
	make_sst_grid(1980, 32, 0.0, grid);

	ClimateIndexSeries series;
	ComputeOceanIndex("r1", grid, OceanIndexOptions(), series);

	failures += expect_true(TestName, series.m_vecIndex.size() == grid.GetTimeCount(),
		"the index must hold one value per month");
	failures += expect_true(TestName,
		series.GetKey().GetBaseName() == "r1_tos_oni_all_1980-2011",
		"the index series must be named by its key");

	double dMean = 0.0;
	double dMaxAbs = 0.0;
	for (size_t t = 0; t < series.m_vecIndex.size(); t++) {
		dMean += series.m_vecIndex[t];
		if (std::abs(series.m_vecIndex[t]) > dMaxAbs) {
			dMaxAbs = std::abs(series.m_vecIndex[t]);
		}
	}
	dMean /= static_cast<double>(series.m_vecIndex.size());

	failures += expect_true(TestName, nearly_equal(dMean, 0.0, 0.05),
		"the index of a trend plus seasonal cycle must average to zero");
	failures += expect_true(TestName, std::abs(series_slope(series.m_vecIndex)) < 1.0e-3,
		"the index must carry no residual trend");
	failures += expect_true(TestName, dMaxAbs < 0.05,
		"the index of a trend plus seasonal cycle must stay near zero");

	// A constant offset does not change the index
	TimeSeriesGrid gridWarm;
	make_sst_grid(1980, 32, 5.0, gridWarm);

	ClimateIndexSeries seriesWarm;
	ComputeOceanIndex("r1", gridWarm, OceanIndexOptions(), seriesWarm);

	double dMaxDifference = 0.0;
	for (size_t t = 0; t < series.m_vecIndex.size(); t++) {
		double dDifference = std::abs(series.m_vecIndex[t] - seriesWarm.m_vecIndex[t]);
		if (dDifference > dMaxDifference) {
			dMaxDifference = dDifference;
		}
	}
	failures += expect_true(TestName, dMaxDifference < 1.0e-3,
		"adding a constant to the input must leave the index unchanged");

	return failures;
}

int test_baseline_and_trend_errors()
{
	int failures = 0;

	// Series does not cover the baseline
	TimeSeriesGrid grid;
	make_sst_grid(1990, 11, 0.0, grid);

	int iKind = -1;
	try {
		ClimateIndexSeries series;
		ComputeOceanIndex("r1", grid, OceanIndexOptions(), series);
	} catch(PipelineError & e) {
		iKind = e.GetKind();
	}
	failures += expect_true(TestName, iKind == PipelineErrorKind_BaselineWindow,
		"a series that misses baseline months must raise a baseline window error");

	// One time step
	NcTimeDimension vecTime;
	make_monthly_axis(1990, 1, 1, vecTime);
	TimeSeriesGrid gridSingle;
	gridSingle.Initialize("tos", "degC", vecTime, grid.m_dLat, grid.m_dLon);
	gridSingle.m_data.Fill(27.0f);

	iKind = -1;
	try {
		TimeSeriesGrid gridDetrended;
		DetrendLinear(gridSingle, gridDetrended);
	} catch(PipelineError & e) {
		iKind = e.GetKind();
	}
	failures += expect_true(TestName, iKind == PipelineErrorKind_TrendFit,
		"a single time step must raise a trend fit error");

	return failures;
}

}

///////////////////////////////////////////////////////////////////////////////

int main(int argc, char** argv) {

	int failures = 0;

	try {
		failures += test_running_mean();
		failures += test_subset_box();
		failures += test_index_removes_trend_and_seasonal_cycle();
		failures += test_baseline_and_trend_errors();

	} catch(Exception & e) {
		std::cerr << "[" << TestName << "] unexpected exception: "
			<< e.ToString() << std::endl;
		failures++;
	}

	return report(TestName, failures);
}

///////////////////////////////////////////////////////////////////////////////
