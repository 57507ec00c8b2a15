///////////////////////////////////////////////////////////////////////////////
///
///	\file    test_ingest.cpp
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

#include "PipelineError.h"
#include "Regrid.h"
#include "TimeSeriesIngest.h"

#include "netcdfcpp.h"

#include <cstdio>
#include <limits>
#include <vector>

namespace
{

const char * const TestName = "ingest";

int test_concatenation_covers_union()
{
	int failures = 0;

	// Out of order on input
	std::vector<TimeSeriesGrid> vecGrids(3);
	make_monthly_grid(1992, 1, 12, "K", 24.0, vecGrids[0]);
	make_monthly_grid(1990, 1, 12, "K", 0.0, vecGrids[1]);
	make_monthly_grid(1991, 1, 12, "K", 12.0, vecGrids[2]);

	TimeSeriesGrid grid;
	ConcatenateTimeSeries(vecGrids, grid);

	failures += expect_true(TestName, grid.GetTimeCount() == 36,
		"concatenation must hold every input time step");
	failures += expect_true(TestName,
		(grid.m_vecTime[0].GetYear() == 1990) && (grid.m_vecTime[0].GetMonth() == 1),
		"concatenation must start at the earliest input");
	failures += expect_true(TestName,
		(grid.m_vecTime[35].GetYear() == 1992) && (grid.m_vecTime[35].GetMonth() == 12),
		"concatenation must end at the latest input");

	bool fOrdered = true;
	for (size_t t = 0; t < grid.GetTimeCount(); t++) {
		if (!nearly_equal(grid.m_data(t,1,1), static_cast<double>(t))) {
			fOrdered = false;
		}
	}
	failures += expect_true(TestName, fOrdered,
		"concatenated data must follow the merged time axis");
	failures += expect_true(TestName, grid.IsMonthly(),
		"concatenated monthly series must be monthly");

	return failures;
}

int test_gap_and_overlap_are_rejected()
{
	int failures = 0;

	// Gap: 1991 missing
	{
		std::vector<TimeSeriesGrid> vecGrids(2);
		make_monthly_grid(1990, 1, 12, "K", 0.0, vecGrids[0]);
		make_monthly_grid(1992, 1, 12, "K", 0.0, vecGrids[1]);

		int iKind = -1;
		try {
			TimeSeriesGrid grid;
			ConcatenateTimeSeries(vecGrids, grid);
		} catch(PipelineError & e) {
			iKind = e.GetKind();
		}
		failures += expect_true(TestName, iKind == PipelineErrorKind_Discontinuity,
			"a missing year must raise a discontinuity error");
	}

	// Overlap: second file starts in July 1990
	{
		std::vector<TimeSeriesGrid> vecGrids(2);
		make_monthly_grid(1990, 1, 12, "K", 0.0, vecGrids[0]);
		make_monthly_grid(1990, 7, 12, "K", 0.0, vecGrids[1]);

		int iKind = -1;
		try {
			TimeSeriesGrid grid;
			ConcatenateTimeSeries(vecGrids, grid);
		} catch(PipelineError & e) {
			iKind = e.GetKind();
		}
		failures += expect_true(TestName, iKind == PipelineErrorKind_Discontinuity,
			"overlapping files must raise a discontinuity error");
	}

	// Different units
	{
		std::vector<TimeSeriesGrid> vecGrids(2);
		make_monthly_grid(1990, 1, 12, "K", 0.0, vecGrids[0]);
		make_monthly_grid(1991, 1, 12, "degC", 0.0, vecGrids[1]);

		int iKind = -1;
		try {
			TimeSeriesGrid grid;
			ConcatenateTimeSeries(vecGrids, grid);
		} catch(PipelineError & e) {
			iKind = e.GetKind();
		}
		failures += expect_true(TestName, iKind == PipelineErrorKind_Units,
			"files with different units must raise a units error");
	}

	return failures;
}

int test_unit_conversion()
{
	int failures = 0;

	TimeSeriesGrid gridPrecip;
	make_monthly_grid(1990, 1, 2, "kg m-2 s-1", 0.0, gridPrecip);
	gridPrecip.m_data(0,0,0) = 1.0e-5f;
	gridPrecip.m_data(1,0,0) = std::numeric_limits<float>::quiet_NaN();
	ConvertPrecipitationUnits(gridPrecip);

	failures += expect_true(TestName, gridPrecip.m_strUnits == "mm day-1",
		"precipitation must be converted to mm day-1");
	failures += expect_true(TestName,
		nearly_equal(gridPrecip.m_data(0,0,0), 0.864, 1.0e-5),
		"1e-5 kg m-2 s-1 must equal 0.864 mm day-1");
	failures += expect_true(TestName,
		gridPrecip.m_data(1,0,0) != gridPrecip.m_data(1,0,0),
		"missing values must stay missing");

	TimeSeriesGrid gridSST;
	make_monthly_grid(1990, 1, 1, "K", 300.0, gridSST);
	ConvertTemperatureUnits(gridSST);
	failures += expect_true(TestName,
		nearly_equal(gridSST.m_data(0,1,0), 26.85, 1.0e-4),
		"300 K must equal 26.85 degC");

	// Already in target units
	TimeSeriesGrid gridCelsius;
	make_monthly_grid(1990, 1, 1, "degC", 20.0, gridCelsius);
	ConvertTemperatureUnits(gridCelsius);
	failures += expect_true(TestName,
		nearly_equal(gridCelsius.m_data(0,0,0), 20.0),
		"conversion to the same units must not change values");

	// Unknown and missing units
	const char * szBadUnits[2] = { "m", "" };
	for (int u = 0; u < 2; u++) {
		TimeSeriesGrid grid;
		make_monthly_grid(1990, 1, 1, szBadUnits[u], 0.0, grid);

		int iKind = -1;
		try {
			ConvertPrecipitationUnits(grid);
		} catch(PipelineError & e) {
			iKind = e.GetKind();
		}
		failures += expect_true(TestName, iKind == PipelineErrorKind_Units,
			std::string("units \"") + szBadUnits[u] + "\" must raise a units error");
	}

	return failures;
}

int test_select_year_range()
{
	int failures = 0;

	TimeSeriesGrid grid;
	make_monthly_grid(1990, 1, 36, "K", 0.0, grid);

	TimeSeriesGrid gridSelected;
	SelectYearRange(grid, YearRange(1991, 1991), gridSelected);
	failures += expect_true(TestName, gridSelected.GetTimeCount() == 12,
		"selecting one year of a monthly series must give 12 steps");
	failures += expect_true(TestName,
		nearly_equal(gridSelected.m_data(0,0,0), 12.0),
		"selection must start at the first step of the range");

	int iKind = -1;
	try {
		SelectYearRange(grid, YearRange(2000, 2005), gridSelected);
	} catch(PipelineError & e) {
		iKind = e.GetKind();
	}
	failures += expect_true(TestName, iKind == PipelineErrorKind_EmptyRange,
		"a range outside the series must raise an empty range error");

	return failures;
}

int test_regrid_reproduces_linear_field()
{
	int failures = 0;

	NcTimeDimension vecTime;
	make_monthly_axis(1990, 1, 1, vecTime);

	DataArray1D<double> dLat;
	DataArray1D<double> dLon;
	make_axis(-80.0, 2.0, 81, dLat);
	make_axis(0.0, 2.0, 180, dLon);

	TimeSeriesGrid gridIn;
	gridIn.Initialize("tos", "degC", vecTime, dLat, dLon);
	for (size_t j = 0; j < gridIn.GetLatCount(); j++) {
	for (size_t i = 0; i < gridIn.GetLonCount(); i++) {
		gridIn.m_data(0,j,i) = static_cast<float>(10.0 + 0.1 * dLat[j] + 0.05 * dLon[i]);
	}
	}

	TimeSeriesGrid gridOut;
	RegridBilinear(gridIn, 1.0, gridOut);

	failures += expect_true(TestName,
		(gridOut.GetLatCount() == 180) && (gridOut.GetLonCount() == 360),
		"1 degree target grid must be 180 x 360");
	failures += expect_true(TestName,
		nearly_equal(gridOut.m_dLat[0], -89.5) && nearly_equal(gridOut.m_dLon[1], 1.0),
		"target grid must use cell-centered latitudes and longitudes from 0");

	double dMaxError = 0.0;
	for (size_t j = 0; j < gridOut.GetLatCount(); j++) {
		double dY = gridOut.m_dLat[j];
		if ((dY < -70.0) || (dY > 70.0)) {
			continue;
		}
		for (size_t i = 0; i < gridOut.GetLonCount(); i++) {
			double dX = gridOut.m_dLon[i];
			if ((dX < 10.0) || (dX > 350.0)) {
				continue;
			}
			double dError = std::abs(gridOut.m_data(0,j,i) - (10.0 + 0.1 * dY + 0.05 * dX));
			if (dError > dMaxError) {
				dMaxError = dError;
			}
		}
	}
	failures += expect_true(TestName, dMaxError < 1.0e-4,
		"bilinear regridding must reproduce a linear field at interior points");

	// Poleward of the source grid the nearest row is used
	failures += expect_true(TestName,
		nearly_equal(gridOut.m_data(0,179,100), 10.0 + 8.0 + 0.05 * 100.0, 1.0e-4),
		"targets poleward of the source must take the nearest source row");

	return failures;
}

int test_regrid_rejects_degenerate_grids()
{
	int failures = 0;

	NcTimeDimension vecTime;
	make_monthly_axis(1990, 1, 1, vecTime);

	DataArray1D<double> dLat;
	DataArray1D<double> dLon;
	make_axis(0.0, 1.0, 1, dLat);
	make_axis(0.0, 10.0, 4, dLon);

	TimeSeriesGrid gridIn;
	gridIn.Initialize("tos", "degC", vecTime, dLat, dLon);

	int iKind = -1;
	try {
		TimeSeriesGrid gridOut;
		RegridBilinear(gridIn, 1.0, gridOut);
	} catch(PipelineError & e) {
		iKind = e.GetKind();
	}
	failures += expect_true(TestName, iKind == PipelineErrorKind_Regrid,
		"a single source latitude must raise a regrid error");

	iKind = -1;
	try {
		DataArray1D<double> dLatOut;
		DataArray1D<double> dLonOut;
		GenerateRegularGlobalGrid(0.7, dLatOut, dLonOut);
	} catch(PipelineError & e) {
		iKind = e.GetKind();
	}
	failures += expect_true(TestName, iKind == PipelineErrorKind_Regrid,
		"a resolution that does not divide the sphere must raise a regrid error");

	return failures;
}

int test_netcdf_round_trip()
{
	int failures = 0;

	const std::string strFile = "climdiag_test_ingest_roundtrip.nc";

	TimeSeriesGrid gridOut;
	make_monthly_grid(1990, 1, 24, "K", 280.0, gridOut);
	gridOut.m_strVariableName = "tos";
	gridOut.m_data(3,1,0) = std::numeric_limits<float>::quiet_NaN();

	WriteTimeSeriesGrid(strFile, gridOut);

	TimeSeriesGrid gridIn;
	LoadTimeSeriesGrid(strFile, "tos", gridIn);

	failures += expect_true(TestName,
		(gridIn.GetTimeCount() == 24) &&
		(gridIn.GetLatCount() == 2) &&
		(gridIn.GetLonCount() == 2),
		"round trip must preserve the grid shape");
	failures += expect_true(TestName, gridIn.m_strUnits == "K",
		"round trip must preserve units");
	failures += expect_true(TestName,
		(gridIn.m_vecTime[13].GetYear() == 1991) &&
		(gridIn.m_vecTime[13].GetMonth() == 2),
		"round trip must preserve the time axis");
	failures += expect_true(TestName,
		nearly_equal(gridIn.m_data(5,0,1), 285.0),
		"round trip must preserve values");
	failures += expect_true(TestName,
		gridIn.m_data(3,1,0) != gridIn.m_data(3,1,0),
		"round trip must preserve missing values");

	int iKind = -1;
	try {
		TimeSeriesGrid gridMissing;
		LoadTimeSeriesGrid(strFile, "pr", gridMissing);
	} catch(PipelineError & e) {
		iKind = e.GetKind();
	}
	failures += expect_true(TestName, iKind == PipelineErrorKind_Input,
		"a missing variable must raise an input error");

	std::remove(strFile.c_str());

	return failures;
}

}

///////////////////////////////////////////////////////////////////////////////

int main(int argc, char** argv) {

	// Turn off fatal errors in NetCDF
	NcError error(NcError::silent_nonfatal);

	int failures = 0;

	try {
		failures += test_concatenation_covers_union();
		failures += test_gap_and_overlap_are_rejected();
		failures += test_unit_conversion();
		failures += test_select_year_range();
		failures += test_regrid_reproduces_linear_field();
		failures += test_regrid_rejects_degenerate_grids();
		failures += test_netcdf_round_trip();

	} catch(Exception & e) {
		std::cerr << "[" << TestName << "] unexpected exception: "
			<< e.ToString() << std::endl;
		failures++;
	}

	return report(TestName, failures);
}

///////////////////////////////////////////////////////////////////////////////
