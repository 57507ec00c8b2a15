///////////////////////////////////////////////////////////////////////////////
///
///	\file    SyntheticGrids.h
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

#ifndef _SYNTHETICGRIDS_H_
#define _SYNTHETICGRIDS_H_

#include "TimeSeriesGrid.h"

#include <cmath>
#include <iostream>
#include <string>

///////////////////////////////////////////////////////////////////////////////

namespace
{

bool nearly_equal(double a, double b, double tol = 1.0e-12)
{
	return std::abs(a - b) <= tol;
}

int expect_true(
	const char * szTestName,
	bool cond,
	const std::string & message
) {
	if (!cond) {
		std::cerr << "[" << szTestName << "] FAIL: " << message << std::endl;
		return 1;
	}
	return 0;
}

int report(
	const char * szTestName,
	int nFailures
) {
	if (nFailures == 0) {
		std::cout << "[" << szTestName << "] all checks passed" << std::endl;
		return 0;
	}
	std::cerr << "[" << szTestName << "] FAILED with "
		<< nFailures << " check(s)." << std::endl;
	return 1;
}

///	<summary>
///		Evenly spaced coordinate axis.
///	</summary>
void make_axis(
	double dFirst,
	double dStep,
	size_t sCount,
	DataArray1D<double> & dAxis
) {
	dAxis.Allocate(sCount);
	for (size_t i = 0; i < sCount; i++) {
		dAxis[i] = dFirst + dStep * static_cast<double>(i);
	}
}

///	<summary>
///		Daily no-leap time axis starting on 1 January of iFirstYear.
///	</summary>
void make_daily_axis(
	int iFirstYear,
	int nYears,
	NcTimeDimension & vecTime
) {
	vecTime.clear();
	Time time(iFirstYear, 1, 1, 0, Time::CalendarNoLeap);
	for (int d = 0; d < 365 * nYears; d++) {
		vecTime.push_back(time);
		time.AddDays(1);
	}
}

///	<summary>
///		Monthly no-leap time axis (mid-month) starting in the given month.
///	</summary>
void make_monthly_axis(
	int iFirstYear,
	int iFirstMonth,
	int nMonths,
	NcTimeDimension & vecTime
) {
	vecTime.clear();
	Time time(iFirstYear, iFirstMonth, 15, 0, Time::CalendarNoLeap);
	for (int m = 0; m < nMonths; m++) {
		vecTime.push_back(time);
		time.AddMonths(1);
	}
}

///	<summary>
///		Monthly grid on a small lat-lon grid filled with the month number
///		since the start of the series plus dOffset.
///	</summary>
void make_monthly_grid(
	int iFirstYear,
	int iFirstMonth,
	int nMonths,
	const std::string & strUnits,
	double dOffset,
	TimeSeriesGrid & grid
) {
	NcTimeDimension vecTime;
	make_monthly_axis(iFirstYear, iFirstMonth, nMonths, vecTime);

	DataArray1D<double> dLat;
	DataArray1D<double> dLon;
	make_axis(-1.0, 2.0, 2, dLat);
	make_axis(0.0, 10.0, 2, dLon);

	grid.Initialize("var", strUnits, vecTime, dLat, dLon);
	for (size_t t = 0; t < grid.GetTimeCount(); t++) {
		for (size_t j = 0; j < grid.GetLatCount(); j++) {
		for (size_t i = 0; i < grid.GetLonCount(); i++) {
			grid.m_data(t,j,i) = static_cast<float>(static_cast<double>(t) + dOffset);
		}
		}
	}
}

}

///////////////////////////////////////////////////////////////////////////////

#endif
