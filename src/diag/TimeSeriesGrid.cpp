///////////////////////////////////////////////////////////////////////////////
///
///	\file    TimeSeriesGrid.cpp
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

#include "TimeSeriesGrid.h"
#include "Exception.h"

#include <cmath>
#include <limits>

///////////////////////////////////////////////////////////////////////////////

void TimeSeriesGrid::Initialize(
	const std::string & strVariableName,
	const std::string & strUnits,
	const NcTimeDimension & vecTime,
	const DataArray1D<double> & dLat,
	const DataArray1D<double> & dLon
) {
	m_strVariableName = strVariableName;
	m_strUnits = strUnits;
	m_vecTime = vecTime;
	m_dLat = dLat;
	m_dLon = dLon;

	m_data.Allocate(vecTime.size(), dLat.GetRows(), dLon.GetRows());
	m_data.Fill(std::numeric_limits<float>::quiet_NaN());
}

///////////////////////////////////////////////////////////////////////////////

void TimeSeriesGrid::Deallocate() {
	m_vecTime.clear();
	m_dLat.Deallocate();
	m_dLon.Deallocate();
	m_data.Deallocate();
}

///////////////////////////////////////////////////////////////////////////////

Time::CalendarType TimeSeriesGrid::GetCalendarType() const {
	if (m_vecTime.size() == 0) {
		return Time::CalendarUnknown;
	}
	return m_vecTime[0].GetCalendarType();
}

///////////////////////////////////////////////////////////////////////////////

YearRange TimeSeriesGrid::GetYearRange() const {
	if (m_vecTime.size() == 0) {
		return YearRange();
	}
	return YearRange(
		m_vecTime[0].GetYear(),
		m_vecTime[m_vecTime.size()-1].GetYear());
}

///////////////////////////////////////////////////////////////////////////////

bool TimeSeriesGrid::HasSameSpatialGrid(
	const TimeSeriesGrid & grid,
	double dTolerance
) const {
	return HasSameSpatialGrid(grid.m_dLat, grid.m_dLon, dTolerance);
}

///////////////////////////////////////////////////////////////////////////////

bool TimeSeriesGrid::HasSameSpatialGrid(
	const DataArray1D<double> & dLat,
	const DataArray1D<double> & dLon,
	double dTolerance
) const {
	if ((m_dLat.GetRows() != dLat.GetRows()) ||
	    (m_dLon.GetRows() != dLon.GetRows())
	) {
		return false;
	}
	for (size_t j = 0; j < m_dLat.GetRows(); j++) {
		if (fabs(m_dLat[j] - dLat[j]) > dTolerance) {
			return false;
		}
	}
	for (size_t i = 0; i < m_dLon.GetRows(); i++) {
		if (fabs(m_dLon[i] - dLon[i]) > dTolerance) {
			return false;
		}
	}
	return true;
}

///////////////////////////////////////////////////////////////////////////////

bool TimeSeriesGrid::IsMonthly() const {
	if (m_vecTime.size() < 2) {
		return false;
	}

	// Monthly data is spaced between 28 and 31 days
	double dDeltaDays = m_vecTime[0].DeltaDays(m_vecTime[1]);
	return ((dDeltaDays >= 27.5) && (dDeltaDays <= 31.5));
}

///////////////////////////////////////////////////////////////////////////////
