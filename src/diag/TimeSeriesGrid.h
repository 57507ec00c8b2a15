///////////////////////////////////////////////////////////////////////////////
///
///	\file    TimeSeriesGrid.h
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

#ifndef _TIMESERIESGRID_H_
#define _TIMESERIESGRID_H_

#include "DataArray1D.h"
#include "DataArray3D.h"
#include "NetCDFUtilities.h"
#include "DiagnosticTypes.h"

#include <string>

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		A gridded time series on a regular latitude-longitude grid, stored
///		as (time, lat, lon).  Missing values are stored as NaN.  The time
///		axis is strictly increasing.
///	</summary>
class TimeSeriesGrid {

public:
	///	<summary>
	///		Constructor.
	///	</summary>
	TimeSeriesGrid() { }

	///	<summary>
	///		Initialize the grid with the given axes.  All values are set to
	///		NaN.
	///	</summary>
	void Initialize(
		const std::string & strVariableName,
		const std::string & strUnits,
		const NcTimeDimension & vecTime,
		const DataArray1D<double> & dLat,
		const DataArray1D<double> & dLon
	);

	///	<summary>
	///		Release all data held by this grid.
	///	</summary>
	void Deallocate();

	///	<summary>
	///		Check if this grid holds data.
	///	</summary>
	bool IsAttached() const {
		return m_data.IsAttached();
	}

public:
	///	<summary>
	///		Number of time steps.
	///	</summary>
	size_t GetTimeCount() const {
		return m_vecTime.size();
	}

	///	<summary>
	///		Number of latitudes.
	///	</summary>
	size_t GetLatCount() const {
		return m_dLat.GetRows();
	}

	///	<summary>
	///		Number of longitudes.
	///	</summary>
	size_t GetLonCount() const {
		return m_dLon.GetRows();
	}

	///	<summary>
	///		Calendar of the time axis.
	///	</summary>
	Time::CalendarType GetCalendarType() const;

	///	<summary>
	///		Range of years covered by the time axis.
	///	</summary>
	YearRange GetYearRange() const;

	///	<summary>
	///		Check if the spatial grid of this object matches another.
	///	</summary>
	bool HasSameSpatialGrid(
		const TimeSeriesGrid & grid,
		double dTolerance = 1.0e-6
	) const;

	///	<summary>
	///		Check if the spatial grid of this object has the given coordinates.
	///	</summary>
	bool HasSameSpatialGrid(
		const DataArray1D<double> & dLat,
		const DataArray1D<double> & dLon,
		double dTolerance = 1.0e-6
	) const;

	///	<summary>
	///		Check if the time axis has monthly spacing.
	///	</summary>
	bool IsMonthly() const;

public:
	///	<summary>
	///		Name of the variable.
	///	</summary>
	std::string m_strVariableName;

	///	<summary>
	///		Physical units of the data.
	///	</summary>
	std::string m_strUnits;

	///	<summary>
	///		Time axis.
	///	</summary>
	NcTimeDimension m_vecTime;

	///	<summary>
	///		Latitudes (degrees north, ascending).
	///	</summary>
	DataArray1D<double> m_dLat;

	///	<summary>
	///		Longitudes (degrees east).
	///	</summary>
	DataArray1D<double> m_dLon;

	///	<summary>
	///		Data stored as (time, lat, lon).
	///	</summary>
	DataArray3D<float> m_data;
};

///////////////////////////////////////////////////////////////////////////////

#endif
