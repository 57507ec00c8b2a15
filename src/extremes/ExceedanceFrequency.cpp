///////////////////////////////////////////////////////////////////////////////
///
///	\file    ExceedanceFrequency.cpp
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

#include "ExceedanceFrequency.h"
#include "Exception.h"
#include "GridStatistics.h"

#include <limits>

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Reduce the per-cell counts of one interval to a series entry.
///	</summary>
static void AppendExceedanceEntry(
	const TimeSeriesGrid & grid,
	const DataArray2D<double> & dThreshold,
	const DataArray1D<double> & dWeights,
	const DataArray2D<int> & nValidCount,
	const DataArray2D<int> & nExceedCount,
	const Time & timeFirst,
	ExceedanceGranularity eGranularity,
	std::vector<ExceedanceEntry> & vecEntries
) {
	const size_t sLatCount = grid.GetLatCount();
	const size_t sLonCount = grid.GetLonCount();

	DataArray2D<double> dFrequency(sLatCount, sLonCount);
	DataArray2D<double> dDays(sLatCount, sLonCount);

	for (size_t j = 0; j < sLatCount; j++) {
	for (size_t i = 0; i < sLonCount; i++) {
		if ((dThreshold(j,i) != dThreshold(j,i)) || (nValidCount(j,i) == 0)) {
			dFrequency(j,i) = std::numeric_limits<double>::quiet_NaN();
			dDays(j,i) = std::numeric_limits<double>::quiet_NaN();
			continue;
		}
		dFrequency(j,i) =
			static_cast<double>(nExceedCount(j,i))
			/ static_cast<double>(nValidCount(j,i));
		dDays(j,i) = static_cast<double>(nExceedCount(j,i));
	}
	}

	ExceedanceEntry entry;
	entry.m_iYear = timeFirst.GetYear();
	if (eGranularity == ExceedanceGranularity_Monthly) {
		entry.m_iMonth = timeFirst.GetMonth();
		entry.m_timeStart = Time(
			timeFirst.GetYear(), timeFirst.GetMonth(), 1, 0,
			timeFirst.GetCalendarType());
	} else {
		entry.m_iMonth = 0;
		entry.m_timeStart = Time(
			timeFirst.GetYear(), 1, 1, 0,
			timeFirst.GetCalendarType());
	}
	entry.m_dFrequency = AreaWeightedMean(dFrequency, dWeights);
	entry.m_dDays = AreaWeightedMean(dDays, dWeights);

	vecEntries.push_back(entry);
}

///////////////////////////////////////////////////////////////////////////////

void ComputeExceedanceEntries(
	const TimeSeriesGrid & grid,
	const DataArray2D<double> & dThreshold,
	ExceedanceGranularity eGranularity,
	std::vector<ExceedanceEntry> & vecEntries
) {
	const size_t sLatCount = grid.GetLatCount();
	const size_t sLonCount = grid.GetLonCount();

	if ((dThreshold.GetRows() != sLatCount) ||
	    (dThreshold.GetColumns() != sLonCount)
	) {
		_EXCEPTION4("Threshold field (%lu x %lu) does not match grid (%lu x %lu)",
			dThreshold.GetRows(), dThreshold.GetColumns(),
			sLatCount, sLonCount);
	}

	vecEntries.clear();

	DataArray1D<double> dWeights;
	ComputeLatitudeWeights(grid.m_dLat, dWeights);

	DataArray2D<int> nValidCount(sLatCount, sLonCount);
	DataArray2D<int> nExceedCount(sLatCount, sLonCount);

	size_t tFirst = 0;
	for (size_t t = 0; t < grid.GetTimeCount(); t++) {

		// Close the current interval when the year or month changes
		if (t != tFirst) {
			const Time & timeFirst = grid.m_vecTime[tFirst];
			const Time & timeCurrent = grid.m_vecTime[t];

			bool fNewInterval;
			if (eGranularity == ExceedanceGranularity_Monthly) {
				fNewInterval = (timeCurrent.MonthIndex() != timeFirst.MonthIndex());
			} else {
				fNewInterval = (timeCurrent.GetYear() != timeFirst.GetYear());
			}

			if (fNewInterval) {
				AppendExceedanceEntry(
					grid, dThreshold, dWeights,
					nValidCount, nExceedCount,
					timeFirst, eGranularity, vecEntries);

				nValidCount.Zero();
				nExceedCount.Zero();
				tFirst = t;
			}
		}

		for (size_t j = 0; j < sLatCount; j++) {
		for (size_t i = 0; i < sLonCount; i++) {
			float flValue = grid.m_data(t,j,i);
			if (flValue != flValue) {
				continue;
			}
			nValidCount(j,i)++;
			if (static_cast<double>(flValue) >= dThreshold(j,i)) {
				nExceedCount(j,i)++;
			}
		}
		}
	}

	if (grid.GetTimeCount() != 0) {
		AppendExceedanceEntry(
			grid, dThreshold, dWeights,
			nValidCount, nExceedCount,
			grid.m_vecTime[tFirst], eGranularity, vecEntries);
	}
}

///////////////////////////////////////////////////////////////////////////////
