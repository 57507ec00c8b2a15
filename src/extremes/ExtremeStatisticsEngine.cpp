///////////////////////////////////////////////////////////////////////////////
///
///	\file    ExtremeStatisticsEngine.cpp
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

#include "ExtremeStatisticsEngine.h"
#include "ExceedanceFrequency.h"
#include "TimeSeriesIngest.h"
#include "Announce.h"
#include "PipelineError.h"
#include "Units.h"

#include <map>

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Number of time steps a complete year of the given grid holds,
///		inferred from the spacing of its first two time steps.
///	</summary>
static int ExpectedStepsInYear(
	const TimeSeriesGrid & grid,
	int iYear
) {
	if (grid.GetTimeCount() < 2) {
		return 1;
	}
	if (grid.IsMonthly()) {
		return 12;
	}

	double dStepSeconds = grid.m_vecTime[0].DeltaSeconds(grid.m_vecTime[1]);
	if (dStepSeconds <= 0.0) {
		_EXCEPTIONT("Time axis is not strictly increasing");
	}

	Time::CalendarType eCalendar = grid.m_vecTime[0].GetCalendarType();
	int nDays = 0;
	for (int m = 1; m <= 12; m++) {
		nDays += Time::DaysInMonth(eCalendar, iYear, m);
	}

	return static_cast<int>(86400.0 * static_cast<double>(nDays) / dStepSeconds + 0.5);
}

///////////////////////////////////////////////////////////////////////////////

ExtremeStatisticsEngine::ExtremeStatisticsEngine(
	const std::string & strMember,
	double dPercentile,
	const YearRange & rangeReference,
	ArtifactWriter & writer,
	const PercentileEstimatorOptions & opts
) :
	m_strMember(strMember),
	m_dPercentile(dPercentile),
	m_rangeReference(rangeReference),
	m_writer(writer),
	m_opts(opts),
	m_eState(State_Reference)
{ }

///////////////////////////////////////////////////////////////////////////////

void ExtremeStatisticsEngine::ComputeReference(
	const TimeSeriesGrid & gridHistorical
) {
	if (m_eState != State_Reference) {
		_EXCEPTION1("Reference threshold for percentile %g already computed",
			m_dPercentile);
	}

	AnnounceStartBlock("Reference threshold p%g over %s",
		m_dPercentile, m_rangeReference.ToString().c_str());

	TimeSeriesGrid gridReference;
	SelectYearRange(gridHistorical, m_rangeReference, gridReference);

	// Every year of the reference period must be fully covered
	std::map<int, int> mapYearSteps;
	for (size_t t = 0; t < gridReference.GetTimeCount(); t++) {
		mapYearSteps[gridReference.m_vecTime[t].GetYear()]++;
	}
	if (static_cast<int>(mapYearSteps.size()) < m_rangeReference.GetYearCount()) {
		_PIPELINEERROR3(PipelineErrorKind_InsufficientReferenceData,
			"Only %lu of %i reference years (%s) are present",
			mapYearSteps.size(),
			m_rangeReference.GetYearCount(),
			m_rangeReference.ToString().c_str());
	}

	std::map<int, int>::const_iterator iterYear = mapYearSteps.begin();
	for (; iterYear != mapYearSteps.end(); iterYear++) {
		int nExpected = ExpectedStepsInYear(gridHistorical, iterYear->first);
		if (iterYear->second < nExpected) {
			_PIPELINEERROR4(PipelineErrorKind_InsufficientReferenceData,
				"Reference year %i has %i of %i time steps (%s)",
				iterYear->first,
				iterYear->second,
				nExpected,
				m_rangeReference.ToString().c_str());
		}
	}

	m_field.m_strMember = m_strMember;
	m_field.m_eVariable = ClimateVariable_Precipitation;
	m_field.m_dPercentile = m_dPercentile;
	m_field.m_rangeReference = m_rangeReference;
	m_field.m_strUnits = gridReference.m_strUnits;
	m_field.m_dLat = gridReference.m_dLat;
	m_field.m_dLon = gridReference.m_dLon;

	ComputePercentileThreshold(
		gridReference,
		m_dPercentile,
		m_opts,
		m_field.m_dThreshold,
		m_field.m_nSampleCount);

	m_writer.WriteThresholdField(m_field);

	m_eState = State_Exceedance;

	AnnounceEndBlock("Done");
}

///////////////////////////////////////////////////////////////////////////////

void ExtremeStatisticsEngine::ComputeExceedance(
	const TimeSeriesGrid & grid,
	const AnalysisPeriod & period,
	ExceedanceGranularity eGranularity,
	ExceedanceSeries & series
) {
	if (m_eState != State_Exceedance) {
		_EXCEPTION1("Exceedance for percentile %g requested before the"
			" reference threshold was computed and persisted",
			m_dPercentile);
	}

	AnnounceStartBlock("%s exceedance p%g over %s (%s)",
		(eGranularity == ExceedanceGranularity_Annual)?("Annual"):("Monthly"),
		m_dPercentile,
		period.m_range.ToString().c_str(),
		period.m_strLabel.c_str());

	// Threshold and data must describe the same quantity on the same grid
	if (!grid.HasSameSpatialGrid(m_field.m_dLat, m_field.m_dLon)) {
		_PIPELINEERROR1(PipelineErrorKind_Input,
			"Grid of \"%s\" differs from the reference threshold grid",
			grid.m_strVariableName.c_str());
	}
	if (CanonicalUnitName(grid.m_strUnits)
		!= CanonicalUnitName(m_field.m_strUnits)
	) {
		_PIPELINEERROR2(PipelineErrorKind_Units,
			"Units \"%s\" differ from reference threshold units \"%s\"",
			grid.m_strUnits.c_str(),
			m_field.m_strUnits.c_str());
	}

	TimeSeriesGrid gridPeriod;
	SelectYearRange(grid, period.m_range, gridPeriod);

	series.m_strMember = m_strMember;
	series.m_eVariable = m_field.m_eVariable;
	series.m_dPercentile = m_dPercentile;
	series.m_rangeReference = m_rangeReference;
	series.m_period = period;
	series.m_eGranularity = eGranularity;

	ComputeExceedanceEntries(
		gridPeriod,
		m_field.m_dThreshold,
		eGranularity,
		series.m_vecEntries);

	m_writer.WriteExceedanceSeries(series);

	AnnounceEndBlock("Done (%lu entries)", series.m_vecEntries.size());
}

///////////////////////////////////////////////////////////////////////////////

const PercentileThresholdField & ExtremeStatisticsEngine::GetThresholdField() const {
	if (m_eState != State_Exceedance) {
		_EXCEPTIONT("Reference threshold has not been computed");
	}
	return m_field;
}

///////////////////////////////////////////////////////////////////////////////
