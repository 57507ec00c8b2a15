///////////////////////////////////////////////////////////////////////////////
///
///	\file    ExtremeStatisticsEngine.h
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

#ifndef _EXTREMESTATISTICSENGINE_H_
#define _EXTREMESTATISTICSENGINE_H_

#include "DiagnosticArtifacts.h"
#include "DiagnosticTypes.h"
#include "PercentileThreshold.h"
#include "TimeSeriesGrid.h"

#include <string>

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Percentile threshold and exceedance computation for one member and
///		one percentile level.  The reference threshold must be computed and
///		persisted before any exceedance series is derived from it; the
///		same threshold is then applied to every period.
///	</summary>
class ExtremeStatisticsEngine {

public:
	///	<summary>
	///		Engine states.
	///	</summary>
	enum State {
		State_Reference,
		State_Exceedance
	};

public:
	///	<summary>
	///		Constructor.
	///	</summary>
	ExtremeStatisticsEngine(
		const std::string & strMember,
		double dPercentile,
		const YearRange & rangeReference,
		ArtifactWriter & writer,
		const PercentileEstimatorOptions & opts = PercentileEstimatorOptions()
	);

public:
	///	<summary>
	///		Compute the threshold field over the reference period of the
	///		given historical series and persist it.
	///	</summary>
	void ComputeReference(
		const TimeSeriesGrid & gridHistorical
	);

	///	<summary>
	///		Compute and persist the exceedance series of the given period.
	///	</summary>
	void ComputeExceedance(
		const TimeSeriesGrid & grid,
		const AnalysisPeriod & period,
		ExceedanceGranularity eGranularity,
		ExceedanceSeries & series
	);

public:
	///	<summary>
	///		Current state.
	///	</summary>
	State GetState() const {
		return m_eState;
	}

	///	<summary>
	///		Percentile level.
	///	</summary>
	double GetPercentile() const {
		return m_dPercentile;
	}

	///	<summary>
	///		Persisted threshold field.
	///	</summary>
	const PercentileThresholdField & GetThresholdField() const;

private:
	///	<summary>
	///		Ensemble member.
	///	</summary>
	std::string m_strMember;

	///	<summary>
	///		Percentile level.
	///	</summary>
	double m_dPercentile;

	///	<summary>
	///		Reference period.
	///	</summary>
	YearRange m_rangeReference;

	///	<summary>
	///		Destination of derived artifacts.
	///	</summary>
	ArtifactWriter & m_writer;

	///	<summary>
	///		Estimator controls.
	///	</summary>
	PercentileEstimatorOptions m_opts;

	///	<summary>
	///		Current state.
	///	</summary>
	State m_eState;

	///	<summary>
	///		Reference threshold field.
	///	</summary>
	PercentileThresholdField m_field;
};

///////////////////////////////////////////////////////////////////////////////

#endif
