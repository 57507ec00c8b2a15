///////////////////////////////////////////////////////////////////////////////
///
///	\file    DiagnosticArtifacts.h
///	\author  ClimDiag Developers
///	\version October 19, 2026
///
///	<summary>
///		Derived products of the pipeline and the interface through which
///		they are persisted.
///	</summary>
///	<remarks>
///		Copyright 2026 ClimDiag Developers
///
///		This file is distributed as part of the ClimDiag source code package.
///		Permission is granted to use, copy, modify and distribute this
///		source code and its documentation under the terms of the GNU General
///		Public License.  This software is provided "as is" without express
///		or implied warranty.
///	</remarks>

#ifndef _DIAGNOSTICARTIFACTS_H_
#define _DIAGNOSTICARTIFACTS_H_

#include "DataArray1D.h"
#include "DataArray2D.h"
#include "DiagnosticTypes.h"
#include "NetCDFUtilities.h"

#include <string>
#include <vector>

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Per-cell percentile threshold over a reference period.  Cells
///		without data hold NaN.
///	</summary>
class PercentileThresholdField {

public:
	///	<summary>
	///		Constructor.
	///	</summary>
	PercentileThresholdField() :
		m_eVariable(ClimateVariable_Precipitation),
		m_dPercentile(0.0)
	{ }

	///	<summary>
	///		Key under which this field is persisted.
	///	</summary>
	ArtifactKey GetKey() const {
		return ArtifactKey(
			m_strMember,
			m_eVariable,
			ArtifactProduct_Threshold,
			AnalysisPeriod("ref", m_rangeReference),
			m_dPercentile);
	}

public:
	///	<summary>
	///		Ensemble member.
	///	</summary>
	std::string m_strMember;

	///	<summary>
	///		Variable the threshold applies to.
	///	</summary>
	ClimateVariable m_eVariable;

	///	<summary>
	///		Percentile level (0, 100).
	///	</summary>
	double m_dPercentile;

	///	<summary>
	///		Reference period.
	///	</summary>
	YearRange m_rangeReference;

	///	<summary>
	///		Units of the threshold values.
	///	</summary>
	std::string m_strUnits;

	///	<summary>
	///		Latitudes.
	///	</summary>
	DataArray1D<double> m_dLat;

	///	<summary>
	///		Longitudes.
	///	</summary>
	DataArray1D<double> m_dLon;

	///	<summary>
	///		Threshold value per (lat, lon) cell.
	///	</summary>
	DataArray2D<double> m_dThreshold;

	///	<summary>
	///		Number of reference samples per (lat, lon) cell.
	///	</summary>
	DataArray2D<int> m_nSampleCount;
};

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Granularity of an exceedance series.
///	</summary>
enum ExceedanceGranularity {
	ExceedanceGranularity_Annual,
	ExceedanceGranularity_Monthly
};

///	<summary>
///		One entry of an exceedance series.
///	</summary>
struct ExceedanceEntry {

	///	<summary>
	///		Year of the entry.
	///	</summary>
	int m_iYear;

	///	<summary>
	///		Month of the entry (1-12), or 0 for annual entries.
	///	</summary>
	int m_iMonth;

	///	<summary>
	///		Start time of the aggregation interval.
	///	</summary>
	Time m_timeStart;

	///	<summary>
	///		Area-weighted mean fraction of days at or above threshold.
	///	</summary>
	double m_dFrequency;

	///	<summary>
	///		Area-weighted mean number of days at or above threshold.
	///	</summary>
	double m_dDays;
};

///	<summary>
///		Series of exceedance frequencies for one member, percentile level
///		and period.
///	</summary>
class ExceedanceSeries {

public:
	///	<summary>
	///		Constructor.
	///	</summary>
	ExceedanceSeries() :
		m_eVariable(ClimateVariable_Precipitation),
		m_dPercentile(0.0),
		m_eGranularity(ExceedanceGranularity_Annual)
	{ }

	///	<summary>
	///		Key under which this series is persisted.
	///	</summary>
	ArtifactKey GetKey() const {
		return ArtifactKey(
			m_strMember,
			m_eVariable,
			(m_eGranularity == ExceedanceGranularity_Annual)
				? ArtifactProduct_AnnualExceedance
				: ArtifactProduct_MonthlyExceedance,
			m_period,
			m_dPercentile);
	}

public:
	///	<summary>
	///		Ensemble member.
	///	</summary>
	std::string m_strMember;

	///	<summary>
	///		Variable.
	///	</summary>
	ClimateVariable m_eVariable;

	///	<summary>
	///		Percentile level of the threshold.
	///	</summary>
	double m_dPercentile;

	///	<summary>
	///		Reference period of the threshold.
	///	</summary>
	YearRange m_rangeReference;

	///	<summary>
	///		Period covered by the series.
	///	</summary>
	AnalysisPeriod m_period;

	///	<summary>
	///		Annual or monthly.
	///	</summary>
	ExceedanceGranularity m_eGranularity;

	///	<summary>
	///		Entries in time order.
	///	</summary>
	std::vector<ExceedanceEntry> m_vecEntries;
};

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		A monthly scalar climate index for one member.
///	</summary>
class ClimateIndexSeries {

public:
	///	<summary>
	///		Constructor.
	///	</summary>
	ClimateIndexSeries() :
		m_eVariable(ClimateVariable_SeaSurfaceTemperature)
	{ }

	///	<summary>
	///		Key under which this series is persisted.
	///	</summary>
	ArtifactKey GetKey() const {
		return ArtifactKey(
			m_strMember,
			m_eVariable,
			ArtifactProduct_OceanIndex,
			m_period);
	}

public:
	///	<summary>
	///		Ensemble member.
	///	</summary>
	std::string m_strMember;

	///	<summary>
	///		Variable the index is derived from.
	///	</summary>
	ClimateVariable m_eVariable;

	///	<summary>
	///		Period covered by the series.
	///	</summary>
	AnalysisPeriod m_period;

	///	<summary>
	///		Baseline period of the climatology.
	///	</summary>
	YearRange m_rangeBaseline;

	///	<summary>
	///		Units of the index.
	///	</summary>
	std::string m_strUnits;

	///	<summary>
	///		Time of each index value.
	///	</summary>
	NcTimeDimension m_vecTime;

	///	<summary>
	///		Index values.
	///	</summary>
	std::vector<double> m_vecIndex;
};

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Destination of derived artifacts.  Implementations decide on the
///		storage; file names are generated from the artifact key.
///	</summary>
class ArtifactWriter {

public:
	///	<summary>
	///		Virtual destructor.
	///	</summary>
	virtual ~ArtifactWriter() { }

public:
	///	<summary>
	///		Persist a threshold field.
	///	</summary>
	virtual void WriteThresholdField(
		const PercentileThresholdField & field
	) = 0;

	///	<summary>
	///		Persist an exceedance series.
	///	</summary>
	virtual void WriteExceedanceSeries(
		const ExceedanceSeries & series
	) = 0;

	///	<summary>
	///		Persist a climate index series.
	///	</summary>
	virtual void WriteClimateIndexSeries(
		const ClimateIndexSeries & series
	) = 0;
};

///////////////////////////////////////////////////////////////////////////////

#endif
