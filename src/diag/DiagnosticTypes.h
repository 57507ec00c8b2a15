///////////////////////////////////////////////////////////////////////////////
///
///	\file    DiagnosticTypes.h
///	\author  ClimDiag Developers
///	\version October 19, 2026
///
///	<summary>
///		Identifiers shared by all stages of the diagnostic pipeline: climate
///		variables, scenario branches, year ranges, analysis periods and the
///		typed keys from which artifact file names are generated.
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

#ifndef _DIAGNOSTICTYPES_H_
#define _DIAGNOSTICTYPES_H_

#include <string>
#include <vector>

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Physical quantities processed by the pipeline.
///	</summary>
enum ClimateVariable {
	ClimateVariable_Precipitation,
	ClimateVariable_SeaSurfaceTemperature
};

///	<summary>
///		Short name of a ClimateVariable as used in artifact names.
///	</summary>
const char * ClimateVariableShortName(ClimateVariable eVariable);

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Stages of the per-member pipeline, used to report where a member
///		failed.
///	</summary>
enum PipelineStage {
	PipelineStage_Ingest,
	PipelineStage_Reference,
	PipelineStage_Exceedance,
	PipelineStage_OceanIndex,
	PipelineStage_Export
};

///	<summary>
///		Name of a PipelineStage.
///	</summary>
const char * PipelineStageName(PipelineStage eStage);

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		An inclusive range of calendar years.
///	</summary>
class YearRange {

public:
	///	<summary>
	///		Constructor.
	///	</summary>
	YearRange() :
		m_iBegin(0),
		m_iEnd(-1)
	{ }

	///	<summary>
	///		Constructor.
	///	</summary>
	YearRange(int iBegin, int iEnd) :
		m_iBegin(iBegin),
		m_iEnd(iEnd)
	{ }

	///	<summary>
	///		Parse from a string of the form "1980-2014".  Throws a
	///		configuration error on malformed or reversed ranges.
	///	</summary>
	static YearRange FromString(const std::string & strRange);

public:
	///	<summary>
	///		First year of the range.
	///	</summary>
	int GetBegin() const {
		return m_iBegin;
	}

	///	<summary>
	///		Last year of the range.
	///	</summary>
	int GetEnd() const {
		return m_iEnd;
	}

	///	<summary>
	///		Number of years in the range.
	///	</summary>
	int GetYearCount() const {
		if (m_iEnd < m_iBegin) {
			return 0;
		}
		return (m_iEnd - m_iBegin + 1);
	}

	///	<summary>
	///		Check if the given year lies in the range.
	///	</summary>
	bool Contains(int iYear) const {
		return ((iYear >= m_iBegin) && (iYear <= m_iEnd));
	}

	///	<summary>
	///		Check if the given range lies entirely in this range.
	///	</summary>
	bool Contains(const YearRange & range) const {
		return (Contains(range.m_iBegin) && Contains(range.m_iEnd));
	}

	///	<summary>
	///		Format as "1980-2014".
	///	</summary>
	std::string ToString() const;

	///	<summary>
	///		Equality.
	///	</summary>
	bool operator==(const YearRange & range) const {
		return ((m_iBegin == range.m_iBegin) && (m_iEnd == range.m_iEnd));
	}

private:
	///	<summary>
	///		First year.
	///	</summary>
	int m_iBegin;

	///	<summary>
	///		Last year.
	///	</summary>
	int m_iEnd;
};

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		A labeled analysis window, such as the historical period or one of
///		the future windows.
///	</summary>
struct AnalysisPeriod {

	///	<summary>
	///		Constructor.
	///	</summary>
	AnalysisPeriod() { }

	///	<summary>
	///		Constructor.
	///	</summary>
	AnalysisPeriod(
		const std::string & strLabel,
		const YearRange & range
	) :
		m_strLabel(strLabel),
		m_range(range)
	{ }

	///	<summary>
	///		Label of the period ("historical", "near", "far", ...).
	///	</summary>
	std::string m_strLabel;

	///	<summary>
	///		Years covered by the period.
	///	</summary>
	YearRange m_range;
};

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Kinds of derived artifacts.
///	</summary>
enum ArtifactProduct {
	ArtifactProduct_Threshold,
	ArtifactProduct_AnnualExceedance,
	ArtifactProduct_MonthlyExceedance,
	ArtifactProduct_OceanIndex
};

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Typed identifier of a derived artifact.  File names are generated
///		from the key and never parsed back.
///	</summary>
class ArtifactKey {

public:
	///	<summary>
	///		Constructor for percentile-based products.
	///	</summary>
	ArtifactKey(
		const std::string & strMember,
		ClimateVariable eVariable,
		ArtifactProduct eProduct,
		const AnalysisPeriod & period,
		double dPercentile
	) :
		m_strMember(strMember),
		m_eVariable(eVariable),
		m_eProduct(eProduct),
		m_period(period),
		m_dPercentile(dPercentile)
	{ }

	///	<summary>
	///		Constructor for products without a percentile level.
	///	</summary>
	ArtifactKey(
		const std::string & strMember,
		ClimateVariable eVariable,
		ArtifactProduct eProduct,
		const AnalysisPeriod & period
	) :
		m_strMember(strMember),
		m_eVariable(eVariable),
		m_eProduct(eProduct),
		m_period(period),
		m_dPercentile(-1.0)
	{ }

public:
	///	<summary>
	///		Check if this key carries a percentile level.
	///	</summary>
	bool HasPercentile() const {
		return (m_dPercentile >= 0.0);
	}

	///	<summary>
	///		Format the percentile level as it appears in names ("p99.9").
	///	</summary>
	std::string GetPercentileLabel() const;

	///	<summary>
	///		Generate the base name of this artifact (without extension).
	///	</summary>
	std::string GetBaseName() const;

	///	<summary>
	///		Generate the file name of this artifact with the given extension.
	///	</summary>
	std::string GetFilename(const std::string & strExtension) const {
		return GetBaseName() + "." + strExtension;
	}

public:
	///	<summary>
	///		Ensemble member identifier.
	///	</summary>
	std::string m_strMember;

	///	<summary>
	///		Variable the artifact is derived from.
	///	</summary>
	ClimateVariable m_eVariable;

	///	<summary>
	///		Product kind.
	///	</summary>
	ArtifactProduct m_eProduct;

	///	<summary>
	///		Period the artifact covers (reference period for thresholds).
	///	</summary>
	AnalysisPeriod m_period;

	///	<summary>
	///		Percentile level, or negative if not applicable.
	///	</summary>
	double m_dPercentile;
};

///////////////////////////////////////////////////////////////////////////////

#endif
