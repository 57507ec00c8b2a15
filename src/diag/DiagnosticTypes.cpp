///////////////////////////////////////////////////////////////////////////////
///
///	\file    DiagnosticTypes.cpp
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

#include "DiagnosticTypes.h"
#include "PipelineError.h"
#include "STLStringHelper.h"

#include <cstdio>
#include <cstdlib>

///////////////////////////////////////////////////////////////////////////////

const char * ClimateVariableShortName(ClimateVariable eVariable) {
	switch (eVariable) {
		case ClimateVariable_Precipitation:
			return "pr";
		case ClimateVariable_SeaSurfaceTemperature:
			return "tos";
	}
	_EXCEPTIONT("Invalid ClimateVariable");
}

///////////////////////////////////////////////////////////////////////////////

const char * PipelineStageName(PipelineStage eStage) {
	switch (eStage) {
		case PipelineStage_Ingest:
			return "ingest";
		case PipelineStage_Reference:
			return "reference";
		case PipelineStage_Exceedance:
			return "exceedance";
		case PipelineStage_OceanIndex:
			return "ocean_index";
		case PipelineStage_Export:
			return "export";
	}
	return "unknown";
}

///////////////////////////////////////////////////////////////////////////////

YearRange YearRange::FromString(const std::string & strRange) {
	std::string strTrimmed = strRange;
	STLStringHelper::RemoveWhitespaceInPlace(strTrimmed);

	size_t sDash = strTrimmed.find('-');
	if ((sDash == std::string::npos) || (sDash == 0)) {
		_PIPELINEERROR1(PipelineErrorKind_Configuration,
			"Malformed year range \"%s\" (expected \"begin-end\")",
			strRange.c_str());
	}

	std::string strBegin = strTrimmed.substr(0, sDash);
	std::string strEnd = strTrimmed.substr(sDash+1);
	STLStringHelper::RemoveWhitespaceInPlace(strBegin);
	STLStringHelper::RemoveWhitespaceInPlace(strEnd);

	if (!STLStringHelper::IsIntegerIndex(strBegin) ||
	    !STLStringHelper::IsIntegerIndex(strEnd)
	) {
		_PIPELINEERROR1(PipelineErrorKind_Configuration,
			"Malformed year range \"%s\" (expected \"begin-end\")",
			strRange.c_str());
	}

	YearRange range(atoi(strBegin.c_str()), atoi(strEnd.c_str()));
	if (range.GetEnd() < range.GetBegin()) {
		_PIPELINEERROR1(PipelineErrorKind_Configuration,
			"Year range \"%s\" ends before it begins",
			strRange.c_str());
	}
	return range;
}

///////////////////////////////////////////////////////////////////////////////

std::string YearRange::ToString() const {
	char szBuffer[32];
	snprintf(szBuffer, 32, "%i-%i", m_iBegin, m_iEnd);
	return std::string(szBuffer);
}

///////////////////////////////////////////////////////////////////////////////

std::string ArtifactKey::GetPercentileLabel() const {
	if (!HasPercentile()) {
		return std::string("");
	}
	char szBuffer[32];
	snprintf(szBuffer, 32, "p%g", m_dPercentile);
	return std::string(szBuffer);
}

///////////////////////////////////////////////////////////////////////////////

std::string ArtifactKey::GetBaseName() const {
	std::string strName = m_strMember;
	strName += "_";
	strName += ClimateVariableShortName(m_eVariable);

	switch (m_eProduct) {
		case ArtifactProduct_Threshold:
			strName += "_threshold";
			break;
		case ArtifactProduct_AnnualExceedance:
			strName += "_exceedance_annual";
			break;
		case ArtifactProduct_MonthlyExceedance:
			strName += "_exceedance_monthly";
			break;
		case ArtifactProduct_OceanIndex:
			strName += "_oni";
			break;
	}

	if (HasPercentile()) {
		strName += "_" + GetPercentileLabel();
	}

	strName += "_" + m_period.m_strLabel;
	strName += "_" + m_period.m_range.ToString();

	return strName;
}

///////////////////////////////////////////////////////////////////////////////
