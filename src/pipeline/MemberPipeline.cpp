///////////////////////////////////////////////////////////////////////////////
///
///	\file    MemberPipeline.cpp
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

#include "MemberPipeline.h"
#include "Announce.h"
#include "ExtremeStatisticsEngine.h"
#include "OceanIndex.h"
#include "Regrid.h"
#include "TimeSeriesIngest.h"

#include <vector>

///////////////////////////////////////////////////////////////////////////////

void MemberPipeline::Run(
	const std::string & strMember,
	PipelineStage & eStage
) {
	if (!m_param.fSkipExtremes) {
		RunExtremes(strMember, eStage);
	}
	if (!m_param.fSkipOceanIndex) {
		RunOceanIndex(strMember, eStage);
	}
}

///////////////////////////////////////////////////////////////////////////////

void MemberPipeline::RunExtremes(
	const std::string & strMember,
	PipelineStage & eStage
) {
	AnnounceStartBlock("Extreme precipitation statistics");

	// Historical precipitation
	eStage = PipelineStage_Ingest;

	std::vector<std::string> vecFiles;
	m_catalog.GetFiles(strMember, m_param.strPrecipVar, "historical", vecFiles);

	TimeSeriesGrid gridPrecip;
	AnnounceStartBlock("Loading historical \"%s\" (%lu files)",
		m_param.strPrecipVar.c_str(), vecFiles.size());
	LoadConcatenatedTimeSeries(vecFiles, m_param.strPrecipVar, gridPrecip);
	ConvertPrecipitationUnits(gridPrecip);
	AnnounceEndBlock("Done");

	// One engine per percentile level; each threshold is persisted before
	// any exceedance series is derived from it
	std::vector<ExtremeStatisticsEngine> vecEngines;
	vecEngines.reserve(m_param.vecPercentiles.size());

	for (size_t p = 0; p < m_param.vecPercentiles.size(); p++) {
		vecEngines.push_back(
			ExtremeStatisticsEngine(
				strMember,
				m_param.vecPercentiles[p],
				m_param.rangeReference,
				m_writer,
				m_param.optsPercentile));

		eStage = PipelineStage_Reference;
		vecEngines[p].ComputeReference(gridPrecip);

		eStage = PipelineStage_Exceedance;
		ExceedanceSeries series;
		vecEngines[p].ComputeExceedance(
			gridPrecip,
			m_param.periodHistorical,
			ExceedanceGranularity_Annual,
			series);
	}

	gridPrecip.Deallocate();

	// Future precipitation
	eStage = PipelineStage_Ingest;

	m_catalog.GetFiles(strMember, m_param.strPrecipVar, m_param.strFutureScenario, vecFiles);

	AnnounceStartBlock("Loading %s \"%s\" (%lu files)",
		m_param.strFutureScenario.c_str(),
		m_param.strPrecipVar.c_str(),
		vecFiles.size());
	LoadConcatenatedTimeSeries(vecFiles, m_param.strPrecipVar, gridPrecip);
	ConvertPrecipitationUnits(gridPrecip);
	AnnounceEndBlock("Done");

	eStage = PipelineStage_Exceedance;

	for (size_t p = 0; p < vecEngines.size(); p++) {
		for (size_t f = 0; f < m_param.vecFuturePeriods.size(); f++) {
			ExceedanceSeries series;
			vecEngines[p].ComputeExceedance(
				gridPrecip,
				m_param.vecFuturePeriods[f],
				ExceedanceGranularity_Annual,
				series);

			// Monthly variant for the near future only
			if ((f == 0) &&
			    (vecEngines[p].GetPercentile() == m_param.dMonthlyPercentile)
			) {
				ExceedanceSeries seriesMonthly;
				vecEngines[p].ComputeExceedance(
					gridPrecip,
					m_param.vecFuturePeriods[f],
					ExceedanceGranularity_Monthly,
					seriesMonthly);
			}
		}
	}

	AnnounceEndBlock("Done");
}

///////////////////////////////////////////////////////////////////////////////

void MemberPipeline::RunOceanIndex(
	const std::string & strMember,
	PipelineStage & eStage
) {
	AnnounceStartBlock("Ocean index");

	// Historical and future SST form one continuous series
	eStage = PipelineStage_Ingest;

	std::vector<std::string> vecFiles;
	std::vector<std::string> vecFutureFiles;
	m_catalog.GetFiles(strMember, m_param.strSSTVar, "historical", vecFiles);
	m_catalog.GetFiles(strMember, m_param.strSSTVar, m_param.strFutureScenario, vecFutureFiles);
	vecFiles.insert(vecFiles.end(), vecFutureFiles.begin(), vecFutureFiles.end());

	TimeSeriesGrid gridRegridded;
	{
		AnnounceStartBlock("Loading \"%s\" (%lu files)",
			m_param.strSSTVar.c_str(), vecFiles.size());

		TimeSeriesGrid gridSST;
		LoadConcatenatedTimeSeries(vecFiles, m_param.strSSTVar, gridSST);
		ConvertTemperatureUnits(gridSST);
		RegridBilinear(gridSST, m_param.dSSTResolution, gridRegridded);

		AnnounceEndBlock("Done");
	}

	eStage = PipelineStage_OceanIndex;

	ClimateIndexSeries series;
	ComputeOceanIndex(strMember, gridRegridded, m_param.optsOceanIndex, series);
	gridRegridded.Deallocate();

	eStage = PipelineStage_Export;
	m_writer.WriteClimateIndexSeries(series);

	AnnounceEndBlock("Done");
}

///////////////////////////////////////////////////////////////////////////////
