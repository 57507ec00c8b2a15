///////////////////////////////////////////////////////////////////////////////
///
///	\file    test_member_pipeline.cpp
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

#include "SyntheticGrids.h"

#include "ArtifactExport.h"
#include "EnsembleParam.h"
#include "InputCatalog.h"
#include "MemberPipeline.h"
#include "TimeSeriesIngest.h"

#include "netcdfcpp.h"

#include <sys/stat.h>

#include <cerrno>
#include <cmath>
#include <cstdio>
#include <fstream>
#include <vector>

namespace
{

const char * const TestName = "member_pipeline";

const char * const OutputDir = "climdiag_test_member_out";

///	<summary>
///		Artifact writer that keeps everything it is given.
///	</summary>
class RecordingArtifactWriter : public ArtifactWriter {

public:
	virtual void WriteThresholdField(
		const PercentileThresholdField & field
	) {
		m_vecThresholds.push_back(field);
	}

	virtual void WriteExceedanceSeries(
		const ExceedanceSeries & series
	) {
		m_vecSeries.push_back(series);
	}

	virtual void WriteClimateIndexSeries(
		const ClimateIndexSeries & series
	) {
		m_vecIndexSeries.push_back(series);
	}

public:
	std::vector<PercentileThresholdField> m_vecThresholds;

	std::vector<ExceedanceSeries> m_vecSeries;

	std::vector<ClimateIndexSeries> m_vecIndexSeries;
};

///	<summary>
///		Daily precipitation flux over 2 x 3 cells.  Every cell varies
///		between 1e-8 and 1e-5 kg m-2 s-1, shifted by dOffset.
///	</summary>
void make_precip_grid(
	int iFirstYear,
	int nYears,
	double dOffset,
	TimeSeriesGrid & grid
) {
	NcTimeDimension vecTime;
	make_daily_axis(iFirstYear, nYears, vecTime);

	DataArray1D<double> dLat;
	DataArray1D<double> dLon;
	make_axis(-1.0, 2.0, 2, dLat);
	make_axis(0.0, 10.0, 3, dLon);

	grid.Initialize("pr", "kg m-2 s-1", vecTime, dLat, dLon);

	for (size_t t = 0; t < grid.GetTimeCount(); t++) {
		for (size_t j = 0; j < 2; j++) {
		for (size_t i = 0; i < 3; i++) {
			long c = static_cast<long>(3 * j + i);
			long r = (static_cast<long>(t) * 7919L + c * 101L) % 1000L;
			grid.m_data(t,j,i) =
				static_cast<float>(static_cast<double>(r + 1) * 1.0e-8 + dOffset);
		}
		}
	}
}

///	<summary>
///		Monthly sea surface temperature in K on a 5 x 10 degree band around
///		the equator: a weak trend plus a seasonal cycle, uniform in space.
///	</summary>
void make_sst_grid(
	int iFirstYear,
	int nMonths,
	int iMonthOffset,
	TimeSeriesGrid & grid
) {
	NcTimeDimension vecTime;
	make_monthly_axis(iFirstYear, 1, nMonths, vecTime);

	DataArray1D<double> dLat;
	DataArray1D<double> dLon;
	make_axis(-15.0, 5.0, 7, dLat);
	make_axis(0.0, 10.0, 36, dLon);

	grid.Initialize("tos", "K", vecTime, dLat, dLon);

	for (size_t t = 0; t < grid.GetTimeCount(); t++) {
		double dMonth = static_cast<double>(t) + static_cast<double>(iMonthOffset);
		double dValue =
			300.0 + 0.002 * dMonth
			+ 1.5 * cos(2.0 * M_PI * static_cast<double>(t % 12) / 12.0);
		for (size_t j = 0; j < grid.GetLatCount(); j++) {
		for (size_t i = 0; i < grid.GetLonCount(); i++) {
			grid.m_data(t,j,i) = static_cast<float>(dValue);
		}
		}
	}
}

///	<summary>
///		Read all lines of a text file.
///	</summary>
void read_lines(
	const std::string & strFile,
	std::vector<std::string> & vecLines
) {
	vecLines.clear();
	std::ifstream ifFile(strFile.c_str());
	std::string strLine;
	while (std::getline(ifFile, strLine)) {
		vecLines.push_back(strLine);
	}
}

bool file_exists(const std::string & strFile)
{
	std::ifstream ifFile(strFile.c_str());
	return ifFile.is_open();
}

///	<summary>
///		Input files of member r1 and a catalog listing them.
///	</summary>
void write_member_inputs(
	const std::string & strCatalog,
	std::vector<std::string> & vecFiles
) {
	vecFiles.clear();

	TimeSeriesGrid grid;

	// Historical precipitation split over two files
	make_precip_grid(2001, 5, 0.0, grid);
	vecFiles.push_back("climdiag_test_pr_hist_2001-2005.nc");
	WriteTimeSeriesGrid(vecFiles.back(), grid);

	make_precip_grid(2006, 5, 0.0, grid);
	vecFiles.push_back("climdiag_test_pr_hist_2006-2010.nc");
	WriteTimeSeriesGrid(vecFiles.back(), grid);

	// Future precipitation above every historical value
	make_precip_grid(2011, 10, 1.0e-3, grid);
	vecFiles.push_back("climdiag_test_pr_ssp585_2011-2020.nc");
	WriteTimeSeriesGrid(vecFiles.back(), grid);

	// Sea surface temperature
	make_sst_grid(2001, 120, 0, grid);
	vecFiles.push_back("climdiag_test_tos_hist_2001-2010.nc");
	WriteTimeSeriesGrid(vecFiles.back(), grid);

	make_sst_grid(2011, 120, 120, grid);
	vecFiles.push_back("climdiag_test_tos_ssp585_2011-2020.nc");
	WriteTimeSeriesGrid(vecFiles.back(), grid);

	std::ofstream ofCatalog(strCatalog.c_str());
	ofCatalog << "# member variable scenario path\n";
	ofCatalog << "r1 pr historical " << vecFiles[0] << "\n";
	ofCatalog << "r1 pr historical " << vecFiles[1] << "\n";
	ofCatalog << "r1 pr ssp585 " << vecFiles[2] << "\n";
	ofCatalog << "r1 tos ssp585 " << vecFiles[4] << "\n";
	ofCatalog << "r1 tos historical " << vecFiles[3] << "\n";
}

///	<summary>
///		Run configuration scaled down to the synthetic inputs.
///	</summary>
void make_param(
	const std::string & strCatalog,
	EnsembleDiagnosticsParam & param
) {
	param.strInputCatalog = strCatalog;
	param.strOutputDir = ".";
	param.strMembers = "1";
	param.strHistoricalPeriod = "2001-2010";
	param.strReferencePeriod = "2003-2010";
	param.strFuturePeriods = "2011-2015,2016-2020";
	param.strBaselinePeriod = "2003-2010";
	param.dSSTResolution = 10.0;
	param.Finalize();
}

int test_member_artifacts(
	const EnsembleDiagnosticsParam & param,
	const InputCatalog & catalog
) {
	int failures = 0;

	RecordingArtifactWriter writer;
	MemberPipeline pipeline(param, catalog, writer);

	PipelineStage eStage = PipelineStage_Ingest;
	pipeline.Run("r1", eStage);

	failures += expect_true(TestName, eStage == PipelineStage_Export,
		"a completed member must end in the export stage");

	// Thresholds
	failures += expect_true(TestName,
		(writer.m_vecThresholds.size() == 2) &&
		nearly_equal(writer.m_vecThresholds[0].m_dPercentile, 99.0) &&
		nearly_equal(writer.m_vecThresholds[1].m_dPercentile, 99.9),
		"one threshold must be persisted per percentile level");
	failures += expect_true(TestName,
		(writer.m_vecThresholds.size() == 2) &&
		(writer.m_vecThresholds[0].m_strUnits == "mm day-1") &&
		(writer.m_vecThresholds[0].m_rangeReference == YearRange(2003, 2010)),
		"thresholds must be computed from converted reference data");

	// Exceedance series by kind
	int nHistorical = 0;
	int nFutureAnnual = 0;
	int nMonthly = 0;
	bool fHistoricalComplete = true;
	bool fFutureSaturated = true;
	bool fReferenceShared = true;
	const ExceedanceSeries * pMonthly = NULL;

	for (size_t s = 0; s < writer.m_vecSeries.size(); s++) {
		const ExceedanceSeries & series = writer.m_vecSeries[s];

		if (!(series.m_rangeReference == YearRange(2003, 2010))) {
			fReferenceShared = false;
		}

		if (series.m_eGranularity == ExceedanceGranularity_Monthly) {
			nMonthly++;
			pMonthly = &series;
			continue;
		}

		if (series.m_period.m_strLabel == "historical") {
			nHistorical++;
			if (series.m_vecEntries.size() != 10) {
				fHistoricalComplete = false;
			}
			continue;
		}

		nFutureAnnual++;
		if (series.m_vecEntries.size() != 5) {
			fFutureSaturated = false;
		}
		for (size_t e = 0; e < series.m_vecEntries.size(); e++) {
			if (!nearly_equal(series.m_vecEntries[e].m_dFrequency, 1.0, 1.0e-9) ||
			    !nearly_equal(series.m_vecEntries[e].m_dDays, 365.0, 1.0e-6)
			) {
				fFutureSaturated = false;
			}
		}
	}

	failures += expect_true(TestName, nHistorical == 2,
		"one historical series must be derived per percentile level");
	failures += expect_true(TestName, fHistoricalComplete,
		"historical series must cover every historical year");
	failures += expect_true(TestName, nFutureAnnual == 4,
		"one annual series must be derived per level and future period");
	failures += expect_true(TestName, fFutureSaturated,
		"future values above every historical value must always exceed"
		" the historical threshold");
	failures += expect_true(TestName, fReferenceShared,
		"every series must derive from the reference threshold");

	failures += expect_true(TestName, nMonthly == 1,
		"exactly one monthly series must be derived");
	failures += expect_true(TestName,
		(pMonthly != NULL) &&
		(pMonthly->m_period.m_strLabel == "future1") &&
		nearly_equal(pMonthly->m_dPercentile, 99.0) &&
		(pMonthly->m_vecEntries.size() == 60),
		"the monthly series must cover the near future at the monthly level");

	// Ocean index
	failures += expect_true(TestName, writer.m_vecIndexSeries.size() == 1,
		"one ocean index series must be persisted");

	if (writer.m_vecIndexSeries.size() == 1) {
		const ClimateIndexSeries & series = writer.m_vecIndexSeries[0];

		failures += expect_true(TestName,
			(series.m_vecIndex.size() == 240) &&
			(series.m_vecTime[0].GetYear() == 2001) &&
			(series.m_vecTime[239].GetYear() == 2020),
			"the index must span the joined historical and future series");
		failures += expect_true(TestName, series.m_strUnits == "degC",
			"the index must be computed in degrees Celsius");
		failures += expect_true(TestName,
			series.GetKey().GetBaseName() == "r1_tos_oni_all_2001-2020",
			"the index must be named by member and full period");

		double dMaxAbs = 0.0;
		for (size_t t = 0; t < series.m_vecIndex.size(); t++) {
			if (fabs(series.m_vecIndex[t]) > dMaxAbs) {
				dMaxAbs = fabs(series.m_vecIndex[t]);
			}
		}
		failures += expect_true(TestName, dMaxAbs < 0.05,
			"a trend plus seasonal cycle must leave no anomaly");
	}

	return failures;
}

int test_member_files(
	const EnsembleDiagnosticsParam & param,
	const InputCatalog & catalog
) {
	int failures = 0;

	if ((mkdir(OutputDir, 0755) != 0) && (errno != EEXIST)) {
		return expect_true(TestName, false,
			std::string("unable to create directory ") + OutputDir);
	}

	RecordingArtifactWriter writerKeys;
	{
		MemberPipeline pipeline(param, catalog, writerKeys);
		PipelineStage eStage = PipelineStage_Ingest;
		pipeline.Run("r1", eStage);
	}

	FileArtifactWriter writer(OutputDir);
	{
		MemberPipeline pipeline(param, catalog, writer);
		PipelineStage eStage = PipelineStage_Ingest;
		pipeline.Run("r1", eStage);
	}

	std::vector<std::string> vecLines;

	// Threshold fields
	for (size_t f = 0; f < writerKeys.m_vecThresholds.size(); f++) {
		std::string strFile =
			writer.GetPath(writerKeys.m_vecThresholds[f].GetKey(), "nc");
		failures += expect_true(TestName, file_exists(strFile),
			"threshold field " + strFile + " must be written");
		std::remove(strFile.c_str());
	}

	// Exceedance series
	for (size_t s = 0; s < writerKeys.m_vecSeries.size(); s++) {
		const ExceedanceSeries & series = writerKeys.m_vecSeries[s];
		std::string strNcFile = writer.GetPath(series.GetKey(), "nc");
		std::string strCSVFile = writer.GetPath(series.GetKey(), "csv");

		failures += expect_true(TestName, file_exists(strNcFile),
			"exceedance series " + strNcFile + " must be written");

		read_lines(strCSVFile, vecLines);
		failures += expect_true(TestName,
			vecLines.size() == series.m_vecEntries.size() + 1,
			"exceedance table " + strCSVFile + " must hold one row per entry");

		if (series.m_eGranularity == ExceedanceGranularity_Monthly) {
			failures += expect_true(TestName,
				(vecLines.size() > 1) &&
				(vecLines[0] == "year,month,frequency,days") &&
				(vecLines[1].find("2011,1,") == 0),
				"monthly tables must list year, month, frequency and days");
		} else {
			failures += expect_true(TestName,
				(vecLines.size() > 0) &&
				(vecLines[0] == "year,frequency,days"),
				"annual tables must list year, frequency and days");
		}

		std::remove(strNcFile.c_str());
		std::remove(strCSVFile.c_str());
	}

	// Ocean index
	for (size_t s = 0; s < writerKeys.m_vecIndexSeries.size(); s++) {
		const ClimateIndexSeries & series = writerKeys.m_vecIndexSeries[s];
		std::string strNcFile = writer.GetPath(series.GetKey(), "nc");
		std::string strCSVFile = writer.GetPath(series.GetKey(), "csv");

		failures += expect_true(TestName, file_exists(strNcFile),
			"index series " + strNcFile + " must be written");

		read_lines(strCSVFile, vecLines);
		failures += expect_true(TestName,
			(vecLines.size() == 241) &&
			(vecLines[0] == "date,year,month,index") &&
			(vecLines[1].find("2001-01-15,2001,1,") == 0),
			"index tables must list date, year, month and index per month");

		std::remove(strNcFile.c_str());
		std::remove(strCSVFile.c_str());
	}

	std::remove(OutputDir);

	return failures;
}

}

///////////////////////////////////////////////////////////////////////////////

int main(int argc, char** argv) {

	// Turn off fatal errors in NetCDF
	NcError error(NcError::silent_nonfatal);

	int failures = 0;

	const std::string strCatalog = "climdiag_test_member_catalog.txt";
	std::vector<std::string> vecFiles;

	try {
		write_member_inputs(strCatalog, vecFiles);

		EnsembleDiagnosticsParam param;
		make_param(strCatalog, param);

		InputCatalog catalog;
		catalog.FromFile(strCatalog);

		failures += test_member_artifacts(param, catalog);
		failures += test_member_files(param, catalog);

	} catch(Exception & e) {
		std::cerr << "[" << TestName << "] unexpected exception: "
			<< e.ToString() << std::endl;
		failures++;
	}

	for (size_t f = 0; f < vecFiles.size(); f++) {
		std::remove(vecFiles[f].c_str());
	}
	std::remove(strCatalog.c_str());

	return report(TestName, failures);
}

///////////////////////////////////////////////////////////////////////////////
