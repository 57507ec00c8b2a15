///////////////////////////////////////////////////////////////////////////////
///
///	\file    test_ensemble_runner.cpp
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

#include "Announce.h"
#include "DiagnosticTypes.h"
#include "EnsembleParam.h"
#include "EnsembleRunner.h"
#include "InputCatalog.h"
#include "PipelineError.h"

#if defined(CLIMDIAG_MPIOMP)
#include <mpi.h>
#endif

#include <cstdio>
#include <fstream>
#include <stdexcept>
#include <vector>

namespace
{

const char * const TestName = "ensemble_runner";

///	<summary>
///		Task whose outcome depends on the member name.
///	</summary>
class ScriptedMemberTask : public MemberTask {

public:
	virtual void Run(
		const std::string & strMember,
		PipelineStage & eStage
	) {
		m_vecVisited.push_back(strMember);

		AnnounceStartBlock("Processing %s", strMember.c_str());

		eStage = PipelineStage_Ingest;
		if (strMember == "r2") {
			_PIPELINEERRORT(PipelineErrorKind_Discontinuity,
				"Time series has a gap");
		}

		eStage = PipelineStage_Exceedance;
		if (strMember == "r3") {
			_EXCEPTIONT("Unexpected failure");
		}

		eStage = PipelineStage_OceanIndex;
		if (strMember == "r4") {
			throw std::runtime_error("out of range");
		}

		eStage = PipelineStage_Export;

		AnnounceEndBlock("Done");
	}

public:
	std::vector<std::string> m_vecVisited;
};

///	<summary>
///		Write a text file.
///	</summary>
void write_text_file(
	const std::string & strFile,
	const std::string & strContent
) {
	std::ofstream ofFile(strFile.c_str());
	ofFile << strContent;
}

int test_failures_do_not_stop_other_members()
{
	int failures = 0;

	std::vector<std::string> vecMembers;
	vecMembers.push_back("r1");
	vecMembers.push_back("r2");
	vecMembers.push_back("r3");
	vecMembers.push_back("r4");
	vecMembers.push_back("r5");

	ScriptedMemberTask task;
	EnsembleSummary summary;

	AnnounceStartBlock("Running ensemble");
	int iIndentationLevel = AnnounceGetIndentationLevel();
	RunEnsemble(vecMembers, task, "", summary);
	failures += expect_true(TestName,
		AnnounceGetIndentationLevel() == iIndentationLevel,
		"blocks left open by failed members must be closed");
	AnnounceEndBlock("Done");

	failures += expect_true(TestName, task.m_vecVisited.size() == 5,
		"every member must be run");
	failures += expect_true(TestName, summary.m_vecOutcomes.size() == 5,
		"the summary must hold every member");
	failures += expect_true(TestName, summary.GetFailureCount() == 3,
		"the summary must count the failed members");

	const MemberOutcome * pOutcome = summary.FindOutcome("r1");
	failures += expect_true(TestName,
		(pOutcome != NULL) && pOutcome->fSuccess,
		"a member without errors must succeed");

	pOutcome = summary.FindOutcome("r5");
	failures += expect_true(TestName,
		(pOutcome != NULL) && pOutcome->fSuccess,
		"a member after failed members must still succeed");

	pOutcome = summary.FindOutcome("r2");
	failures += expect_true(TestName,
		(pOutcome != NULL) &&
		!pOutcome->fSuccess &&
		(pOutcome->eStage == PipelineStage_Ingest) &&
		(pOutcome->strErrorKind == "DiscontinuityError"),
		"a pipeline error must be reported with its kind and stage");
	failures += expect_true(TestName,
		(pOutcome != NULL) &&
		(pOutcome->strMessage.find("Time series has a gap") != std::string::npos),
		"a failed member must carry its error message");

	pOutcome = summary.FindOutcome("r3");
	failures += expect_true(TestName,
		(pOutcome != NULL) &&
		!pOutcome->fSuccess &&
		(pOutcome->eStage == PipelineStage_Exceedance) &&
		(pOutcome->strErrorKind == "Exception"),
		"a generic exception must be reported with its stage");

	pOutcome = summary.FindOutcome("r4");
	failures += expect_true(TestName,
		(pOutcome != NULL) &&
		!pOutcome->fSuccess &&
		(pOutcome->eStage == PipelineStage_OceanIndex) &&
		(pOutcome->strErrorKind == "std::exception"),
		"a standard exception must be reported with its stage");

	failures += expect_true(TestName, summary.FindOutcome("r9") == NULL,
		"members outside the run must not be found");

	// Report file
	const std::string strReport = "climdiag_test_ensemble_summary.csv";
	summary.WriteReport(strReport);

	std::ifstream ifReport(strReport.c_str());
	std::vector<std::string> vecLines;
	std::string strLine;
	while (std::getline(ifReport, strLine)) {
		vecLines.push_back(strLine);
	}
	ifReport.close();
	std::remove(strReport.c_str());

	failures += expect_true(TestName,
		(vecLines.size() == 6) &&
		(vecLines[0] == "member,status,stage,error_kind") &&
		(vecLines[1] == "r1,success,,") &&
		(vecLines[2] == "r2,failure,ingest,DiscontinuityError"),
		"the report must list one row per member");

	return failures;
}

int test_member_logs()
{
	int failures = 0;

	std::vector<std::string> vecMembers;
	vecMembers.push_back("climdiag_test_rA");
	vecMembers.push_back("r2");

	ScriptedMemberTask task;
	EnsembleSummary summary;

	AnnounceStartBlock("Running ensemble with logs");
	int iIndentationLevel = AnnounceGetIndentationLevel();
	RunEnsemble(vecMembers, task, ".", summary);
	failures += expect_true(TestName,
		AnnounceGetIndentationLevel() == iIndentationLevel,
		"redirecting to member logs must keep the enclosing block open");
	AnnounceEndBlock("Done");

	const std::string strLog = "./climdiag_test_rA_log.txt";
	std::ifstream ifLog(strLog.c_str());
	failures += expect_true(TestName, ifLog.is_open(),
		"each member must write its own log");
	ifLog.close();
	std::remove(strLog.c_str());
	std::remove("./r2_log.txt");

	const MemberOutcome * pOutcome = summary.FindOutcome("climdiag_test_rA");
	failures += expect_true(TestName,
		(pOutcome != NULL) && pOutcome->fSuccess,
		"logging must not affect the member outcome");
	failures += expect_true(TestName, summary.GetFailureCount() == 1,
		"a failed member must be reported when logging to files");

	return failures;
}

int test_member_list()
{
	int failures = 0;

	std::vector<std::string> vecMembers;
	ParseMemberList("1-3,r7,abc", vecMembers);
	failures += expect_true(TestName,
		(vecMembers.size() == 5) &&
		(vecMembers[0] == "r1") &&
		(vecMembers[2] == "r3") &&
		(vecMembers[3] == "r7") &&
		(vecMembers[4] == "abc"),
		"member ranges must expand to r-prefixed identifiers");

	ParseMemberList("1-40", vecMembers);
	failures += expect_true(TestName,
		(vecMembers.size() == 40) && (vecMembers[39] == "r40"),
		"the default member range must give 40 members");

	const char * szBadLists[4] = { "1-3,2", "5-2", "1,,2", "" };
	for (int l = 0; l < 4; l++) {
		int iKind = -1;
		try {
			ParseMemberList(szBadLists[l], vecMembers);
		} catch(PipelineError & e) {
			iKind = e.GetKind();
		}
		failures += expect_true(TestName, iKind == PipelineErrorKind_Configuration,
			std::string("member list \"") + szBadLists[l]
				+ "\" must raise a configuration error");
	}

	return failures;
}

int test_year_range_and_artifact_keys()
{
	int failures = 0;

	YearRange range = YearRange::FromString(" 1980-2014 ");
	failures += expect_true(TestName,
		(range.GetBegin() == 1980) &&
		(range.GetEnd() == 2014) &&
		(range.GetYearCount() == 35),
		"year ranges must parse both ends inclusively");
	failures += expect_true(TestName,
		range.Contains(YearRange(1990, 2000)) && !range.Contains(YearRange(1970, 2000)),
		"range containment must require both ends inside");

	const char * szBadRanges[4] = { "2014-1980", "1980", "1980-", "a-b" };
	for (int r = 0; r < 4; r++) {
		int iKind = -1;
		try {
			YearRange::FromString(szBadRanges[r]);
		} catch(PipelineError & e) {
			iKind = e.GetKind();
		}
		failures += expect_true(TestName, iKind == PipelineErrorKind_Configuration,
			std::string("year range \"") + szBadRanges[r]
				+ "\" must raise a configuration error");
	}

	ArtifactKey keyThreshold(
		"r12",
		ClimateVariable_Precipitation,
		ArtifactProduct_Threshold,
		AnalysisPeriod("ref", YearRange(1980, 2014)),
		99.9);
	failures += expect_true(TestName,
		keyThreshold.GetFilename("nc") == "r12_pr_threshold_p99.9_ref_1980-2014.nc",
		"threshold artifacts must be named by member, level and period");

	ArtifactKey keyAnnual(
		"r12",
		ClimateVariable_Precipitation,
		ArtifactProduct_AnnualExceedance,
		AnalysisPeriod("future1", YearRange(2015, 2050)),
		99.0);
	failures += expect_true(TestName,
		keyAnnual.GetFilename("csv") == "r12_pr_exceedance_annual_p99_future1_2015-2050.csv",
		"exceedance artifacts must be named by member, level and period");

	ArtifactKey keyIndex(
		"r12",
		ClimateVariable_SeaSurfaceTemperature,
		ArtifactProduct_OceanIndex,
		AnalysisPeriod("all", YearRange(1950, 2100)));
	failures += expect_true(TestName,
		!keyIndex.HasPercentile() &&
		(keyIndex.GetFilename("nc") == "r12_tos_oni_all_1950-2100.nc"),
		"index artifacts must carry no percentile level");

	return failures;
}

int test_input_catalog()
{
	int failures = 0;

	const std::string strCatalog = "climdiag_test_catalog.txt";
	write_text_file(strCatalog,
		"# member variable scenario path\n"
		"r1 pr historical /data/pr_r1_hist_1.nc\n"
		"\n"
		"r1 pr historical /data/pr_r1_hist_2.nc\n"
		"r1 pr ssp585 /data/pr_r1_ssp585.nc\n"
		"r2 tos historical /data/tos_r2_hist.nc\n");

	InputCatalog catalog;
	catalog.FromFile(strCatalog);
	failures += expect_true(TestName, catalog.GetEntryCount() == 4,
		"comments and blank lines must be skipped");

	std::vector<std::string> vecFiles;
	catalog.GetFiles("r1", "pr", "historical", vecFiles);
	failures += expect_true(TestName,
		(vecFiles.size() == 2) && (vecFiles[1] == "/data/pr_r1_hist_2.nc"),
		"files must be returned in catalog order");

	int iKind = -1;
	try {
		catalog.GetFiles("r2", "pr", "historical", vecFiles);
	} catch(PipelineError & e) {
		iKind = e.GetKind();
	}
	failures += expect_true(TestName, iKind == PipelineErrorKind_Input,
		"a member without files must raise an input error");

	// Malformed entry
	write_text_file(strCatalog, "r1 pr historical\n");
	iKind = -1;
	try {
		InputCatalog catalogBad;
		catalogBad.FromFile(strCatalog);
	} catch(PipelineError & e) {
		iKind = e.GetKind();
	}
	failures += expect_true(TestName, iKind == PipelineErrorKind_Configuration,
		"a malformed catalog line must raise a configuration error");

	std::remove(strCatalog.c_str());

	iKind = -1;
	try {
		InputCatalog catalogMissing;
		catalogMissing.FromFile(strCatalog);
	} catch(PipelineError & e) {
		iKind = e.GetKind();
	}
	failures += expect_true(TestName, iKind == PipelineErrorKind_Configuration,
		"a missing catalog must raise a configuration error");

	return failures;
}

int test_parameter_validation()
{
	int failures = 0;

	const std::string strCatalog = "climdiag_test_param_catalog.txt";
	write_text_file(strCatalog, "r1 pr historical /data/pr.nc\n");

	// Defaults
	{
		EnsembleDiagnosticsParam param;
		param.strInputCatalog = strCatalog;
		param.strOutputDir = ".";
		param.Finalize();

		failures += expect_true(TestName, param.vecMembers.size() == 40,
			"the default run must cover 40 members");
		failures += expect_true(TestName,
			(param.vecFuturePeriods.size() == 2) &&
			(param.vecFuturePeriods[0].m_strLabel == "future1") &&
			(param.vecFuturePeriods[1].m_range == YearRange(2051, 2100)),
			"future periods must be parsed in order");
		failures += expect_true(TestName,
			(param.vecPercentiles.size() == 2) &&
			nearly_equal(param.vecPercentiles[1], 99.9),
			"percentile levels must be parsed");
		failures += expect_true(TestName,
			param.optsOceanIndex.m_rangeBaseline == YearRange(1981, 2010),
			"the default baseline must be 1981-2010");
	}

	// Invalid configurations
	for (int c = 0; c < 7; c++) {
		EnsembleDiagnosticsParam param;
		param.strInputCatalog = strCatalog;
		param.strOutputDir = ".";

		std::string strCase;
		switch (c) {
			case 0:
				param.strOutputDir = "climdiag_no_such_directory";
				strCase = "a missing output directory";
				break;
			case 1:
				param.strReferencePeriod = "1940-2014";
				strCase = "a reference period outside the historical period";
				break;
			case 2:
				param.strPercentiles = "99,99";
				strCase = "a repeated percentile level";
				break;
			case 3:
				param.dMonthlyPercentile = 95.0;
				strCase = "a monthly percentile that is not computed";
				break;
			case 4:
				param.strOniBox = "190,240,-5";
				strCase = "an incomplete ocean index box";
				break;
			case 5:
				param.dSSTResolution = 0.7;
				strCase = "a resolution that does not divide the sphere";
				break;
			case 6:
				param.fSkipExtremes = true;
				param.fSkipOceanIndex = true;
				strCase = "skipping every diagnostic";
				break;
		}

		int iKind = -1;
		try {
			param.Finalize();
		} catch(PipelineError & e) {
			iKind = e.GetKind();
		}
		failures += expect_true(TestName, iKind == PipelineErrorKind_Configuration,
			strCase + " must raise a configuration error");
	}

	std::remove(strCatalog.c_str());

	return failures;
}

}

///////////////////////////////////////////////////////////////////////////////

int main(int argc, char** argv) {

#if defined(CLIMDIAG_MPIOMP)
	MPI_Init(&argc, &argv);
#endif

	int failures = 0;

	try {
		failures += test_failures_do_not_stop_other_members();
		failures += test_member_logs();
		failures += test_member_list();
		failures += test_year_range_and_artifact_keys();
		failures += test_input_catalog();
		failures += test_parameter_validation();

	} catch(Exception & e) {
		std::cerr << "[" << TestName << "] unexpected exception: "
			<< e.ToString() << std::endl;
		failures++;
	}

#if defined(CLIMDIAG_MPIOMP)
	MPI_Finalize();
#endif

	return report(TestName, failures);
}

///////////////////////////////////////////////////////////////////////////////
