///////////////////////////////////////////////////////////////////////////////
///
///	\file    EnsembleDiagnostics.cpp
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

#include "Announce.h"
#include "ArtifactExport.h"
#include "CommandLine.h"
#include "EnsembleParam.h"
#include "EnsembleRunner.h"
#include "Exception.h"
#include "InputCatalog.h"
#include "MemberPipeline.h"

#include "netcdfcpp.h"

#if defined(CLIMDIAG_MPIOMP)
#include <mpi.h>
#endif

///////////////////////////////////////////////////////////////////////////////

int main(int argc, char** argv) {

#if defined(CLIMDIAG_MPIOMP)
	// Initialize MPI
	MPI_Init(&argc, &argv);
#endif

	// Turn off fatal errors in NetCDF
	NcError error(NcError::silent_nonfatal);

	// Enable output only on rank zero
	AnnounceOnlyOutputOnRankZero();

	// Exit status
	int iStatus = 0;

try {
	// Parameters
	EnsembleDiagnosticsParam param;

	// Parse the command line
	BeginCommandLine()
		CommandLineString(param.strInputCatalog, "in_catalog", "");
		CommandLineString(param.strOutputDir, "out_dir", "");
		CommandLineStringD(param.strMembers, "members", "1-40", "[first-last,name,...]");
		CommandLineString(param.strFutureScenario, "future_scenario", "ssp585");
		CommandLineString(param.strPrecipVar, "prvar", "pr");
		CommandLineString(param.strSSTVar, "sstvar", "tos");
		CommandLineStringD(param.strHistoricalPeriod, "historical_period", "1950-2014", "[yyyy-yyyy]");
		CommandLineStringD(param.strReferencePeriod, "reference_period", "1980-2014", "[yyyy-yyyy]");
		CommandLineStringD(param.strFuturePeriods, "future_periods", "2015-2050,2051-2100", "[yyyy-yyyy,...]");
		CommandLineStringD(param.strPercentiles, "percentiles", "99,99.9", "[p,...]");
		CommandLineDouble(param.dMonthlyPercentile, "monthly_percentile", 99.0);
		CommandLineStringD(param.strOniBox, "oni_box", "190,240,-5,5", "[lon0,lon1,lat0,lat1] (degrees)");
		CommandLineStringD(param.strBaselinePeriod, "baseline_period", "1981-2010", "[yyyy-yyyy]");
		CommandLineDoubleD(param.dSSTResolution, "sst_resolution", 1.0, "(degrees)");
		CommandLineInt(param.nBins, "bins", 16);
		CommandLineInt(param.nIterations, "iter", 8);
		CommandLineBool(param.fSkipExtremes, "skip_extremes");
		CommandLineBool(param.fSkipOceanIndex, "skip_oni");
		CommandLineInt(param.iVerbosityLevel, "verbosity", 0);

		ParseCommandLine(argc, argv);
	EndCommandLine(argv)

	AnnounceBanner();

	// Set verbosity level
	AnnounceSetVerbosityLevel(param.iVerbosityLevel);

	Announce(1, "%s", GetCommandLineAsString(argc, argv).c_str());

	// Validate parameters
	param.Finalize();

	// Load the input catalog
	AnnounceStartBlock("Loading input catalog");
	InputCatalog catalog;
	catalog.FromFile(param.strInputCatalog);
	Announce("%lu files", catalog.GetEntryCount());
	AnnounceEndBlock("Done");

	// Run all members
	AnnounceStartBlock("Processing %lu members", param.vecMembers.size());

	FileArtifactWriter writer(param.strOutputDir);

	MemberPipeline pipeline(param, catalog, writer);

	EnsembleSummary summary;
	RunEnsemble(param.vecMembers, pipeline, param.strOutputDir, summary);

	AnnounceEndBlock("Done");

	// Report
	summary.Report();

	int nRank = 0;
#if defined(CLIMDIAG_MPIOMP)
	MPI_Comm_rank(MPI_COMM_WORLD, &nRank);
#endif
	if (nRank == 0) {
		summary.WriteReport(param.strOutputDir + "/ensemble_summary.csv");
	}

	if (summary.GetFailureCount() != 0) {
		iStatus = 1;
	}

	AnnounceBanner();

} catch(Exception & e) {
	Announce(e.ToString().c_str());
	iStatus = 2;
}

#if defined(CLIMDIAG_MPIOMP)
	// Deinitialize MPI
	MPI_Finalize();
#endif

	return iStatus;
}

///////////////////////////////////////////////////////////////////////////////
