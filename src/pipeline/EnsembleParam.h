///////////////////////////////////////////////////////////////////////////////
///
///	\file    EnsembleParam.h
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

#ifndef _ENSEMBLEPARAM_H_
#define _ENSEMBLEPARAM_H_

#include "DiagnosticTypes.h"
#include "OceanIndex.h"
#include "PercentileThreshold.h"

#include <string>
#include <vector>

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Expand a member list such as "1-40" or "1-3,r7" into member
///		identifiers ("r1", "r2", ...).
///	</summary>
void ParseMemberList(
	const std::string & strMembers,
	std::vector<std::string> & vecMembers
);

///	<summary>
///		Parse a list of numbers separated by ','.
///	</summary>
void ParseDoubleList(
	const std::string & strOption,
	const std::string & strList,
	std::vector<double> & vecValues
);

///////////////////////////////////////////////////////////////////////////////

class EnsembleDiagnosticsParam {

public:
	///	<summary>
	///		Constructor.
	///	</summary>
	EnsembleDiagnosticsParam() :
		strMembers("1-40"),
		strFutureScenario("ssp585"),
		strPrecipVar("pr"),
		strSSTVar("tos"),
		strHistoricalPeriod("1950-2014"),
		strReferencePeriod("1980-2014"),
		strFuturePeriods("2015-2050,2051-2100"),
		strPercentiles("99,99.9"),
		dMonthlyPercentile(99.0),
		strOniBox("190,240,-5,5"),
		strBaselinePeriod("1981-2010"),
		dSSTResolution(1.0),
		nBins(16),
		nIterations(8),
		fSkipExtremes(false),
		fSkipOceanIndex(false),
		iVerbosityLevel(0)
	{ }

	///	<summary>
	///		Parse the list-valued options and validate all options.  Throws
	///		a configuration error on the first invalid option.
	///	</summary>
	void Finalize();

public:
	// Input catalog
	std::string strInputCatalog;

	// Output directory
	std::string strOutputDir;

	// Member list
	std::string strMembers;

	// Scenario name of the future branch
	std::string strFutureScenario;

	// Precipitation variable name
	std::string strPrecipVar;

	// Sea surface temperature variable name
	std::string strSSTVar;

	// Historical exceedance period
	std::string strHistoricalPeriod;

	// Percentile reference period
	std::string strReferencePeriod;

	// Future periods (first is the near future)
	std::string strFuturePeriods;

	// Percentile levels
	std::string strPercentiles;

	// Percentile level of the monthly exceedance variant
	double dMonthlyPercentile;

	// Ocean index box
	std::string strOniBox;

	// Ocean index climatology baseline
	std::string strBaselinePeriod;

	// Resolution of the regridded SST (degrees)
	double dSSTResolution;

	// Number of percentile bins
	int nBins;

	// Number of percentile iterations
	int nIterations;

	// Skip the extreme statistics
	bool fSkipExtremes;

	// Skip the ocean index
	bool fSkipOceanIndex;

	// Verbosity level
	int iVerbosityLevel;

public:
	// Member identifiers
	std::vector<std::string> vecMembers;

	// Historical exceedance period
	AnalysisPeriod periodHistorical;

	// Reference period
	YearRange rangeReference;

	// Future periods
	std::vector<AnalysisPeriod> vecFuturePeriods;

	// Percentile levels
	std::vector<double> vecPercentiles;

	// Percentile estimator controls
	PercentileEstimatorOptions optsPercentile;

	// Ocean index region and baseline
	OceanIndexOptions optsOceanIndex;
};

///////////////////////////////////////////////////////////////////////////////

#endif
