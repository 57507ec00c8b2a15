///////////////////////////////////////////////////////////////////////////////
///
///	\file    EnsembleParam.cpp
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

#include "EnsembleParam.h"
#include "PipelineError.h"
#include "STLStringHelper.h"

#include <cmath>
#include <cstdlib>
#include <fstream>
#include <set>

#include <sys/stat.h>

///////////////////////////////////////////////////////////////////////////////

void ParseMemberList(
	const std::string & strMembers,
	std::vector<std::string> & vecMembers
) {
	std::vector<std::string> vecItems;
	try {
		STLStringHelper::ParseVariableList(strMembers, vecItems, ",");
	} catch(Exception & e) {
		_PIPELINEERROR1(PipelineErrorKind_Configuration,
			"Malformed member list \"%s\"", strMembers.c_str());
	}

	std::set<std::string> setMembers;
	vecMembers.clear();

	for (size_t i = 0; i < vecItems.size(); i++) {
		const std::string & strItem = vecItems[i];
		std::vector<std::string> vecExpanded;

		size_t sDash = strItem.find('-');

		// Range of member numbers
		if ((sDash != std::string::npos) &&
		    STLStringHelper::IsIntegerIndex(strItem.substr(0, sDash)) &&
		    STLStringHelper::IsIntegerIndex(strItem.substr(sDash+1))
		) {
			int iBegin = atoi(strItem.substr(0, sDash).c_str());
			int iEnd = atoi(strItem.substr(sDash+1).c_str());
			if ((iBegin < 1) || (iEnd < iBegin)) {
				_PIPELINEERROR1(PipelineErrorKind_Configuration,
					"Invalid member range \"%s\"", strItem.c_str());
			}
			for (int m = iBegin; m <= iEnd; m++) {
				char szMember[32];
				snprintf(szMember, 32, "r%i", m);
				vecExpanded.push_back(szMember);
			}

		// Single member number
		} else if (STLStringHelper::IsIntegerIndex(strItem)) {
			vecExpanded.push_back(std::string("r") + strItem);

		// Member name
		} else {
			for (size_t s = 0; s < strItem.length(); s++) {
				if (isspace(strItem[s]) || (strItem[s] == '/')) {
					_PIPELINEERROR1(PipelineErrorKind_Configuration,
						"Invalid member name \"%s\"", strItem.c_str());
				}
			}
			vecExpanded.push_back(strItem);
		}

		for (size_t m = 0; m < vecExpanded.size(); m++) {
			if (setMembers.find(vecExpanded[m]) != setMembers.end()) {
				_PIPELINEERROR1(PipelineErrorKind_Configuration,
					"Member \"%s\" listed more than once",
					vecExpanded[m].c_str());
			}
			setMembers.insert(vecExpanded[m]);
			vecMembers.push_back(vecExpanded[m]);
		}
	}

	if (vecMembers.size() == 0) {
		_PIPELINEERRORT(PipelineErrorKind_Configuration,
			"No ensemble members specified (--members)");
	}
}

///////////////////////////////////////////////////////////////////////////////

void ParseDoubleList(
	const std::string & strOption,
	const std::string & strList,
	std::vector<double> & vecValues
) {
	std::vector<std::string> vecItems;
	try {
		STLStringHelper::ParseVariableList(strList, vecItems, ",");
	} catch(Exception & e) {
		_PIPELINEERROR2(PipelineErrorKind_Configuration,
			"Malformed list \"%s\" for %s", strList.c_str(), strOption.c_str());
	}

	vecValues.clear();
	for (size_t i = 0; i < vecItems.size(); i++) {
		if (!STLStringHelper::IsFloat(vecItems[i])) {
			_PIPELINEERROR2(PipelineErrorKind_Configuration,
				"Invalid number \"%s\" for %s",
				vecItems[i].c_str(), strOption.c_str());
		}
		vecValues.push_back(atof(vecItems[i].c_str()));
	}
}

///////////////////////////////////////////////////////////////////////////////

void EnsembleDiagnosticsParam::Finalize() {

	// Input catalog and output directory
	if (strInputCatalog.length() == 0) {
		_PIPELINEERRORT(PipelineErrorKind_Configuration,
			"No input catalog (--in_catalog) specified");
	}
	{
		std::ifstream ifCatalog(strInputCatalog.c_str());
		if (!ifCatalog.is_open()) {
			_PIPELINEERROR1(PipelineErrorKind_Configuration,
				"Unable to open input catalog \"%s\"",
				strInputCatalog.c_str());
		}
	}

	if (strOutputDir.length() == 0) {
		_PIPELINEERRORT(PipelineErrorKind_Configuration,
			"No output directory (--out_dir) specified");
	}
	struct stat statOutputDir;
	if ((stat(strOutputDir.c_str(), &statOutputDir) != 0) ||
	    !S_ISDIR(statOutputDir.st_mode)
	) {
		_PIPELINEERROR1(PipelineErrorKind_Configuration,
			"Output directory \"%s\" does not exist",
			strOutputDir.c_str());
	}

	// Members
	ParseMemberList(strMembers, vecMembers);

	if (strFutureScenario.length() == 0) {
		_PIPELINEERRORT(PipelineErrorKind_Configuration,
			"No future scenario (--future_scenario) specified");
	}
	if (strFutureScenario == "historical") {
		_PIPELINEERRORT(PipelineErrorKind_Configuration,
			"Future scenario (--future_scenario) cannot be \"historical\"");
	}

	// Periods
	periodHistorical =
		AnalysisPeriod("historical", YearRange::FromString(strHistoricalPeriod));
	rangeReference = YearRange::FromString(strReferencePeriod);

	if (!periodHistorical.m_range.Contains(rangeReference)) {
		_PIPELINEERROR2(PipelineErrorKind_Configuration,
			"Reference period %s must lie within the historical period %s",
			rangeReference.ToString().c_str(),
			periodHistorical.m_range.ToString().c_str());
	}

	std::vector<std::string> vecFutureItems;
	try {
		STLStringHelper::ParseVariableList(strFuturePeriods, vecFutureItems, ",");
	} catch(Exception & e) {
		_PIPELINEERROR1(PipelineErrorKind_Configuration,
			"Malformed list of future periods \"%s\"",
			strFuturePeriods.c_str());
	}
	if (vecFutureItems.size() == 0) {
		_PIPELINEERRORT(PipelineErrorKind_Configuration,
			"At least one future period (--future_periods) required");
	}
	vecFuturePeriods.clear();
	for (size_t p = 0; p < vecFutureItems.size(); p++) {
		char szLabel[32];
		snprintf(szLabel, 32, "future%lu", p+1);
		vecFuturePeriods.push_back(
			AnalysisPeriod(szLabel, YearRange::FromString(vecFutureItems[p])));
	}

	// Percentiles
	ParseDoubleList("--percentiles", strPercentiles, vecPercentiles);
	if (vecPercentiles.size() == 0) {
		_PIPELINEERRORT(PipelineErrorKind_Configuration,
			"At least one percentile level (--percentiles) required");
	}

	bool fMonthlyPercentileFound = false;
	for (size_t p = 0; p < vecPercentiles.size(); p++) {
		if ((vecPercentiles[p] <= 0.0) || (vecPercentiles[p] >= 100.0)) {
			_PIPELINEERROR1(PipelineErrorKind_Configuration,
				"Percentile level %g must be in the range (0, 100)",
				vecPercentiles[p]);
		}
		for (size_t q = 0; q < p; q++) {
			if (vecPercentiles[q] == vecPercentiles[p]) {
				_PIPELINEERROR1(PipelineErrorKind_Configuration,
					"Percentile level %g listed more than once",
					vecPercentiles[p]);
			}
		}
		if (vecPercentiles[p] == dMonthlyPercentile) {
			fMonthlyPercentileFound = true;
		}
	}
	if (!fMonthlyPercentileFound) {
		_PIPELINEERROR1(PipelineErrorKind_Configuration,
			"Monthly percentile level %g (--monthly_percentile) must be one"
			" of --percentiles", dMonthlyPercentile);
	}

	// Percentile estimator
	if (nBins < 2) {
		_PIPELINEERRORT(PipelineErrorKind_Configuration,
			"--bins must be at least 2");
	}
	if (nIterations < 1) {
		_PIPELINEERRORT(PipelineErrorKind_Configuration,
			"--iter must be at least 1");
	}
	optsPercentile.m_nBins = nBins;
	optsPercentile.m_nIterations = nIterations;

	// Ocean index box
	std::vector<double> vecBox;
	ParseDoubleList("--oni_box", strOniBox, vecBox);
	if (vecBox.size() != 4) {
		_PIPELINEERROR1(PipelineErrorKind_Configuration,
			"--oni_box must have the form lonMin,lonMax,latMin,latMax (given \"%s\")",
			strOniBox.c_str());
	}
	if ((vecBox[2] < -90.0) || (vecBox[3] > 90.0) || (vecBox[2] > vecBox[3])) {
		_PIPELINEERROR2(PipelineErrorKind_Configuration,
			"Invalid latitude bounds (%g, %g) in --oni_box",
			vecBox[2], vecBox[3]);
	}
	optsOceanIndex.m_box.set(vecBox[0], vecBox[1], vecBox[2], vecBox[3]);
	optsOceanIndex.m_rangeBaseline = YearRange::FromString(strBaselinePeriod);

	// Regrid resolution
	if (dSSTResolution <= 0.0) {
		_PIPELINEERROR1(PipelineErrorKind_Configuration,
			"--sst_resolution must be positive (given %g)", dSSTResolution);
	}
	double dLonCount = 360.0 / dSSTResolution;
	double dLatCount = 180.0 / dSSTResolution;
	if ((fabs(dLonCount - floor(dLonCount + 0.5)) > 1.0e-6) ||
	    (fabs(dLatCount - floor(dLatCount + 0.5)) > 1.0e-6)
	) {
		_PIPELINEERROR1(PipelineErrorKind_Configuration,
			"--sst_resolution %g must evenly divide 180 degrees", dSSTResolution);
	}

	if (fSkipExtremes && fSkipOceanIndex) {
		_PIPELINEERRORT(PipelineErrorKind_Configuration,
			"Both --skip_extremes and --skip_oni specified; nothing to do");
	}
}

///////////////////////////////////////////////////////////////////////////////
