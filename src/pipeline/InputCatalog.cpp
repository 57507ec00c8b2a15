///////////////////////////////////////////////////////////////////////////////
///
///	\file    InputCatalog.cpp
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

#include "InputCatalog.h"
#include "PipelineError.h"
#include "STLStringHelper.h"

#include <fstream>

///////////////////////////////////////////////////////////////////////////////

void InputCatalog::FromFile(
	const std::string & strCatalogFile
) {
	std::ifstream ifCatalog(strCatalogFile.c_str());
	if (!ifCatalog.is_open()) {
		_PIPELINEERROR1(PipelineErrorKind_Configuration,
			"Unable to open input catalog \"%s\"",
			strCatalogFile.c_str());
	}

	int iLine = 0;
	std::string strLine;
	std::vector<std::string> vecTokens;

	while (std::getline(ifCatalog, strLine)) {
		iLine++;

		STLStringHelper::RemoveWhitespaceInPlace(strLine);
		if (strLine.length() == 0) {
			continue;
		}
		if (strLine[0] == '#') {
			continue;
		}

		STLStringHelper::SplitWhitespace(strLine, vecTokens);
		if (vecTokens.size() != 4) {
			_PIPELINEERROR2(PipelineErrorKind_Configuration,
				"Malformed entry on line %i of input catalog \"%s\""
				" (expected \"member variable scenario path\")",
				iLine, strCatalogFile.c_str());
		}

		AddEntry(vecTokens[0], vecTokens[1], vecTokens[2], vecTokens[3]);
	}

	if (m_vecEntries.size() == 0) {
		_PIPELINEERROR1(PipelineErrorKind_Configuration,
			"No entries found in input catalog \"%s\"",
			strCatalogFile.c_str());
	}
}

///////////////////////////////////////////////////////////////////////////////

void InputCatalog::AddEntry(
	const std::string & strMember,
	const std::string & strVariable,
	const std::string & strScenario,
	const std::string & strPath
) {
	Entry entry;
	entry.strMember = strMember;
	entry.strVariable = strVariable;
	entry.strScenario = strScenario;
	entry.strPath = strPath;
	m_vecEntries.push_back(entry);
}

///////////////////////////////////////////////////////////////////////////////

void InputCatalog::GetFiles(
	const std::string & strMember,
	const std::string & strVariable,
	const std::string & strScenario,
	std::vector<std::string> & vecFiles
) const {
	vecFiles.clear();
	for (size_t e = 0; e < m_vecEntries.size(); e++) {
		const Entry & entry = m_vecEntries[e];
		if ((entry.strMember == strMember) &&
		    (entry.strVariable == strVariable) &&
		    (entry.strScenario == strScenario)
		) {
			vecFiles.push_back(entry.strPath);
		}
	}

	if (vecFiles.size() == 0) {
		_PIPELINEERROR3(PipelineErrorKind_Input,
			"No input files for member \"%s\", variable \"%s\", scenario \"%s\"",
			strMember.c_str(), strVariable.c_str(), strScenario.c_str());
	}
}

///////////////////////////////////////////////////////////////////////////////
