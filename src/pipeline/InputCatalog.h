///////////////////////////////////////////////////////////////////////////////
///
///	\file    InputCatalog.h
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

#ifndef _INPUTCATALOG_H_
#define _INPUTCATALOG_H_

#include <string>
#include <vector>

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		List of input files, each tagged with its ensemble member, variable
///		and scenario.  The catalog file holds one entry per line:
///		"member variable scenario path".  Blank lines and lines starting
///		with '#' are ignored.
///	</summary>
class InputCatalog {

public:
	///	<summary>
	///		One input file.
	///	</summary>
	struct Entry {
		std::string strMember;
		std::string strVariable;
		std::string strScenario;
		std::string strPath;
	};

public:
	///	<summary>
	///		Parse the catalog from a file.
	///	</summary>
	void FromFile(
		const std::string & strCatalogFile
	);

	///	<summary>
	///		Add an entry.
	///	</summary>
	void AddEntry(
		const std::string & strMember,
		const std::string & strVariable,
		const std::string & strScenario,
		const std::string & strPath
	);

	///	<summary>
	///		Get the files of one member, variable and scenario in catalog
	///		order.  Throws an input error if there are none.
	///	</summary>
	void GetFiles(
		const std::string & strMember,
		const std::string & strVariable,
		const std::string & strScenario,
		std::vector<std::string> & vecFiles
	) const;

	///	<summary>
	///		Number of entries.
	///	</summary>
	size_t GetEntryCount() const {
		return m_vecEntries.size();
	}

private:
	///	<summary>
	///		Entries in catalog order.
	///	</summary>
	std::vector<Entry> m_vecEntries;
};

///////////////////////////////////////////////////////////////////////////////

#endif
