///////////////////////////////////////////////////////////////////////////////
///
///	\file    STLStringHelper.h
///	\author  Paul Ullrich
///	\version October 19, 2026
///
///	<remarks>
///		Copyright 2000-2026 Paul Ullrich
///
///		This file is distributed as part of the ClimDiag source code package.
///		Permission is granted to use, copy, modify and distribute this
///		source code and its documentation under the terms of the GNU General
///		Public License.  This software is provided "as is" without express
///		or implied warranty.
///	</remarks>

#ifndef _STLSTRINGHELPER_H_
#define _STLSTRINGHELPER_H_

#include "Exception.h"

#include <string>
#include <vector>

#include <cctype>
#include <cstring>

///	<summary>
///		This class exposes additional functionality which can be used to
///		supplement the STL string class.
///	</summary>
class STLStringHelper {

///////////////////////////////////////////////////////////////////////////////

private:
STLStringHelper() { }

public:

///////////////////////////////////////////////////////////////////////////////

inline static void ToLower(std::string &str) {
	for(size_t i = 0; i < str.length(); i++) {
		str[i] = tolower(str[i]);
	}
}

///////////////////////////////////////////////////////////////////////////////

inline static bool IsIntegerIndex(const std::string &str) {
	if (str.length() == 0) {
		return false;
	}
	for(size_t i = 0; i < str.length(); i++) {
		if ((str[i] < '0') || (str[i] > '9')) {
			return false;
		}
	}
	return true;
}

///////////////////////////////////////////////////////////////////////////////

inline static bool IsInteger(const std::string &str) {
	if (str.length() == 0) {
		return false;
	}
	for(size_t i = 0; i < str.length(); i++) {
		if ((i == 0) && ((str[i] == '-') || (str[i] == '+'))) {
			if (str.length() == 1) {
				return false;
			}
			continue;
		}
		if ((str[i] < '0') || (str[i] > '9')) {
			return false;
		}
	}
	return true;
}

///////////////////////////////////////////////////////////////////////////////

inline static bool IsFloat(const std::string &str) {
	bool fHasDigit = false;
	bool fHasExponent = false;
	bool fHasDecimal = false;
	for(size_t i = 0; i < str.length(); i++) {
		if ((str[i] >= '0') && (str[i] <= '9')) {
			fHasDigit = true;
			continue;
		}
		if (str[i] == '.') {
			if (fHasDecimal || fHasExponent) {
				return false;
			}
			fHasDecimal = true;
			continue;
		}
		if ((str[i] == 'e') || (str[i] == 'E')) {
			if (fHasExponent || !fHasDigit || (i == str.length()-1)) {
				return false;
			}
			fHasExponent = true;
			continue;
		}
		if ((str[i] == '-') || (str[i] == '+')) {
			if (i == 0) {
				continue;
			}
			if ((str[i-1] == 'e') || (str[i-1] == 'E')) {
				continue;
			}
		}
		return false;
	}
	return fHasDigit;
}

///////////////////////////////////////////////////////////////////////////////

static void RemoveWhitespaceInPlace(
	std::string & strString
) {
	size_t sBegin = strString.length();
	for (size_t s = 0; s < strString.length(); s++) {
		if (!isspace(strString[s])) {
			sBegin = s;
			break;
		}
	}
	if (sBegin == strString.length()) {
		strString = "";
		return;
	}

	size_t sEnd = strString.length();
	for (size_t s = sEnd-1; s > sBegin; s--) {
		if (!isspace(strString[s])) {
			sEnd = s+1;
			break;
		}
	}

	strString = strString.substr(sBegin, sEnd - sBegin);
}

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Split a delimited list into its items.  Whitespace around each item
///		is removed; empty items are an error.
///	</summary>
static void ParseVariableList(
	const std::string & strVariables,
	std::vector< std::string > & vecVariableStrings,
	const std::string & strDelimiters = std::string(",;")
) {
	if (strVariables.length() == 0) {
		return;
	}

	size_t sBegin = 0;
	for (size_t s = 0; s <= strVariables.length(); s++) {
		if ((s != strVariables.length()) &&
		    (strDelimiters.find(strVariables[s]) == std::string::npos)
		) {
			continue;
		}

		std::string strItem = strVariables.substr(sBegin, s - sBegin);
		RemoveWhitespaceInPlace(strItem);
		if (strItem.length() == 0) {
			_EXCEPTION1("Zero length item in list \"%s\"",
				strVariables.c_str());
		}
		vecVariableStrings.push_back(strItem);
		sBegin = s + 1;
	}
}

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Split a string into whitespace-separated tokens.
///	</summary>
static void SplitWhitespace(
	const std::string & strLine,
	std::vector< std::string > & vecTokens
) {
	vecTokens.clear();

	size_t s = 0;
	while (s < strLine.length()) {
		while ((s < strLine.length()) && isspace(strLine[s])) {
			s++;
		}
		if (s == strLine.length()) {
			break;
		}
		size_t sBegin = s;
		while ((s < strLine.length()) && !isspace(strLine[s])) {
			s++;
		}
		vecTokens.push_back(strLine.substr(sBegin, s - sBegin));
	}
}

///////////////////////////////////////////////////////////////////////////////

};

#endif
