///////////////////////////////////////////////////////////////////////////////
///
///	\file    CommandLine.h
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

#ifndef _COMMANDLINE_H_
#define _COMMANDLINE_H_

#include "Announce.h"
#include "Exception.h"
#include "PipelineError.h"
#include "STLStringHelper.h"

#include <vector>
#include <string>
#include <cstdlib>
#include <cstring>
#include <cmath>

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Types of parameters.
///	</summary>
enum ArgumentType {
	ArgumentTypeNone,
	ArgumentTypeBool,
	ArgumentTypeString,
	ArgumentTypeInt,
	ArgumentTypeDouble
};

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		A command line parameter.
///	</summary>
class CommandLineArgument {
public:
	///	<summary>
	///		Default constructor.
	///	</summary>
	CommandLineArgument(
		const std::string & strName,
		const std::string & strDescription
	) :
		m_strName(std::string("--") + strName),
		m_strDescription(strDescription)
	{ }

	///	<summary>
	///		Virtual destructor.
	///	</summary>
	virtual ~CommandLineArgument() {
	}

	///	<summary>
	///		Identify the type of parameter.
	///	</summary>
	virtual ArgumentType GetArgumentType() const {
		return ArgumentTypeNone;
	}

	///	<summary>
	///		Number of values required.
	///	</summary>
	virtual int GetValueCount() const = 0;

	///	<summary>
	///		Print the usage information of this parameter.
	///	</summary>
	virtual void PrintUsage() const = 0;

	///	<summary>
	///		Activate this parameter.
	///	</summary>
	virtual void Activate() {
	}

	///	<summary>
	///		Set the value from a string.  Returns false if the string could
	///		not be interpreted as a value of this type.
	///	</summary>
	virtual bool SetValue(
		const std::string & strValue
	) {
		_EXCEPTIONT("Argument does not take a value");
	}

public:
	///	<summary>
	///		Name of this parameter, including the leading "--".
	///	</summary>
	std::string m_strName;

	///	<summary>
	///		Description of this parameter.
	///	</summary>
	std::string m_strDescription;
};

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		A command line boolean (a flag without value).
///	</summary>
class CommandLineArgumentBool : public CommandLineArgument {
public:
	CommandLineArgumentBool(
		bool & ref,
		const std::string & strName,
		const std::string & strDescription
	) :
		CommandLineArgument(strName, strDescription),
		m_fValue(ref)
	{
		m_fValue = false;
	}

	virtual ArgumentType GetArgumentType() const {
		return ArgumentTypeBool;
	}

	virtual int GetValueCount() const {
		return (0);
	}

	virtual void PrintUsage() const {
		Announce("  %s <bool> [%s] %s",
			m_strName.c_str(),
			(m_fValue)?("true"):("false"),
			m_strDescription.c_str());
	}

	virtual void Activate() {
		m_fValue = true;
	}

public:
	///	<summary>
	///		Argument value.
	///	</summary>
	bool & m_fValue;
};

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		A command line string.
///	</summary>
class CommandLineArgumentString : public CommandLineArgument {
public:
	CommandLineArgumentString(
		std::string & ref,
		const std::string & strName,
		const std::string & strDefaultValue,
		const std::string & strDescription
	) :
		CommandLineArgument(strName, strDescription),
		m_strValue(ref)
	{
		m_strValue = strDefaultValue;
	}

	virtual ArgumentType GetArgumentType() const {
		return ArgumentTypeString;
	}

	virtual int GetValueCount() const {
		return (1);
	}

	virtual void PrintUsage() const {
		Announce("  %s <string> [\"%s\"] %s",
			m_strName.c_str(),
			m_strValue.c_str(),
			m_strDescription.c_str());
	}

	virtual bool SetValue(
		const std::string & strValue
	) {
		m_strValue = strValue;
		return true;
	}

public:
	///	<summary>
	///		Argument value.
	///	</summary>
	std::string & m_strValue;
};

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		A command line integer.
///	</summary>
class CommandLineArgumentInt : public CommandLineArgument {
public:
	CommandLineArgumentInt(
		int & ref,
		const std::string & strName,
		int nDefaultValue,
		const std::string & strDescription
	) :
		CommandLineArgument(strName, strDescription),
		m_nValue(ref)
	{
		m_nValue = nDefaultValue;
	}

	virtual ArgumentType GetArgumentType() const {
		return ArgumentTypeInt;
	}

	virtual int GetValueCount() const {
		return (1);
	}

	virtual void PrintUsage() const {
		Announce("  %s <integer> [%i] %s",
			m_strName.c_str(),
			m_nValue,
			m_strDescription.c_str());
	}

	virtual bool SetValue(
		const std::string & strValue
	) {
		if (!STLStringHelper::IsInteger(strValue)) {
			return false;
		}
		m_nValue = atoi(strValue.c_str());
		return true;
	}

public:
	///	<summary>
	///		Argument value.
	///	</summary>
	int & m_nValue;
};

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		A command line double.
///	</summary>
class CommandLineArgumentDouble : public CommandLineArgument {
public:
	CommandLineArgumentDouble(
		double & ref,
		const std::string & strName,
		double dDefaultValue,
		const std::string & strDescription
	) :
		CommandLineArgument(strName, strDescription),
		m_dValue(ref)
	{
		m_dValue = dDefaultValue;
	}

	virtual ArgumentType GetArgumentType() const {
		return ArgumentTypeDouble;
	}

	virtual int GetValueCount() const {
		return (1);
	}

	virtual void PrintUsage() const {
		if (fabs(m_dValue) < 1.0e6) {
			Announce("  %s <double> [%f] %s",
				m_strName.c_str(),
				m_dValue,
				m_strDescription.c_str());
		} else {
			Announce("  %s <double> [%e] %s",
				m_strName.c_str(),
				m_dValue,
				m_strDescription.c_str());
		}
	}

	virtual bool SetValue(
		const std::string & strValue
	) {
		if (!STLStringHelper::IsFloat(strValue)) {
			return false;
		}
		m_dValue = atof(strValue.c_str());
		return true;
	}

public:
	///	<summary>
	///		Argument value.
	///	</summary>
	double & m_dValue;
};

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Begin the definition of command line parameters.
///	</summary>
#define BeginCommandLine() \
	{ bool _errorCommandLine = false; \
	  std::vector<CommandLineArgument*> _vecArguments;

///	<summary>
///		Define a new command line boolean parameter.
///	</summary>
#define CommandLineBool(ref, name) \
	_vecArguments.push_back( \
		new CommandLineArgumentBool(ref, name, ""));

#define CommandLineBoolD(ref, name, desc) \
	_vecArguments.push_back( \
		new CommandLineArgumentBool(ref, name, desc));

///	<summary>
///		Define a new command line string parameter.
///	</summary>
#define CommandLineString(ref, name, value) \
	_vecArguments.push_back( \
		new CommandLineArgumentString(ref, name, value, ""));

#define CommandLineStringD(ref, name, value, desc) \
	_vecArguments.push_back( \
		new CommandLineArgumentString(ref, name, value, desc));

///	<summary>
///		Define a new command line integer parameter.
///	</summary>
#define CommandLineInt(ref, name, value) \
	_vecArguments.push_back( \
		new CommandLineArgumentInt(ref, name, value, ""));

#define CommandLineIntD(ref, name, value, desc) \
	_vecArguments.push_back( \
		new CommandLineArgumentInt(ref, name, value, desc));

///	<summary>
///		Define a new command line double parameter.
///	</summary>
#define CommandLineDouble(ref, name, value) \
	_vecArguments.push_back( \
		new CommandLineArgumentDouble(ref, name, value, ""));

#define CommandLineDoubleD(ref, name, value, desc) \
	_vecArguments.push_back( \
		new CommandLineArgumentDouble(ref, name, value, desc));

///	<summary>
///		Parse the command line.  Unknown options, missing values and values
///		of the wrong type all flag an error, which is reported by
///		EndCommandLine after the usage has been printed.
///	</summary>
#define ParseCommandLine(argc, argv) \
	for (int _command = 1; _command < argc; _command++) { \
		bool _found = false; \
		for (size_t _p = 0; _p < _vecArguments.size(); _p++) { \
			if (_vecArguments[_p]->m_strName != argv[_command]) { \
				continue; \
			} \
			_found = true; \
			_vecArguments[_p]->Activate(); \
			if (_vecArguments[_p]->GetValueCount() == 0) { \
				break; \
			} \
			if ((_command + 1 >= argc) || \
			    (strncmp(argv[_command + 1], "--", 2) == 0) \
			) { \
				Announce("ERROR: Missing value for option %s", argv[_command]); \
				_errorCommandLine = true; \
				break; \
			} \
			_command++; \
			if (!_vecArguments[_p]->SetValue(argv[_command])) { \
				Announce("ERROR: Invalid value \"%s\" for option %s", \
					argv[_command], argv[_command-1]); \
				_errorCommandLine = true; \
			} \
			break; \
		} \
		if (!_found) { \
			Announce("ERROR: Invalid argument \"%s\"", argv[_command]); \
			_errorCommandLine = true; \
		} \
	}

///	<summary>
///		Print usage information.
///	</summary>
#define PrintCommandLineUsage(argv) \
	if (_errorCommandLine) { \
		Announce("\nUsage: %s <Argument List>", argv[0]); \
	} \
	Announce("Arguments:"); \
	for (size_t _p = 0; _p < _vecArguments.size(); _p++) { \
		_vecArguments[_p]->PrintUsage(); \
	}

///	<summary>
///		End the definition of command line parameters.  Throws a
///		configuration error if parsing failed.
///	</summary>
#define EndCommandLine(argv) \
		PrintCommandLineUsage(argv); \
		for (size_t _p = 0; _p < _vecArguments.size(); _p++) { \
			delete _vecArguments[_p]; \
		} \
		if (_errorCommandLine) { \
			_PIPELINEERRORT(PipelineErrorKind_Configuration, \
				"Unable to parse command line"); \
		} \
	}

///	<summary>
///		Concatenate the command line into a string.
///	</summary>
inline std::string GetCommandLineAsString(int argc, char ** argv) {
	std::string strCommandLine;
	for (int i = 0; i < argc; i++) {
		strCommandLine += argv[i];
		if (i != argc-1) {
			strCommandLine += " ";
		}
	}
	return strCommandLine;
}

///////////////////////////////////////////////////////////////////////////////

#endif
