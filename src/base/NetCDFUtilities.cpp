///////////////////////////////////////////////////////////////////////////////
///
///	\file    NetCDFUtilities.cpp
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

#include "NetCDFUtilities.h"
#include "Exception.h"
#include "PipelineError.h"
#include "Announce.h"
#include "DataArray1D.h"
#include "netcdfcpp.h"

#include <cstring>
#include <vector>

////////////////////////////////////////////////////////////////////////////////

static const char * s_szTimeNames[] = {
	"time", "Time", "xtime", "valid_time", "day"
};

static const int s_nTimeNames = 5;

////////////////////////////////////////////////////////////////////////////////

size_t NcGetVarFromList(
	NcFile & ncFile,
	const std::vector<std::string> & vecVarNames,
	NcVar ** pvar
) {
	for (size_t v = 0; v < vecVarNames.size(); v++) {
		NcVar * var = ncFile.get_var(vecVarNames[v].c_str());
		if (var != NULL) {
			if (pvar != NULL) {
				(*pvar) = var;
			}
			return v;
		}
	}
	return vecVarNames.size();
}

////////////////////////////////////////////////////////////////////////////////

void NcGetLatitudeLongitudeVars(
	NcFile & ncFile,
	const std::string & strFilename,
	NcVar ** pvarLat,
	NcVar ** pvarLon
) {
	std::vector<std::string> vecLatitudeNames;
	vecLatitudeNames.push_back("lat");
	vecLatitudeNames.push_back("latitude");
	vecLatitudeNames.push_back("LAT");
	vecLatitudeNames.push_back("Latitude");

	std::vector<std::string> vecLongitudeNames;
	vecLongitudeNames.push_back("lon");
	vecLongitudeNames.push_back("longitude");
	vecLongitudeNames.push_back("LON");
	vecLongitudeNames.push_back("Longitude");

	size_t sLat = NcGetVarFromList(ncFile, vecLatitudeNames, pvarLat);
	if (sLat == vecLatitudeNames.size()) {
		_PIPELINEERROR1(PipelineErrorKind_Input,
			"No latitude variable found in file \"%s\"",
			strFilename.c_str());
	}

	size_t sLon = NcGetVarFromList(ncFile, vecLongitudeNames, pvarLon);
	if (sLon == vecLongitudeNames.size()) {
		_PIPELINEERROR1(PipelineErrorKind_Input,
			"No longitude variable found in file \"%s\"",
			strFilename.c_str());
	}

	if (((*pvarLat)->num_dims() != 1) || ((*pvarLon)->num_dims() != 1)) {
		_PIPELINEERROR1(PipelineErrorKind_Input,
			"Latitude and longitude must be one-dimensional in file \"%s\"",
			strFilename.c_str());
	}
}

////////////////////////////////////////////////////////////////////////////////

bool NcIsTimeDimension(
	NcDim * dim
) {
	for (int i = 0; i < s_nTimeNames; i++) {
		if (strcmp(dim->name(), s_szTimeNames[i]) == 0) {
			return true;
		}
	}
	return false;
}

////////////////////////////////////////////////////////////////////////////////

NcDim * NcGetTimeDimension(
	NcFile & ncFile
) {
	for (int i = 0; i < s_nTimeNames; i++) {
		NcDim * dim = ncFile.get_dim(s_szTimeNames[i]);
		if (dim != NULL) {
			return dim;
		}
	}
	return NULL;
}

////////////////////////////////////////////////////////////////////////////////

NcVar * NcGetTimeVariable(
	NcFile & ncFile
) {
	for (int i = 0; i < s_nTimeNames; i++) {
		NcVar * var = ncFile.get_var(s_szTimeNames[i]);
		if (var != NULL) {
			return var;
		}
	}
	return NULL;
}

////////////////////////////////////////////////////////////////////////////////

std::string NcGetVarAttString(
	NcVar * var,
	const std::string & strAttName
) {
	for (int a = 0; a < var->num_atts(); a++) {
		NcAtt * att = var->get_att(a);
		if (att == NULL) {
			continue;
		}
		bool fMatch = (strAttName == att->name());
		if (fMatch && (att->type() == ncChar)) {
			char * szValue = att->as_string(0);
			std::string strValue(szValue);
			delete[] szValue;
			delete att;
			return strValue;
		}
		delete att;
		if (fMatch) {
			break;
		}
	}
	return std::string("");
}

////////////////////////////////////////////////////////////////////////////////

bool NcGetVarMissingValue(
	NcVar * var,
	double & dMissingValue
) {
	for (int a = 0; a < var->num_atts(); a++) {
		NcAtt * att = var->get_att(a);
		if (att == NULL) {
			continue;
		}
		std::string strAttName = att->name();
		if ((strAttName == "_FillValue") || (strAttName == "missing_value")) {
			if ((att->type() != ncChar) && (att->num_vals() > 0)) {
				dMissingValue = att->as_double(0);
				delete att;
				return true;
			}
		}
		delete att;
	}
	return false;
}

////////////////////////////////////////////////////////////////////////////////

NcDim * AddNcDimOrUseExisting(
	NcFile & ncFile,
	const std::string & strDimName,
	long lDimSize
) {
	NcDim * dim = ncFile.get_dim(strDimName.c_str());
	if (dim == NULL) {
		dim = ncFile.add_dim(strDimName.c_str(), lDimSize);
		if (dim == NULL) {
			_EXCEPTION2("Error adding dimension \"%s\" (%li) to file",
				strDimName.c_str(), lDimSize);
		}
	} else if (dim->size() != lDimSize) {
		_EXCEPTION3("Attempting to redefine dimension \"%s\" from size %li to %li",
			strDimName.c_str(), dim->size(), lDimSize);
	}
	return dim;
}

////////////////////////////////////////////////////////////////////////////////

void ReadCFTimeDataFromNcFile(
	NcFile * ncfile,
	const std::string & strFilename,
	NcTimeDimension & vecTimes,
	bool fWarnOnMissingCalendar
) {
	_ASSERT(ncfile != NULL);

	vecTimes.clear();

	// Get time dimension and variable
	NcDim * dimTime = NcGetTimeDimension(*ncfile);
	NcVar * varTime = NcGetTimeVariable(*ncfile);

	if (varTime == NULL) {
		_PIPELINEERROR1(PipelineErrorKind_Input,
			"Variable \"time\" not found in file \"%s\"",
			strFilename.c_str());
	}
	if (dimTime == NULL) {
		_PIPELINEERROR1(PipelineErrorKind_Input,
			"Dimension \"time\" not found in file \"%s\"",
			strFilename.c_str());
	}
	if (varTime->num_dims() != 1) {
		_PIPELINEERROR1(PipelineErrorKind_Input,
			"Variable \"time\" has more than one dimension in file \"%s\"",
			strFilename.c_str());
	}
	if (!NcIsTimeDimension(varTime->get_dim(0))) {
		_PIPELINEERROR1(PipelineErrorKind_Input,
			"Variable \"time\" does not have time dimension in file \"%s\"",
			strFilename.c_str());
	}

	long lTimeCount = dimTime->size();

	// Calendar attribute
	std::string strCalendar = NcGetVarAttString(varTime, "calendar");
	if (strCalendar == "") {
		if (fWarnOnMissingCalendar) {
			Announce("WARNING: Variable \"time\" is missing \"calendar\" attribute; assuming \"standard\"");
		}
		strCalendar = "standard";
	}
	Time::CalendarType eCalendarType =
		Time::CalendarTypeFromString(strCalendar);
	if (eCalendarType == Time::CalendarUnknown) {
		_PIPELINEERROR2(PipelineErrorKind_Input,
			"Unsupported calendar \"%s\" in file \"%s\"",
			strCalendar.c_str(), strFilename.c_str());
	}

	// Units attribute
	std::string strUnits = NcGetVarAttString(varTime, "units");
	if (strUnits == "") {
		_PIPELINEERROR1(PipelineErrorKind_Input,
			"Variable \"time\" is missing \"units\" attribute in file \"%s\"",
			strFilename.c_str());
	}

	vecTimes.m_nctype = varTime->type();
	vecTimes.m_units = strUnits;

	if (lTimeCount == 0) {
		return;
	}

	// Load in time data as double regardless of storage type
	DataArray1D<double> vecTimeDouble(lTimeCount);

	if ((varTime->type() != ncInt) &&
	    (varTime->type() != ncFloat) &&
	    (varTime->type() != ncDouble)
	) {
		_PIPELINEERROR1(PipelineErrorKind_Input,
			"Variable \"time\" has invalid type "
			"(expected \"int\", \"float\" or \"double\")"
			" in file \"%s\"", strFilename.c_str());
	}

	varTime->set_cur((long)0);
	if (!varTime->get(&(vecTimeDouble[0]), lTimeCount)) {
		_PIPELINEERROR1(PipelineErrorKind_Input,
			"Unable to read variable \"time\" from file \"%s\"",
			strFilename.c_str());
	}

	for (long t = 0; t < lTimeCount; t++) {
		Time time(eCalendarType);
		time.FromCFCompliantUnitsOffsetDouble(
			vecTimes.m_units,
			vecTimeDouble[t]);

		vecTimes.push_back(time);
	}
}

////////////////////////////////////////////////////////////////////////////////

void WriteCFTimeDataToNcFile(
	NcFile * ncfile,
	const std::string & strFilename,
	const NcTimeDimension & vecTimes,
	bool fRecordDim
) {
	_ASSERT(ncfile != NULL);

	if (vecTimes.size() == 0) {
		_EXCEPTIONT("NcTimeDimension has zero size");
	}

	NcDim * dimTime = NcGetTimeDimension(*ncfile);
	if (dimTime == NULL) {
		if (fRecordDim) {
			dimTime = ncfile->add_dim("time", 0);
		} else {
			dimTime = ncfile->add_dim("time", vecTimes.size());
		}
		if (dimTime == NULL) {
			_EXCEPTION1("Unable to create dimension \"time\" in file \"%s\"",
				strFilename.c_str());
		}
	} else if (!fRecordDim && (dimTime->size() != (long)vecTimes.size())) {
		_EXCEPTION3("File \"%s\" already contains dimension \"time\" with unexpected size (%li != %lu)",
			strFilename.c_str(), dimTime->size(), vecTimes.size());
	}

	NcVar * varTime = ncfile->add_var("time", ncDouble, dimTime);
	if (varTime == NULL) {
		NcError ncerr;
		_EXCEPTION3("Unable to create variable \"time\" in file \"%s\" (%i: %s)",
			strFilename.c_str(), ncerr.get_err(), ncerr.get_errmsg());
	}

	DataArray1D<double> dTimes(vecTimes.size());
	for (size_t t = 0; t < dTimes.GetRows(); t++) {
		dTimes[t] =
			vecTimes[t].GetCFCompliantUnitsOffsetDouble(vecTimes.units());
	}
	varTime->set_cur((long)0);
	if (!varTime->put(&(dTimes[0]), dTimes.GetRows())) {
		_EXCEPTION1("Unable to write variable \"time\" to file \"%s\"",
			strFilename.c_str());
	}

	varTime->add_att("long_name", "time");
	varTime->add_att("calendar", vecTimes[0].GetCalendarName().c_str());
	varTime->add_att("units", vecTimes.units().c_str());
}

////////////////////////////////////////////////////////////////////////////////
