///////////////////////////////////////////////////////////////////////////////
///
///	\file    ArtifactExport.cpp
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

#include "ArtifactExport.h"
#include "Announce.h"
#include "Exception.h"
#include "NetCDFUtilities.h"

#include "netcdfcpp.h"

#include <cstdio>
#include <limits>
#include <vector>

///////////////////////////////////////////////////////////////////////////////

std::string FileArtifactWriter::GetPath(
	const ArtifactKey & key,
	const std::string & strExtension
) const {
	if (m_strOutputDir.length() == 0) {
		return key.GetFilename(strExtension);
	}
	if (m_strOutputDir[m_strOutputDir.length()-1] == '/') {
		return m_strOutputDir + key.GetFilename(strExtension);
	}
	return m_strOutputDir + "/" + key.GetFilename(strExtension);
}

///////////////////////////////////////////////////////////////////////////////

void FileArtifactWriter::WriteThresholdField(
	const PercentileThresholdField & field
) {
	ArtifactKey key = field.GetKey();
	std::string strPath = GetPath(key, "nc");

	Announce("Writing threshold field \"%s\"", strPath.c_str());

	NcFile ncfile(strPath.c_str(), NcFile::Replace);
	if (!ncfile.is_valid()) {
		_EXCEPTION1("Unable to open file \"%s\" for writing",
			strPath.c_str());
	}

	long lLatCount = static_cast<long>(field.m_dLat.GetRows());
	long lLonCount = static_cast<long>(field.m_dLon.GetRows());

	ncfile.add_att("member", field.m_strMember.c_str());
	ncfile.add_att("percentile", field.m_dPercentile);
	ncfile.add_att("reference_period", field.m_rangeReference.ToString().c_str());

	NcDim * dimLat = AddNcDimOrUseExisting(ncfile, "lat", lLatCount);
	NcDim * dimLon = AddNcDimOrUseExisting(ncfile, "lon", lLonCount);

	NcVar * varLat = ncfile.add_var("lat", ncDouble, dimLat);
	NcVar * varLon = ncfile.add_var("lon", ncDouble, dimLon);
	NcVar * varThreshold = ncfile.add_var("threshold", ncDouble, dimLat, dimLon);
	NcVar * varCount = ncfile.add_var("sample_count", ncInt, dimLat, dimLon);
	if ((varLat == NULL) || (varLon == NULL) ||
	    (varThreshold == NULL) || (varCount == NULL)
	) {
		_EXCEPTION1("Unable to create variables in file \"%s\"",
			strPath.c_str());
	}

	varLat->add_att("units", "degrees_north");
	varLon->add_att("units", "degrees_east");
	varThreshold->add_att("units", field.m_strUnits.c_str());
	varThreshold->add_att("_FillValue", std::numeric_limits<double>::quiet_NaN());
	varThreshold->add_att("percentile", field.m_dPercentile);
	varThreshold->add_att("reference_period", field.m_rangeReference.ToString().c_str());

	if (!varLat->put(&(field.m_dLat[0]), lLatCount) ||
	    !varLon->put(&(field.m_dLon[0]), lLonCount) ||
	    !varThreshold->put(field.m_dThreshold.GetData(), lLatCount, lLonCount) ||
	    !varCount->put(field.m_nSampleCount.GetData(), lLatCount, lLonCount)
	) {
		_EXCEPTION1("Unable to write data to file \"%s\"",
			strPath.c_str());
	}
}

///////////////////////////////////////////////////////////////////////////////

void FileArtifactWriter::WriteExceedanceSeries(
	const ExceedanceSeries & series
) {
	ArtifactKey key = series.GetKey();
	bool fMonthly = (series.m_eGranularity == ExceedanceGranularity_Monthly);
	const size_t sEntries = series.m_vecEntries.size();

	if (sEntries == 0) {
		_EXCEPTION1("Exceedance series \"%s\" is empty",
			key.GetBaseName().c_str());
	}

	// NetCDF
	std::string strPath = GetPath(key, "nc");
	Announce("Writing exceedance series \"%s\"", strPath.c_str());

	{
		NcFile ncfile(strPath.c_str(), NcFile::Replace);
		if (!ncfile.is_valid()) {
			_EXCEPTION1("Unable to open file \"%s\" for writing",
				strPath.c_str());
		}

		ncfile.add_att("member", series.m_strMember.c_str());
		ncfile.add_att("percentile", series.m_dPercentile);
		ncfile.add_att("reference_period", series.m_rangeReference.ToString().c_str());
		ncfile.add_att("period", series.m_period.m_strLabel.c_str());
		ncfile.add_att("period_years", series.m_period.m_range.ToString().c_str());
		ncfile.add_att("granularity", (fMonthly)?("monthly"):("annual"));

		NcTimeDimension vecTime;
		std::vector<int> vecYear(sEntries);
		std::vector<int> vecMonth(sEntries);
		std::vector<double> vecFrequency(sEntries);
		std::vector<double> vecDays(sEntries);
		for (size_t e = 0; e < sEntries; e++) {
			const ExceedanceEntry & entry = series.m_vecEntries[e];
			vecTime.push_back(entry.m_timeStart);
			vecYear[e] = entry.m_iYear;
			vecMonth[e] = entry.m_iMonth;
			vecFrequency[e] = entry.m_dFrequency;
			vecDays[e] = entry.m_dDays;
		}

		WriteCFTimeDataToNcFile(&ncfile, strPath, vecTime);

		NcDim * dimTime = NcGetTimeDimension(ncfile);
		if (dimTime == NULL) {
			_EXCEPTION1("Unable to create time dimension in file \"%s\"",
				strPath.c_str());
		}

		NcVar * varYear = ncfile.add_var("year", ncInt, dimTime);
		NcVar * varFrequency = ncfile.add_var("frequency", ncDouble, dimTime);
		NcVar * varDays = ncfile.add_var("days", ncDouble, dimTime);
		if ((varYear == NULL) || (varFrequency == NULL) || (varDays == NULL)) {
			_EXCEPTION1("Unable to create variables in file \"%s\"",
				strPath.c_str());
		}
		varFrequency->add_att("long_name",
			"area-weighted mean fraction of days at or above threshold");
		varFrequency->add_att("units", "1");
		varDays->add_att("long_name",
			"area-weighted mean number of days at or above threshold");
		varDays->add_att("units", "days");

		long lEntries = static_cast<long>(sEntries);
		if (!varYear->put(&(vecYear[0]), lEntries) ||
		    !varFrequency->put(&(vecFrequency[0]), lEntries) ||
		    !varDays->put(&(vecDays[0]), lEntries)
		) {
			_EXCEPTION1("Unable to write data to file \"%s\"",
				strPath.c_str());
		}

		if (fMonthly) {
			NcVar * varMonth = ncfile.add_var("month", ncInt, dimTime);
			if ((varMonth == NULL) || !varMonth->put(&(vecMonth[0]), lEntries)) {
				_EXCEPTION1("Unable to write month to file \"%s\"",
					strPath.c_str());
			}
		}
	}

	// CSV
	std::string strCSVPath = GetPath(key, "csv");
	FILE * fp = fopen(strCSVPath.c_str(), "w");
	if (fp == NULL) {
		_EXCEPTION1("Unable to open file \"%s\" for writing",
			strCSVPath.c_str());
	}

	if (fMonthly) {
		fprintf(fp, "year,month,frequency,days\n");
	} else {
		fprintf(fp, "year,frequency,days\n");
	}
	for (size_t e = 0; e < sEntries; e++) {
		const ExceedanceEntry & entry = series.m_vecEntries[e];
		if (fMonthly) {
			fprintf(fp, "%i,%i,%.8g,%.8g\n",
				entry.m_iYear, entry.m_iMonth,
				entry.m_dFrequency, entry.m_dDays);
		} else {
			fprintf(fp, "%i,%.8g,%.8g\n",
				entry.m_iYear, entry.m_dFrequency, entry.m_dDays);
		}
	}
	fclose(fp);
}

///////////////////////////////////////////////////////////////////////////////

void FileArtifactWriter::WriteClimateIndexSeries(
	const ClimateIndexSeries & series
) {
	ArtifactKey key = series.GetKey();
	const size_t sMonths = series.m_vecIndex.size();

	if ((sMonths == 0) || (series.m_vecTime.size() != sMonths)) {
		_EXCEPTION1("Index series \"%s\" is empty or inconsistent",
			key.GetBaseName().c_str());
	}

	// NetCDF
	std::string strPath = GetPath(key, "nc");
	Announce("Writing index series \"%s\"", strPath.c_str());

	{
		NcFile ncfile(strPath.c_str(), NcFile::Replace);
		if (!ncfile.is_valid()) {
			_EXCEPTION1("Unable to open file \"%s\" for writing",
				strPath.c_str());
		}

		ncfile.add_att("member", series.m_strMember.c_str());
		ncfile.add_att("baseline_period", series.m_rangeBaseline.ToString().c_str());

		WriteCFTimeDataToNcFile(&ncfile, strPath, series.m_vecTime);

		NcDim * dimTime = NcGetTimeDimension(ncfile);
		if (dimTime == NULL) {
			_EXCEPTION1("Unable to create time dimension in file \"%s\"",
				strPath.c_str());
		}

		NcVar * varIndex = ncfile.add_var("oni", ncDouble, dimTime);
		if (varIndex == NULL) {
			_EXCEPTION1("Unable to create variables in file \"%s\"",
				strPath.c_str());
		}
		varIndex->add_att("long_name", "Nino 3.4 sea surface temperature anomaly index");
		varIndex->add_att("units", series.m_strUnits.c_str());
		varIndex->add_att("_FillValue", std::numeric_limits<double>::quiet_NaN());

		if (!varIndex->put(&(series.m_vecIndex[0]), static_cast<long>(sMonths))) {
			_EXCEPTION1("Unable to write data to file \"%s\"",
				strPath.c_str());
		}
	}

	// CSV
	std::string strCSVPath = GetPath(key, "csv");
	FILE * fp = fopen(strCSVPath.c_str(), "w");
	if (fp == NULL) {
		_EXCEPTION1("Unable to open file \"%s\" for writing",
			strCSVPath.c_str());
	}

	fprintf(fp, "date,year,month,index\n");
	for (size_t t = 0; t < sMonths; t++) {
		const Time & time = series.m_vecTime[t];
		fprintf(fp, "%s,%i,%i,%.8g\n",
			time.ToDateString().c_str(),
			time.GetYear(),
			time.GetMonth(),
			series.m_vecIndex[t]);
	}
	fclose(fp);
}

///////////////////////////////////////////////////////////////////////////////
