///////////////////////////////////////////////////////////////////////////////
///
///	\file    TimeSeriesIngest.cpp
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

#include "TimeSeriesIngest.h"
#include "Announce.h"
#include "DataArray2D.h"
#include "Exception.h"
#include "PipelineError.h"
#include "NetCDFUtilities.h"
#include "Units.h"

#include "netcdfcpp.h"

#include <algorithm>
#include <cmath>
#include <cstring>
#include <limits>

///////////////////////////////////////////////////////////////////////////////

void LoadTimeSeriesGrid(
	const std::string & strFilename,
	const std::string & strVariableName,
	TimeSeriesGrid & grid
) {
	NcFile ncfile(strFilename.c_str());
	if (!ncfile.is_valid()) {
		_PIPELINEERROR1(PipelineErrorKind_Input,
			"Unable to open file \"%s\"", strFilename.c_str());
	}

	NcVar * var = ncfile.get_var(strVariableName.c_str());
	if (var == NULL) {
		_PIPELINEERROR2(PipelineErrorKind_Input,
			"Variable \"%s\" not found in file \"%s\"",
			strVariableName.c_str(), strFilename.c_str());
	}
	if (var->num_dims() != 3) {
		_PIPELINEERROR2(PipelineErrorKind_Input,
			"Variable \"%s\" in file \"%s\" must have dimensions (time, lat, lon)",
			strVariableName.c_str(), strFilename.c_str());
	}
	if (!NcIsTimeDimension(var->get_dim(0))) {
		_PIPELINEERROR2(PipelineErrorKind_Input,
			"First dimension of variable \"%s\" in file \"%s\" must be time",
			strVariableName.c_str(), strFilename.c_str());
	}

	// Coordinates
	NcVar * varLat = NULL;
	NcVar * varLon = NULL;
	NcGetLatitudeLongitudeVars(ncfile, strFilename, &varLat, &varLon);

	long lLatCount = varLat->get_dim(0)->size();
	long lLonCount = varLon->get_dim(0)->size();

	if ((lLatCount != var->get_dim(1)->size()) ||
	    (lLonCount != var->get_dim(2)->size())
	) {
		_PIPELINEERROR2(PipelineErrorKind_Input,
			"Coordinate sizes of variable \"%s\" in file \"%s\" do not match"
			" latitude and longitude",
			strVariableName.c_str(), strFilename.c_str());
	}
	if ((lLatCount == 0) || (lLonCount == 0)) {
		_PIPELINEERROR1(PipelineErrorKind_Input,
			"Empty spatial grid in file \"%s\"", strFilename.c_str());
	}

	DataArray1D<double> dLat(lLatCount);
	DataArray1D<double> dLon(lLonCount);

	varLat->set_cur((long)0);
	if (!varLat->get(&(dLat[0]), lLatCount)) {
		_PIPELINEERROR1(PipelineErrorKind_Input,
			"Unable to read latitudes from file \"%s\"", strFilename.c_str());
	}
	varLon->set_cur((long)0);
	if (!varLon->get(&(dLon[0]), lLonCount)) {
		_PIPELINEERROR1(PipelineErrorKind_Input,
			"Unable to read longitudes from file \"%s\"", strFilename.c_str());
	}

	// Latitudes are stored ascending
	bool fFlipLatitude = ((lLatCount > 1) && (dLat[0] > dLat[1]));
	if (fFlipLatitude) {
		for (long j = 0; j < lLatCount / 2; j++) {
			std::swap(dLat[j], dLat[lLatCount-1-j]);
		}
	}

	// Time axis
	NcTimeDimension vecTime;
	ReadCFTimeDataFromNcFile(&ncfile, strFilename, vecTime, true);

	if (static_cast<long>(vecTime.size()) != var->get_dim(0)->size()) {
		_PIPELINEERROR1(PipelineErrorKind_Input,
			"Time axis size mismatch in file \"%s\"", strFilename.c_str());
	}
	for (size_t t = 1; t < vecTime.size(); t++) {
		if (vecTime[t] <= vecTime[t-1]) {
			_PIPELINEERROR3(PipelineErrorKind_Discontinuity,
				"Time axis of file \"%s\" is not strictly increasing (%s, %s)",
				strFilename.c_str(),
				vecTime[t-1].ToString().c_str(),
				vecTime[t].ToString().c_str());
		}
	}

	// Metadata
	std::string strUnits = NcGetVarAttString(var, "units");

	double dMissingValue = 0.0;
	bool fHasMissingValue = NcGetVarMissingValue(var, dMissingValue);
	float flMissingValue = static_cast<float>(dMissingValue);

	Announce(1, "Loading \"%s\" from \"%s\" (%lu times, %li x %li)",
		strVariableName.c_str(),
		strFilename.c_str(),
		vecTime.size(),
		lLatCount,
		lLonCount);

	grid.Initialize(strVariableName, strUnits, vecTime, dLat, dLon);

	// Data
	DataArray2D<float> dSlice(lLatCount, lLonCount);

	for (size_t t = 0; t < vecTime.size(); t++) {
		var->set_cur(static_cast<long>(t), 0, 0);
		if (!var->get(&(dSlice(0,0)), 1, lLatCount, lLonCount)) {
			_PIPELINEERROR2(PipelineErrorKind_Input,
				"Unable to read variable \"%s\" from file \"%s\"",
				strVariableName.c_str(), strFilename.c_str());
		}

		for (long j = 0; j < lLatCount; j++) {
			long jOut = (fFlipLatitude)?(lLatCount-1-j):(j);
			for (long i = 0; i < lLonCount; i++) {
				float flValue = dSlice(j,i);
				if (fHasMissingValue && (flValue == flMissingValue)) {
					continue;
				}
				grid.m_data(t,jOut,i) = flValue;
			}
		}
	}
}

///////////////////////////////////////////////////////////////////////////////

void WriteTimeSeriesGrid(
	const std::string & strFilename,
	const TimeSeriesGrid & grid
) {
	NcFile ncfile(strFilename.c_str(), NcFile::Replace);
	if (!ncfile.is_valid()) {
		_PIPELINEERROR1(PipelineErrorKind_Input,
			"Unable to open file \"%s\" for writing", strFilename.c_str());
	}

	long lLatCount = static_cast<long>(grid.GetLatCount());
	long lLonCount = static_cast<long>(grid.GetLonCount());

	WriteCFTimeDataToNcFile(&ncfile, strFilename, grid.m_vecTime);

	NcDim * dimTime = NcGetTimeDimension(ncfile);
	if (dimTime == NULL) {
		_EXCEPTION1("Unable to create time dimension in file \"%s\"",
			strFilename.c_str());
	}
	NcDim * dimLat = AddNcDimOrUseExisting(ncfile, "lat", lLatCount);
	NcDim * dimLon = AddNcDimOrUseExisting(ncfile, "lon", lLonCount);

	NcVar * varLat = ncfile.add_var("lat", ncDouble, dimLat);
	NcVar * varLon = ncfile.add_var("lon", ncDouble, dimLon);
	NcVar * var = ncfile.add_var(
		grid.m_strVariableName.c_str(), ncFloat, dimTime, dimLat, dimLon);
	if ((varLat == NULL) || (varLon == NULL) || (var == NULL)) {
		_EXCEPTION1("Unable to create variables in file \"%s\"",
			strFilename.c_str());
	}

	varLat->add_att("units", "degrees_north");
	varLon->add_att("units", "degrees_east");
	var->add_att("units", grid.m_strUnits.c_str());
	var->add_att("_FillValue", std::numeric_limits<float>::quiet_NaN());

	varLat->put(&(grid.m_dLat[0]), lLatCount);
	varLon->put(&(grid.m_dLon[0]), lLonCount);

	for (size_t t = 0; t < grid.GetTimeCount(); t++) {
		var->set_cur(static_cast<long>(t), 0, 0);
		if (!var->put(grid.m_data(t), 1, lLatCount, lLonCount)) {
			_EXCEPTION1("Unable to write data to file \"%s\"",
				strFilename.c_str());
		}
	}
}

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Orders time series by their first time step.
///	</summary>
class TimeSeriesStartComparator {
public:
	TimeSeriesStartComparator(
		const std::vector<TimeSeriesGrid> & vecGrids
	) :
		m_vecGrids(vecGrids)
	{ }

	bool operator()(size_t a, size_t b) const {
		return (m_vecGrids[a].m_vecTime[0] < m_vecGrids[b].m_vecTime[0]);
	}

private:
	const std::vector<TimeSeriesGrid> & m_vecGrids;
};

///////////////////////////////////////////////////////////////////////////////

void ConcatenateTimeSeries(
	const std::vector<TimeSeriesGrid> & vecGrids,
	TimeSeriesGrid & gridOut
) {
	// Order the non-empty inputs by start time
	std::vector<size_t> vecOrder;
	for (size_t g = 0; g < vecGrids.size(); g++) {
		if (vecGrids[g].GetTimeCount() != 0) {
			vecOrder.push_back(g);
		}
	}
	if (vecOrder.size() == 0) {
		_PIPELINEERRORT(PipelineErrorKind_Input,
			"No time steps available for concatenation");
	}
	std::sort(
		vecOrder.begin(),
		vecOrder.end(),
		TimeSeriesStartComparator(vecGrids));

	const TimeSeriesGrid & gridFirst = vecGrids[vecOrder[0]];

	// Inputs must agree on grid, units and calendar
	for (size_t g = 1; g < vecOrder.size(); g++) {
		const TimeSeriesGrid & grid = vecGrids[vecOrder[g]];
		if (!gridFirst.HasSameSpatialGrid(grid)) {
			_PIPELINEERROR1(PipelineErrorKind_Input,
				"Spatial grid of \"%s\" differs between input files",
				grid.m_strVariableName.c_str());
		}
		if (CanonicalUnitName(grid.m_strUnits)
			!= CanonicalUnitName(gridFirst.m_strUnits)
		) {
			_PIPELINEERROR2(PipelineErrorKind_Units,
				"Units differ between input files (\"%s\", \"%s\")",
				gridFirst.m_strUnits.c_str(),
				grid.m_strUnits.c_str());
		}
		if (!Time::CalendarsCompatible(
			gridFirst.GetCalendarType(), grid.GetCalendarType())
		) {
			_PIPELINEERRORT(PipelineErrorKind_Input,
				"Calendars differ between input files");
		}
	}

	// Infer the time step: calendar months or a fixed number of seconds
	bool fMonthly = false;
	bool fStepKnown = false;
	double dStepSeconds = 0.0;

	for (size_t g = 0; g < vecOrder.size(); g++) {
		const TimeSeriesGrid & grid = vecGrids[vecOrder[g]];
		if (grid.GetTimeCount() < 2) {
			continue;
		}
		fMonthly = grid.IsMonthly();
		dStepSeconds = grid.m_vecTime[0].DeltaSeconds(grid.m_vecTime[1]);
		fStepKnown = true;
		break;
	}
	if (!fStepKnown && (vecOrder.size() > 1)) {
		const Time & time0 = vecGrids[vecOrder[0]].m_vecTime[0];
		const Time & time1 = vecGrids[vecOrder[1]].m_vecTime[0];
		dStepSeconds = time0.DeltaSeconds(time1);
		double dStepDays = dStepSeconds / 86400.0;
		fMonthly = ((dStepDays >= 27.5) && (dStepDays <= 31.5));
	}

	// Verify continuity across the merged axis
	size_t sTotalTimes = 0;
	const Time * pPrevious = NULL;

	for (size_t g = 0; g < vecOrder.size(); g++) {
		const TimeSeriesGrid & grid = vecGrids[vecOrder[g]];
		for (size_t t = 0; t < grid.GetTimeCount(); t++) {
			const Time & timeCurrent = grid.m_vecTime[t];
			if (pPrevious != NULL) {
				double dDelta = pPrevious->DeltaSeconds(timeCurrent);

				bool fContiguous;
				bool fOverlap;
				if (fMonthly) {
					int nMonths = timeCurrent.MonthIndex() - pPrevious->MonthIndex();
					fContiguous = (nMonths == 1);
					fOverlap = (nMonths < 1);
				} else {
					fContiguous = (fabs(dDelta - dStepSeconds) < 1.0);
					fOverlap = (dDelta < dStepSeconds);
				}

				if (!fContiguous) {
					_PIPELINEERROR3(PipelineErrorKind_Discontinuity,
						"Time series has %s between %s and %s",
						(fOverlap)?("an overlap"):("a gap"),
						pPrevious->ToString().c_str(),
						timeCurrent.ToString().c_str());
				}
			}
			pPrevious = &timeCurrent;
		}
		sTotalTimes += grid.GetTimeCount();
	}

	// Build the merged time axis and data
	NcTimeDimension vecTime = gridFirst.m_vecTime;
	vecTime.clear();
	vecTime.reserve(sTotalTimes);
	for (size_t g = 0; g < vecOrder.size(); g++) {
		const TimeSeriesGrid & grid = vecGrids[vecOrder[g]];
		vecTime.insert(vecTime.end(), grid.m_vecTime.begin(), grid.m_vecTime.end());
	}

	gridOut.Initialize(
		gridFirst.m_strVariableName,
		gridFirst.m_strUnits,
		vecTime,
		gridFirst.m_dLat,
		gridFirst.m_dLon);

	size_t sSliceSize = gridFirst.GetLatCount() * gridFirst.GetLonCount();
	size_t tOut = 0;
	for (size_t g = 0; g < vecOrder.size(); g++) {
		const TimeSeriesGrid & grid = vecGrids[vecOrder[g]];
		for (size_t t = 0; t < grid.GetTimeCount(); t++) {
			memcpy(gridOut.m_data(tOut), grid.m_data(t), sSliceSize * sizeof(float));
			tOut++;
		}
	}

	Announce(1, "Concatenated %lu files: %s to %s",
		vecOrder.size(),
		gridOut.m_vecTime[0].ToDateString().c_str(),
		gridOut.m_vecTime[sTotalTimes-1].ToDateString().c_str());
}

///////////////////////////////////////////////////////////////////////////////

void LoadConcatenatedTimeSeries(
	const std::vector<std::string> & vecFilenames,
	const std::string & strVariableName,
	TimeSeriesGrid & gridOut
) {
	if (vecFilenames.size() == 0) {
		_PIPELINEERROR1(PipelineErrorKind_Input,
			"No input files for variable \"%s\"", strVariableName.c_str());
	}

	std::vector<TimeSeriesGrid> vecGrids(vecFilenames.size());
	for (size_t f = 0; f < vecFilenames.size(); f++) {
		LoadTimeSeriesGrid(vecFilenames[f], strVariableName, vecGrids[f]);
	}

	ConcatenateTimeSeries(vecGrids, gridOut);
}

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Apply a linear unit conversion to every value of the grid.
///	</summary>
static void ConvertGridUnits(
	TimeSeriesGrid & grid,
	const std::string & strTargetUnits
) {
	if (grid.m_strUnits == "") {
		_PIPELINEERROR1(PipelineErrorKind_Units,
			"Variable \"%s\" has no units",
			grid.m_strVariableName.c_str());
	}

	// All supported conversions are of the form a * x + b
	double dZero = 0.0;
	double dOne = 1.0;
	if (!ConvertUnits<double>(dZero, grid.m_strUnits, strTargetUnits) ||
	    !ConvertUnits<double>(dOne, grid.m_strUnits, strTargetUnits)
	) {
		_PIPELINEERROR3(PipelineErrorKind_Units,
			"Cannot convert variable \"%s\" from \"%s\" to \"%s\"",
			grid.m_strVariableName.c_str(),
			grid.m_strUnits.c_str(),
			strTargetUnits.c_str());
	}

	double dScale = dOne - dZero;
	double dOffset = dZero;

	if ((dScale != 1.0) || (dOffset != 0.0)) {
		float * pData = grid.m_data.GetData();
		size_t sTotalSize = grid.m_data.GetTotalSize();
		for (size_t s = 0; s < sTotalSize; s++) {
			pData[s] = static_cast<float>(dScale * pData[s] + dOffset);
		}
	}

	grid.m_strUnits = strTargetUnits;
}

///////////////////////////////////////////////////////////////////////////////

void ConvertPrecipitationUnits(
	TimeSeriesGrid & grid
) {
	ConvertGridUnits(grid, "mm day-1");
}

///////////////////////////////////////////////////////////////////////////////

void ConvertTemperatureUnits(
	TimeSeriesGrid & grid
) {
	ConvertGridUnits(grid, "degC");
}

///////////////////////////////////////////////////////////////////////////////

void SelectYearRange(
	const TimeSeriesGrid & gridIn,
	const YearRange & range,
	TimeSeriesGrid & gridOut
) {
	std::vector<size_t> vecSelected;
	for (size_t t = 0; t < gridIn.GetTimeCount(); t++) {
		if (range.Contains(gridIn.m_vecTime[t].GetYear())) {
			vecSelected.push_back(t);
		}
	}

	if (vecSelected.size() == 0) {
		_PIPELINEERROR2(PipelineErrorKind_EmptyRange,
			"No time steps of \"%s\" in years %s",
			gridIn.m_strVariableName.c_str(),
			range.ToString().c_str());
	}

	NcTimeDimension vecTime = gridIn.m_vecTime;
	vecTime.clear();
	for (size_t s = 0; s < vecSelected.size(); s++) {
		vecTime.push_back(gridIn.m_vecTime[vecSelected[s]]);
	}

	gridOut.Initialize(
		gridIn.m_strVariableName,
		gridIn.m_strUnits,
		vecTime,
		gridIn.m_dLat,
		gridIn.m_dLon);

	size_t sSliceSize = gridIn.GetLatCount() * gridIn.GetLonCount();
	for (size_t s = 0; s < vecSelected.size(); s++) {
		memcpy(gridOut.m_data(s), gridIn.m_data(vecSelected[s]), sSliceSize * sizeof(float));
	}
}

///////////////////////////////////////////////////////////////////////////////
