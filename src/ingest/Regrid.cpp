///////////////////////////////////////////////////////////////////////////////
///
///	\file    Regrid.cpp
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

#include "Regrid.h"
#include "Announce.h"
#include "LatLonBox.h"
#include "PipelineError.h"

#include <cmath>
#include <limits>

///////////////////////////////////////////////////////////////////////////////

void GenerateRegularGlobalGrid(
	double dResolution,
	DataArray1D<double> & dLat,
	DataArray1D<double> & dLon
) {
	if (dResolution <= 0.0) {
		_PIPELINEERROR1(PipelineErrorKind_Regrid,
			"Invalid target resolution (%f)", dResolution);
	}

	double dLonCount = 360.0 / dResolution;
	double dLatCount = 180.0 / dResolution;
	int nLonCount = static_cast<int>(dLonCount + 0.5);
	int nLatCount = static_cast<int>(dLatCount + 0.5);

	if ((fabs(dLonCount - static_cast<double>(nLonCount)) > 1.0e-6) ||
	    (fabs(dLatCount - static_cast<double>(nLatCount)) > 1.0e-6)
	) {
		_PIPELINEERROR1(PipelineErrorKind_Regrid,
			"Target resolution %f does not evenly divide the sphere",
			dResolution);
	}

	dLat.Allocate(nLatCount);
	dLon.Allocate(nLonCount);

	for (int j = 0; j < nLatCount; j++) {
		dLat[j] = -90.0 + (static_cast<double>(j) + 0.5) * dResolution;
	}
	for (int i = 0; i < nLonCount; i++) {
		dLon[i] = static_cast<double>(i) * dResolution;
	}
}

///////////////////////////////////////////////////////////////////////////////

void RegridBilinear(
	const TimeSeriesGrid & gridIn,
	double dResolution,
	TimeSeriesGrid & gridOut
) {
	const size_t sLatIn = gridIn.GetLatCount();
	const size_t sLonIn = gridIn.GetLonCount();

	if ((sLatIn < 2) || (sLonIn < 2)) {
		_PIPELINEERROR2(PipelineErrorKind_Regrid,
			"Degenerate source grid (%lu x %lu); at least 2 points required"
			" along each axis", sLatIn, sLonIn);
	}

	// Source latitudes must be strictly increasing
	for (size_t j = 1; j < sLatIn; j++) {
		if (gridIn.m_dLat[j] <= gridIn.m_dLat[j-1]) {
			_PIPELINEERRORT(PipelineErrorKind_Regrid,
				"Source latitudes are not strictly increasing");
		}
	}

	// Unwrap source longitudes into [lon0, lon0 + 360)
	DataArray1D<double> dLonIn(sLonIn);
	dLonIn[0] = gridIn.m_dLon[0];
	for (size_t i = 1; i < sLonIn; i++) {
		dLonIn[i] = dLonIn[0]
			+ LatLonBox<double>::wrap(gridIn.m_dLon[i] - dLonIn[0]);
		if (dLonIn[i] <= dLonIn[i-1]) {
			_PIPELINEERRORT(PipelineErrorKind_Regrid,
				"Source longitudes are not strictly increasing");
		}
	}

	DataArray1D<double> dLatOut;
	DataArray1D<double> dLonOut;
	GenerateRegularGlobalGrid(dResolution, dLatOut, dLonOut);

	const size_t sLatOut = dLatOut.GetRows();
	const size_t sLonOut = dLonOut.GetRows();

	// Latitude stencil
	DataArray1D<int> iLatA(sLatOut);
	DataArray1D<int> iLatB(sLatOut);
	DataArray1D<double> dLatWeightB(sLatOut);

	for (size_t j = 0; j < sLatOut; j++) {
		double dY = dLatOut[j];
		if (dY <= gridIn.m_dLat[0]) {
			iLatA[j] = 0;
			iLatB[j] = 0;
			dLatWeightB[j] = 0.0;
		} else if (dY >= gridIn.m_dLat[sLatIn-1]) {
			iLatA[j] = static_cast<int>(sLatIn-1);
			iLatB[j] = static_cast<int>(sLatIn-1);
			dLatWeightB[j] = 0.0;
		} else {
			size_t jA = 0;
			while (gridIn.m_dLat[jA+1] < dY) {
				jA++;
			}
			iLatA[j] = static_cast<int>(jA);
			iLatB[j] = static_cast<int>(jA+1);
			dLatWeightB[j] =
				(dY - gridIn.m_dLat[jA])
				/ (gridIn.m_dLat[jA+1] - gridIn.m_dLat[jA]);
		}
	}

	// Longitude stencil (periodic)
	DataArray1D<int> iLonA(sLonOut);
	DataArray1D<int> iLonB(sLonOut);
	DataArray1D<double> dLonWeightB(sLonOut);

	for (size_t i = 0; i < sLonOut; i++) {
		double dX = dLonIn[0] + LatLonBox<double>::wrap(dLonOut[i] - dLonIn[0]);
		if (dX >= dLonIn[sLonIn-1]) {
			iLonA[i] = static_cast<int>(sLonIn-1);
			iLonB[i] = 0;
			dLonWeightB[i] =
				(dX - dLonIn[sLonIn-1])
				/ (dLonIn[0] + 360.0 - dLonIn[sLonIn-1]);
		} else {
			size_t iA = 0;
			while (dLonIn[iA+1] <= dX) {
				iA++;
			}
			iLonA[i] = static_cast<int>(iA);
			iLonB[i] = static_cast<int>(iA+1);
			dLonWeightB[i] = (dX - dLonIn[iA]) / (dLonIn[iA+1] - dLonIn[iA]);
		}
	}

	Announce(1, "Regridding \"%s\" from %lu x %lu to %lu x %lu",
		gridIn.m_strVariableName.c_str(),
		sLatIn, sLonIn, sLatOut, sLonOut);

	gridOut.Initialize(
		gridIn.m_strVariableName,
		gridIn.m_strUnits,
		gridIn.m_vecTime,
		dLatOut,
		dLonOut);

	for (size_t t = 0; t < gridIn.GetTimeCount(); t++) {
		for (size_t j = 0; j < sLatOut; j++) {
			for (size_t i = 0; i < sLonOut; i++) {

				const int iLat[2] = { iLatA[j], iLatB[j] };
				const int iLon[2] = { iLonA[i], iLonB[i] };
				const double dWeightLat[2] = { 1.0 - dLatWeightB[j], dLatWeightB[j] };
				const double dWeightLon[2] = { 1.0 - dLonWeightB[i], dLonWeightB[i] };

				double dSum = 0.0;
				double dWeightSum = 0.0;
				for (int a = 0; a < 2; a++) {
				for (int b = 0; b < 2; b++) {
					double dWeight = dWeightLat[a] * dWeightLon[b];
					if (dWeight == 0.0) {
						continue;
					}
					float flValue = gridIn.m_data(t, iLat[a], iLon[b]);
					if (flValue != flValue) {
						continue;
					}
					dSum += dWeight * static_cast<double>(flValue);
					dWeightSum += dWeight;
				}
				}

				if (dWeightSum > 0.0) {
					gridOut.m_data(t,j,i) = static_cast<float>(dSum / dWeightSum);
				}
			}
		}
	}
}

///////////////////////////////////////////////////////////////////////////////
