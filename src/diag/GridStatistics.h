///////////////////////////////////////////////////////////////////////////////
///
///	\file    GridStatistics.h
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

#ifndef _GRIDSTATISTICS_H_
#define _GRIDSTATISTICS_H_

#include "Exception.h"
#include "DataArray1D.h"
#include "DataArray2D.h"

#include <limits>

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Compute the area weight cos(lat) of each latitude row of a regular
///		latitude-longitude grid.
///	</summary>
void ComputeLatitudeWeights(
	const DataArray1D<double> & dLat,
	DataArray1D<double> & dWeights
);

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Area-weighted mean of a (lat, lon) field.  NaN cells are excluded
///		from both the sum and the total weight.
///	</summary>
///	<returns>
///		The weighted mean, or NaN if no cell carries data.
///	</returns>
template <typename T>
double AreaWeightedMean(
	const T * pField,
	const DataArray1D<double> & dWeights,
	size_t sLonCount
) {
	double dSum = 0.0;
	double dWeightSum = 0.0;

	for (size_t j = 0; j < dWeights.GetRows(); j++) {
		for (size_t i = 0; i < sLonCount; i++) {
			double dValue = static_cast<double>(pField[j * sLonCount + i]);
			if (dValue != dValue) {
				continue;
			}
			dSum += dWeights[j] * dValue;
			dWeightSum += dWeights[j];
		}
	}

	if (dWeightSum == 0.0) {
		return std::numeric_limits<double>::quiet_NaN();
	}
	return (dSum / dWeightSum);
}

///	<summary>
///		Area-weighted mean of a (lat, lon) field.
///	</summary>
template <typename T>
double AreaWeightedMean(
	const DataArray2D<T> & field,
	const DataArray1D<double> & dWeights
) {
	if (field.GetRows() != dWeights.GetRows()) {
		_EXCEPTION2("Field / weight size mismatch (%lu, %lu)",
			field.GetRows(), dWeights.GetRows());
	}
	return AreaWeightedMean<T>(field.GetData(), dWeights, field.GetColumns());
}

///////////////////////////////////////////////////////////////////////////////

#endif
