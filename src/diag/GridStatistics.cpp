///////////////////////////////////////////////////////////////////////////////
///
///	\file    GridStatistics.cpp
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

#include "GridStatistics.h"

#include <cmath>

///////////////////////////////////////////////////////////////////////////////

void ComputeLatitudeWeights(
	const DataArray1D<double> & dLat,
	DataArray1D<double> & dWeights
) {
	dWeights.Allocate(dLat.GetRows());
	for (size_t j = 0; j < dLat.GetRows(); j++) {
		dWeights[j] = cos(dLat[j] * M_PI / 180.0);
		if (dWeights[j] < 0.0) {
			dWeights[j] = 0.0;
		}
	}
}

///////////////////////////////////////////////////////////////////////////////
