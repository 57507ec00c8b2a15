///////////////////////////////////////////////////////////////////////////////
///
///	\file    ArtifactExport.h
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

#ifndef _ARTIFACTEXPORT_H_
#define _ARTIFACTEXPORT_H_

#include "DiagnosticArtifacts.h"

#include <string>

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Writes artifacts into an output directory: NetCDF files for every
///		artifact and CSV tables for the series.
///	</summary>
class FileArtifactWriter : public ArtifactWriter {

public:
	///	<summary>
	///		Constructor.
	///	</summary>
	FileArtifactWriter(
		const std::string & strOutputDir
	) :
		m_strOutputDir(strOutputDir)
	{ }

public:
	///	<summary>
	///		Path of an artifact file with the given extension.
	///	</summary>
	std::string GetPath(
		const ArtifactKey & key,
		const std::string & strExtension
	) const;

public:
	///	<summary>
	///		Write a threshold field as NetCDF.
	///	</summary>
	virtual void WriteThresholdField(
		const PercentileThresholdField & field
	);

	///	<summary>
	///		Write an exceedance series as NetCDF and CSV.
	///	</summary>
	virtual void WriteExceedanceSeries(
		const ExceedanceSeries & series
	);

	///	<summary>
	///		Write a climate index series as NetCDF and CSV.
	///	</summary>
	virtual void WriteClimateIndexSeries(
		const ClimateIndexSeries & series
	);

private:
	///	<summary>
	///		Output directory.
	///	</summary>
	std::string m_strOutputDir;
};

///////////////////////////////////////////////////////////////////////////////

#endif
