///////////////////////////////////////////////////////////////////////////////
///
///	\file    MemberPipeline.h
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

#ifndef _MEMBERPIPELINE_H_
#define _MEMBERPIPELINE_H_

#include "DiagnosticArtifacts.h"
#include "EnsembleParam.h"
#include "EnsembleRunner.h"
#include "InputCatalog.h"

#include <string>

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Full diagnostic pipeline of one ensemble member: ingest, extreme
///		statistics and ocean index, with all artifacts sent to the writer.
///	</summary>
class MemberPipeline : public MemberTask {

public:
	///	<summary>
	///		Constructor.
	///	</summary>
	MemberPipeline(
		const EnsembleDiagnosticsParam & param,
		const InputCatalog & catalog,
		ArtifactWriter & writer
	) :
		m_param(param),
		m_catalog(catalog),
		m_writer(writer)
	{ }

public:
	///	<summary>
	///		Process one member.
	///	</summary>
	virtual void Run(
		const std::string & strMember,
		PipelineStage & eStage
	);

protected:
	///	<summary>
	///		Thresholds and exceedance series of precipitation.
	///	</summary>
	void RunExtremes(
		const std::string & strMember,
		PipelineStage & eStage
	);

	///	<summary>
	///		Ocean index of sea surface temperature.
	///	</summary>
	void RunOceanIndex(
		const std::string & strMember,
		PipelineStage & eStage
	);

private:
	///	<summary>
	///		Run configuration.
	///	</summary>
	const EnsembleDiagnosticsParam & m_param;

	///	<summary>
	///		Input files.
	///	</summary>
	const InputCatalog & m_catalog;

	///	<summary>
	///		Destination of artifacts.
	///	</summary>
	ArtifactWriter & m_writer;
};

///////////////////////////////////////////////////////////////////////////////

#endif
