///////////////////////////////////////////////////////////////////////////////
///
///	\file    EnsembleRunner.h
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

#ifndef _ENSEMBLERUNNER_H_
#define _ENSEMBLERUNNER_H_

#include "DiagnosticTypes.h"

#include <string>
#include <vector>

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Work performed for one ensemble member.
///	</summary>
class MemberTask {

public:
	///	<summary>
	///		Virtual destructor.
	///	</summary>
	virtual ~MemberTask() { }

	///	<summary>
	///		Process one member.  eStage is kept current so that a failure can
	///		be attributed to the stage it occurred in.
	///	</summary>
	virtual void Run(
		const std::string & strMember,
		PipelineStage & eStage
	) = 0;
};

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Result of processing one member.
///	</summary>
struct MemberOutcome {

	///	<summary>
	///		Constructor.
	///	</summary>
	MemberOutcome() :
		fSuccess(false),
		eStage(PipelineStage_Ingest)
	{ }

	// Member identifier
	std::string strMember;

	// Member completed all stages
	bool fSuccess;

	// Stage reached (failing stage on failure)
	PipelineStage eStage;

	// Failure kind ("DiscontinuityError", ...)
	std::string strErrorKind;

	// Failure message
	std::string strMessage;
};

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Outcomes of all members of a run.
///	</summary>
class EnsembleSummary {

public:
	///	<summary>
	///		Number of failed members.
	///	</summary>
	size_t GetFailureCount() const;

	///	<summary>
	///		Outcome of the given member, or NULL if it was not processed.
	///	</summary>
	const MemberOutcome * FindOutcome(
		const std::string & strMember
	) const;

	///	<summary>
	///		Announce a report listing succeeded and failed members.
	///	</summary>
	void Report() const;

	///	<summary>
	///		Write the report to a file.
	///	</summary>
	void WriteReport(
		const std::string & strFilename
	) const;

public:
	///	<summary>
	///		Outcomes in member order.
	///	</summary>
	std::vector<MemberOutcome> m_vecOutcomes;
};

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Run the task for every member.  A failure is recorded and does not
///		prevent other members from running.  Under MPI members are
///		distributed round-robin over ranks and all outcomes, failure
///		messages included, are gathered on every rank.  If strLogDir is non-empty each member logs to
///		"strLogDir/member_log.txt".
///	</summary>
void RunEnsemble(
	const std::vector<std::string> & vecMembers,
	MemberTask & task,
	const std::string & strLogDir,
	EnsembleSummary & summary
);

///////////////////////////////////////////////////////////////////////////////

#endif
