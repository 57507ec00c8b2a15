///////////////////////////////////////////////////////////////////////////////
///
///	\file    EnsembleRunner.cpp
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

#include "EnsembleRunner.h"
#include "Announce.h"
#include "Exception.h"
#include "PipelineError.h"

#if defined(CLIMDIAG_MPIOMP)
#include <mpi.h>
#endif

#include <cstdio>
#include <exception>
#include <string>
#include <vector>

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Outcome status codes exchanged between ranks.
///	</summary>
enum OutcomeStatus {
	OutcomeStatus_NotRun = 0,
	OutcomeStatus_Success = 1,
	OutcomeStatus_Failure = 2
};

///	<summary>
///		Failure kind codes beyond the PipelineErrorKind values.
///	</summary>
static const int OutcomeKind_Exception = PipelineErrorKind_Configuration + 1;
static const int OutcomeKind_StdException = PipelineErrorKind_Configuration + 2;

///////////////////////////////////////////////////////////////////////////////

static const char * OutcomeKindName(int iKind) {
	if (iKind == OutcomeKind_Exception) {
		return "Exception";
	}
	if (iKind == OutcomeKind_StdException) {
		return "std::exception";
	}
	return PipelineErrorKindName(static_cast<PipelineErrorKind>(iKind));
}

///////////////////////////////////////////////////////////////////////////////

size_t EnsembleSummary::GetFailureCount() const {
	size_t sFailures = 0;
	for (size_t m = 0; m < m_vecOutcomes.size(); m++) {
		if (!m_vecOutcomes[m].fSuccess) {
			sFailures++;
		}
	}
	return sFailures;
}

///////////////////////////////////////////////////////////////////////////////

const MemberOutcome * EnsembleSummary::FindOutcome(
	const std::string & strMember
) const {
	for (size_t m = 0; m < m_vecOutcomes.size(); m++) {
		if (m_vecOutcomes[m].strMember == strMember) {
			return &(m_vecOutcomes[m]);
		}
	}
	return NULL;
}

///////////////////////////////////////////////////////////////////////////////

void EnsembleSummary::Report() const {
	size_t sFailures = GetFailureCount();

	AnnounceStartBlock("Ensemble summary: %lu succeeded, %lu failed",
		m_vecOutcomes.size() - sFailures, sFailures);

	for (size_t m = 0; m < m_vecOutcomes.size(); m++) {
		const MemberOutcome & outcome = m_vecOutcomes[m];
		if (outcome.fSuccess) {
			Announce("%s: succeeded", outcome.strMember.c_str());
		} else {
			Announce("%s: FAILED in stage \"%s\" (%s)",
				outcome.strMember.c_str(),
				PipelineStageName(outcome.eStage),
				outcome.strErrorKind.c_str());
			if (outcome.strMessage.length() != 0) {
				Announce("  %s", outcome.strMessage.c_str());
			}
		}
	}

	AnnounceEndBlock(NULL);
}

///////////////////////////////////////////////////////////////////////////////

void EnsembleSummary::WriteReport(
	const std::string & strFilename
) const {
	FILE * fp = fopen(strFilename.c_str(), "w");
	if (fp == NULL) {
		_EXCEPTION1("Unable to open file \"%s\" for writing",
			strFilename.c_str());
	}

	fprintf(fp, "member,status,stage,error_kind\n");
	for (size_t m = 0; m < m_vecOutcomes.size(); m++) {
		const MemberOutcome & outcome = m_vecOutcomes[m];
		if (outcome.fSuccess) {
			fprintf(fp, "%s,success,,\n", outcome.strMember.c_str());
		} else {
			fprintf(fp, "%s,failure,%s,%s\n",
				outcome.strMember.c_str(),
				PipelineStageName(outcome.eStage),
				outcome.strErrorKind.c_str());
		}
	}
	fclose(fp);
}

///////////////////////////////////////////////////////////////////////////////

void RunEnsemble(
	const std::vector<std::string> & vecMembers,
	MemberTask & task,
	const std::string & strLogDir,
	EnsembleSummary & summary
) {
	const size_t sMembers = vecMembers.size();

	std::vector<int> vecStatus(sMembers, OutcomeStatus_NotRun);
	std::vector<int> vecStage(sMembers, 0);
	std::vector<int> vecKind(sMembers, 0);
	std::vector<std::string> vecMessage(sMembers);

#if defined(CLIMDIAG_MPIOMP)
	// Spread members across ranks
	int nMPIRank;
	MPI_Comm_rank(MPI_COMM_WORLD, &nMPIRank);

	int nMPISize;
	MPI_Comm_size(MPI_COMM_WORLD, &nMPISize);
#endif

	for (size_t m = 0; m < sMembers; m++) {
#if defined(CLIMDIAG_MPIOMP)
		if (static_cast<int>(m % nMPISize) != nMPIRank) {
			continue;
		}
#endif
		const std::string & strMember = vecMembers[m];

		// Redirect output to the member log
		int iIndentationLevel = AnnounceGetIndentationLevel();
		FILE * fpPrevious = AnnounceGetOutputBuffer();
		bool fOnlyRankZero = AnnounceIsOnlyOutputOnRankZero();

		FILE * fpLog = NULL;
		if (strLogDir.length() != 0) {
			std::string strLogFile = strLogDir + "/" + strMember + "_log.txt";
			fpLog = fopen(strLogFile.c_str(), "w");
			if (fpLog == NULL) {
				Announce("WARNING: Unable to open log file \"%s\"",
					strLogFile.c_str());
			} else {
				AnnounceSetOutputBuffer(fpLog);
				AnnounceOutputOnAllRanks();
			}
		}

		AnnounceBanner();
		Announce("Member %s", strMember.c_str());
		AnnounceBanner();

		PipelineStage eStage = PipelineStage_Ingest;
		int iKind = -1;
		std::string strMessage;

		try {
			task.Run(strMember, eStage);

		} catch(PipelineError & e) {
			iKind = static_cast<int>(e.GetKind());
			strMessage = e.ToString();

		} catch(Exception & e) {
			iKind = OutcomeKind_Exception;
			strMessage = e.ToString();

		} catch(std::exception & e) {
			iKind = OutcomeKind_StdException;
			strMessage = e.what();
		}

		if (iKind < 0) {
			Announce("Member %s completed", strMember.c_str());
			vecStatus[m] = OutcomeStatus_Success;
		} else {
			Announce("ERROR: Member %s failed in stage \"%s\"",
				strMember.c_str(), PipelineStageName(eStage));
			Announce("%s", strMessage.c_str());
			vecStatus[m] = OutcomeStatus_Failure;
			vecKind[m] = iKind;
			vecMessage[m] = strMessage;
		}
		vecStage[m] = static_cast<int>(eStage);

		// Restore output
		if (fpLog != NULL) {
			AnnounceSetOutputBuffer(fpPrevious);
			if (fOnlyRankZero) {
				AnnounceOnlyOutputOnRankZero();
			}
			fclose(fpLog);
		}

		// Blocks left open by a failed member are closed
		AnnounceSetIndentationLevel(iIndentationLevel);

		if (iKind < 0) {
			Announce("Member %s: succeeded", strMember.c_str());
		} else {
			Announce("Member %s: FAILED (%s)",
				strMember.c_str(), OutcomeKindName(iKind));
		}
	}

#if defined(CLIMDIAG_MPIOMP)
	// Gather outcomes; each member is owned by exactly one rank
	if (sMembers != 0) {
		std::vector<int> vecLocal(3 * sMembers);
		std::vector<int> vecGlobal(3 * sMembers);
		for (size_t m = 0; m < sMembers; m++) {
			vecLocal[3*m  ] = vecStatus[m];
			vecLocal[3*m+1] = vecStage[m];
			vecLocal[3*m+2] = vecKind[m];
		}
		MPI_Allreduce(
			&(vecLocal[0]),
			&(vecGlobal[0]),
			static_cast<int>(3 * sMembers),
			MPI_INT,
			MPI_MAX,
			MPI_COMM_WORLD);
		for (size_t m = 0; m < sMembers; m++) {
			vecStatus[m] = vecGlobal[3*m  ];
			vecStage[m]  = vecGlobal[3*m+1];
			vecKind[m]   = vecGlobal[3*m+2];
		}

		// Gather failure messages; rank r holds members r, r+size, ...
		std::vector<char> vecLocalText;
		for (size_t m = static_cast<size_t>(nMPIRank); m < sMembers; m += nMPISize) {
			vecLocalText.insert(
				vecLocalText.end(), vecMessage[m].begin(), vecMessage[m].end());
			vecLocalText.push_back('\0');
		}

		int nLocalLength = static_cast<int>(vecLocalText.size());
		std::vector<int> vecLength(nMPISize);
		MPI_Allgather(
			&nLocalLength,
			1,
			MPI_INT,
			&(vecLength[0]),
			1,
			MPI_INT,
			MPI_COMM_WORLD);

		std::vector<int> vecDisplacement(nMPISize);
		int nTotalLength = 0;
		for (int r = 0; r < nMPISize; r++) {
			vecDisplacement[r] = nTotalLength;
			nTotalLength += vecLength[r];
		}

		std::vector<char> vecGlobalText(nTotalLength + 1, '\0');
		MPI_Allgatherv(
			vecLocalText.data(),
			nLocalLength,
			MPI_CHAR,
			&(vecGlobalText[0]),
			&(vecLength[0]),
			&(vecDisplacement[0]),
			MPI_CHAR,
			MPI_COMM_WORLD);

		for (int r = 0; r < nMPISize; r++) {
			size_t sPos = static_cast<size_t>(vecDisplacement[r]);
			for (size_t m = static_cast<size_t>(r); m < sMembers; m += nMPISize) {
				vecMessage[m] = std::string(&(vecGlobalText[sPos]));
				sPos += vecMessage[m].length() + 1;
			}
		}
	}
#endif

	summary.m_vecOutcomes.clear();
	for (size_t m = 0; m < sMembers; m++) {
		MemberOutcome outcome;
		outcome.strMember = vecMembers[m];
		outcome.fSuccess = (vecStatus[m] == OutcomeStatus_Success);
		outcome.eStage = static_cast<PipelineStage>(vecStage[m]);
		if (vecStatus[m] == OutcomeStatus_Failure) {
			outcome.strErrorKind = OutcomeKindName(vecKind[m]);
			outcome.strMessage = vecMessage[m];
		} else if (vecStatus[m] == OutcomeStatus_NotRun) {
			outcome.strErrorKind = "NotRun";
		}
		summary.m_vecOutcomes.push_back(outcome);
	}
}

///////////////////////////////////////////////////////////////////////////////
