///////////////////////////////////////////////////////////////////////////////
///
///	\file    Announce.cpp
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

#ifdef CLIMDIAG_MPIOMP
#include <mpi.h>
#endif

#include "Announce.h"
#include "Exception.h"

#include <cstdio>
#include <cstring>
#include <cstdarg>

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Verbosity level.
///	</summary>
int g_iVerbosityLevel = 0;

///	<summary>
///		Output buffer (stdout if NULL).
///	</summary>
FILE * g_fpAnnounceOutput = NULL;

///	<summary>
///		Only output on rank 0.
///	</summary>
bool g_fOnlyOutputOnRankZero = false;

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Maximum announcement buffer size.
///	</summary>
static const int AnnouncementBufferSize = 1024;

///	<summary>
///		Maximum indentation level.
///	</summary>
static const int MaximumIndentationLevel = 16;

///	<summary>
///		Banner size.
///	</summary>
static const int BannerSize = 60;

///	<summary>
///		Current indentation level.
///	</summary>
static int s_nIndentationLevel = 0;

///	<summary>
///		Flag indicating whether a start block is still dangling.
///	</summary>
static bool s_fBlockFlag = false;

///////////////////////////////////////////////////////////////////////////////

static FILE * AnnounceOutput() {
	if (g_fpAnnounceOutput == NULL) {
		return stdout;
	}
	return g_fpAnnounceOutput;
}

///////////////////////////////////////////////////////////////////////////////

static bool AnnounceIsSilent() {
#ifdef CLIMDIAG_MPIOMP
	if (g_fOnlyOutputOnRankZero) {
		int nRank;
		MPI_Comm_rank(MPI_COMM_WORLD, &nRank);
		if (nRank > 0) {
			return true;
		}
	}
#endif
	return false;
}

///////////////////////////////////////////////////////////////////////////////

static void FormatAnnouncement(
	char * szBuffer,
	const char * szText,
	va_list arguments
) {
	int nc = vsnprintf(szBuffer, AnnouncementBufferSize, szText, arguments);
	if (nc > AnnouncementBufferSize-2) {
		szBuffer[AnnouncementBufferSize-4] = '.';
		szBuffer[AnnouncementBufferSize-3] = '.';
		szBuffer[AnnouncementBufferSize-2] = '.';
		szBuffer[AnnouncementBufferSize-1] = '\0';
	}
}

///////////////////////////////////////////////////////////////////////////////

static void CloseDanglingBlock() {
	if (s_fBlockFlag) {
		fprintf(AnnounceOutput(), "\n");
		s_fBlockFlag = false;
	}
}

///////////////////////////////////////////////////////////////////////////////

static void WriteIndentedLine(const char * szBuffer) {
	FILE * fp = AnnounceOutput();
	for (int i = 0; i < s_nIndentationLevel; i++) {
		fprintf(fp, "..");
	}
	fprintf(fp, "%s\n", szBuffer);
	fflush(fp);
}

///////////////////////////////////////////////////////////////////////////////

FILE * AnnounceGetOutputBuffer() {
	return AnnounceOutput();
}

///////////////////////////////////////////////////////////////////////////////

void AnnounceSetOutputBuffer(FILE * fpAnnounceOutput) {
	CloseDanglingBlock();
	fflush(AnnounceOutput());

	g_fpAnnounceOutput = fpAnnounceOutput;
	s_nIndentationLevel = 0;
}

///////////////////////////////////////////////////////////////////////////////

void AnnounceSetVerbosityLevel(int iVerbosityLevel) {
	g_iVerbosityLevel = iVerbosityLevel;
}

///////////////////////////////////////////////////////////////////////////////

void AnnounceOnlyOutputOnRankZero() {
	g_fOnlyOutputOnRankZero = true;
}

///////////////////////////////////////////////////////////////////////////////

void AnnounceOutputOnAllRanks() {
	g_fOnlyOutputOnRankZero = false;
}

///////////////////////////////////////////////////////////////////////////////

bool AnnounceIsOnlyOutputOnRankZero() {
	return g_fOnlyOutputOnRankZero;
}

///////////////////////////////////////////////////////////////////////////////

int AnnounceGetIndentationLevel() {
	return s_nIndentationLevel;
}

///////////////////////////////////////////////////////////////////////////////

void AnnounceSetIndentationLevel(int iIndentationLevel) {
	if ((iIndentationLevel < 0) ||
	    (iIndentationLevel > MaximumIndentationLevel)
	) {
		_EXCEPTION1("Invalid indentation level (%i)", iIndentationLevel);
	}

	CloseDanglingBlock();
	s_nIndentationLevel = iIndentationLevel;
}

///////////////////////////////////////////////////////////////////////////////

void AnnounceStartBlock(
	const char * szText,
	...
) {
	// Do not start a block at maximum indentation level
	if (s_nIndentationLevel == MaximumIndentationLevel) {
		return;
	}
	if (szText == NULL) {
		return;
	}
	if (AnnounceIsSilent()) {
		return;
	}

	CloseDanglingBlock();

	char szBuffer[AnnouncementBufferSize];
	va_list arguments;
	va_start(arguments, szText);
	FormatAnnouncement(szBuffer, szText, arguments);
	va_end(arguments);

	FILE * fp = AnnounceOutput();
	for (int i = 0; i < s_nIndentationLevel; i++) {
		fprintf(fp, "..");
	}
	fprintf(fp, "%s", szBuffer);

	s_fBlockFlag = true;
	s_nIndentationLevel++;

	fflush(fp);
}

///////////////////////////////////////////////////////////////////////////////

void AnnounceStartBlock(
	int iVerbosity,
	const char * szText
) {
	if (iVerbosity > g_iVerbosityLevel) {
		return;
	}

	AnnounceStartBlock("%s", szText);
}

///////////////////////////////////////////////////////////////////////////////

void AnnounceEndBlock(
	const char * szText,
	...
) {
	// Do not remove a block at minimum indentation level
	if (s_nIndentationLevel == 0) {
		return;
	}
	if (AnnounceIsSilent()) {
		return;
	}

	FILE * fp = AnnounceOutput();

	if (szText != NULL) {
		char szBuffer[AnnouncementBufferSize];
		va_list arguments;
		va_start(arguments, szText);
		FormatAnnouncement(szBuffer, szText, arguments);
		va_end(arguments);

		// Block was opened without any nested output; finish it in place
		if (s_fBlockFlag) {
			s_fBlockFlag = false;
			fprintf(fp, ".. %s\n", szBuffer);
			s_nIndentationLevel--;

		} else {
			WriteIndentedLine(szBuffer);
			s_nIndentationLevel--;
		}

	} else {
		CloseDanglingBlock();
		s_nIndentationLevel--;
	}

	fflush(fp);
}

///////////////////////////////////////////////////////////////////////////////

void AnnounceEndBlock(
	int iVerbosity,
	const char * szText
) {
	if (iVerbosity > g_iVerbosityLevel) {
		return;
	}

	if (szText == NULL) {
		AnnounceEndBlock(NULL);
	} else {
		AnnounceEndBlock("%s", szText);
	}
}

///////////////////////////////////////////////////////////////////////////////

void Announce(const char * szText, ...) {

	if (AnnounceIsSilent()) {
		return;
	}

	CloseDanglingBlock();

	if (szText == NULL) {
		return;
	}

	char szBuffer[AnnouncementBufferSize];
	va_list arguments;
	va_start(arguments, szText);
	FormatAnnouncement(szBuffer, szText, arguments);
	va_end(arguments);

	WriteIndentedLine(szBuffer);
}

///////////////////////////////////////////////////////////////////////////////

void Announce(
	int iVerbosity,
	const char * szText,
	...
) {
	if (iVerbosity > g_iVerbosityLevel) {
		return;
	}
	if (AnnounceIsSilent()) {
		return;
	}

	CloseDanglingBlock();

	if (szText == NULL) {
		return;
	}

	char szBuffer[AnnouncementBufferSize];
	va_list arguments;
	va_start(arguments, szText);
	FormatAnnouncement(szBuffer, szText, arguments);
	va_end(arguments);

	WriteIndentedLine(szBuffer);
}

///////////////////////////////////////////////////////////////////////////////

void AnnounceBanner(const char * szText) {

	if (AnnounceIsSilent()) {
		return;
	}

	CloseDanglingBlock();

	FILE * fp = AnnounceOutput();

	if (szText == NULL) {
		for (int i = 0; i < BannerSize; i++) {
			fprintf(fp, "-");
		}
		fprintf(fp, "\n");
		fflush(fp);
		return;
	}

	int nLen = strlen(szText) + 2;
	fprintf(fp, "--");
	if (nLen > BannerSize - 2) {
		fprintf(fp, "%s--", szText);
	} else {
		fprintf(fp, " %s ", szText);
		for (int i = 0; i < BannerSize - nLen - 2; i++) {
			fprintf(fp, "-");
		}
	}
	fprintf(fp, "\n");
	fflush(fp);
}

///////////////////////////////////////////////////////////////////////////////
