///////////////////////////////////////////////////////////////////////////////
///
///	\file    Announce.h
///	\author  Paul Ullrich
///	\version October 19, 2026
///
///	<summary>
///		Functions for making announcements to standard output safely when
///		using MPI.
///	</summary>
///	<remarks>
///		Copyright 2000-2026 Paul Ullrich
///
///		This file is distributed as part of the ClimDiag source code package.
///		Permission is granted to use, copy, modify and distribute this
///		source code and its documentation under the terms of the GNU General
///		Public License.  This software is provided "as is" without express
///		or implied warranty.
///	</remarks>

#ifndef _ANNOUNCE_H_
#define _ANNOUNCE_H_

#include <cstdio>

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Get the current output buffer.
///	</summary>
FILE * AnnounceGetOutputBuffer();

///	<summary>
///		Redirect announcements to the given buffer.  The indentation level
///		is reset so that a new buffer starts at the outermost block.
///	</summary>
void AnnounceSetOutputBuffer(FILE * fpAnnounceOutput);

///	<summary>
///		Set the verbosity level.
///	</summary>
void AnnounceSetVerbosityLevel(int iVerbosityLevel);

///	<summary>
///		Only output on MPI rank zero.
///	</summary>
void AnnounceOnlyOutputOnRankZero();

///	<summary>
///		Output on all MPI ranks.
///	</summary>
void AnnounceOutputOnAllRanks();

///	<summary>
///		Check if output is restricted to MPI rank zero.
///	</summary>
bool AnnounceIsOnlyOutputOnRankZero();

///	<summary>
///		Get the current indentation level.
///	</summary>
int AnnounceGetIndentationLevel();

///	<summary>
///		Set the indentation level, closing any blocks opened beyond it.
///	</summary>
void AnnounceSetIndentationLevel(int iIndentationLevel);

///	<summary>
///		Begin a new announcement block.
///	</summary>
void AnnounceStartBlock(const char * szText, ...);

///	<summary>
///		Begin a new announcement block if verbosity is high enough.
///	</summary>
void AnnounceStartBlock(int iVerbosity, const char * szText);

///	<summary>
///		End an announcement block.
///	</summary>
void AnnounceEndBlock(const char * szText, ...);

///	<summary>
///		End an announcement block if verbosity is high enough.
///	</summary>
void AnnounceEndBlock(int iVerbosity, const char * szText);

///	<summary>
///		Make an announcement.
///	</summary>
void Announce(const char * szText, ...);

///	<summary>
///		Make an announcement if verbosity is high enough.
///	</summary>
void Announce(int iVerbosity, const char * szText, ...);

///	<summary>
///		Create a banner / separator containing the specified text.
///	</summary>
void AnnounceBanner(const char * szText = NULL);

///////////////////////////////////////////////////////////////////////////////

#endif
