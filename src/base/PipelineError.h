///////////////////////////////////////////////////////////////////////////////
///
///	\file    PipelineError.h
///	\author  ClimDiag Developers
///	\version October 19, 2026
///
///	<summary>
///		Typed exceptions raised by the diagnostic pipeline stages.  Each
///		error carries a kind so that member-level failures can be reported
///		in the ensemble summary.
///	</summary>
///	<remarks>
///		Copyright 2026 ClimDiag Developers
///
///		This file is distributed as part of the ClimDiag source code package.
///		Permission is granted to use, copy, modify and distribute this
///		source code and its documentation under the terms of the GNU General
///		Public License.  This software is provided "as is" without express
///		or implied warranty.
///	</remarks>

#ifndef _PIPELINEERROR_H_
#define _PIPELINEERROR_H_

#include "Exception.h"

#include <cstdarg>

///////////////////////////////////////////////////////////////////////////////

#define _PIPELINEERRORT(kind, text) \
throw PipelineError(kind, __FILE__, __LINE__, "%s", text)

#define _PIPELINEERROR1(kind, text, var1) \
throw PipelineError(kind, __FILE__, __LINE__, text, var1)

#define _PIPELINEERROR2(kind, text, var1, var2) \
throw PipelineError(kind, __FILE__, __LINE__, text, var1, var2)

#define _PIPELINEERROR3(kind, text, var1, var2, var3) \
throw PipelineError(kind, __FILE__, __LINE__, text, var1, var2, var3)

#define _PIPELINEERROR4(kind, text, var1, var2, var3, var4) \
throw PipelineError(kind, __FILE__, __LINE__, text, var1, var2, var3, var4)

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Failure kinds recognized by the ensemble summary.
///	</summary>
enum PipelineErrorKind {
	PipelineErrorKind_Discontinuity,
	PipelineErrorKind_Regrid,
	PipelineErrorKind_EmptyRange,
	PipelineErrorKind_InsufficientReferenceData,
	PipelineErrorKind_ThresholdDegeneracy,
	PipelineErrorKind_BaselineWindow,
	PipelineErrorKind_TrendFit,
	PipelineErrorKind_Units,
	PipelineErrorKind_Input,
	PipelineErrorKind_Configuration
};

///	<summary>
///		Get the name of a PipelineErrorKind as it appears in reports.
///	</summary>
inline const char * PipelineErrorKindName(
	PipelineErrorKind eKind
) {
	switch (eKind) {
		case PipelineErrorKind_Discontinuity:
			return "DiscontinuityError";
		case PipelineErrorKind_Regrid:
			return "RegridError";
		case PipelineErrorKind_EmptyRange:
			return "EmptyRangeError";
		case PipelineErrorKind_InsufficientReferenceData:
			return "InsufficientReferenceDataError";
		case PipelineErrorKind_ThresholdDegeneracy:
			return "ThresholdDegeneracyError";
		case PipelineErrorKind_BaselineWindow:
			return "BaselineWindowError";
		case PipelineErrorKind_TrendFit:
			return "TrendFitError";
		case PipelineErrorKind_Units:
			return "UnitsError";
		case PipelineErrorKind_Input:
			return "InputError";
		case PipelineErrorKind_Configuration:
			return "ConfigurationError";
	}
	return "UnknownError";
}

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		An Exception raised by a pipeline stage, tagged with its kind.
///	</summary>
class PipelineError : public Exception {

public:
	///	<summary>
	///		Constructor with text and variables.
	///	</summary>
	PipelineError(
		PipelineErrorKind eKind,
		const char * szFile,
		unsigned int uiLine,
		const char * szText,
		...
	) :
		Exception(szFile, uiLine),
		m_eKind(eKind)
	{
		va_list arguments;
		va_start(arguments, szText);
		FormatText(szText, arguments);
		va_end(arguments);
	}

public:
	///	<summary>
	///		Get the kind of this error.
	///	</summary>
	PipelineErrorKind GetKind() const {
		return m_eKind;
	}

	///	<summary>
	///		Get the name of the kind of this error.
	///	</summary>
	const char * GetKindName() const {
		return PipelineErrorKindName(m_eKind);
	}

	///	<summary>
	///		Get a string representation of this error.
	///	</summary>
	virtual std::string ToString() const {
		return std::string(GetKindName()) + ": " + Exception::ToString();
	}

private:
	///	<summary>
	///		Kind of error.
	///	</summary>
	PipelineErrorKind m_eKind;
};

///////////////////////////////////////////////////////////////////////////////

#endif
