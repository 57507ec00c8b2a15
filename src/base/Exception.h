///////////////////////////////////////////////////////////////////////////////
///
///	\file    Exception.h
///	\author  Paul Ullrich
///	\version October 19, 2026
///
///	<summary>
///		This file provides functionality for formatted Exceptions.
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

#ifndef _EXCEPTION_H_
#define _EXCEPTION_H_

///////////////////////////////////////////////////////////////////////////////

#include <string>
#include <cstdio>
#include <cstdarg>

///////////////////////////////////////////////////////////////////////////////

#define _EXCEPTION() \
throw Exception(__FILE__, __LINE__)

#define _EXCEPTIONT(text) \
throw Exception(__FILE__, __LINE__, "%s", text)

#define _EXCEPTION1(text, var1) \
throw Exception(__FILE__, __LINE__, text, var1)

#define _EXCEPTION2(text, var1, var2) \
throw Exception(__FILE__, __LINE__, text, var1, var2)

#define _EXCEPTION3(text, var1, var2, var3) \
throw Exception(__FILE__, __LINE__, text, var1, var2, var3)

#define _EXCEPTION4(text, var1, var2, var3, var4) \
throw Exception(__FILE__, __LINE__, text, var1, var2, var3, var4)

#define _EXCEPTION5(text, var1, var2, var3, var4, var5) \
throw Exception(__FILE__, __LINE__, text, var1, var2, var3, var4, var5)

///////////////////////////////////////////////////////////////////////////////

#ifdef NDEBUG
#define _ASSERT(x)
#else
#define _ASSERT(x) \
if (!(x)) { \
	throw Exception(__FILE__, __LINE__, "Assertion failure (%s)", #x); \
}
#endif

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		An Exception is a formatted error message that is generated from a
///		throw directive.  This class is automatically generated when using
///		the _EXCEPTION macros.
///	</summary>
class Exception {

	public:
		///	<summary>
		///		Maximum buffer size for exception strings.
		///	</summary>
		static const int ExceptionBufferSize = 1024;

	public:
		///	<summary>
		///		Generic constructor.
		///	</summary>
		Exception(
			const char * szFile,
			unsigned int uiLine
		) :
			m_strText("General exception"),
			m_strFile(szFile),
			m_uiLine(uiLine)
		{ }

		///	<summary>
		///		Constructor with text and variables.
		///	</summary>
		Exception(
			const char * szFile,
			unsigned int uiLine,
			const char * szText,
			...
		) :
			m_strFile(szFile),
			m_uiLine(uiLine)
		{
			va_list arguments;
			va_start(arguments, szText);
			FormatText(szText, arguments);
			va_end(arguments);
		}

		///	<summary>
		///		Virtual destructor.
		///	</summary>
		virtual ~Exception() { }

	protected:
		///	<summary>
		///		Write the formatted message text from a variable argument list.
		///	</summary>
		void FormatText(
			const char * szText,
			va_list arguments
		) {
			char szBuffer[ExceptionBufferSize];

			int nc = vsnprintf(szBuffer, ExceptionBufferSize, szText, arguments);
			if (nc > ExceptionBufferSize-2) {
				szBuffer[ExceptionBufferSize-4] = '.';
				szBuffer[ExceptionBufferSize-3] = '.';
				szBuffer[ExceptionBufferSize-2] = '.';
				szBuffer[ExceptionBufferSize-1] = '\0';
			}

			m_strText = szBuffer;
		}

	public:
		///	<summary>
		///		Get a string representation of this exception.
		///	</summary>
		virtual std::string ToString() const {
			std::string strReturn;

			char szBuffer[128];

			// Preamble
			snprintf(szBuffer, 128, "EXCEPTION (");
			strReturn.append(szBuffer);

			// File name
			strReturn.append(m_strFile);

			// Line number
			snprintf(szBuffer, 128, ", Line %u) ", m_uiLine);
			strReturn.append(szBuffer);

			// Text
			strReturn.append(m_strText);

			return strReturn;
		}

		///	<summary>
		///		Get the message text without file and line information.
		///	</summary>
		const std::string & GetText() const {
			return m_strText;
		}

	private:
		///	<summary>
		///		A string denoting the error in question.
		///	</summary>
		std::string m_strText;

		///	<summary>
		///		A string containing the filename where the exception occurred.
		///	</summary>
		std::string m_strFile;

		///	<summary>
		///		A constant containing the line number where the exception
		///		occurred.
		///	</summary>
		unsigned int m_uiLine;
};

///////////////////////////////////////////////////////////////////////////////

#endif
