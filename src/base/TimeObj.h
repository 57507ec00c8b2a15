///////////////////////////////////////////////////////////////////////////////
///
///	\file    TimeObj.h
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

#ifndef _TIMEOBJ_H_
#define _TIMEOBJ_H_

#include "Exception.h"
#include "STLStringHelper.h"

#include <string>
#include <cstdlib>
#include <cmath>

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		A class for storing a calendar-aware time as year, month, day and
///		seconds of the day.
///	</summary>
class Time {

public:
	///	<summary>
	///		Type of calendar.
	///	</summary>
	enum CalendarType {
		CalendarUnknown,
		CalendarNoLeap,
		Calendar365Day,
		CalendarStandard,
		CalendarGregorian,
		Calendar360Day
	};

public:
	///	<summary>
	///		Constructor.
	///	</summary>
	Time(
		CalendarType eCalendarType = CalendarNoLeap
	) :
		m_iYear(0),
		m_iMonth(0),
		m_iDay(0),
		m_iSecond(0),
		m_eCalendarType(eCalendarType)
	{
		if (m_eCalendarType == CalendarUnknown) {
			_EXCEPTIONT("Invalid CalendarType");
		}
	}

	///	<summary>
	///		Constructor.  Month and day are one-indexed; out-of-range values
	///		are normalized into the calendar.
	///	</summary>
	Time(
		int iYear,
		int iMonth,
		int iDay,
		int iSecond,
		CalendarType eCalendarType = CalendarNoLeap
	) :
		m_iYear(iYear),
		m_iMonth(iMonth - 1),
		m_iDay(iDay - 1),
		m_iSecond(iSecond),
		m_eCalendarType(eCalendarType)
	{
		if (m_eCalendarType == CalendarUnknown) {
			_EXCEPTIONT("Invalid CalendarType");
		}
		NormalizeTime();
	}

public:
	///	<summary>
	///		Returns the CalendarType associated with the given string.
	///	</summary>
	static CalendarType CalendarTypeFromString(
		const std::string & strCalendar
	) {
		std::string strCalendarTemp = strCalendar;
		STLStringHelper::ToLower(strCalendarTemp);

		if (strCalendarTemp == "noleap") {
			return CalendarNoLeap;
		} else if (strCalendarTemp == "365_day") {
			return Calendar365Day;
		} else if (strCalendarTemp == "standard") {
			return CalendarStandard;
		} else if (strCalendarTemp == "gregorian") {
			return CalendarGregorian;
		} else if (strCalendarTemp == "proleptic_gregorian") {
			return CalendarGregorian;
		} else if (strCalendarTemp == "360_day") {
			return Calendar360Day;
		} else {
			return CalendarUnknown;
		}
	}

	///	<summary>
	///		Number of days in the given month (one-indexed) of the given year.
	///	</summary>
	static int DaysInMonth(
		CalendarType eCalendarType,
		int iYear,
		int iMonth
	);

	///	<summary>
	///		Check if two calendars follow the same day counting rules.
	///	</summary>
	static bool CalendarsCompatible(
		CalendarType eCalendarType1,
		CalendarType eCalendarType2
	);

public:
	///	<summary>
	///		Equality between Times.
	///	</summary>
	bool operator==(const Time & time) const;

	///	<summary>
	///		Inequality between Times.
	///	</summary>
	bool operator!=(const Time & time) const {
		return !((*this) == time);
	}

	///	<summary>
	///		Comparator.
	///	</summary>
	bool operator<(const Time & time) const;

	///	<summary>
	///		Comparator.
	///	</summary>
	bool operator>(const Time & time) const {
		return (time < (*this));
	}

	///	<summary>
	///		Comparator.
	///	</summary>
	bool operator<=(const Time & time) const {
		return !(time < (*this));
	}

	///	<summary>
	///		Comparator.
	///	</summary>
	bool operator>=(const Time & time) const {
		return !((*this) < time);
	}

protected:
	///	<summary>
	///		Renormalize the time into the calendar.
	///	</summary>
	void NormalizeTime();

	///	<summary>
	///		Set the date from a day number (see DayNumber()).
	///	</summary>
	void FromDayNumber(int nDayNumber);

public:
	///	<summary>
	///		Add a number of seconds to the Time.
	///	</summary>
	void AddSeconds(long lSeconds);

	///	<summary>
	///		Add a number of days to the Time.
	///	</summary>
	void AddDays(int nDays);

	///	<summary>
	///		Add a number of months to the Time.  The day is clamped to the
	///		length of the new month.
	///	</summary>
	void AddMonths(int nMonths);

public:
	///	<summary>
	///		Get the day number of this date in the calendar.
	///	</summary>
	int DayNumber() const;

	///	<summary>
	///		Get the month index (12 * year + month) of this date.
	///	</summary>
	inline int MonthIndex() const {
		return (12 * m_iYear + m_iMonth);
	}

	///	<summary>
	///		Number of seconds from this Time to the given Time.
	///	</summary>
	double DeltaSeconds(const Time & time) const;

	///	<summary>
	///		Number of days from this Time to the given Time.
	///	</summary>
	double DeltaDays(const Time & time) const;

public:
	///	<summary>
	///		Get the year.
	///	</summary>
	inline int GetYear() const {
		return m_iYear;
	}

	///	<summary>
	///		Get the month (1-12).
	///	</summary>
	inline int GetMonth() const {
		return m_iMonth + 1;
	}

	///	<summary>
	///		Get the day of the month (one-indexed).
	///	</summary>
	inline int GetDay() const {
		return m_iDay + 1;
	}

	///	<summary>
	///		Get the number of seconds into the day.
	///	</summary>
	inline int GetSecond() const {
		return m_iSecond;
	}

	///	<summary>
	///		Get the CalendarType.
	///	</summary>
	inline CalendarType GetCalendarType() const {
		return m_eCalendarType;
	}

public:
	///	<summary>
	///		Output as a date string "yyyy-MM-dd".
	///	</summary>
	std::string ToDateString() const;

	///	<summary>
	///		Output as a string "yyyy-MM-dd hh:mm:ss".
	///	</summary>
	std::string ToString() const;

	///	<summary>
	///		Parse from a string of the form "yyyy-MM-dd[ hh:mm:ss]".  The
	///		separator between date and time may be ' ' or 'T'.
	///	</summary>
	void FromFormattedString(const std::string & strFormattedTime);

	///	<summary>
	///		Set this Time from a CF-compliant units string such as
	///		"days since 1850-01-01" and an offset.
	///	</summary>
	void FromCFCompliantUnitsOffsetDouble(
		const std::string & strFormattedTime,
		double dOffset
	);

	///	<summary>
	///		Get the offset of this Time in the given CF-compliant units.
	///	</summary>
	double GetCFCompliantUnitsOffsetDouble(
		const std::string & strFormattedTime
	) const;

	///	<summary>
	///		Get the name of the calendar.
	///	</summary>
	std::string GetCalendarName() const;

private:
	///	<summary>
	///		Split a CF units string into its length in seconds and its
	///		reference Time.
	///	</summary>
	void ParseCFUnits(
		const std::string & strFormattedTime,
		double & dUnitSeconds,
		Time & timeReference
	) const;

private:
	///	<summary>
	///		Year.
	///	</summary>
	int m_iYear;

	///	<summary>
	///		Month (zero-indexed).
	///	</summary>
	int m_iMonth;

	///	<summary>
	///		Day (zero-indexed).
	///	</summary>
	int m_iDay;

	///	<summary>
	///		Seconds into the day.
	///	</summary>
	int m_iSecond;

	///	<summary>
	///		Calendar type.
	///	</summary>
	CalendarType m_eCalendarType;
};

///////////////////////////////////////////////////////////////////////////////

#endif
