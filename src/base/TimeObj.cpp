///////////////////////////////////////////////////////////////////////////////
///
///	\file    TimeObj.cpp
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

#include "TimeObj.h"
#include "Exception.h"

#include <cstdio>
#include <cstring>

///////////////////////////////////////////////////////////////////////////////

int Time::DaysInMonth(
	CalendarType eCalendarType,
	int iYear,
	int iMonth
) {
	static const int nDaysPerMonth[]
		= {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};

	if ((iMonth < 1) || (iMonth > 12)) {
		_EXCEPTION1("Month out of range (%i)", iMonth);
	}

	if (eCalendarType == Calendar360Day) {
		return 30;
	}
	if ((iMonth == 2) &&
	    ((eCalendarType == CalendarStandard) ||
	     (eCalendarType == CalendarGregorian))
	) {
		if ((iYear % 4) == 0) {
			if (((iYear % 100) == 0) && ((iYear % 400) != 0)) {
				return 28;
			}
			return 29;
		}
	}
	return nDaysPerMonth[iMonth-1];
}

///////////////////////////////////////////////////////////////////////////////

bool Time::CalendarsCompatible(
	CalendarType eCalendarType1,
	CalendarType eCalendarType2
) {
	if (eCalendarType1 == eCalendarType2) {
		return true;
	}
	if (((eCalendarType1 == CalendarNoLeap) ||
	     (eCalendarType1 == Calendar365Day)) &&
	    ((eCalendarType2 == CalendarNoLeap) ||
	     (eCalendarType2 == Calendar365Day))
	) {
		return true;
	}
	if (((eCalendarType1 == CalendarStandard) ||
	     (eCalendarType1 == CalendarGregorian)) &&
	    ((eCalendarType2 == CalendarStandard) ||
	     (eCalendarType2 == CalendarGregorian))
	) {
		return true;
	}
	return false;
}

///////////////////////////////////////////////////////////////////////////////

bool Time::operator==(const Time & time) const {
	if (!CalendarsCompatible(m_eCalendarType, time.m_eCalendarType)) {
		return false;
	}
	return ((m_iYear   == time.m_iYear)  &&
	        (m_iMonth  == time.m_iMonth) &&
	        (m_iDay    == time.m_iDay)   &&
	        (m_iSecond == time.m_iSecond));
}

///////////////////////////////////////////////////////////////////////////////

bool Time::operator<(const Time & time) const {
	if (!CalendarsCompatible(m_eCalendarType, time.m_eCalendarType)) {
		_EXCEPTION2("Cannot compare Time objects with different calendars (%s/%s)",
			GetCalendarName().c_str(),
			time.GetCalendarName().c_str());
	}

	if (m_iYear != time.m_iYear) {
		return (m_iYear < time.m_iYear);
	}
	if (m_iMonth != time.m_iMonth) {
		return (m_iMonth < time.m_iMonth);
	}
	if (m_iDay != time.m_iDay) {
		return (m_iDay < time.m_iDay);
	}
	return (m_iSecond < time.m_iSecond);
}

///////////////////////////////////////////////////////////////////////////////

void Time::NormalizeTime() {

	// Carry seconds into days
	int nAddedDays = 0;
	if (m_iSecond >= 86400) {
		nAddedDays = m_iSecond / 86400;
	} else if (m_iSecond < 0) {
		nAddedDays = - ((86399 - m_iSecond) / 86400);
	}
	m_iSecond -= nAddedDays * 86400;
	m_iDay += nAddedDays;

	// Carry months into years
	int nAddedYears = 0;
	if (m_iMonth >= 12) {
		nAddedYears = m_iMonth / 12;
	} else if (m_iMonth < 0) {
		nAddedYears = - ((11 - m_iMonth) / 12);
	}
	m_iMonth -= nAddedYears * 12;
	m_iYear += nAddedYears;

	// Carry days into months
	while (m_iDay < 0) {
		m_iMonth--;
		if (m_iMonth < 0) {
			m_iMonth = 11;
			m_iYear--;
		}
		m_iDay += DaysInMonth(m_eCalendarType, m_iYear, m_iMonth+1);
	}
	for (;;) {
		int nDays = DaysInMonth(m_eCalendarType, m_iYear, m_iMonth+1);
		if (m_iDay < nDays) {
			break;
		}
		m_iDay -= nDays;
		m_iMonth++;
		if (m_iMonth > 11) {
			m_iMonth = 0;
			m_iYear++;
		}
	}
}

///////////////////////////////////////////////////////////////////////////////

int Time::DayNumber() const {

	// Based on https://alcor.concordia.ca/~gpkatch/gdate-algorithm.html
	// with zero-indexed month and day
	if ((m_eCalendarType == CalendarNoLeap) ||
	    (m_eCalendarType == Calendar365Day)
	) {
		int nM = (m_iMonth + 10) % 12;
		int nY = m_iYear - nM/10;
		return (365 * nY + (nM * 306 + 5) / 10 + m_iDay);

	} else if (
		(m_eCalendarType == CalendarStandard) ||
		(m_eCalendarType == CalendarGregorian)
	) {
		int nM = (m_iMonth + 10) % 12;
		int nY = m_iYear - nM/10;
		return (365 * nY + nY / 4 - nY / 100 + nY / 400
			+ (nM * 306 + 5) / 10 + m_iDay);

	} else if (m_eCalendarType == Calendar360Day) {
		return (360 * m_iYear + 30 * m_iMonth + m_iDay);
	}

	_EXCEPTIONT("Invalid CalendarType");
}

///////////////////////////////////////////////////////////////////////////////

void Time::FromDayNumber(int nDayNumber) {

	if (nDayNumber < 0) {
		_EXCEPTION1("Day number out of range (%i)", nDayNumber);
	}

	if (m_eCalendarType == Calendar360Day) {
		m_iYear = nDayNumber / 360;
		m_iMonth = (nDayNumber % 360) / 30;
		m_iDay = nDayNumber % 30;
		return;
	}

	// Years start on March 1 in the day number
	int nY;
	int nDDD;
	if ((m_eCalendarType == CalendarNoLeap) ||
	    (m_eCalendarType == Calendar365Day)
	) {
		nY = nDayNumber / 365;
		nDDD = nDayNumber - 365 * nY;

	} else if (
		(m_eCalendarType == CalendarStandard) ||
		(m_eCalendarType == CalendarGregorian)
	) {
		nY = static_cast<int>(
			(10000 * static_cast<long>(nDayNumber) + 14780) / 3652425);
		nDDD = nDayNumber - (365 * nY + nY / 4 - nY / 100 + nY / 400);
		if (nDDD < 0) {
			nY--;
			nDDD = nDayNumber - (365 * nY + nY / 4 - nY / 100 + nY / 400);
		}

	} else {
		_EXCEPTIONT("Invalid CalendarType");
	}

	int nMI = (100 * nDDD + 52) / 3060;
	m_iYear = nY + (nMI + 2) / 12;
	m_iMonth = (nMI + 2) % 12;
	m_iDay = nDDD - (nMI * 306 + 5) / 10;
}

///////////////////////////////////////////////////////////////////////////////

void Time::AddSeconds(long lSeconds) {
	long lTotal = static_cast<long>(m_iSecond) + lSeconds;

	long lDays = lTotal / 86400;
	if ((lTotal % 86400) < 0) {
		lDays--;
	}

	m_iSecond = static_cast<int>(lTotal - lDays * 86400);
	if (lDays != 0) {
		AddDays(static_cast<int>(lDays));
	}
}

///////////////////////////////////////////////////////////////////////////////

void Time::AddDays(int nDays) {
	FromDayNumber(DayNumber() + nDays);
}

///////////////////////////////////////////////////////////////////////////////

void Time::AddMonths(int nMonths) {
	int nMonthIndex = MonthIndex() + nMonths;

	m_iYear = nMonthIndex / 12;
	m_iMonth = nMonthIndex % 12;
	if (m_iMonth < 0) {
		m_iMonth += 12;
		m_iYear--;
	}

	int nDays = DaysInMonth(m_eCalendarType, m_iYear, m_iMonth+1);
	if (m_iDay >= nDays) {
		m_iDay = nDays - 1;
	}
}

///////////////////////////////////////////////////////////////////////////////

double Time::DeltaSeconds(const Time & time) const {
	if (!CalendarsCompatible(m_eCalendarType, time.m_eCalendarType)) {
		_EXCEPTIONT("Incompatible calendar types");
	}

	int nDayNumber1 = DayNumber();
	int nDayNumber2 = time.DayNumber();

	return static_cast<double>(nDayNumber2 - nDayNumber1) * 86400.0
		+ static_cast<double>(time.m_iSecond - m_iSecond);
}

///////////////////////////////////////////////////////////////////////////////

double Time::DeltaDays(const Time & time) const {
	return DeltaSeconds(time) / 86400.0;
}

///////////////////////////////////////////////////////////////////////////////

std::string Time::ToDateString() const {
	char szBuffer[100];
	snprintf(szBuffer, 100, "%04i-%02i-%02i",
		m_iYear, m_iMonth+1, m_iDay+1);

	return std::string(szBuffer);
}

///////////////////////////////////////////////////////////////////////////////

std::string Time::ToString() const {
	char szBuffer[100];
	snprintf(szBuffer, 100, "%04i-%02i-%02i %02i:%02i:%02i",
		m_iYear,
		m_iMonth+1,
		m_iDay+1,
		m_iSecond / 3600,
		(m_iSecond % 3600) / 60,
		(m_iSecond % 60));

	return std::string(szBuffer);
}

///////////////////////////////////////////////////////////////////////////////

void Time::FromFormattedString(
	const std::string & strFormattedTime
) {
	std::string strTime = strFormattedTime;
	STLStringHelper::RemoveWhitespaceInPlace(strTime);

	int iYear = 0;
	int iMonth = 1;
	int iDay = 1;
	int iHour = 0;
	int iMinute = 0;
	double dSecond = 0.0;

	int nDateFields =
		sscanf(strTime.c_str(), "%d-%d-%d", &iYear, &iMonth, &iDay);

	if (nDateFields < 1) {
		_EXCEPTION1("Malformed Time string (%s)", strFormattedTime.c_str());
	}

	// Optional time of day
	size_t sTime = strTime.find_first_of(" T");
	if (sTime != std::string::npos) {
		std::string strClock = strTime.substr(sTime+1);
		STLStringHelper::RemoveWhitespaceInPlace(strClock);
		if (strClock.length() != 0) {
			int nTimeFields =
				sscanf(strClock.c_str(), "%d:%d:%lf",
					&iHour, &iMinute, &dSecond);
			if (nTimeFields < 1) {
				_EXCEPTION1("Malformed Time string (%s)",
					strFormattedTime.c_str());
			}
		}
	}

	if ((iMonth < 1) || (iMonth > 12)) {
		_EXCEPTION1("Month out of range in Time string (%s)",
			strFormattedTime.c_str());
	}
	if ((iDay < 1) || (iDay > DaysInMonth(m_eCalendarType, iYear, iMonth))) {
		_EXCEPTION1("Day out of range in Time string (%s)",
			strFormattedTime.c_str());
	}

	m_iYear = iYear;
	m_iMonth = iMonth - 1;
	m_iDay = iDay - 1;
	m_iSecond = 0;

	AddSeconds(
		3600 * static_cast<long>(iHour)
		+ 60 * static_cast<long>(iMinute)
		+ static_cast<long>(dSecond));
}

///////////////////////////////////////////////////////////////////////////////

void Time::ParseCFUnits(
	const std::string & strFormattedTime,
	double & dUnitSeconds,
	Time & timeReference
) const {
	size_t sSince = strFormattedTime.find(" since ");
	if (sSince == std::string::npos) {
		_EXCEPTION1("Unknown \"time::units\" format \"%s\"",
			strFormattedTime.c_str());
	}

	std::string strUnit = strFormattedTime.substr(0, sSince);
	STLStringHelper::RemoveWhitespaceInPlace(strUnit);
	STLStringHelper::ToLower(strUnit);

	if ((strUnit == "days") || (strUnit == "day")) {
		dUnitSeconds = 86400.0;
	} else if ((strUnit == "hours") || (strUnit == "hour")) {
		dUnitSeconds = 3600.0;
	} else if ((strUnit == "minutes") || (strUnit == "minute")) {
		dUnitSeconds = 60.0;
	} else if ((strUnit == "seconds") || (strUnit == "second")) {
		dUnitSeconds = 1.0;
	} else {
		_EXCEPTION1("Unknown \"time::units\" format \"%s\"",
			strFormattedTime.c_str());
	}

	timeReference = Time(m_eCalendarType);
	timeReference.FromFormattedString(strFormattedTime.substr(sSince + 7));
}

///////////////////////////////////////////////////////////////////////////////

void Time::FromCFCompliantUnitsOffsetDouble(
	const std::string & strFormattedTime,
	double dOffset
) {
	double dUnitSeconds;
	Time timeReference(m_eCalendarType);
	ParseCFUnits(strFormattedTime, dUnitSeconds, timeReference);

	*this = timeReference;

	// Round to the nearest second to remove floating point noise
	double dSeconds = dOffset * dUnitSeconds;
	AddSeconds(static_cast<long>(floor(dSeconds + 0.5)));
}

///////////////////////////////////////////////////////////////////////////////

double Time::GetCFCompliantUnitsOffsetDouble(
	const std::string & strFormattedTime
) const {
	double dUnitSeconds;
	Time timeReference(m_eCalendarType);
	ParseCFUnits(strFormattedTime, dUnitSeconds, timeReference);

	return timeReference.DeltaSeconds(*this) / dUnitSeconds;
}

///////////////////////////////////////////////////////////////////////////////

std::string Time::GetCalendarName() const {
	if (m_eCalendarType == CalendarNoLeap) {
		return std::string("noleap");
	} else if (m_eCalendarType == Calendar365Day) {
		return std::string("365_day");
	} else if (m_eCalendarType == CalendarStandard) {
		return std::string("standard");
	} else if (m_eCalendarType == CalendarGregorian) {
		return std::string("gregorian");
	} else if (m_eCalendarType == Calendar360Day) {
		return std::string("360_day");
	}
	_EXCEPTIONT("Invalid CalendarType");
}

///////////////////////////////////////////////////////////////////////////////
