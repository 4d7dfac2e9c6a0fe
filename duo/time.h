// *****************************************************************************
// * This file is part of the FtpDuo project. It is distributed under          *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef TIME_H_6620193847561029
#define TIME_H_6620193847561029

#include <ctime>
#include <string>
#include "string_tools.h"


namespace duo
{
//calendar date and time of day, no time zone attached
struct TimeComp
{
    int year   = 0;
    int month  = 0; //1-12
    int day    = 0; //1-31
    int hour   = 0; //0-23
    int minute = 0; //0-59
    int second = 0; //0-60 (leap second)

    bool operator==(const TimeComp&) const = default;
};

//all return TimeComp() on error
TimeComp getUtcTime(time_t utc);
TimeComp getUtcTime(); //now
TimeComp getLocalTime(time_t utc);

std::pair<time_t, bool /*success*/> utcToTimeT(const TimeComp& tc); //fails for impossible dates like "Feb 30"

std::string formatTime(const char* format, const TimeComp& tc); //std::strftime() syntax; empty string on error

const char* const formatIsoTimeTag = "%H:%M:%S"; //14:55:02

//"Jan" - "Dec" as used by "ls -l"
int getMonthIndex(std::string_view monthName); //0-11, case-insensitive; -1 if unknown
const char* getMonthName(int month); //1-12








//############################ implementation ##############################
namespace impl
{
const char* const shortMonthNames[12] = {"Jan", "Feb", "Mar", "Apr", "May", "Jun", "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};

inline
TimeComp fromCTime(const std::tm* ctc)
{
    if (!ctc)
        return {};
    return {ctc->tm_year + 1900, ctc->tm_mon + 1, ctc->tm_mday, ctc->tm_hour, ctc->tm_min, ctc->tm_sec};
}


inline
bool toCTime(const TimeComp& tc, std::tm& ctc)
{
    if (tc == TimeComp() ||
        tc.month  < 1 || tc.month  > 12 ||
        tc.day    < 1 || tc.day    > 31 ||
        tc.hour   < 0 || tc.hour   > 23 ||
        tc.minute < 0 || tc.minute > 59 ||
        tc.second < 0 || tc.second > 60)
        return false;

    ctc = {};
    ctc.tm_year  = tc.year - 1900;
    ctc.tm_mon   = tc.month - 1;
    ctc.tm_mday  = tc.day;
    ctc.tm_hour  = tc.hour;
    ctc.tm_min   = tc.minute;
    ctc.tm_sec   = tc.second;
    ctc.tm_isdst = -1;
    return true;
}
}


inline
TimeComp getUtcTime(time_t utc)
{
    std::tm ctc = {};
    return impl::fromCTime(::gmtime_r(&utc, &ctc));
}


inline
TimeComp getUtcTime()
{
    const time_t now = std::time(nullptr);
    return now == -1 ? TimeComp() : getUtcTime(now);
}


inline
TimeComp getLocalTime(time_t utc)
{
    std::tm ctc = {};
    return impl::fromCTime(::localtime_r(&utc, &ctc));
}


inline
std::pair<time_t, bool /*success*/> utcToTimeT(const TimeComp& tc)
{
    std::tm ctc;
    if (!impl::toCTime(tc, ctc))
        return {};
    ctc.tm_isdst = 0;

    const time_t utc = ::timegm(&ctc);
    //timegm() silently carries overflow into the next month
    if (utc == -1 || ctc.tm_mday != tc.day || ctc.tm_mon != tc.month - 1)
        return {};

    return {utc, true};
}


inline
std::string formatTime(const char* format, const TimeComp& tc)
{
    std::tm ctc;
    if (!impl::toCTime(tc, ctc))
        return {};
    std::mktime(&ctc); //fill in tm_wday, tm_yday for %a, %j, ...

    char buf[128] = {};
    return std::string(buf, std::strftime(buf, sizeof(buf), format, &ctc));
}


inline
int getMonthIndex(std::string_view monthName)
{
    for (int i = 0; i < 12; ++i)
        if (equalAsciiNoCase(impl::shortMonthNames[i], monthName))
            return i;
    return -1;
}


inline
const char* getMonthName(int month)
{
    assert(1 <= month && month <= 12);
    return impl::shortMonthNames[std::clamp(month, 1, 12) - 1];
}
}

#endif //TIME_H_6620193847561029
