// *****************************************************************************
// * This file is part of the FtpMirror project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The FtpMirror authors - All Rights Reserved                 *
// *****************************************************************************

#ifndef TIME_H_2938475610293847
#define TIME_H_2938475610293847

#include <ctime>
#include <cstdint>
#include "zstring.h"
#include "string_tools.h"


namespace mirr
{
struct TimeComp //replaces std::tm
{
    int year   = 0; // -
    int month  = 0; //1-12
    int day    = 0; //1-31
    int hour   = 0; //0-23
    int minute = 0; //0-59
    int second = 0; //0-60 (including leap second)

    bool operator==(const TimeComp&) const = default;
};

TimeComp getLocalTime(time_t utc = std::time(nullptr)); //returns TimeComp() on error

/* example:
            formatTime(formatIsoDateTag, tc); -> "2011-10-29"
            formatTime(formatIsoTimeTag, tc); -> "17:55:34"          */
Zstring formatTime(const Zchar* format, const TimeComp& tc = getLocalTime()); //format as specified by "std::strftime", returns empty string on error

const Zchar* const formatIsoDateTag     = Zstr("%Y-%m-%d");          //e.g. 2001-08-23
const Zchar* const formatIsoTimeTag     = Zstr("%H:%M:%S");          //e.g. 14:55:02
const Zchar* const formatIsoDateTimeTag = Zstr("%Y-%m-%d %H:%M:%S"); //e.g. 2001-08-23 14:55:02

//format: [-][HH:]MM:SS    e.g. 1:23:45
Zstring formatTimeSpan(int64_t timeInSec);








//############################ implementation ##############################
inline
TimeComp getLocalTime(time_t utc)
{
    std::tm ctc{};
    if (::localtime_r(&utc, &ctc) == nullptr)
        return TimeComp();

    TimeComp tc;
    tc.year   = ctc.tm_year + 1900;
    tc.month  = ctc.tm_mon + 1;
    tc.day    = ctc.tm_mday;
    tc.hour   = ctc.tm_hour;
    tc.minute = ctc.tm_min;
    tc.second = ctc.tm_sec;
    return tc;
}


inline
Zstring formatTime(const Zchar* format, const TimeComp& tc)
{
    if (tc == TimeComp()) //failure code from getLocalTime()
        return Zstring();

    std::tm ctc{};
    ctc.tm_year  = tc.year - 1900;
    ctc.tm_mon   = tc.month - 1;
    ctc.tm_mday  = tc.day;
    ctc.tm_hour  = tc.hour;
    ctc.tm_min   = tc.minute;
    ctc.tm_sec   = tc.second;
    ctc.tm_isdst = -1;

    Zchar buffer[256] = {};
    const size_t charsWritten = std::strftime(buffer, std::size(buffer), format, &ctc);
    return Zstring(buffer, charsWritten);
}


inline
Zstring formatTimeSpan(int64_t timeInSec)
{
    Zstring output;
    if (timeInSec < 0)
    {
        output += Zstr('-');
        timeInSec = -timeInSec;
    }

    const int64_t hours   = timeInSec / 3600;
    const int64_t minutes = timeInSec / 60 % 60;
    const int64_t seconds = timeInSec % 60;

    auto twoDigits = [](int64_t n) { return (n < 10 ? Zstr("0") : Zstr("")) + numberTo<Zstring>(n); };

    if (hours > 0)
        output += numberTo<Zstring>(hours) + Zstr(':');
    output += twoDigits(minutes) + Zstr(':') + twoDigits(seconds);
    return output;
}
}

#endif //TIME_H_2938475610293847
