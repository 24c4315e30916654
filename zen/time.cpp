// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "time.h"
#include <algorithm>
#include <cerrno>

using namespace zen;


namespace
{
std::tm toClibTimeComponents(const TimeComp& tc)
{
    std::tm ctc = {};
    ctc.tm_year  = tc.year - 1900; //years since 1900
    ctc.tm_mon   = tc.month - 1;   //0-11
    ctc.tm_mday  = tc.day;         //1-31
    ctc.tm_hour  = tc.hour;        //0-23
    ctc.tm_min   = tc.minute;      //0-59
    ctc.tm_sec   = tc.second;      //0-60 (including leap second)
    ctc.tm_isdst = -1;             //> 0 if DST is active, == 0 if DST is not active, < 0 if the information is not available
    return ctc;
}


TimeComp toZenTimeComponents(const std::tm& ctc)
{
    TimeComp tc;
    tc.year   = ctc.tm_year + 1900;
    tc.month  = ctc.tm_mon + 1;
    tc.day    = ctc.tm_mday;
    tc.hour   = ctc.tm_hour;
    tc.minute = ctc.tm_min;
    tc.second = ctc.tm_sec;
    return tc;
}


bool isValid(const TimeComp& tc)
{
    return 1 <= tc.month  && tc.month  <= 12 &&
           1 <= tc.day    && tc.day    <= 31 &&
           0 <= tc.hour   && tc.hour   <= 23 &&
           0 <= tc.minute && tc.minute <= 59 &&
           0 <= tc.second && tc.second <= 61;
}
}


TimeComp zen::getUtcTime(time_t utc)
{
    std::tm ctc = {};
    if (::gmtime_r(&utc, &ctc) == nullptr) //64-bit Linux: apparently NO limits
        return TimeComp();

    return toZenTimeComponents(ctc);
}


TimeComp zen::getUtcTime()
{
    const time_t utc = std::time(nullptr); //returns -1 on error
    if (utc == -1)
        return TimeComp();

    return getUtcTime(utc);
}


TimeComp zen::getLocalTime(time_t utc)
{
    std::tm ctc = {};
    if (::localtime_r(&utc, &ctc) == nullptr)
        return TimeComp();

    return toZenTimeComponents(ctc);
}


std::pair<time_t, bool /*success*/> zen::utcToTimeT(const TimeComp& tc)
{
    if (tc == TimeComp() || !isValid(tc))
        return {};

    std::tm ctc = toClibTimeComponents(tc);
    ctc.tm_isdst = 0; //unused by timegm(), but take no chances

    errno = 0;
    const time_t utc = ::timegm(&ctc);
    if (utc == -1 && errno != 0) //disambiguate from 1969-12-31 23:59:59
        return {};

    return {utc, true};
}


Zstring zen::formatTime(const Zchar* format, const TimeComp& tc)
{
    if (tc == TimeComp()) //failure code from getLocalTime()
        return Zstring();

    std::tm ctc = toClibTimeComponents(tc);
    std::mktime(&ctc); //std::strftime() needs all elements of "struct tm" filled, e.g. tm_wday, tm_yday

    Zstring buf(256, Zstr('\0'));
    const size_t charsWritten = std::strftime(buf.data(), buf.size(), format, &ctc);
    buf.resize(charsWritten);
    return buf;
}


TimeComp zen::parseTime(std::string_view format, std::string_view str)
{
    auto itStr = str.begin();

    auto extractNumber = [&](int& result, size_t digitCount)
    {
        if (static_cast<size_t>(str.end() - itStr) < digitCount)
            return false;

        if (!std::all_of(itStr, itStr + digitCount, isDigit<char>))
            return false;

        result = stringTo<int>(makeStringView(itStr, itStr + digitCount));
        itStr += digitCount;
        return true;
    };

    TimeComp output;

    for (auto itFmt = format.begin(); itFmt != format.end(); ++itFmt)
    {
        const char fmt = *itFmt;

        if (fmt == '%')
        {
            if (++itFmt == format.end())
                return TimeComp();

            bool ok = false;
            switch (*itFmt)
            {
                //*INDENT-OFF*
                case 'Y': ok = extractNumber(output.year,   4); break;
                case 'm': ok = extractNumber(output.month,  2); break;
                case 'd': ok = extractNumber(output.day,    2); break;
                case 'H': ok = extractNumber(output.hour,   2); break;
                case 'M': ok = extractNumber(output.minute, 2); break;
                case 'S': ok = extractNumber(output.second, 2); break;
                //*INDENT-ON*
            }
            if (!ok)
                return TimeComp();
        }
        else if (isWhiteSpace(fmt)) //single whitespace in format => skip 0..n whitespace chars
        {
            while (itStr != str.end() && isWhiteSpace(*itStr))
                ++itStr;
        }
        else
        {
            if (itStr == str.end() || *itStr != fmt)
                return TimeComp();
            ++itStr;
        }
    }

    if (itStr != str.end())
        return TimeComp();

    return output;
}
