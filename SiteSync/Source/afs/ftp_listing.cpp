// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "ftp_listing.h"
#include <functional>
#include <zen/time.h>

using namespace zen;
using namespace sitesync;


namespace
{
class FtpLineParser
{
public:
    explicit FtpLineParser(const std::string_view& line) : it_(line.begin()), itEnd_(line.end()) {}

    template <class Function>
    std::string_view readFixed(size_t count, Function acceptChar) //throw SysError
    {
        if (static_cast<ptrdiff_t>(count) > itEnd_ - it_)
            throw SysError(L"Unexpected end of line.");

        const auto rngEnd = it_ + count;
        if (!std::all_of(it_, rngEnd, acceptChar))
            throw SysError(L"Expected char type not found.");

        return makeStringView(std::exchange(it_, rngEnd), rngEnd);
    }

    template <class Function> //non-empty range
    std::string_view readWhile(Function acceptChar) //throw SysError
    {
        const auto rngEnd = std::find_if_not(it_, itEnd_, acceptChar);
        if (rngEnd == it_)
            throw SysError(L"Expected char range not found.");

        return makeStringView(std::exchange(it_, rngEnd), rngEnd);
    }

    void skipBlanks() { readWhile(&isWhiteSpace<char>); } //throw SysError

    std::string_view readToken() { return readWhile(std::not_fn(&isWhiteSpace<char>)); } //throw SysError

    std::string_view readRemainder() { return readWhile([](char) { return true; }); } //throw SysError

    char peekNextChar() const { return it_ == itEnd_ ? '\0' : *it_; }

private:
    std::string_view::const_iterator it_;
    const std::string_view::const_iterator itEnd_;
};


bool isDotEntry(std::string_view itemName) { return itemName == "." || itemName == ".."; }


int getCurrentUtcYear(time_t utcTimeNow) //throw SysError
{
    const TimeComp tc = getUtcTime(utcTimeNow);
    if (tc == TimeComp())
        throw SysError(L"Failed to determine current time: " + numberTo<std::wstring>(utcTimeNow));
    return tc.year;
}


time_t toTimeT(const TimeComp& tc) //throw SysError
{
    //LIST times are server-local: treat as UTC (like FileZilla)
    const auto [modTime, timeValid] = utcToTimeT(tc);
    if (!timeValid)
        throw SysError(L"Modification time is invalid.");
    return modTime;
}

//----------------------------------------------------------------------------------------------------------------

RemoteItem parseMlsdLine(const std::string_view& rawLine) //throw SysError
{
    /*  type=cdir;modify=20240105101500;UNIX.mode=0755; .
        type=file;size=4;modify=20240105101500.123;UNIX.mode=0600; index.html
        type=dir;modify=20240105101500; assets
        type=OS.unix=slink:/var/www; current                                   */
    try
    {
        auto itFirst = rawLine.begin();
        if (startsWith(rawLine, ' ')) //curl may already have stripped the leading blank
            ++itFirst;

        const auto itBlank = std::find(itFirst, rawLine.end(), ' ');
        if (itBlank == rawLine.end())
            throw SysError(L"Item name not available.");

        RemoteItem item;
        item.itemName = Zstring(makeStringView(itBlank + 1, rawLine.end()));

        std::string_view typeFact;
        std::string_view sizeFact;

        split(makeStringView(itFirst, itBlank), ';', [&](const std::string_view fact)
        {
            const std::string_view factValue = afterFirst(fact, '=', IfNotFoundReturn::none);

            if (startsWithAsciiNoCase(fact, "type=")) //fact names are case-insensitive
                typeFact = beforeFirst(factValue, ':', IfNotFoundReturn::all);
            else if (startsWithAsciiNoCase(fact, "size="))
                sizeFact = factValue;
            else if (startsWithAsciiNoCase(fact, "modify="))
            {
                item.modTime = parseFtpTimeVal(factValue);
                if (!item.modTime)
                    throw SysError(L"Modification time is invalid.");
            }
        });

        if (equalAsciiNoCase(typeFact, "cdir") ||
            equalAsciiNoCase(typeFact, "pdir"))
            return {Zstr("."), ItemType::folder};

        if (equalAsciiNoCase(typeFact, "dir"))
            item.type = ItemType::folder;
        else if (equalAsciiNoCase(typeFact, "OS.unix=slink") ||
                 equalAsciiNoCase(typeFact, "OS.unix=symlink"))
            item.type = ItemType::symlink;

        if (item.itemName.empty())
            throw SysError(L"Item name not available.");

        if (item.type == ItemType::file)
        {
            if (sizeFact.empty() || !std::all_of(sizeFact.begin(), sizeFact.end(), &isDigit<char>))
                throw SysError(L"File size not available.");
            item.fileSize = stringTo<uint64_t>(sizeFact);
        }
        return item;
    }
    catch (const SysError& e)
    {
        throw SysError(L"Unexpected FTP response. (" + utfTo<std::wstring>(rawLine) + L") " + e.toString());
    }
}

//----------------------------------------------------------------------------------------------------------------

/*  "ls -l" style:
        drwxr-xr-x 2 www  www      4096 Jan 10 11:58 assets
        -rw-r--r-- 1 www  www      1084 Sep  2  2023 index.html
        lrwxrwxrwx 1 www  www        18 Apr 26 15:17 current -> /var/www/release

    variants: owner without group ("ls -l --no-group"), neither owner nor group ("ls -g --no-group")   */
RemoteItem parseUnixLine(const std::string_view& rawLine, time_t utcTimeNow, int utcCurrentYear, int ownerGroupCount) //throw SysError
{
    try
    {
        FtpLineParser parser(rawLine);

        const char typeTag = parser.readFixed(1, [](char c) //throw SysError
        {
            return c == '-' || c == 'b' || c == 'c' || c == 'd' || c == 'l' || c == 'p' || c == 's';
        })[0];

        parser.readFixed(9, [](char c) //throw SysError
        {
            return c == '-' || c == 'r' || c == 'w' || c == 'x' || c == 's' || c == 'S' || c == 't' || c == 'T';
        });
        parser.skipBlanks();

        parser.readWhile(&isDigit<char>); //hard-link count
        parser.skipBlanks();

        for (int i = 0; i < ownerGroupCount; ++i)
        {
            parser.readToken();
            parser.skipBlanks();
        }

        const uint64_t fileSize = stringTo<uint64_t>(parser.readWhile(&isDigit<char>)); //throw SysError
        parser.skipBlanks();
        //------------------------------------------------------------------------------------
        const std::string_view monthName = parser.readToken(); //throw SysError
        parser.skipBlanks();

        static const char* const monthNames[] = {"Jan", "Feb", "Mar", "Apr", "May", "Jun", "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};
        const auto itMonth = std::find_if(std::begin(monthNames), std::end(monthNames), [&](const char* name) { return equalAsciiNoCase(name, monthName); });
        if (itMonth == std::end(monthNames))
            throw SysError(L"Failed to parse month name.");

        TimeComp tc;
        tc.month = 1 + static_cast<int>(itMonth - std::begin(monthNames));
        tc.day = stringTo<int>(parser.readWhile(&isDigit<char>)); //throw SysError
        parser.skipBlanks();
        if (tc.day < 1 || tc.day > 31)
            throw SysError(L"Failed to parse day of month.");

        //"hh:mm" for recent items, "yyyy" otherwise
        const std::string_view timeOrYear = parser.readWhile([](char c) { return c == ':' || isDigit(c); }); //throw SysError
        parser.skipBlanks();

        if (contains(timeOrYear, ':'))
        {
            tc.hour   = stringTo<int>(beforeFirst(timeOrYear, ':', IfNotFoundReturn::none));
            tc.minute = stringTo<int>(afterFirst (timeOrYear, ':', IfNotFoundReturn::none));
            if (tc.hour < 0 || tc.hour > 23 || tc.minute < 0 || tc.minute > 59)
                throw SysError(L"Failed to parse modification time.");

            tc.year = utcCurrentYear;
            //server time zone is unknown: allow one day of leeway before assuming last year
            if (toTimeT(tc) > utcTimeNow + 24 * 3600)
                --tc.year;
        }
        else if (timeOrYear.size() == 4)
        {
            tc.year = stringTo<int>(timeOrYear);
            if (tc.year < 1600 || tc.year >= 3000)
                throw SysError(L"Failed to parse modification time.");
        }
        else
            throw SysError(L"Failed to parse modification time.");

        const time_t modTime = toTimeT(tc); //throw SysError
        //------------------------------------------------------------------------------------
        const std::string_view trail = parser.readRemainder(); //throw SysError
        const std::string_view itemName = typeTag == 'l' ? beforeFirst(trail, " -> ", IfNotFoundReturn::all) : trail;
        if (itemName.empty())
            throw SysError(L"Item name not available.");

        if (isDotEntry(itemName))
            return {Zstring(itemName), ItemType::folder};

        RemoteItem item{Zstring(itemName)};
        if (typeTag == 'd')
        {
            item.type = ItemType::folder;
            if (endsWith(item.itemName, '/')) //"ls --file-type"
                item.itemName.pop_back();
        }
        else if (typeTag == 'l')
            item.type = ItemType::symlink;
        else
            item.fileSize = fileSize;

        item.modTime = modTime;
        return item;
    }
    catch (const SysError& e)
    {
        throw SysError(L"Unexpected FTP response. (" + utfTo<std::wstring>(rawLine) + L") [ownerGroupCount: " + numberTo<std::wstring>(ownerGroupCount) + L"] " + e.toString());
    }
}

//----------------------------------------------------------------------------------------------------------------

/*  IIS "dir" style:
        10-27-15  03:46AM       <DIR>          pub
        04-08-14  03:09PM               11,399 readme.txt
        06-22-2017  16:25         1875499 archive.zip                */
RemoteItem parseDosLine(const std::string_view& rawLine, int utcCurrentYear) //throw SysError
{
    try
    {
        FtpLineParser parser(rawLine);

        auto isDateSeparator = [](char c) { return c == '-' || c == '/'; };

        TimeComp tc;
        tc.month = stringTo<int>(parser.readFixed(2, &isDigit<char>)); //throw SysError
        parser.readFixed(1, isDateSeparator);
        tc.day = stringTo<int>(parser.readFixed(2, &isDigit<char>)); //throw SysError
        parser.readFixed(1, isDateSeparator);
        const std::string_view yearStr = parser.readWhile(&isDigit<char>); //throw SysError
        parser.skipBlanks();

        if (tc.month < 1 || tc.month > 12 || tc.day < 1 || tc.day > 31)
            throw SysError(L"Failed to parse modification time.");

        if (yearStr.size() == 2)
        {
            tc.year = (utcCurrentYear / 100) * 100 + stringTo<int>(yearStr);
            if (tc.year > utcCurrentYear + 1) //two-digit years never lie in the future
                tc.year -= 100;
        }
        else if (yearStr.size() == 4)
            tc.year = stringTo<int>(yearStr);
        else
            throw SysError(L"Failed to parse modification time.");
        //------------------------------------------------------------------------------------
        tc.hour = stringTo<int>(parser.readFixed(2, &isDigit<char>)); //throw SysError
        parser.readFixed(1, [](char c) { return c == ':'; });
        tc.minute = stringTo<int>(parser.readFixed(2, &isDigit<char>)); //throw SysError

        if (!isWhiteSpace(parser.peekNextChar())) //12-hour clock
        {
            const std::string_view period = parser.readFixed(2, [](char c) { return c == 'A' || c == 'P' || c == 'M'; }); //throw SysError
            if (period == "PM")
            {
                if (tc.hour < 12)
                    tc.hour += 12;
            }
            else if (tc.hour == 12)
                tc.hour = 0;
        }
        parser.skipBlanks();

        if (tc.hour < 0 || tc.hour > 23 || tc.minute < 0 || tc.minute > 59)
            throw SysError(L"Failed to parse modification time.");

        const time_t modTime = toTimeT(tc); //throw SysError
        //------------------------------------------------------------------------------------
        const std::string_view dirTagOrSize = parser.readToken(); //throw SysError
        parser.skipBlanks();

        RemoteItem item;
        if (dirTagOrSize == "<DIR>")
            item.type = ItemType::folder;
        else
        {
            std::string sizeStr(dirTagOrSize);
            replace(sizeStr, ',', "");
            replace(sizeStr, '.', "");
            if (sizeStr.empty() || !std::all_of(sizeStr.begin(), sizeStr.end(), &isDigit<char>))
                throw SysError(L"Failed to parse file size.");
            item.fileSize = stringTo<uint64_t>(sizeStr);
        }

        item.itemName = Zstring(parser.readRemainder()); //throw SysError
        item.modTime = modTime;
        return item;
    }
    catch (const SysError& e)
    {
        throw SysError(L"Unexpected FTP response. (" + utfTo<std::wstring>(rawLine) + L") " + e.toString());
    }
}
}


std::vector<std::string_view> sitesync::splitFtpResponse(const std::string& buf)
{
    std::vector<std::string_view> lines;

    split2(buf, [](char c) { return isLineBreak(c) || c == '\0'; },
    [&lines](const std::string_view block)
    {
        if (!block.empty()) //<CR><LF> yields empty blocks
            lines.push_back(block);
    });
    return lines;
}


FtpFeatures sitesync::parseFeatResponse(const std::string& featResponse)
{
    //https://tools.ietf.org/html/rfc2389#page-4
    const std::vector<std::string_view> lines = splitFtpResponse(featResponse);

    FtpFeatures output;
    auto it = std::find_if(lines.begin(), lines.end(), [](const std::string_view& line) { return startsWith(line, "211-") || startsWith(line, "211 "); });
    if (it == lines.end())
        return output;

    for (++it; it != lines.end(); ++it)
    {
        if (startsWithAsciiNoCase(*it, "211 End") ||
            startsWithAsciiNoCase(*it, "211 "))
            break;

        std::string line(*it);
        if (startsWith(line, "211-")) //ProFTPD "MultilineRFC2228"
            line = ' ' + afterFirst(line, '-', IfNotFoundReturn::none);

        //MLST implies MLSD support: https://tools.ietf.org/html/rfc3659#section-7.8
        if (equalAsciiNoCase     (line, " MLST")  ||
            startsWithAsciiNoCase(line, " MLST ") ||
            equalAsciiNoCase     (line, " MLSD"))
            output.mlsd = true;
        else if (equalAsciiNoCase(line, " UTF8") ||
                 equalAsciiNoCase(line, " UTF8 ON"))
            output.utf8 = true;
    }
    return output;
}


std::string_view sitesync::getFtpReplyValue(const std::string& response, std::string_view statusPrefix) //throw SysError
{
    for (const std::string_view& line : splitFtpResponse(response))
        if (startsWith(line, statusPrefix))
            return trimCpy(line.substr(statusPrefix.size()));

    throw SysError(L"Unexpected FTP response. (" + utfTo<std::wstring>(response) + L')');
}


std::optional<time_t> sitesync::parseFtpTimeVal(std::string_view timeVal)
{
    timeVal = beforeLast(timeVal, '.', IfNotFoundReturn::all); //drop fraction of seconds

    const TimeComp tc = parseTime("%Y%m%d%H%M%S", timeVal);
    if (tc == TimeComp())
        return std::nullopt;

    if (const auto [modTime, timeValid] = utcToTimeT(tc);
        timeValid)
        return modTime;
    return std::nullopt;
}


std::vector<RemoteItem> sitesync::parseMlsdListing(const std::string& buf) //throw SysError
{
    std::vector<RemoteItem> output;
    for (const std::string_view& line : splitFtpResponse(buf))
    {
        RemoteItem item = parseMlsdLine(line); //throw SysError
        if (!isDotEntry(item.itemName))
            output.push_back(std::move(item));
    }
    return output;
}


std::vector<RemoteItem> sitesync::parseListListing(const std::string& buf, time_t utcTimeNow) //throw SysError
{
    //DOS listings start with the date, Unix listings with the type tag
    if (!buf.empty() && isDigit(buf[0]))
        return parseDosListing(buf, utcTimeNow); //throw SysError
    return parseUnixListing(buf, utcTimeNow); //throw SysError
}


std::vector<RemoteItem> sitesync::parseUnixListing(const std::string& buf, time_t utcTimeNow) //throw SysError
{
    const std::vector<std::string_view> lines = splitFtpResponse(buf);
    auto itLine = lines.begin();

    if (itLine != lines.end() && startsWith(*itLine, "total "))
        ++itLine;

    const int utcCurrentYear = getCurrentUtcYear(utcTimeNow); //throw SysError

    //number of owner/group columns: detect once per item type (dirs and files may differ!)
    std::optional<int> dirOwnerGroupCount;
    std::optional<int> fileOwnerGroupCount;
    std::optional<int> linkOwnerGroupCount;

    std::vector<RemoteItem> output;
    for (; itLine != lines.end(); ++itLine)
    {
        const std::string_view line = *itLine;

        std::optional<int>& ownerGroupCount = line[0] == 'd' ? dirOwnerGroupCount :
                                              line[0] == 'l' ? linkOwnerGroupCount : fileOwnerGroupCount;
        if (!ownerGroupCount)
        {
            std::optional<SysError> firstError;
            for (int i = 2; i >= 0 && !ownerGroupCount; --i)
                try
                {
                    parseUnixLine(line, utcTimeNow, utcCurrentYear, i); //throw SysError
                    ownerGroupCount = i;
                }
                catch (const SysError& e)
                {
                    if (!firstError)
                        firstError = e;
                }
            if (!ownerGroupCount)
                throw *firstError;
        }

        RemoteItem item = parseUnixLine(line, utcTimeNow, utcCurrentYear, *ownerGroupCount); //throw SysError
        if (!isDotEntry(item.itemName))
            output.push_back(std::move(item));
    }
    return output;
}


std::vector<RemoteItem> sitesync::parseDosListing(const std::string& buf, time_t utcTimeNow) //throw SysError
{
    const int utcCurrentYear = getCurrentUtcYear(utcTimeNow); //throw SysError

    std::vector<RemoteItem> output;
    for (const std::string_view& line : splitFtpResponse(buf))
    {
        RemoteItem item = parseDosLine(line, utcCurrentYear); //throw SysError
        if (!isDotEntry(item.itemName))
            output.push_back(std::move(item));
    }
    return output;
}
