// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "log_file.h"
#include <zen/file_access.h>
#include <zen/file_io.h>
#include <zen/time.h>

using namespace zen;
using namespace sitesync;


namespace
{
const int TAB_SPACE_LEN = 4;


std::string formatTimeSpan(int64_t timeInSec)
{
    const int64_t hours = timeInSec / 3600;
    const int64_t mins  = timeInSec % 3600 / 60;
    const int64_t secs  = timeInSec % 60;

    std::string output = numberTo<std::string>(hours) + ':';
    if (mins < 10) output += '0';
    output += numberTo<std::string>(mins) + ':';
    if (secs < 10) output += '0';
    return output + numberTo<std::string>(secs);
}


std::string generateLogHeader(const ProcessSummary& s, const ErrorLog& log)
{
    const std::string tabSpace(TAB_SPACE_LEN, ' ');

    const TimeComp tc = getLocalTime(std::chrono::system_clock::to_time_t(s.startTime)); //returns TimeComp() on error
    const std::string headerLine = utfTo<std::string>(s.jobName) + ' ' + formatTime(formatIsoDateTimeTag, tc);

    //assemble summary box
    std::vector<std::string> summary;
    summary.emplace_back();
    summary.push_back(tabSpace + utfTo<std::string>(getTaskResultLabel(s.result)));
    summary.emplace_back();

    const ErrorLogStats logCount = getStats(log);

    if (logCount.error   > 0) summary.push_back(tabSpace + utfTo<std::string>(_("Errors:")   + L' ' + numberTo<std::wstring>(logCount.error)));
    if (logCount.warning > 0) summary.push_back(tabSpace + utfTo<std::string>(_("Warnings:") + L' ' + numberTo<std::wstring>(logCount.warning)));

    summary.push_back(tabSpace + utfTo<std::string>(_("Files transferred:")    + L' ' + numberTo<std::wstring>(s.syncStats.transferred)));
    summary.push_back(tabSpace + utfTo<std::string>(_("Files up to date:")     + L' ' + numberTo<std::wstring>(s.syncStats.skipped)));
    summary.push_back(tabSpace + utfTo<std::string>(_("Files failed:")         + L' ' + numberTo<std::wstring>(s.syncStats.failed)));
    summary.push_back(tabSpace + utfTo<std::string>(_("Folders created:")      + L' ' + numberTo<std::wstring>(s.syncStats.dirsCreated)));
    summary.push_back(tabSpace + utfTo<std::string>(_("Bytes transferred:")    + L' ' + numberTo<std::wstring>(s.statsProcessed.bytes)));

    const int64_t totalTimeSec = std::chrono::duration_cast<std::chrono::seconds>(s.totalTime).count();
    summary.push_back(tabSpace + utfTo<std::string>(_("Total time:")) + ' ' + formatTimeSpan(totalTimeSec));

    size_t sepLineLen = 0; //calculate max width (considering Unicode!)
    for (const std::string& str : summary) sepLineLen = std::max(sepLineLen, unicodeLength(str));

    std::string output = headerLine + '\n';
    output += std::string(sepLineLen + 1, '_') + '\n';

    for (const std::string& str : summary)
        output += '|' + str + '\n';

    output += '|' + std::string(sepLineLen, '_') + '\n';
    return output;
}
}


std::string sitesync::generateLogText(const ProcessSummary& summary, const ErrorLog& log)
{
    std::string output = generateLogHeader(summary, log) + '\n';

    for (const LogEntry& entry : log)
        output += formatMessage(entry);

    return output;
}


void sitesync::saveLogFile(const Zstring& logFilePath, const ProcessSummary& summary, const ErrorLog& log) //throw FileError
{
    if (const std::optional<Zstring> parentPath = getParentFolderPath(logFilePath);
        parentPath && !parentPath->empty())
        createDirectoryIfMissingRecursion(*parentPath); //throw FileError

    setFileContent(logFilePath, generateLogText(summary, log), nullptr /*notifyUnbufferedIO*/); //throw FileError
}
