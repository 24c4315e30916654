// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef LOG_FILE_H_931726432167489732164
#define LOG_FILE_H_931726432167489732164

#include <zen/error_log.h>
#include <zen/file_error.h>
#include "status_handler.h"


namespace sitesync
{
//summary box followed by all log entries
std::string generateLogText(const ProcessSummary& summary, const zen::ErrorLog& log);

//overwrites an existing file; parent folders are created
void saveLogFile(const Zstring& logFilePath, const ProcessSummary& summary, const zen::ErrorLog& log); //throw FileError
}

#endif //LOG_FILE_H_931726432167489732164
