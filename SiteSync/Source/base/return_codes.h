// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef RETURN_CODES_H_81307482137054156
#define RETURN_CODES_H_81307482137054156

#include <cassert>
#include <zen/i18n.h>


namespace sitesync
{
enum class SiteSyncExitCode //as returned after process exit
{
    success = 0,
    errors,      //finished, but success rate below threshold
    exception,   //sync-level error: connection, scan, purge
    cancelled,
    invalidArgs, //command line
};


enum class TaskResult
{
    success,
    errors,
    exception,
    cancelled,
};


inline
SiteSyncExitCode mapToExitCode(TaskResult result)
{
    switch (result)
    {
        case TaskResult::success:
            return SiteSyncExitCode::success;
        case TaskResult::errors:
            return SiteSyncExitCode::errors;
        case TaskResult::exception:
            return SiteSyncExitCode::exception;
        case TaskResult::cancelled:
            return SiteSyncExitCode::cancelled;
    }
    assert(false);
    return SiteSyncExitCode::exception;
}


inline
std::wstring getTaskResultLabel(TaskResult result)
{
    switch (result)
    {
        case TaskResult::success:
            return _("Completed successfully");
        case TaskResult::errors:
            return _("Completed with errors");
        case TaskResult::exception:
            return _("Synchronization failed");
        case TaskResult::cancelled:
            return _("Stopped");
    }
    assert(false);
    return std::wstring();
}
}

#endif //RETURN_CODES_H_81307482137054156
