// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "status_handler.h"
#include <atomic>
#include <csignal>
#include <iostream>
#include <zen/sys_error.h>

using namespace zen;
using namespace sitesync;


namespace
{
std::chrono::steady_clock::time_point lastExec;

std::atomic<bool> abortSignal{false}; //written by signal handler

void onAbortSignal(int /*sig*/)
{
    abortSignal = true;
}


std::wstring getPhaseLabel(ProcessPhase phase)
{
    switch (phase)
    {
        case ProcessPhase::none:
            break;
        case ProcessPhase::scan:
            return _("Scanning...");
        case ProcessPhase::purge:
            return _("Deleting destination items...");
        case ProcessPhase::sync:
            return _("Synchronizing...");
    }
    return std::wstring();
}
}


bool sitesync::uiUpdateDue(bool force)
{
    const auto now = std::chrono::steady_clock::now();

    if (now >= lastExec + UI_UPDATE_INTERVAL || force)
    {
        lastExec = now;
        return true;
    }
    return false;
}


void sitesync::installAbortSignalHandler() //throw SysError
{
    for (const auto& [sig, sigName] : {std::pair{SIGINT, "signal(SIGINT)"}, std::pair{SIGTERM, "signal(SIGTERM)"}})
        if (::signal(sig, onAbortSignal) == SIG_ERR)
            THROW_LAST_SYS_ERROR(sigName);
}


bool sitesync::abortSignalReceived() { return abortSignal; }

//------------------------------------------------------------------------------------------

ConsoleStatusHandler::ConsoleStatusHandler(const std::wstring& jobName, bool verbose) :
    jobName_(jobName),
    verbose_(verbose) {}


void ConsoleStatusHandler::initNewPhase(int itemsTotal, int64_t bytesTotal, ProcessPhase phaseId)
{
    StatusHandler::initNewPhase(itemsTotal, bytesTotal, phaseId);

    if (verbose_)
        std::cout << utfTo<std::string>(getPhaseLabel(phaseId)) + '\n' << std::flush;
    forceUiUpdateNoThrow();
}


void ConsoleStatusHandler::logMessage(const std::wstring& msg, MsgType type)
{
    const MessageType logType = [&]
    {
        switch (type)
        {
            case MsgType::info:
                return MSG_TYPE_INFO;
            case MsgType::warning:
                return MSG_TYPE_WARNING;
            case MsgType::error:
                break;
        }
        return MSG_TYPE_ERROR;
    }();

    logMsg(errorLog_, msg, logType);

    const std::string msgFmt = formatMessage(errorLog_.back());
    if (logType == MSG_TYPE_INFO)
    {
        if (verbose_)
            std::cout << msgFmt << std::flush;
    }
    else
        std::cerr << msgFmt << std::flush;
}


void ConsoleStatusHandler::reportFatalError(const std::wstring& msg)
{
    logMessage(msg, MsgType::error);
}


void ConsoleStatusHandler::forceUiUpdateNoThrow()
{
    if (abortSignalReceived() && !abortRequested())
    {
        userRequestAbort();
        logMessage(_("Stop requested: Waiting for current operation to finish..."), MsgType::warning);
    }

    if (verbose_ && currentStatusText() != lastStatusPrinted_)
    {
        lastStatusPrinted_ = currentStatusText();

        std::wstring progress;
        if (const ProgressStats total = getStatsTotal();
            total.items >= 0)
            progress = L'[' + numberTo<std::wstring>(getStatsCurrent().items) + L'/' + numberTo<std::wstring>(total.items) + L"] ";

        std::cout << utfTo<std::string>(progress + lastStatusPrinted_) + '\n' << std::flush;
    }
}


ProcessSummary ConsoleStatusHandler::prepareResult(const std::optional<SyncResult>& syncResult)
{
    ProcessSummary summary;
    summary.startTime = startTime_;
    summary.jobName   = jobName_;
    summary.totalTime = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - startTimeSteady_);
    summary.statsProcessed = getStatsCurrent();
    summary.statsTotal     = getStatsTotal();

    if (syncResult)
    {
        summary.syncStats = syncResult->stats;
        summary.result = syncResult->success ? TaskResult::success : TaskResult::errors;
    }
    else
        summary.result = abortRequested() ? TaskResult::cancelled : TaskResult::exception;

    return summary;
}
