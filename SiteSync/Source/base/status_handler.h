// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef STATUS_HANDLER_H_81704805908341534
#define STATUS_HANDLER_H_81704805908341534

#include <chrono>
#include <optional>
#include <zen/error_log.h>
#include "process_callback.h"
#include "return_codes.h"
#include "structures.h"


namespace sitesync
{
bool uiUpdateDue(bool force = false); //test if a specific amount of time is over

//Exception class used to abort the "scan", "purge" and "sync" process
class AbortProcess {};


struct ProgressStats
{
    int     items = 0;
    int64_t bytes = 0;

    bool operator==(const ProgressStats&) const = default;
};


struct ProcessSummary
{
    std::chrono::system_clock::time_point startTime;
    TaskResult result = TaskResult::cancelled;
    std::wstring jobName; //"download ftp://host/path <-> /local/path"
    SyncStats syncStats;
    ProgressStats statsProcessed;
    ProgressStats statsTotal;
    std::chrono::milliseconds totalTime{};
};


//partial callback implementation with common functionality
class StatusHandler : public ProcessCallback
{
public:
    void initNewPhase(int itemsTotal, int64_t bytesTotal, ProcessPhase phase) override //(throw X)
    {
        assert((itemsTotal < 0) == (bytesTotal < 0));
        currentPhase_ = phase;
        statsCurrent_ = {};
        statsTotal_ = { itemsTotal, bytesTotal };
    }

    void updateDataProcessed(int itemsDelta, int64_t bytesDelta) override { updateData(statsCurrent_, itemsDelta, bytesDelta); } //note: these methods MUST NOT throw in order
    void updateDataTotal    (int itemsDelta, int64_t bytesDelta) override { updateData(statsTotal_,   itemsDelta, bytesDelta); } //to allow usage within destructors!

    void requestUiUpdate(bool force) final //throw AbortProcess
    {
        if (uiUpdateDue(force))
        {
            forceUiUpdateNoThrow();

            if (abortRequested_)
                throw AbortProcess();
        }
    }

    virtual void forceUiUpdateNoThrow() = 0; //noexcept

    void updateStatus(const std::wstring& msg) final //throw AbortProcess
    {
        statusText_ = msg; //update *before* running operations that can throw
        requestUiUpdate(false /*force*/); //throw AbortProcess
    }

    void userRequestAbort() { abortRequested_ = true; } //evaluated during the next UI update

    ProcessPhase currentPhase() const { return currentPhase_; }

    ProgressStats getStatsCurrent() const { return statsCurrent_; }
    ProgressStats getStatsTotal  () const { return statsTotal_; }

    const std::wstring& currentStatusText() const { return statusText_; }

    bool abortRequested() const { return abortRequested_; }

private:
    void updateData(ProgressStats& stats, int itemsDelta, int64_t bytesDelta)
    {
        stats.items += itemsDelta;
        stats.bytes += bytesDelta;
    }

    ProcessPhase currentPhase_ = ProcessPhase::none;
    ProgressStats statsCurrent_;
    ProgressStats statsTotal_ { -1, -1 };
    std::wstring statusText_;

    bool abortRequested_ = false;
};

//------------------------------------------------------------------------------------------

//command line: print log entries to stdout/stderr, collect them for the log file
class ConsoleStatusHandler : public StatusHandler
{
public:
    ConsoleStatusHandler(const std::wstring& jobName, bool verbose); //noexcept

    void initNewPhase    (int itemsTotal, int64_t bytesTotal, ProcessPhase phaseId) override; //
    void logMessage      (const std::wstring& msg, MsgType type)                    override; //noexcept
    void reportFatalError(const std::wstring& msg)                                  override; //

    void forceUiUpdateNoThrow() override; //noexcept

    //call once after the sync
    ProcessSummary prepareResult(const std::optional<SyncResult>& syncResult /*none: exception or abort*/);

    const zen::ErrorLog& getErrorLog() const { return errorLog_; }

private:
    ConsoleStatusHandler           (const ConsoleStatusHandler&) = delete;
    ConsoleStatusHandler& operator=(const ConsoleStatusHandler&) = delete;

    const std::wstring jobName_;
    const std::chrono::system_clock::time_point startTime_ = std::chrono::system_clock::now();
    const std::chrono::steady_clock::time_point startTimeSteady_ = std::chrono::steady_clock::now();
    const bool verbose_;

    zen::ErrorLog errorLog_;
    std::wstring lastStatusPrinted_;
};


//SIGINT/SIGTERM => userRequestAbort() at the next UI update
void installAbortSignalHandler(); //throw SysError
bool abortSignalReceived(); //noexcept
}

#endif //STATUS_HANDLER_H_81704805908341534
