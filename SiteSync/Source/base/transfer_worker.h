// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef TRANSFER_WORKER_H_3409857203948572
#define TRANSFER_WORKER_H_3409857203948572

#include "structures.h"
#include "status_handler_impl.h"
#include "../afs/abstract.h"


namespace sitesync
{
enum class AttemptStatus
{
    success,
    retryable, //connection loss, timeout, size mismatch, ...
    fatal,     //permission denied, disk full, name not allowed: retrying won't help
};

struct AttemptResult
{
    AttemptStatus status = AttemptStatus::success;
    std::wstring errorMsg; //empty on success
};


struct TransferOutcome
{
    TransferTask task;
    bool success = false;
    bool permanent = false; //failed without exhausting the retries
    size_t attempts = 0;
    std::wstring errorMsg;
};


/*  copies single files over one dedicated connection:
    1. delete stale ".in.<name>" marker (failure: warning, then write to ".in.<name>.1", ".in.<name>.2", ...)
    2. write data to the marker: in one buffer, or streamed block-wise above the large-file threshold
    3. verify marker size, then rename it over the final name

    the connection is dropped after any failed attempt and reopened lazily     */
class TransferWorker
{
public:
    TransferWorker(const ConnectionFactory& connFactory, const SyncSettings& settings, AsyncCallback& acb) :
        connFactory_(connFactory), settings_(settings), acb_(acb) {}

    //retry with exponential backoff; per-file errors are reported via outcome, not thrown
    TransferOutcome transfer(const TransferTask& task); //throw ThreadStopRequest

    //single try without retry
    AttemptResult attemptTransfer(const TransferTask& task); //throw ThreadStopRequest

private:
    TransferWorker           (const TransferWorker&) = delete;
    TransferWorker& operator=(const TransferWorker&) = delete;

    RemoteSession& getSession(); //throw ErrorConnection

    void download(RemoteSession& session, const TransferTask& task); //throw FileError, ThreadStopRequest
    void upload  (RemoteSession& session, const TransferTask& task); //throw FileError, ThreadStopRequest

    const ConnectionFactory& connFactory_;
    const SyncSettings settings_;
    AsyncCallback& acb_;

    std::unique_ptr<RemoteSession> session_; //bound to this worker only
};
}

#endif //TRANSFER_WORKER_H_3409857203948572
