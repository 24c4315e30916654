// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "test_util.h"
#include "../SiteSync/Source/base/transfer_worker.h"

using namespace zen;
using namespace sitesync;
using namespace sitesync::test;


namespace
{
SyncSettings getTestSettings()
{
    SyncSettings settings;
    settings.retry.baseDelay = std::chrono::milliseconds(1);
    return settings;
}


TransferOutcome runTransfer(const ConnectionFactory& factory, const TransferTask& task, TestCallback& cb, const SyncSettings& settings = getTestSettings())
{
    TransferOutcome outcome;
    runOnWorkerThread([&](AsyncCallback& acb)
    {
        TransferWorker worker(factory, settings, acb);
        outcome = worker.transfer(task);
    }, cb);
    return outcome;
}
}


static void test_download_creates_parent_folders()
{
    TempFolder remote;
    TempFolder local;
    writeFile(remote / "a/b.txt", "hello");

    FaultPlan plan;
    FaultyConnectionFactory factory(remote.path(), plan);
    TestCallback cb;

    const TransferOutcome outcome = runTransfer(factory, {"/a/b.txt", local / "a/b.txt", 5, SyncDirection::download}, cb);

    assert(outcome.success);
    assert(outcome.attempts == 1);
    assert(readFile(local / "a/b.txt") == "hello");
    assert(!exists(local / "a/.in.b.txt"));
    assert(cb.itemsProcessed == 1 && cb.bytesProcessed == 5);
}

static void test_stale_marker_removed()
{
    TempFolder remote;
    TempFolder local;

    //download
    writeFile(remote / "b.txt", "fresh content");
    writeFile(local / ".in.b.txt", "garbage from an interrupted run");

    FaultPlan plan;
    FaultyConnectionFactory factory(remote.path(), plan);
    TestCallback cb;

    const TransferOutcome down = runTransfer(factory, {"/b.txt", local / "b.txt", 13, SyncDirection::download}, cb);
    assert(down.success);
    assert(readFile(local / "b.txt") == "fresh content");
    assert(!exists(local / ".in.b.txt"));

    //upload
    writeFile(local / "u.txt", "upload me");
    writeFile(remote / "up/.in.u.txt", "garbage");

    const TransferOutcome up = runTransfer(factory, {"/up/u.txt", local / "u.txt", 9, SyncDirection::upload}, cb);
    assert(up.success);
    assert(readFile(remote / "up/u.txt") == "upload me");
    assert(!exists(remote / "up/.in.u.txt"));
    assert(cb.errors == 0);
}

static void test_large_file_round_trip()
{
    TempFolder remote;
    TempFolder local;

    const std::string content = makeContent(10 * 1024 * 1024 + 1, 'a'); //just above the streaming threshold
    writeFile(remote / "big.bin", content);

    FaultPlan plan;
    FaultyConnectionFactory factory(remote.path(), plan);
    TestCallback cb;

    const TransferOutcome down = runTransfer(factory, {"/big.bin", local / "big.bin", content.size(), SyncDirection::download}, cb);
    assert(down.success);
    assert(readFile(local / "big.bin") == content);

    const TransferOutcome up = runTransfer(factory, {"/copy/big.bin", local / "big.bin", content.size(), SyncDirection::upload}, cb);
    assert(up.success);
    assert(readFile(remote / "copy/big.bin") == content);
    assert(cb.bytesProcessed == 2 * static_cast<int64_t>(content.size()));
}

static void test_transient_failures_are_retried()
{
    TempFolder remote;
    TempFolder local;
    writeFile(remote / "c.txt", "retry");

    FaultPlan plan;
    plan.addTransientFailures("c.txt", 2);
    FaultyConnectionFactory factory(remote.path(), plan);
    TestCallback cb;

    const TransferOutcome outcome = runTransfer(factory, {"/c.txt", local / "c.txt", 5, SyncDirection::download}, cb);

    assert(outcome.success);
    assert(outcome.attempts == 3);
    assert(plan.getSessionsOpened() == 3); //new connection after each failed attempt
    assert(cb.warnings == 2);
    assert(cb.errors == 0);
    assert(readFile(local / "c.txt") == "retry");
}

static void test_retries_exhausted()
{
    TempFolder remote;
    TempFolder local;
    writeFile(local / "c.txt", "never arrives");

    FaultPlan plan;
    plan.addTransientFailures("c.txt", 3);
    FaultyConnectionFactory factory(remote.path(), plan);
    TestCallback cb;

    const TransferOutcome outcome = runTransfer(factory, {"/c.txt", local / "c.txt", 13, SyncDirection::upload}, cb);

    assert(!outcome.success);
    assert(!outcome.permanent);
    assert(outcome.attempts == 3);
    assert(!outcome.errorMsg.empty());
    assert(cb.errors == 1);
    assert(!exists(remote / "c.txt"));
}

static void test_permanent_failure_not_retried()
{
    TempFolder remote;
    TempFolder local;
    writeFile(remote / "denied.txt", "secret");

    FaultPlan plan;
    plan.addPermanentFailure("denied.txt");
    FaultyConnectionFactory factory(remote.path(), plan);
    TestCallback cb;

    const TransferOutcome outcome = runTransfer(factory, {"/denied.txt", local / "denied.txt", 6, SyncDirection::download}, cb);

    assert(!outcome.success);
    assert(outcome.permanent);
    assert(outcome.attempts == 1);
    assert(plan.getSessionsOpened() == 1);
    assert(!exists(local / "denied.txt"));
    assert(!exists(local / ".in.denied.txt"));
}

static void test_size_mismatch_fails_verification()
{
    TempFolder remote;
    TempFolder local;
    writeFile(remote / "changed.txt", "12345");

    FaultPlan plan;
    FaultyConnectionFactory factory(remote.path(), plan);
    TestCallback cb;

    //file changed on the server after the scan
    const TransferOutcome outcome = runTransfer(factory, {"/changed.txt", local / "changed.txt", 6, SyncDirection::download}, cb);

    assert(!outcome.success);
    assert(!outcome.permanent);
    assert(outcome.attempts == 3);
    assert(!exists(local / "changed.txt"));
    assert(!exists(local / ".in.changed.txt"));
}

static void test_single_attempt_result()
{
    TempFolder remote;
    TempFolder local;
    writeFile(remote / "ok.txt", "ok");
    writeFile(remote / "denied.txt", "no");
    writeFile(remote / "flaky.txt", "maybe");

    FaultPlan plan;
    plan.addPermanentFailure("denied.txt");
    plan.addTransientFailures("flaky.txt", 1);
    FaultyConnectionFactory factory(remote.path(), plan);
    TestCallback cb;

    std::vector<AttemptResult> results;
    runOnWorkerThread([&](AsyncCallback& acb)
    {
        TransferWorker worker(factory, getTestSettings(), acb);
        results.push_back(worker.attemptTransfer({"/ok.txt",     local / "ok.txt",     2, SyncDirection::download}));
        results.push_back(worker.attemptTransfer({"/denied.txt", local / "denied.txt", 2, SyncDirection::download}));
        results.push_back(worker.attemptTransfer({"/flaky.txt",  local / "flaky.txt",  5, SyncDirection::download}));
    }, cb);

    assert(results.size() == 3);
    assert(results[0].status == AttemptStatus::success && results[0].errorMsg.empty());
    assert(results[1].status == AttemptStatus::fatal);
    assert(results[2].status == AttemptStatus::retryable);
}

static void test_undeletable_marker_uses_next_name()
{
    TempFolder remote;
    TempFolder local;

    //download: marker name taken by a non-empty folder
    writeFile(remote / "b.txt", "fresh content");
    writeFile(local / ".in.b.txt/keep", "not a marker");

    FaultPlan plan;
    FaultyConnectionFactory factory(remote.path(), plan);
    TestCallback cb;

    const TransferOutcome down = runTransfer(factory, {"/b.txt", local / "b.txt", 13, SyncDirection::download}, cb);
    assert(down.success);
    assert(down.attempts == 1);
    assert(readFile(local / "b.txt") == "fresh content");
    assert(readFile(local / ".in.b.txt/keep") == "not a marker");
    assert(!exists(local / ".in.b.txt.1"));
    assert(cb.warnings == 1);

    //upload
    writeFile(local / "u.txt", "upload me");
    writeFile(remote / "up/.in.u.txt/keep", "not a marker");

    const TransferOutcome up = runTransfer(factory, {"/up/u.txt", local / "u.txt", 9, SyncDirection::upload}, cb);
    assert(up.success);
    assert(up.attempts == 1);
    assert(readFile(remote / "up/u.txt") == "upload me");
    assert(!exists(remote / "up/.in.u.txt.1"));
    assert(cb.warnings == 2);
    assert(cb.errors == 0);
}

static void test_upload_trusts_scanned_folder()
{
    TempFolder remote;
    TempFolder local;
    writeFile(local / "s.txt", "scanned");
    createDirectoryIfMissingRecursion(remote / "dir");

    FaultPlan plan;
    FaultyConnectionFactory factory(remote.path(), plan);
    TestCallback cb;

    TransferTask task{"/dir/s.txt", local / "s.txt", 7, SyncDirection::upload};
    task.staleMarkerFound = false;

    const TransferOutcome outcome = runTransfer(factory, task, cb);
    assert(outcome.success);
    assert(readFile(remote / "dir/s.txt") == "scanned");
    assert(plan.getItemTypeRequests() == 0); //neither marker check nor parent folder lookup

    //unknown destination: both are looked up
    const TransferOutcome unknown = runTransfer(factory, {"/dir2/s.txt", local / "s.txt", 7, SyncDirection::upload}, cb);
    assert(unknown.success);
    assert(plan.getItemTypeRequests() > 0);
}

static void test_many_retries_without_overflow()
{
    TempFolder remote;
    TempFolder local;
    writeFile(remote / "m.txt", "many");

    FaultPlan plan;
    plan.addTransientFailures("m.txt", 39);
    FaultyConnectionFactory factory(remote.path(), plan);
    TestCallback cb;

    SyncSettings settings;
    settings.retry.attempts  = 40;
    settings.retry.baseDelay = std::chrono::milliseconds(0);

    const TransferOutcome outcome = runTransfer(factory, {"/m.txt", local / "m.txt", 4, SyncDirection::download}, cb, settings);
    assert(outcome.success);
    assert(outcome.attempts == 40);
    assert(cb.warnings == 39);
}

int main()
{
    test_download_creates_parent_folders();
    test_stale_marker_removed();
    test_large_file_round_trip();
    test_transient_failures_are_retried();
    test_retries_exhausted();
    test_permanent_failure_not_retried();
    test_size_mismatch_fails_verification();
    test_single_attempt_result();
    test_undeletable_marker_uses_next_name();
    test_upload_trusts_scanned_folder();
    test_many_retries_without_overflow();
    std::cout << "All transfer worker tests passed" << std::endl;
    return 0;
}
