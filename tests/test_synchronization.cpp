// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "test_util.h"
#include "../SiteSync/Source/base/synchronization.h"

using namespace zen;
using namespace sitesync;
using namespace sitesync::test;


namespace
{
const size_t FILE_COUNT = 20;

//"f00.txt" ... "f19.txt" in three folder levels; returns relative paths
std::vector<Zstring> createSourceTree(const Zstring& rootPath, time_t modTime)
{
    std::vector<Zstring> relPaths;
    for (size_t i = 0; i < FILE_COUNT; ++i)
    {
        const Zstring fileName = Zstring(Zstr("f")) + (i < 10 ? Zstr("0") : Zstr("")) + numberTo<Zstring>(i) + Zstr(".txt");
        const Zstring relPath = i % 3 == 0 ? Zstr("dir1/")      + fileName :
                                i % 3 == 1 ? Zstr("dir2/deep/") + fileName : fileName;

        writeFile(appendPath(rootPath, relPath), makeContent(100 + i * 10, 'A'));
        setModTime(appendPath(rootPath, relPath), modTime);
        relPaths.push_back(relPath);
    }
    return relPaths;
}


SyncConfig getTestConfig(const Zstring& localRoot, SyncDirection direction, bool purgeBefore = false)
{
    SyncConfig cfg;
    cfg.remoteRoot  = Zstr("/");
    cfg.localRoot   = localRoot;
    cfg.direction   = direction;
    cfg.purgeBefore = purgeBefore;
    cfg.settings.retry.baseDelay = std::chrono::milliseconds(1);
    return cfg;
}


time_t anHourAgo() { return std::time(nullptr) - 3600; }
}


static void test_download_is_idempotent()
{
    TempFolder remote;
    TempFolder local;
    const std::vector<Zstring> relPaths = createSourceTree(remote.path(), anHourAgo());

    FaultPlan plan;
    FaultyConnectionFactory factory(remote.path(), plan);
    TestCallback cb;

    const SyncResult first = synchronize(factory, getTestConfig(local.path(), SyncDirection::download), cb);
    assert(first.success);
    assert(first.stats == (SyncStats{FILE_COUNT, 0, 0, 3}));

    for (const Zstring& relPath : relPaths)
        assert(readFile(local / relPath) == readFile(remote / relPath));

    const SyncResult second = synchronize(factory, getTestConfig(local.path(), SyncDirection::download), cb);
    assert(second.success);
    assert(second.stats == (SyncStats{0, FILE_COUNT, 0, 0}));

    //newer remote file is copied again
    setModTime(remote / relPaths[5], std::time(nullptr) + 3600);
    const SyncResult third = synchronize(factory, getTestConfig(local.path(), SyncDirection::download), cb);
    assert(third.stats == (SyncStats{1, FILE_COUNT - 1, 0, 0}));

    assert(cb.errors == 0);
}

static void test_upload_is_idempotent()
{
    TempFolder remote;
    TempFolder local;
    const std::vector<Zstring> relPaths = createSourceTree(local.path(), anHourAgo());

    const std::unique_ptr<ConnectionFactory> factory = createNativeConnectionFactory(remote.path());
    TestCallback cb;

    const SyncResult first = synchronize(*factory, getTestConfig(local.path(), SyncDirection::upload), cb);
    assert(first.success);
    assert(first.stats == (SyncStats{FILE_COUNT, 0, 0, 3}));

    for (const Zstring& relPath : relPaths)
        assert(readFile(remote / relPath) == readFile(local / relPath));

    const SyncResult second = synchronize(*factory, getTestConfig(local.path(), SyncDirection::upload), cb);
    assert(second.success);
    assert(second.stats == (SyncStats{0, FILE_COUNT, 0, 0}));
}

static void test_one_permanent_failure_succeeds()
{
    TempFolder remote;
    TempFolder local;
    createSourceTree(remote.path(), anHourAgo());

    FaultPlan plan;
    plan.addPermanentFailure("f07.txt");
    FaultyConnectionFactory factory(remote.path(), plan);
    TestCallback cb;

    const SyncResult result = synchronize(factory, getTestConfig(local.path(), SyncDirection::download), cb);

    assert(result.success); //19 / 20 >= 0.9
    assert(result.stats.transferred == FILE_COUNT - 1);
    assert(result.stats.failed == 1);
    assert(result.stats.transferred + result.stats.skipped + result.stats.failed == FILE_COUNT);
    assert(!exists(local / "dir2/deep/f07.txt"));
    assert(cb.errors >= 1);
}

static void test_three_permanent_failures_fail()
{
    TempFolder remote;
    TempFolder local;
    createSourceTree(remote.path(), anHourAgo());

    FaultPlan plan;
    plan.addPermanentFailure("f02.txt");
    plan.addPermanentFailure("f09.txt");
    plan.addPermanentFailure("f13.txt");
    FaultyConnectionFactory factory(remote.path(), plan);
    TestCallback cb;

    const SyncResult result = synchronize(factory, getTestConfig(local.path(), SyncDirection::download), cb);

    assert(!result.success); //17 / 20 < 0.9
    assert(result.stats.transferred == FILE_COUNT - 3);
    assert(result.stats.failed == 3);
    assert(result.stats.transferred + result.stats.skipped + result.stats.failed == FILE_COUNT);
}

static void test_transient_failures_recover()
{
    TempFolder remote;
    TempFolder local;
    createSourceTree(remote.path(), anHourAgo());

    FaultPlan plan;
    plan.addTransientFailures("f01.txt", 2);
    plan.addTransientFailures("f10.txt", 1);
    FaultyConnectionFactory factory(remote.path(), plan);
    TestCallback cb;

    const SyncResult result = synchronize(factory, getTestConfig(local.path(), SyncDirection::download), cb);

    assert(result.success);
    assert(result.stats.transferred == FILE_COUNT);
    assert(result.stats.failed == 0);
    assert(cb.warnings == 3);
}

static void test_purge_before_download()
{
    TempFolder remote;
    TempFolder local;
    const std::vector<Zstring> relPaths = createSourceTree(remote.path(), anHourAgo());

    for (const Zstring& relPath : {Zstr("stale0.txt"), Zstr("stale1.txt"), Zstr("old/stale2.txt"), Zstr("old/stale3.txt"), Zstr("dir1/stale4.txt")})
        writeFile(local / relPath, "stale");

    //up-to-date copy: transferred nevertheless since the destination is cleared
    writeFile(local / relPaths[0], "local version");

    FaultPlan plan;
    FaultyConnectionFactory factory(remote.path(), plan);
    TestCallback cb;

    const SyncResult result = synchronize(factory, getTestConfig(local.path(), SyncDirection::download, true /*purgeBefore*/), cb);

    assert(result.success);
    assert(result.stats.transferred == FILE_COUNT);
    assert(result.stats.skipped == 0);
    assert(!exists(local / "stale0.txt"));
    assert(!exists(local / "stale1.txt"));
    assert(!exists(local / "old"));
    assert(!exists(local / "dir1/stale4.txt"));
    assert(readFile(local / relPaths[0]) == readFile(remote / relPaths[0]));
    assert(std::find(cb.phases.begin(), cb.phases.end(), ProcessPhase::purge) < std::find(cb.phases.begin(), cb.phases.end(), ProcessPhase::sync));
}

static void test_purge_before_upload()
{
    TempFolder remote;
    TempFolder local;
    createSourceTree(local.path(), anHourAgo());

    for (const Zstring& relPath : {Zstr("stale0.txt"), Zstr("stale1.txt"), Zstr("old/stale2.txt"), Zstr("old/stale3.txt"), Zstr("dir1/stale4.txt")})
        writeFile(remote / relPath, "stale");

    const std::unique_ptr<ConnectionFactory> factory = createNativeConnectionFactory(remote.path());
    TestCallback cb;

    const SyncResult result = synchronize(*factory, getTestConfig(local.path(), SyncDirection::upload, true /*purgeBefore*/), cb);

    assert(result.success);
    assert(result.stats.transferred == FILE_COUNT);
    assert(!exists(remote / "stale0.txt"));
    assert(!exists(remote / "stale1.txt"));
    assert(!exists(remote / "old"));
    assert(!exists(remote / "dir1/stale4.txt"));
    assert(exists(remote / "dir1/f00.txt"));
}

static void test_missing_remote_root()
{
    TempFolder remote;
    TempFolder local;
    writeFile(local / "keep.txt", "must not be purged");

    const std::unique_ptr<ConnectionFactory> factory = createNativeConnectionFactory(remote.path());
    TestCallback cb;

    SyncConfig cfg = getTestConfig(local.path(), SyncDirection::download, true /*purgeBefore*/);
    cfg.remoteRoot = Zstr("/missing");

    bool notFound = false;
    try { synchronize(*factory, cfg, cb); }
    catch (const ErrorRemoteNotFound&) { notFound = true; }
    assert(notFound);
    assert(exists(local / "keep.txt"));
}

static void test_connection_failure()
{
    TempFolder local;
    const std::unique_ptr<ConnectionFactory> factory = createNativeConnectionFactory(local / "no-such-share");
    TestCallback cb;

    bool connectionError = false;
    try { synchronize(*factory, getTestConfig(local.path(), SyncDirection::download), cb); }
    catch (const ErrorConnection&) { connectionError = true; }
    assert(connectionError);
}

static void test_nothing_to_transfer()
{
    TempFolder remote;
    TempFolder local;

    const std::unique_ptr<ConnectionFactory> factory = createNativeConnectionFactory(remote.path());
    TestCallback cb;

    const SyncResult result = synchronize(*factory, getTestConfig(local.path(), SyncDirection::download), cb);
    assert(result.success);
    assert(result.stats == SyncStats{});
}

static void test_name_clash_counts_as_failure()
{
    TempFolder remote;
    TempFolder local;
    writeFile(remote / "item", "a file");
    createDirectoryIfMissingRecursion(local / "item");

    const std::unique_ptr<ConnectionFactory> factory = createNativeConnectionFactory(remote.path());
    TestCallback cb;

    const SyncResult result = synchronize(*factory, getTestConfig(local.path(), SyncDirection::download), cb);
    assert(!result.success);
    assert(result.stats.failed == 1);
    assert(getItemType(local / "item") == ItemType::folder);
}

static void test_unknown_mod_time_means_transfer()
{
    TempFolder remote;
    TempFolder local;
    writeFile(remote / "a.txt", "remote a");
    writeFile(remote / "b.txt", "remote b");
    setModTime(remote / "a.txt", anHourAgo());
    setModTime(remote / "b.txt", anHourAgo());
    writeFile(local / "a.txt", "local a"); //newer than remote
    writeFile(local / "b.txt", "local b"); //

    FaultPlan plan;
    plan.setListingWithoutTimes(true);
    plan.addModTimeFailure("b.txt");
    FaultyConnectionFactory factory(remote.path(), plan);
    TestCallback cb;

    const SyncResult result = synchronize(factory, getTestConfig(local.path(), SyncDirection::download), cb);

    assert(result.success);
    assert(result.stats == (SyncStats{1, 1, 0, 0}));
    assert(readFile(local / "a.txt") == "local a");
    assert(readFile(local / "b.txt") == "remote b");
}

static void test_purge_failure_aborts_before_transfer()
{
    TempFolder remote;
    TempFolder local;
    createSourceTree(local.path(), anHourAgo());
    writeFile(remote / "locked.txt", "cannot be deleted");

    FaultPlan plan;
    plan.addRemoveFailure("locked.txt");
    FaultyConnectionFactory factory(remote.path(), plan);
    TestCallback cb;

    bool purgeError = false;
    try { synchronize(factory, getTestConfig(local.path(), SyncDirection::upload, true /*purgeBefore*/), cb); }
    catch (const ErrorPurge&) { purgeError = true; }

    assert(purgeError);
    assert(exists(remote / "locked.txt"));
    assert(!exists(remote / "f02.txt"));
    assert(!exists(remote / "dir1"));
    assert(std::find(cb.phases.begin(), cb.phases.end(), ProcessPhase::sync) == cb.phases.end());
}

static void test_dry_run_changes_nothing()
{
    TempFolder remote;
    TempFolder local;
    createSourceTree(remote.path(), anHourAgo());
    writeFile(local / "stale.txt", "stale");

    FaultPlan plan;
    FaultyConnectionFactory factory(remote.path(), plan);
    TestCallback cb;

    SyncConfig cfg = getTestConfig(local.path(), SyncDirection::download, true /*purgeBefore*/);
    cfg.dryRun = true;

    const SyncResult down = synchronize(factory, cfg, cb);
    assert(down.success);
    assert(down.stats == SyncStats{});
    assert(exists(local / "stale.txt"));
    assert(!exists(local / "dir1"));
    assert(plan.getSessionsOpened() == 1); //scan only
    assert(static_cast<size_t>(std::count_if(cb.messages.begin(), cb.messages.end(), [](const std::wstring& msg) { return contains(msg, L"would download"); })) == FILE_COUNT);
    assert(std::find(cb.phases.begin(), cb.phases.end(), ProcessPhase::purge) == cb.phases.end());

    //upload into an empty remote folder
    TempFolder emptyRemote;
    const std::unique_ptr<ConnectionFactory> uploadFactory = createNativeConnectionFactory(emptyRemote.path());
    cfg = getTestConfig(remote.path(), SyncDirection::upload);
    cfg.dryRun = true;

    const SyncResult up = synchronize(*uploadFactory, cfg, cb);
    assert(up.success);
    assert(up.stats == SyncStats{});
    assert(!exists(emptyRemote / "dir1"));
    assert(!exists(emptyRemote / "f02.txt"));
}

static void test_upload_several_sources()
{
    TempFolder remote;
    TempFolder local1;
    TempFolder local2;
    TempFolder local3;
    writeFile(local1 / "a.txt", "from local1");
    writeFile(local1 / "sub/b.txt", "b");
    writeFile(local2 / "assets/c.txt", "c");
    writeFile(local3 / "a.txt", "from local3");
    setModTime(local1 / "a.txt",     anHourAgo());
    setModTime(local1 / "sub/b.txt", anHourAgo());
    setModTime(local2 / "assets/c.txt", anHourAgo());
    setModTime(local3 / "a.txt",     anHourAgo());

    const std::unique_ptr<ConnectionFactory> factory = createNativeConnectionFactory(remote.path());
    TestCallback cb;

    SyncConfig cfg = getTestConfig(Zstring(), SyncDirection::upload);
    cfg.uploadSources =
    {
        {local1.path(), false},
        {local2 / "assets", true /*keepFolderName*/},
        {local3.path(), false},
    };

    const SyncResult first = synchronize(*factory, cfg, cb);
    assert(first.success);
    assert(first.stats == (SyncStats{3, 1, 0, 2})); //"a.txt" of local1 is superseded by local3
    assert(readFile(remote / "a.txt") == "from local3");
    assert(readFile(remote / "sub/b.txt") == "b");
    assert(readFile(remote / "assets/c.txt") == "c");
    assert(!exists(remote / "c.txt"));
    assert(cb.warnings == 1);

    const SyncResult second = synchronize(*factory, cfg, cb);
    assert(second.success);
    assert(second.stats == (SyncStats{0, 4, 0, 0}));
}

int main()
{
    test_download_is_idempotent();
    test_upload_is_idempotent();
    test_one_permanent_failure_succeeds();
    test_three_permanent_failures_fail();
    test_transient_failures_recover();
    test_purge_before_download();
    test_purge_before_upload();
    test_missing_remote_root();
    test_connection_failure();
    test_nothing_to_transfer();
    test_name_clash_counts_as_failure();
    test_unknown_mod_time_means_transfer();
    test_purge_failure_aborts_before_transfer();
    test_dry_run_changes_nothing();
    test_upload_several_sources();
    std::cout << "All synchronization tests passed" << std::endl;
    return 0;
}
