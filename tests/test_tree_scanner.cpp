// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "test_util.h"
#include "../SiteSync/Source/base/tree_scanner.h"

using namespace zen;
using namespace sitesync;
using namespace sitesync::test;


static void test_remote_scan_order_and_filtering()
{
    TempFolder remote;
    TempFolder local;

    writeFile(remote / "root.txt", "root");
    writeFile(remote / "a/x.txt", "x");
    writeFile(remote / "a/sub/y.txt", "y");
    writeFile(remote / "b/z.txt", "z");
    writeFile(remote / ".in.partial", "interrupted transfer");
    [[maybe_unused]] const int rv1 = ::symlink((remote / "a").c_str(), (remote / "link").c_str());
    [[maybe_unused]] const int rv2 = ::symlink((remote / "root.txt").c_str(), (remote / "filelink").c_str());
    assert(rv1 == 0 && rv2 == 0);

    const std::unique_ptr<ConnectionFactory> factory = createNativeConnectionFactory(remote.path());
    const std::unique_ptr<RemoteSession> session = factory->openSession();

    RemoteTreeScanner scanner(*session, Zstr("/"), local.path());

    std::vector<FolderListing> listings;
    while (std::optional<FolderListing> folder = scanner.next())
        listings.push_back(std::move(*folder));

    assert(listings.size() == 4); //"link" is not followed
    assert(listings[0].relPath == "");
    assert(listings[1].relPath == "a");
    assert(listings[2].relPath == "a/sub");
    assert(listings[3].relPath == "b");

    //neither the marker nor the file symlink are reported
    assert(listings[0].sourceFiles.size() == 1);
    assert(listings[0].sourceFiles[0].path == "/root.txt");
    assert(listings[0].sourceFiles[0].sizeBytes == 4);
    assert(listings[0].sourceFiles[0].modTime);

    assert(listings[2].sourceFiles.size() == 1);
    assert(listings[2].sourceFiles[0].path == "/a/sub/y.txt");

    //local folders exist before the files are handed out
    assert(getItemType(local / "a/sub") == ItemType::folder);
    assert(getItemType(local / "b") == ItemType::folder);
    assert(!exists(local / "link"));
    assert(scanner.getDirsCreated() == 3);
}

static void test_remote_scan_reports_targets()
{
    TempFolder remote;
    TempFolder local;

    writeFile(remote / "a.txt", "remote");
    writeFile(local / "a.txt", "local");
    setModTime(local / "a.txt", 1000);

    const std::unique_ptr<RemoteSession> session = createNativeConnectionFactory(remote.path())->openSession();
    RemoteTreeScanner scanner(*session, Zstr("/"), local.path());

    const std::optional<FolderListing> root = scanner.next();
    assert(root);
    assert(root->targetItems.size() == 1);
    assert(root->targetItems.at("a.txt").type == ItemType::file);
    assert(root->targetItems.at("a.txt").modTime == 1000);
    assert(!scanner.next());
    assert(scanner.getDirsCreated() == 0);
}

static void test_remote_scan_root_errors()
{
    TempFolder remote;
    TempFolder local;
    writeFile(remote / "file.txt", "content");

    const std::unique_ptr<RemoteSession> session = createNativeConnectionFactory(remote.path())->openSession();

    bool notFound = false;
    try
    {
        RemoteTreeScanner scanner(*session, Zstr("/missing"), local.path());
        scanner.next();
    }
    catch (const ErrorRemoteNotFound&) { notFound = true; }
    assert(notFound);

    bool scanError = false;
    try
    {
        RemoteTreeScanner scanner(*session, Zstr("/file.txt"), local.path());
        scanner.next();
    }
    catch (const ErrorRemoteNotFound&) { assert(false); }
    catch (const ErrorScan&) { scanError = true; }
    assert(scanError);
}

static void test_local_scan_creates_remote_folders()
{
    TempFolder remote;
    TempFolder local;

    writeFile(local / "c.txt", "c");
    writeFile(local / "sub/d.txt", "d");
    writeFile(local / ".in.c.txt", "stale marker");
    [[maybe_unused]] const int rv = ::symlink((local / "sub").c_str(), (local / "lnk").c_str());
    assert(rv == 0);

    writeFile(remote / "c.txt", "old");
    setModTime(remote / "c.txt", 1000);

    const std::unique_ptr<RemoteSession> session = createNativeConnectionFactory(remote.path())->openSession();
    LocalTreeScanner scanner(*session, local.path(), Zstr("/"));

    const std::optional<FolderListing> root = scanner.next();
    assert(root && root->relPath.empty());
    assert(root->sourceFiles.size() == 1);
    assert(root->sourceFiles[0].path == local / "c.txt");
    assert(root->targetItems.at("c.txt").modTime == 1000);

    const std::optional<FolderListing> sub = scanner.next();
    assert(sub && sub->relPath == "sub");
    assert(sub->sourceFiles.size() == 1);
    assert(sub->targetItems.empty());

    assert(!scanner.next());
    assert(scanner.getDirsCreated() == 1);
    assert(getItemType(remote / "sub") == ItemType::folder);
    assert(!exists(remote / "lnk"));
}

static void test_local_folder_creation_is_idempotent()
{
    TempFolder local;

    assert(createLocalFolderIfMissingRecursion(local / "x/y/z") == 3);
    assert(createLocalFolderIfMissingRecursion(local / "x/y/z") == 0);
    assert(createLocalFolderIfMissingRecursion(local / "x/w") == 1);
}

static void test_remote_scan_unknown_mod_time()
{
    TempFolder remote;
    TempFolder local;

    writeFile(remote / "a.txt", "a");
    writeFile(remote / "b.txt", "b");
    writeFile(remote / "c.txt", "c");
    writeFile(local / "a.txt", "old a");
    writeFile(local / "b.txt", "old b");

    FaultPlan plan;
    plan.setListingWithoutTimes(true);
    plan.addModTimeFailure("b.txt");
    FaultyConnectionFactory factory(remote.path(), plan);
    const std::unique_ptr<RemoteSession> session = factory.openSession();

    RemoteTreeScanner scanner(*session, Zstr("/"), local.path());

    const std::optional<FolderListing> root = scanner.next(); //no ErrorScan
    assert(root && root->sourceFiles.size() == 3);
    assert(root->sourceFiles[0].path == "/a.txt" &&  root->sourceFiles[0].modTime);
    assert(root->sourceFiles[1].path == "/b.txt" && !root->sourceFiles[1].modTime); //unknown: will be transferred
    assert(root->sourceFiles[2].path == "/c.txt" && !root->sourceFiles[2].modTime); //no local counterpart: not asked
    assert(plan.getModTimeRequests() == 2);
    assert(!scanner.next());
}

static void test_local_scan_unknown_mod_time()
{
    TempFolder remote;
    TempFolder local;

    writeFile(local / "a.txt", "a");
    writeFile(local / "b.txt", "b");
    writeFile(remote / "a.txt", "old a");
    writeFile(remote / "b.txt", "old b");
    writeFile(remote / "x.txt", "remote only");

    FaultPlan plan;
    plan.setListingWithoutTimes(true);
    plan.addModTimeFailure("b.txt");
    FaultyConnectionFactory factory(remote.path(), plan);
    const std::unique_ptr<RemoteSession> session = factory.openSession();

    LocalTreeScanner scanner(*session, local.path(), Zstr("/"));

    const std::optional<FolderListing> root = scanner.next();
    assert(root && root->sourceFiles.size() == 2);
    assert( root->targetItems.at("a.txt").modTime);
    assert(!root->targetItems.at("b.txt").modTime);
    assert(!root->targetItems.at("x.txt").modTime);
    assert(plan.getModTimeRequests() == 2);
}

static void test_scan_without_folder_creation()
{
    TempFolder remote;
    TempFolder local;

    writeFile(remote / "a/x.txt", "x");
    writeFile(local / "up/y.txt", "y");

    const std::unique_ptr<RemoteSession> session = createNativeConnectionFactory(remote.path())->openSession();

    RemoteTreeScanner remoteScanner(*session, Zstr("/"), local.path(), false /*createMissingFolders*/);
    size_t folderCount = 0;
    while (std::optional<FolderListing> folder = remoteScanner.next())
    {
        if (folder->relPath == "a")
        {
            assert(folder->sourceFiles.size() == 1);
            assert(folder->targetItems.empty());
        }
        ++folderCount;
    }
    assert(folderCount == 2);
    assert(remoteScanner.getDirsCreated() == 0);
    assert(!exists(local / "a"));

    LocalTreeScanner localScanner(*session, local.path(), Zstr("/"), false /*createMissingFolders*/);
    while (std::optional<FolderListing> folder = localScanner.next())
        if (folder->relPath == "up")
            assert(folder->targetItems.empty());
    assert(localScanner.getDirsCreated() == 0);
    assert(!exists(remote / "up"));
}

int main()
{
    test_remote_scan_order_and_filtering();
    test_remote_scan_reports_targets();
    test_remote_scan_root_errors();
    test_local_scan_creates_remote_folders();
    test_local_folder_creation_is_idempotent();
    test_remote_scan_unknown_mod_time();
    test_local_scan_unknown_mod_time();
    test_scan_without_folder_creation();
    std::cout << "All tree scanner tests passed" << std::endl;
    return 0;
}
