// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef TREE_SCANNER_H_0892347509823475098
#define TREE_SCANNER_H_0892347509823475098

#include <unordered_map>
#include "structures.h"
#include "../afs/abstract.h"


namespace sitesync
{
struct TargetItem
{
    zen::ItemType type = zen::ItemType::file;
    std::optional<time_t> modTime;
};

//one visited source folder with its files, and what is already at the destination
struct FolderListing
{
    Zstring relPath; //relative to the scan root; empty for the root itself
    std::vector<FileMetadata> sourceFiles; //FileMetadata::path: full source path
    std::unordered_map<Zstring, TargetItem> targetItems; //by item name
};


/*  walk remote tree depth-first over one control connection; lazily, one folder per next()
    - the matching local folder is created before a folder's files are returned (unless "createMissingFolders" is false)
    - symlinks are never followed nor reported
    - temporary ".in.<name>" markers are never reported         */
class RemoteTreeScanner
{
public:
    RemoteTreeScanner(RemoteSession& session, const Zstring& remoteRoot, const Zstring& localRoot, bool createMissingFolders = true) :
        session_(session), remoteRoot_(remoteRoot), localRoot_(localRoot), createMissingFolders_(createMissingFolders) {}

    std::optional<FolderListing> next(); //throw ErrorRemoteNotFound, ErrorScan

    uint64_t getDirsCreated() const { return dirsCreated_; } //local folders

private:
    RemoteTreeScanner           (const RemoteTreeScanner&) = delete;
    RemoteTreeScanner& operator=(const RemoteTreeScanner&) = delete;

    RemoteSession& session_;
    const Zstring remoteRoot_;
    const Zstring localRoot_;
    const bool createMissingFolders_; //false: dry run

    bool started_ = false;
    std::vector<Zstring> foldersToVisit_; //relative paths: LIFO
    uint64_t dirsCreated_ = 0;
};


//upload counterpart: walk the local tree, create missing remote folders ("mkdir -p") and list them for comparison
class LocalTreeScanner
{
public:
    LocalTreeScanner(RemoteSession& session, const Zstring& localRoot, const Zstring& remoteRoot, bool createMissingFolders = true) :
        session_(session), localRoot_(localRoot), remoteRoot_(remoteRoot), createMissingFolders_(createMissingFolders) {}

    std::optional<FolderListing> next(); //throw ErrorScan

    uint64_t getDirsCreated() const { return dirsCreated_; } //remote folders

private:
    LocalTreeScanner           (const LocalTreeScanner&) = delete;
    LocalTreeScanner& operator=(const LocalTreeScanner&) = delete;

    RemoteSession& session_;
    const Zstring localRoot_;
    const Zstring remoteRoot_;
    const bool createMissingFolders_; //false: dry run

    bool started_ = false;
    std::vector<Zstring> foldersToVisit_; //relative paths: LIFO
    uint64_t dirsCreated_ = 0;
};

//------------------------------------------------------------------------------------------

//"mkdir -p" for local folders: returns number of folders created; tolerates concurrent creation
size_t createLocalFolderIfMissingRecursion(const Zstring& folderPath); //throw FileError
}

#endif //TREE_SCANNER_H_0892347509823475098
