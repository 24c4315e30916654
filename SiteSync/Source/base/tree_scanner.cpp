// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "tree_scanner.h"
#include <zen/file_traverser.h>

using namespace zen;
using namespace sitesync;


namespace
{
Zstring appendRelPath(const Zstring& basePath, const Zstring& relPath)
{
    return relPath.empty() ? basePath : appendPath(basePath, relPath);
}


Zstring appendItemName(const Zstring& relPath, const Zstring& itemName)
{
    return relPath.empty() ? itemName : relPath + FILE_NAME_SEPARATOR + itemName;
}


/*  some servers report no time in the folder listing => ask for each file that matters
    - a time that cannot be determined stays empty: the file will be transferred
    - a lost connection still ends the scan                          */
std::optional<time_t> getRemoteModTimeIfAvailable(RemoteSession& session, const Zstring& filePath) //throw ErrorConnection
{
    try
    {
        return session.getModTime(filePath); //throw FileError
    }
    catch (const ErrorConnection&) { throw; }
    catch (const FileError&) { return std::nullopt; }
}


std::unordered_map<Zstring, TargetItem> readLocalTargets(const Zstring& localFolderPath) //throw FileError
{
    std::unordered_map<Zstring, TargetItem> targets;

    traverseFolder(localFolderPath,
    [&](const FileInfo&    fi) { targets.emplace(fi.itemName, TargetItem{ItemType::file, fi.modTime}); },
    [&](const FolderInfo&  fi) { targets.emplace(fi.itemName, TargetItem{ItemType::folder}); },
    [&](const SymlinkInfo& si) { targets.emplace(si.itemName, TargetItem{ItemType::symlink}); }); //throw FileError

    return targets;
}
}


size_t sitesync::createLocalFolderIfMissingRecursion(const Zstring& folderPath) //throw FileError
{
    //path most likely already exists => check first
    if (const std::optional<ItemType> type = getItemTypeIfExists(folderPath)) //throw FileError
    {
        if (*type != ItemType::folder)
            throw FileError(replaceCpy(_("Cannot create directory %x."), L"%x", fmtPath(folderPath)),
                            replaceCpy(_("The name %x is already used by another item."), L"%x", fmtPath(getItemName(folderPath))));
        return 0;
    }

    size_t foldersCreated = 0;

    if (const std::optional<Zstring> parentPath = getParentFolderPath(folderPath);
        parentPath && !parentPath->empty())
        foldersCreated += createLocalFolderIfMissingRecursion(*parentPath); //throw FileError

    try
    {
        createDirectory(folderPath); //throw FileError, ErrorTargetExisting
        ++foldersCreated;
    }
    catch (ErrorTargetExisting&)
    {
        //created by another thread in the meantime?
        if (getItemTypeIfExists(folderPath) != ItemType::folder) //throw FileError
            throw;
    }
    return foldersCreated;
}


std::optional<FolderListing> RemoteTreeScanner::next() //throw ErrorRemoteNotFound, ErrorScan
{
    if (!started_)
    {
        started_ = true;

        std::optional<ItemType> rootType;
        try
        {
            rootType = session_.getItemTypeIfExists(remoteRoot_); //throw FileError
        }
        catch (const FileError& e) { throw ErrorScan(e.toString()); }

        if (!rootType)
            throw ErrorRemoteNotFound(replaceCpy(_("Cannot find folder %x."), L"%x", fmtPath(session_.getDisplayPath(remoteRoot_))));
        if (*rootType != ItemType::folder)
            throw ErrorScan(replaceCpy(_("Cannot read directory %x."), L"%x", fmtPath(session_.getDisplayPath(remoteRoot_))),
                            replaceCpy(_("The name %x is already used by another item."), L"%x", fmtPath(getItemName(remoteRoot_))));

        foldersToVisit_.push_back(Zstring());
    }

    if (foldersToVisit_.empty())
        return std::nullopt;

    FolderListing output;
    output.relPath = std::move(foldersToVisit_.back());
    foldersToVisit_.pop_back();

    const Zstring remoteFolderPath = appendRelPath(remoteRoot_, output.relPath);
    const Zstring localFolderPath  = appendRelPath(localRoot_,  output.relPath);
    try
    {
        std::vector<RemoteItem> items = session_.readFolder(remoteFolderPath); //throw FileError
        std::sort(items.begin(), items.end(), [](const RemoteItem& lhs, const RemoteItem& rhs) { return lhs.itemName < rhs.itemName; });

        std::vector<Zstring> subFolders;
        for (const RemoteItem& item : items)
            switch (item.type)
            {
                case ItemType::file:
                    if (!isTempMarkerName(item.itemName))
                        output.sourceFiles.push_back({appendRemotePath(remoteFolderPath, item.itemName), item.fileSize, item.modTime});
                    break;
                case ItemType::folder:
                    subFolders.push_back(appendItemName(output.relPath, item.itemName));
                    break;
                case ItemType::symlink: //never follow: the remote tree stays a DAG
                    break;
            }
        //LIFO: visit in alphabetical order
        foldersToVisit_.insert(foldersToVisit_.end(), subFolders.rbegin(), subFolders.rend());

        if (createMissingFolders_)
            dirsCreated_ += createLocalFolderIfMissingRecursion(localFolderPath); //throw FileError

        if (createMissingFolders_ || getItemTypeIfExists(localFolderPath)) //throw FileError
            output.targetItems = readLocalTargets(localFolderPath); //throw FileError

        //without a local counterpart the file is transferred anyway: no need to ask for its time
        for (FileMetadata& file : output.sourceFiles)
            if (!file.modTime)
                if (auto it = output.targetItems.find(getItemName(file.path));
                    it != output.targetItems.end() && it->second.type == ItemType::file)
                    file.modTime = getRemoteModTimeIfAvailable(session_, file.path); //throw ErrorConnection
    }
    catch (const FileError& e) { throw ErrorScan(e.toString()); }

    return output;
}


std::optional<FolderListing> LocalTreeScanner::next() //throw ErrorScan
{
    if (!started_)
    {
        started_ = true;
        try
        {
            if (getItemType(localRoot_) != ItemType::folder) //throw FileError
                throw FileError(replaceCpy(_("Cannot read directory %x."), L"%x", fmtPath(localRoot_)),
                                replaceCpy(_("The name %x is already used by another item."), L"%x", fmtPath(getItemName(localRoot_))));
        }
        catch (const FileError& e) { throw ErrorScan(e.toString()); }

        foldersToVisit_.push_back(Zstring());
    }

    if (foldersToVisit_.empty())
        return std::nullopt;

    FolderListing output;
    output.relPath = std::move(foldersToVisit_.back());
    foldersToVisit_.pop_back();

    const Zstring localFolderPath  = appendRelPath(localRoot_,  output.relPath);
    const Zstring remoteFolderPath = appendRelPath(remoteRoot_, output.relPath);
    try
    {
        std::vector<Zstring> subFolders;

        traverseFolder(localFolderPath,
        [&](const FileInfo& fi)
        {
            if (!isTempMarkerName(fi.itemName))
                output.sourceFiles.push_back({fi.fullPath, fi.fileSize, fi.modTime});
        },
        [&](const FolderInfo& fi) { subFolders.push_back(appendItemName(output.relPath, fi.itemName)); },
        nullptr /*symlinks: never follow*/); //throw FileError

        std::sort(output.sourceFiles.begin(), output.sourceFiles.end(), [](const FileMetadata& lhs, const FileMetadata& rhs) { return lhs.path < rhs.path; });
        std::sort(subFolders.begin(), subFolders.end());
        foldersToVisit_.insert(foldersToVisit_.end(), subFolders.rbegin(), subFolders.rend());

        bool remoteFolderExisted = true;
        if (createMissingFolders_)
        {
            const size_t foldersCreated = createFolderIfMissingRecursion(session_, remoteFolderPath); //throw FileError
            dirsCreated_ += foldersCreated;
            remoteFolderExisted = foldersCreated == 0;
        }
        else
            remoteFolderExisted = static_cast<bool>(session_.getItemTypeIfExists(remoteFolderPath)); //throw FileError

        if (remoteFolderExisted) //new folders are empty
        {
            for (const RemoteItem& item : session_.readFolder(remoteFolderPath)) //throw FileError
                output.targetItems.emplace(item.itemName, TargetItem{item.type, item.modTime});

            //only the times of files that may be overwritten matter
            for (const FileMetadata& file : output.sourceFiles)
                if (auto it = output.targetItems.find(getItemName(file.path));
                    it != output.targetItems.end() && it->second.type == ItemType::file && !it->second.modTime)
                    it->second.modTime = getRemoteModTimeIfAvailable(session_, appendRemotePath(remoteFolderPath, it->first)); //throw ErrorConnection
        }
    }
    catch (const FileError& e) { throw ErrorScan(e.toString()); }

    return output;
}
