// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "remote_purger.h"
#include <zen/file_traverser.h>

using namespace zen;
using namespace sitesync;


namespace
{
void purgeRemoteRecursion(RemoteSession& session, const Zstring& folderPath,
                          const std::function<void(const std::wstring& displayPath)>& onBeforeDelete) //throw FileError, X
{
    for (const RemoteItem& item : session.readFolder(folderPath)) //throw FileError
    {
        const Zstring itemPath = appendRemotePath(folderPath, item.itemName);

        if (onBeforeDelete)
            onBeforeDelete(session.getDisplayPath(itemPath)); //throw X

        if (item.type == ItemType::folder)
        {
            purgeRemoteRecursion(session, itemPath, onBeforeDelete); //throw FileError, X
            session.removeFolder(itemPath); //throw FileError
        }
        else //files and symlinks
            session.removeFile(itemPath); //throw FileError
    }
}


void purgeLocalRecursion(const Zstring& folderPath,
                         const std::function<void(const std::wstring& displayPath)>& onBeforeDelete) //throw FileError, X
{
    std::vector<Zstring> filePaths;
    std::vector<Zstring> symlinkPaths;
    std::vector<Zstring> folderPaths;

    traverseFolder(folderPath,
    [&](const FileInfo&    fi) {    filePaths.push_back(fi.fullPath); },
    [&](const FolderInfo&  fi) {  folderPaths.push_back(fi.fullPath); },
    [&](const SymlinkInfo& si) { symlinkPaths.push_back(si.fullPath); }); //throw FileError

    for (const Zstring& filePath : filePaths)
    {
        if (onBeforeDelete) onBeforeDelete(utfTo<std::wstring>(filePath)); //throw X
        removeFilePlain(filePath); //throw FileError
    }

    for (const Zstring& symlinkPath : symlinkPaths)
    {
        if (onBeforeDelete) onBeforeDelete(utfTo<std::wstring>(symlinkPath)); //throw X
        removeSymlinkPlain(symlinkPath); //throw FileError
    }

    for (const Zstring& subFolderPath : folderPaths)
    {
        if (onBeforeDelete) onBeforeDelete(utfTo<std::wstring>(subFolderPath)); //throw X
        purgeLocalRecursion(subFolderPath, onBeforeDelete); //throw FileError, X
        removeDirectoryPlain(subFolderPath); //throw FileError
    }
}
}


void sitesync::purgeRemoteFolder(RemoteSession& session, const Zstring& rootPath,
                                 const std::function<void(const std::wstring& displayPath)>& onBeforeDelete) //throw ErrorPurge, X
{
    try
    {
        if (!session.getItemTypeIfExists(rootPath)) //throw FileError
            return; //nothing to purge

        purgeRemoteRecursion(session, rootPath, onBeforeDelete); //throw FileError, X
    }
    catch (const FileError& e)
    {
        throw ErrorPurge(replaceCpy(_("Cannot delete directory %x."), L"%x", fmtPath(session.getDisplayPath(rootPath))), e.toString());
    }
}


void sitesync::purgeLocalFolder(const Zstring& rootPath,
                                const std::function<void(const std::wstring& displayPath)>& onBeforeDelete) //throw ErrorPurge, X
{
    try
    {
        if (!itemExists(rootPath)) //throw FileError
            return;

        purgeLocalRecursion(rootPath, onBeforeDelete); //throw FileError, X
    }
    catch (const FileError& e)
    {
        throw ErrorPurge(replaceCpy(_("Cannot delete directory %x."), L"%x", fmtPath(rootPath)), e.toString());
    }
}
