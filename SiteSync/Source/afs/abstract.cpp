// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "abstract.h"

using namespace zen;
using namespace sitesync;


size_t sitesync::createFolderIfMissingRecursion(RemoteSession& session, const Zstring& folderPath) //throw FileError
{
    //path most likely already exists => check first
    if (const std::optional<ItemType> type = session.getItemTypeIfExists(folderPath)) //throw FileError
    {
        if (*type != ItemType::folder)
            throw FileError(replaceCpy(_("Cannot create directory %x."), L"%x", fmtPath(session.getDisplayPath(folderPath))),
                            replaceCpy(_("The name %x is already used by another item."), L"%x", fmtPath(getItemName(folderPath))));
        return 0;
    }

    size_t foldersCreated = 0;

    if (const std::optional<Zstring> parentPath = getParentFolderPath(folderPath);
        parentPath && !parentPath->empty())
        foldersCreated += createFolderIfMissingRecursion(session, *parentPath); //throw FileError

    try
    {
        session.createFolder(folderPath); //throw FileError, ErrorTargetExisting
        ++foldersCreated;
    }
    catch (FileError&)
    {
        //created in the meantime? FTP servers don't report "already existing" reliably => check explicitly
        if (session.getItemTypeIfExists(folderPath) != ItemType::folder) //throw FileError
            throw;
    }
    return foldersCreated;
}
