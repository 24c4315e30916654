// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef REMOTE_PURGER_H_7823450982374509
#define REMOTE_PURGER_H_7823450982374509

#include <functional>
#include "../afs/abstract.h"


namespace sitesync
{
/*  delete everything below "rootPath"; the root itself is kept
    - symlinks are deleted as entries, never followed
    - no rollback on failure          */
void purgeRemoteFolder(RemoteSession& session, const Zstring& rootPath,
                       const std::function<void(const std::wstring& displayPath)>& onBeforeDelete /*throw X*/); //throw ErrorPurge, X

//same for the local side (download with purge)
void purgeLocalFolder(const Zstring& rootPath,
                      const std::function<void(const std::wstring& displayPath)>& onBeforeDelete /*throw X*/); //throw ErrorPurge, X
}

#endif //REMOTE_PURGER_H_7823450982374509
