// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef SYNCHRONIZATION_H_8913470815943295
#define SYNCHRONIZATION_H_8913470815943295

#include "structures.h"
#include "process_callback.h"
#include "../afs/abstract.h"


namespace sitesync
{
/*  1. open the scan connection and check the source root
    2. optional: purge the destination
    3. walk the source tree(s) and build the task list (ascending by size)
    4. copy in parallel: min(maxWorkers, #tasks) workers, each with its own connection
    5. success: nothing to transfer or transferred / (transferred + failed) >= successThreshold

    per-file failures are counted, never thrown
    dry run: steps 2 and 4 are only logged; no folder is created      */
SyncResult synchronize(const ConnectionFactory& connFactory,
                       const SyncConfig& cfg,
                       ProcessCallback& callback); //throw ErrorConnection, ErrorRemoteNotFound, ErrorScan, ErrorPurge, X

//success rate rule in isolation
bool isSyncSuccessful(const SyncStats& stats, double successThreshold);
}

#endif //SYNCHRONIZATION_H_8913470815943295
