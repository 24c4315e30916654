// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "sync_decision.h"

using namespace sitesync;


bool sitesync::shouldTransfer(bool targetExists, const std::optional<time_t>& targetModTime, const std::optional<time_t>& sourceModTime)
{
    if (!targetExists)
        return true;

    if (!targetModTime || !sourceModTime)
        return true;

    return *sourceModTime > *targetModTime;
}
