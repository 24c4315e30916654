// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef SYNC_DECISION_H_2304982347509823457
#define SYNC_DECISION_H_2304982347509823457

#include <ctime>
#include <optional>


namespace sitesync
{
/* transfer if
    - target is missing
    - source is strictly newer than target (equal times: skip)
    - any of both modification times is unknown

   download: target = local file,  source = remote file
   upload:   target = remote file, source = local file       */
bool shouldTransfer(bool targetExists, const std::optional<time_t>& targetModTime, const std::optional<time_t>& sourceModTime);
}

#endif //SYNC_DECISION_H_2304982347509823457
