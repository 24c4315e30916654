// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "structures.h"
#include <cassert>
#include <zen/i18n.h>
#include <zen/file_path.h>

using namespace zen;
using namespace sitesync;


std::wstring sitesync::getDirectionName(SyncDirection direction)
{
    switch (direction)
    {
        case SyncDirection::download:
            return _("Download");
        case SyncDirection::upload:
            return _("Upload");
    }
    assert(false);
    return std::wstring();
}


std::vector<std::pair<Zstring, Zstring>> sitesync::getUploadFolderPairs(const SyncConfig& cfg)
{
    if (cfg.uploadSources.empty())
        return {{cfg.localRoot, cfg.remoteRoot}};

    std::vector<std::pair<Zstring, Zstring>> output;
    for (const UploadSource& source : cfg.uploadSources)
        output.emplace_back(source.localPath,
                            source.keepFolderName ? appendPath(cfg.remoteRoot, getItemName(source.localPath)) : cfg.remoteRoot);
    return output;
}
