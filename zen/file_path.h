// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef FILE_PATH_H_3984678473567247567
#define FILE_PATH_H_3984678473567247567

#include <cassert>
#include <optional>
#include <unordered_map>
#include "zstring.h"


namespace zen
{
    const Zchar FILE_NAME_SEPARATOR = '/';

//"/folder/file.txt" => "/folder"; "/" and "" => none
std::optional<Zstring> getParentFolderPath(const Zstring& itemPath);

inline Zstring getItemName(const Zstring& itemPath) { return afterLast(itemPath, FILE_NAME_SEPARATOR, IfNotFoundReturn::all); }

Zstring appendPath(const Zstring& basePath, const Zstring& relPath);

//snapshot of the process environment: ::getenv() is *not* thread-safe
std::unordered_map<Zstring, Zstring> getAllEnvVars();
}

#endif //FILE_PATH_H_3984678473567247567
