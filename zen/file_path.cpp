// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "file_path.h"

    #include <unistd.h> //environ

using namespace zen;


std::optional<Zstring> zen::getParentFolderPath(const Zstring& itemPath)
{
    Zstring path = itemPath;
    if (path.size() > 1 && endsWith(path, FILE_NAME_SEPARATOR))
        path.pop_back();

    if (path.empty() || path == Zstr("/"))
        return std::nullopt;

    const size_t pos = path.rfind(FILE_NAME_SEPARATOR);
    if (pos == Zstring::npos)
        return Zstring(); //relative item name: parent is the current directory
    if (pos == 0)
        return Zstring(Zstr("/"));

    return path.substr(0, pos);
}


Zstring zen::appendPath(const Zstring& basePath, const Zstring& relPath)
{
    assert(!startsWith(relPath, FILE_NAME_SEPARATOR));
    if (relPath.empty())
        return basePath;

    if (basePath.empty()) //basePath might be a relative path, too!
        return relPath;

    if (endsWith(basePath, FILE_NAME_SEPARATOR))
        return basePath + relPath;

    Zstring output = basePath;
    output.reserve(basePath.size() + 1 + relPath.size());     //append all three strings using a single memory allocation
    return std::move(output) + FILE_NAME_SEPARATOR + relPath; //
}


std::unordered_map<Zstring, Zstring> zen::getAllEnvVars()
{
    std::unordered_map<Zstring, Zstring> envVars;
    if (char** line = environ)
        for (; *line; ++line)
        {
            const std::string_view entry(*line);
            envVars.emplace(beforeFirst(entry, '=', IfNotFoundReturn::all),
                            afterFirst (entry, '=', IfNotFoundReturn::none));
        }
    return envVars;
}
