// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef NATIVE_H_16827648792570934572834
#define NATIVE_H_16827648792570934572834

#include "abstract.h"


namespace sitesync
{
//"remote" side stored in a local folder, e.g. a mounted share: item path "/" maps to "rootPath"
std::unique_ptr<ConnectionFactory> createNativeConnectionFactory(const Zstring& rootPath);

bool acceptsPathPhraseNative(const Zstring& pathPhrase); //noexcept
}

#endif //NATIVE_H_16827648792570934572834
