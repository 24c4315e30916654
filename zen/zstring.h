// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef ZSTRING_H_73425873425789
#define ZSTRING_H_73425873425789

#include <stdexcept> //not used by this header, but the "rest of the world" needs it!
#include <string>
#include <string_view>
#include "string_tools.h"


//native string type for interfacing with Posix APIs: UTF-8 encoded
using Zchar = char;
#define Zstr(x) x

using Zstring     = std::basic_string     <Zchar>;
using ZstringView = std::basic_string_view<Zchar>;

#endif //ZSTRING_H_73425873425789
