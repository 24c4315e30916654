// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef I18_N_H_3843489325044253425456
#define I18_N_H_3843489325044253425456

#include "string_tools.h"


//marks user-facing text; sitesync ships English only, so the lookup is an identity

#define ZEN_TRANS_CONCAT_SUB(X, Y) X ## Y
#define _(s) zen::translate(ZEN_TRANS_CONCAT_SUB(L, s))
//source and translation are required to use %x as placeholder


namespace zen
{
inline
std::wstring translate(const std::wstring& text) { return text; }
}

#endif //I18_N_H_3843489325044253425456
