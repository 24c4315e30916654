// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef FTP_LISTING_H_4590872345908723452345
#define FTP_LISTING_H_4590872345908723452345

#include <zen/sys_error.h>
#include "abstract.h"


namespace sitesync
{
//parsers for raw FTP server responses; "." and ".." are dropped from all listings

std::vector<std::string_view> splitFtpResponse(const std::string& buf);
std::vector<std::string_view> splitFtpResponse(std::string&&) = delete;

struct FtpFeatures
{
    bool mlsd = false;
    bool utf8 = false;
};
FtpFeatures parseFeatResponse(const std::string& featResponse);

//"213 <value>" response to SIZE, MDTM
std::string_view getFtpReplyValue(const std::string& response, std::string_view statusPrefix); //throw SysError

//MLSD: https://tools.ietf.org/html/rfc3659#section-7
std::vector<RemoteItem> parseMlsdListing(const std::string& buf); //throw SysError

//LIST: no standard format => detect Unix "ls -l" vs. DOS "dir" style
//utcTimeNow: needed to guess the year of recent Unix entries
std::vector<RemoteItem> parseListListing(const std::string& buf, time_t utcTimeNow); //throw SysError
std::vector<RemoteItem> parseUnixListing(const std::string& buf, time_t utcTimeNow); //throw SysError
std::vector<RemoteItem> parseDosListing (const std::string& buf, time_t utcTimeNow); //throw SysError

//"YYYYMMDDHHMMSS[.sss]" as used by MLSD "modify" fact and MDTM
std::optional<time_t> parseFtpTimeVal(std::string_view timeVal);
}

#endif //FTP_LISTING_H_4590872345908723452345
