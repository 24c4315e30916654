// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include <cassert>
#include <iostream>
#include "../SiteSync/Source/afs/ftp.h"
#include "../SiteSync/Source/afs/ftp_listing.h"

using namespace zen;
using namespace sitesync;

namespace
{
const time_t NOW_2024_01_05 = 1704449700; //2024-01-05 10:15:00 UTC


const RemoteItem& findItem(const std::vector<RemoteItem>& items, const Zstring& itemName)
{
    auto it = std::find_if(items.begin(), items.end(), [&](const RemoteItem& item) { return item.itemName == itemName; });
    assert(it != items.end());
    return *it;
}


bool throwsSysError(const std::function<void()>& fun)
{
    try { fun(); }
    catch (const SysError&) { return true; }
    return false;
}
}


static void test_feat_response()
{
    const FtpFeatures feat = parseFeatResponse("211-Features:\r\n"
                                               " MDTM\r\n"
                                               " MLST type*;size*;modify*;\r\n"
                                               " REST STREAM\r\n"
                                               " SIZE\r\n"
                                               " UTF8\r\n"
                                               "211 End\r\n");
    assert(feat.mlsd);
    assert(feat.utf8);

    const FtpFeatures featProFtpd = parseFeatResponse("211-Features:\r\n"
                                                      "211-MDTM\r\n"
                                                      "211-SIZE\r\n"
                                                      "211 End\r\n");
    assert(!featProFtpd.mlsd);
    assert(!featProFtpd.utf8);

    const FtpFeatures featNone = parseFeatResponse("500 Unknown command.\r\n");
    assert(!featNone.mlsd && !featNone.utf8);
}

static void test_reply_value()
{
    assert(getFtpReplyValue("213 20240105101500\r\n", "213 ") == "20240105101500");
    assert(getFtpReplyValue("213 1084\r\n", "213 ") == "1084");
    assert(throwsSysError([] { getFtpReplyValue("550 No such file.\r\n", "213 "); }));
}

static void test_time_val()
{
    assert(parseFtpTimeVal("20240105101500") == NOW_2024_01_05);
    assert(parseFtpTimeVal("20240105101500.123") == NOW_2024_01_05);
    assert(!parseFtpTimeVal("2024010510"));
    assert(!parseFtpTimeVal("garbage"));
}

static void test_mlsd_listing()
{
    const std::vector<RemoteItem> items = parseMlsdListing(
                                              "type=cdir;modify=20240105101500;UNIX.mode=0755; .\r\n"
                                              "type=pdir;modify=20240105101500;UNIX.mode=0755; ..\r\n"
                                              "type=file;size=1084;modify=20240105101500.123;UNIX.mode=0644; index.html\r\n"
                                              "type=dir;modify=20240105101500; assets\r\n"
                                              "type=OS.unix=slink:/var/www; current\r\n"
                                              "Type=File;Size=0;Modify=20240105101500; name with blanks.txt\r\n");
    assert(items.size() == 4);

    const RemoteItem& index = findItem(items, "index.html");
    assert(index.type == ItemType::file);
    assert(index.fileSize == 1084);
    assert(index.modTime == NOW_2024_01_05);

    assert(findItem(items, "assets").type == ItemType::folder);
    assert(findItem(items, "current").type == ItemType::symlink);
    assert(findItem(items, "name with blanks.txt").fileSize == 0);

    assert(throwsSysError([] { parseMlsdListing("type=file;modify=20240105101500; nosize.txt\r\n"); }));
}

static void test_unix_listing()
{
    const std::vector<RemoteItem> items = parseListListing(
                                              "total 12\r\n"
                                              "drwxr-xr-x 2 www  www      4096 Jan 10 11:58 assets\r\n"
                                              "drwxr-xr-x 2 www  www      4096 Jan  4 23:00 .\r\n"
                                              "-rw-r--r-- 1 www  www      1084 Sep  2  2023 index.html\r\n"
                                              "lrwxrwxrwx 1 www  www        18 Apr 26  2023 current -> /var/www/release\r\n", NOW_2024_01_05);
    assert(items.size() == 3);

    const RemoteItem& assets = findItem(items, "assets");
    assert(assets.type == ItemType::folder);
    assert(assets.modTime == 1673351880); //"Jan 10" lies in the future => last year

    const RemoteItem& index = findItem(items, "index.html");
    assert(index.type == ItemType::file);
    assert(index.fileSize == 1084);
    assert(index.modTime == 1693612800);

    assert(findItem(items, "current").type == ItemType::symlink);

    //no group column
    const std::vector<RemoteItem> itemsNoGroup = parseUnixListing("-rw-r--r-- 1 www 1084 Jan  4 23:00 recent.txt\r\n", NOW_2024_01_05);
    assert(itemsNoGroup.size() == 1);
    assert(itemsNoGroup[0].fileSize == 1084);
    assert(itemsNoGroup[0].modTime == 1704409200);

    assert(throwsSysError([] { parseUnixListing("this is not a listing\r\n", NOW_2024_01_05); }));
}

static void test_dos_listing()
{
    const std::vector<RemoteItem> items = parseListListing(
                                              "10-27-15  03:46AM       <DIR>          pub\r\n"
                                              "04-08-14  03:09PM               11,399 readme.txt\r\n"
                                              "06-22-2017  16:25         1875499 archive.zip\r\n", NOW_2024_01_05);
    assert(items.size() == 3);

    const RemoteItem& pub = findItem(items, "pub");
    assert(pub.type == ItemType::folder);
    assert(pub.modTime == 1445917560);

    const RemoteItem& readme = findItem(items, "readme.txt");
    assert(readme.type == ItemType::file);
    assert(readme.fileSize == 11399);
    assert(readme.modTime == 1396969740);

    const RemoteItem& archive = findItem(items, "archive.zip");
    assert(archive.fileSize == 1875499);
    assert(archive.modTime == 1498148700);
}

static void test_path_phrase()
{
    assert( acceptsPathPhraseFtp("ftp://example.com"));
    assert( acceptsPathPhraseFtp("  FTP://example.com/"));
    assert(!acceptsPathPhraseFtp("/home/user"));

    const FtpPathPhrase full = parseFtpPathPhrase("ftp://user001:p@ss@www.example.com:2121/public_html/site/|ssl|timeout=5");
    assert(full.login.server   == "www.example.com");
    assert(full.login.portCfg  == 2121);
    assert(full.login.username == "user001");
    assert(full.login.password == "p@ss");
    assert(full.login.useTls);
    assert(full.login.timeoutSec == 5);
    assert(full.folderPath == "/public_html/site");

    const FtpPathPhrase minimal = parseFtpPathPhrase("ftp://example.com");
    assert(minimal.login.server == "example.com");
    assert(minimal.login.portCfg == 0);
    assert(minimal.login.username.empty());
    assert(!minimal.login.useTls);
    assert(minimal.login.timeoutSec == 20);
    assert(minimal.folderPath == "/");

    assert(throwsSysError([] { parseFtpPathPhrase("ftp://example.com:abc/path"); }));
    assert(throwsSysError([] { parseFtpPathPhrase("ftp://user@/path"); }));
    assert(throwsSysError([] { parseFtpPathPhrase("ftp://example.com/path|unknown"); }));
}

int main()
{
    test_feat_response();
    test_reply_value();
    test_time_val();
    test_mlsd_listing();
    test_unix_listing();
    test_dos_listing();
    test_path_phrase();
    std::cout << "All FTP listing tests passed" << std::endl;
    return 0;
}
