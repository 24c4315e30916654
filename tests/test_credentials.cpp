// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include <cassert>
#include <cstdlib>
#include <iostream>
#include <unordered_map>
#include "../SiteSync/Source/base/credentials.h"

using namespace zen;
using namespace sitesync;

using EnvVars = std::unordered_map<Zstring, Zstring>;


static void test_env_var_name()
{
    assert(EnvCredentialStore::getEnvVarName("mysite", CRED_TYPE_FTP_USERNAME) == "CRED_MYSITE_FTP_USERNAME");
    assert(EnvCredentialStore::getEnvVarName("my-site.com", CRED_TYPE_FTP_PASSWORD) == "CRED_MY_SITE_COM_FTP_PASSWORD");
}

static void test_store_lookup()
{
    const EnvCredentialStore store(EnvVars{{"CRED_MYSITE_FTP_USERNAME", "alice"}, {"CRED_MYSITE_FTP_PASSWORD", ""}});

    assert(store.getCredential("mysite", CRED_TYPE_FTP_USERNAME) == "alice");

    bool missing = false;
    try { store.getCredential("mysite", CRED_TYPE_FTP_PASSWORD); } //empty counts as missing
    catch (const SysErrorCredentialMissing&) { missing = true; }
    assert(missing);

    missing = false;
    try { store.getCredential("other", CRED_TYPE_FTP_USERNAME); }
    catch (const SysErrorCredentialMissing&) { missing = true; }
    assert(missing);
}

static void test_resolve_from_store()
{
    const EnvCredentialStore store(EnvVars{{"CRED_MYSITE_FTP_USERNAME", "alice"}, {"CRED_MYSITE_FTP_PASSWORD", "secret"}});

    const FtpCredentials creds = resolveFtpCredentials(store, "mysite", "bob", "static");
    assert(creds.source == CredentialSource::manager);
    assert(creds.username == "alice");
    assert(creds.password == "secret");
}

static void test_resolve_fallback()
{
    //incomplete store entry
    const EnvCredentialStore store(EnvVars{{"CRED_MYSITE_FTP_USERNAME", "alice"}});

    const FtpCredentials creds = resolveFtpCredentials(store, "mysite", "bob", "static");
    assert(creds.source == CredentialSource::staticConfig);
    assert(creds.username == "bob");
    assert(creds.password == "static");

    //no site name
    const FtpCredentials noSite = resolveFtpCredentials(store, "", "", "");
    assert(noSite.source == CredentialSource::staticConfig);
    assert(noSite.username.empty());
}

static void test_process_environment()
{
    [[maybe_unused]] const int rv1 = ::setenv("CRED_ENVTEST_FTP_USERNAME", "carol", 1);
    [[maybe_unused]] const int rv2 = ::setenv("CRED_ENVTEST_FTP_PASSWORD", "pw", 1);
    assert(rv1 == 0 && rv2 == 0);

    const EnvCredentialStore store; //snapshot

    ::unsetenv("CRED_ENVTEST_FTP_PASSWORD");

    const FtpCredentials creds = resolveFtpCredentials(store, "envtest", "", "");
    assert(creds.source == CredentialSource::manager);
    assert(creds.username == "carol");
    assert(creds.password == "pw");
}

int main()
{
    test_env_var_name();
    test_store_lookup();
    test_resolve_from_store();
    test_resolve_fallback();
    test_process_environment();
    std::cout << "All credential tests passed" << std::endl;
    return 0;
}
