// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "credentials.h"
#include <cassert>
#include <zen/file_path.h>
#include <zen/i18n.h>

using namespace zen;
using namespace sitesync;


EnvCredentialStore::EnvCredentialStore() : envVars_(getAllEnvVars()) {}


Zstring EnvCredentialStore::getEnvVarName(const Zstring& siteName, const Zstring& credType)
{
    Zstring name = Zstr("CRED_") + siteName + Zstr('_') + credType;
    for (Zchar& c : name)
    {
        c = asciiToUpper(c);
        if (c == Zstr('-') || c == Zstr('.') || c == Zstr(' ')) //not allowed in shell variable names
            c = Zstr('_');
    }
    return name;
}


Zstring EnvCredentialStore::getCredential(const Zstring& siteName, const Zstring& credType) const //throw SysErrorCredentialMissing
{
    const Zstring varName = getEnvVarName(siteName, credType);

    auto it = envVars_.find(varName);
    if (it == envVars_.end() || it->second.empty())
        throw SysErrorCredentialMissing(replaceCpy(_("Environment variable %x is not set."), L"%x", utfTo<std::wstring>(varName)));

    return it->second;
}


FtpCredentials sitesync::resolveFtpCredentials(const CredentialStore& store, const Zstring& siteName,
                                               const Zstring& staticUsername, const Zstring& staticPassword)
{
    if (!siteName.empty())
        try
        {
            FtpCredentials creds;
            creds.username = store.getCredential(siteName, CRED_TYPE_FTP_USERNAME); //throw SysErrorCredentialMissing
            creds.password = store.getCredential(siteName, CRED_TYPE_FTP_PASSWORD); //
            creds.source   = CredentialSource::manager;
            return creds;
        }
        catch (SysErrorCredentialMissing&) {} //=> static configuration

    return {staticUsername, staticPassword, CredentialSource::staticConfig};
}


std::wstring sitesync::getCredentialSourceName(CredentialSource source)
{
    switch (source)
    {
        case CredentialSource::manager:
            return _("credential store");
        case CredentialSource::staticConfig:
            return _("static configuration");
    }
    assert(false);
    return std::wstring();
}
