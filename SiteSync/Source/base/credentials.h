// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef CREDENTIALS_H_4390857234095723
#define CREDENTIALS_H_4390857234095723

#include <unordered_map>
#include <zen/sys_error.h>
#include <zen/zstring.h>


namespace sitesync
{
DEFINE_NEW_SYS_ERROR(SysErrorCredentialMissing)

//well-known credential types
const Zchar CRED_TYPE_FTP_USERNAME[] = Zstr("FTP_USERNAME");
const Zchar CRED_TYPE_FTP_PASSWORD[] = Zstr("FTP_PASSWORD");


//credential store: constructed once at startup, passed explicitly
class CredentialStore
{
public:
    virtual ~CredentialStore() {}

    virtual Zstring getCredential(const Zstring& siteName, const Zstring& credType) const = 0; //throw SysErrorCredentialMissing
};


//"CRED_<SITE>_<TYPE>" environment variables; snapshot taken at construction
class EnvCredentialStore : public CredentialStore
{
public:
    EnvCredentialStore(); //current process environment
    explicit EnvCredentialStore(std::unordered_map<Zstring, Zstring>&& envVars) : envVars_(std::move(envVars)) {}

    Zstring getCredential(const Zstring& siteName, const Zstring& credType) const override; //throw SysErrorCredentialMissing

    static Zstring getEnvVarName(const Zstring& siteName, const Zstring& credType);

private:
    const std::unordered_map<Zstring, Zstring> envVars_;
};

//------------------------------------------------------------------------------------------

enum class CredentialSource
{
    manager,      //credential store
    staticConfig, //command line or ftp:// phrase
};

struct FtpCredentials
{
    Zstring username;
    Zstring password;
    CredentialSource source = CredentialSource::staticConfig;
};

/*  1. credential store: both username and password must be found
    2. fall back to the static configuration

    siteName empty: skip the store       */
FtpCredentials resolveFtpCredentials(const CredentialStore& store, const Zstring& siteName,
                                     const Zstring& staticUsername, const Zstring& staticPassword);

std::wstring getCredentialSourceName(CredentialSource source);
}

#endif //CREDENTIALS_H_4390857234095723
