// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include <algorithm>
#include <iostream>
#include <zen/file_access.h>
#include <zen/scope_guard.h>
#include "afs/ftp.h"
#include "afs/native.h"
#include "base/credentials.h"
#include "base/log_file.h"
#include "base/status_handler.h"
#include "base/synchronization.h"

using namespace zen;
using namespace sitesync;


namespace
{
struct CommandLineConfig
{
    SyncDirection direction = SyncDirection::download;
    Zstring remotePhrase;
    std::vector<UploadSource> localFolders; //download: exactly one
    Zstring siteName;
    std::optional<Zstring> username; //override ftp:// phrase
    std::optional<Zstring> password; //
    bool useTls = false;
    bool purgeBefore = false;
    bool dryRun = false;
    size_t maxWorkers = SyncSettings().maxWorkers;
    std::optional<int> timeoutSec;
    Zstring logFilePath;
    bool verbose = false;
};


void showSyntaxHelp()
{
    std::cout <<
              "Usage: sitesync <download|upload> --remote <ftp://[user[:password]@]host[:port]/path | folder>\n"
              "                --local <folder> [options]\n"
              "\n"
              "Options:\n"
              "  --local <folder>     upload: may be repeated, content goes into the remote folder\n"
              "  --local-named <folder>  upload: copy into a remote subfolder named like <folder>\n"
              "  --site <name>        credential store entry: CRED_<NAME>_FTP_USERNAME, CRED_<NAME>_FTP_PASSWORD\n"
              "  --user <name>        FTP user name (if not found in the credential store)\n"
              "  --password <pass>    FTP password  (if not found in the credential store)\n"
              "  --tls                explicit FTPS\n"
              "  --purge              delete all destination items before copying\n"
              "  --dry-run            only report what would be copied or deleted\n"
              "  --workers <n>        parallel transfers (default: 4)\n"
              "  --timeout <sec>      per connection attempt and I/O operation (default: 20)\n"
              "  --log-file <path>    save the log\n"
              "  --verbose            print progress and info messages\n"
              "\n"
              "Exit codes: 0 success, 1 finished with errors, 2 synchronization failed, 3 stopped, 4 invalid command line\n";
}


int parsePositiveNumber(const Zstring& optionName, const Zstring& value) //throw SysError
{
    if (value.empty() || !std::all_of(value.begin(), value.end(), [](Zchar c) { return isDigit(c); }) || stringTo<int>(value) <= 0)
        throw SysError(replaceCpy(replaceCpy(_("Invalid value %y for option %x."), L"%x", utfTo<std::wstring>(optionName)),
                                  L"%y", fmtPath(value)));
    return stringTo<int>(value);
}


//nullopt: help requested
std::optional<CommandLineConfig> parseCommandLine(const std::vector<Zstring>& commandArgs) //throw SysError
{
    auto isHelpRequest = [](const Zstring& arg)
    {
        auto it = std::find_if(arg.begin(), arg.end(), [](Zchar c) { return c != Zstr('/') && c != Zstr('-'); });
        if (it == arg.begin()) return false; //require at least one prefix character

        const Zstring argTmp(it, arg.end());
        return equalAsciiNoCase(argTmp, "help") ||
               equalAsciiNoCase(argTmp, "h")    ||
               argTmp == Zstr("?");
    };

    //"--local-named": the folder name must survive
    auto getFolderPath = [](const Zstring& value)
    {
        Zstring folderPath = trimCpy(value);
        while (folderPath.size() > 1 && endsWith(folderPath, FILE_NAME_SEPARATOR))
            folderPath.pop_back();
        return folderPath;
    };

    CommandLineConfig cfg;
    bool directionSet = false;

    for (auto it = commandArgs.begin(); it != commandArgs.end(); ++it)
    {
        const Zstring& arg = *it;

        auto getValue = [&]() -> const Zstring& //throw SysError
        {
            if (++it == commandArgs.end() || startsWith(*it, Zstr("--")))
                throw SysError(replaceCpy(_("A value is expected after %x."), L"%x", utfTo<std::wstring>(arg)));
            return *it;
        };

        if (isHelpRequest(arg))
            return std::nullopt;
        else if (!directionSet && (arg == Zstr("download") || arg == Zstr("upload")))
        {
            cfg.direction = arg == Zstr("download") ? SyncDirection::download : SyncDirection::upload;
            directionSet = true;
        }
        else if (arg == Zstr("--remote"))   cfg.remotePhrase = trimCpy(getValue()); //throw SysError
        else if (arg == Zstr("--local"))       cfg.localFolders.push_back({getFolderPath(getValue()), false}); //throw SysError
        else if (arg == Zstr("--local-named")) cfg.localFolders.push_back({getFolderPath(getValue()), true});  //
        else if (arg == Zstr("--site"))     cfg.siteName     = getValue();          //
        else if (arg == Zstr("--user"))     cfg.username     = getValue();          //
        else if (arg == Zstr("--password")) cfg.password     = getValue();          //
        else if (arg == Zstr("--log-file")) cfg.logFilePath  = getValue();          //
        else if (arg == Zstr("--workers"))  cfg.maxWorkers   = parsePositiveNumber(arg, getValue()); //
        else if (arg == Zstr("--timeout"))  cfg.timeoutSec   = parsePositiveNumber(arg, getValue()); //
        else if (arg == Zstr("--tls"))      cfg.useTls       = true;
        else if (arg == Zstr("--purge"))    cfg.purgeBefore  = true;
        else if (arg == Zstr("--dry-run"))  cfg.dryRun       = true;
        else if (arg == Zstr("--verbose"))  cfg.verbose      = true;
        else
            throw SysError(replaceCpy(_("Unknown command line argument %x."), L"%x", fmtPath(arg)));
    }

    if (!directionSet)
        throw SysError(_("Please specify the direction: \"download\" or \"upload\"."));
    if (cfg.remotePhrase.empty())
        throw SysError(replaceCpy(_("Missing option %x."), L"%x", L"--remote"));
    if (cfg.localFolders.empty())
        throw SysError(replaceCpy(_("Missing option %x."), L"%x", L"--local"));
    if (cfg.direction == SyncDirection::download &&
        (cfg.localFolders.size() > 1 || cfg.localFolders[0].keepFolderName))
        throw SysError(_("Download requires exactly one --local folder."));

    return cfg;
}


struct RemoteTarget
{
    std::unique_ptr<ConnectionFactory> connFactory;
    Zstring remoteRoot;
    bool usesFtp = false;
};


RemoteTarget createRemoteTarget(const CommandLineConfig& cfg, const CredentialStore& credStore, PhaseCallback& cb) //throw SysError
{
    if (acceptsPathPhraseFtp(cfg.remotePhrase))
    {
        FtpPathPhrase phrase = parseFtpPathPhrase(cfg.remotePhrase); //throw SysError

        const FtpCredentials creds = resolveFtpCredentials(credStore, cfg.siteName,
                                                           cfg.username ? *cfg.username : phrase.login.username,
                                                           cfg.password ? *cfg.password : phrase.login.password);
        cb.logMessage(replaceCpy(_("FTP credentials: %x"), L"%x", getCredentialSourceName(creds.source)), PhaseCallback::MsgType::info);

        phrase.login.username = creds.username;
        phrase.login.password = creds.password;
        if (cfg.useTls)
            phrase.login.useTls = true;
        if (cfg.timeoutSec)
            phrase.login.timeoutSec = *cfg.timeoutSec;

        return {createFtpConnectionFactory(phrase.login), phrase.folderPath, true};
    }

    if (acceptsPathPhraseNative(cfg.remotePhrase))
        return {createNativeConnectionFactory(cfg.remotePhrase), Zstr("/"), false};

    throw SysError(replaceCpy(_("Unsupported remote location %x."), L"%x", fmtPath(cfg.remotePhrase)));
}


SiteSyncExitCode runSync(const CommandLineConfig& cfg)
{
    const std::wstring jobName = getDirectionName(cfg.direction) + L' ' + utfTo<std::wstring>(cfg.remotePhrase) + L" <-> " + utfTo<std::wstring>(cfg.localFolders[0].localPath) +
                                 (cfg.localFolders.size() > 1 ? L", ..." : L"");

    ConsoleStatusHandler statusHandler(jobName, cfg.verbose);
    std::optional<SyncResult> syncResult;

    try
    {
        installAbortSignalHandler(); //throw SysError

        const EnvCredentialStore credStore; //explicit value: no process-wide registry

        RemoteTarget target = createRemoteTarget(cfg, credStore, statusHandler); //throw SysError

        if (target.usesFtp)
            ftpInit(); //throw SysError
        ZEN_ON_SCOPE_EXIT(if (target.usesFtp) ftpTeardown());

        SyncConfig syncCfg;
        syncCfg.remoteRoot  = target.remoteRoot;
        syncCfg.localRoot   = cfg.localFolders[0].localPath;
        if (cfg.direction == SyncDirection::upload)
            syncCfg.uploadSources = cfg.localFolders;
        syncCfg.direction   = cfg.direction;
        syncCfg.purgeBefore = cfg.purgeBefore;
        syncCfg.dryRun      = cfg.dryRun;
        syncCfg.settings.maxWorkers = cfg.maxWorkers;

        syncResult = synchronize(*target.connFactory, syncCfg, statusHandler); //throw FileError, AbortProcess
    }
    catch (const SysError& e) { statusHandler.reportFatalError(e.toString()); }
    catch (const FileError& e) { statusHandler.reportFatalError(e.toString()); } //ErrorConnection, ErrorRemoteNotFound, ErrorScan, ErrorPurge
    catch (AbortProcess&) { statusHandler.logMessage(_("Stopped"), PhaseCallback::MsgType::error); }

    const ProcessSummary summary = statusHandler.prepareResult(syncResult);

    std::cout << utfTo<std::string>(getTaskResultLabel(summary.result)) + '\n' +
              utfTo<std::string>(replaceCpy(replaceCpy(replaceCpy(replaceCpy(_("Transferred: %a, skipped: %b, failed: %c, folders created: %d"),
                                                                              L"%a", numberTo<std::wstring>(summary.syncStats.transferred)),
                                                                   L"%b", numberTo<std::wstring>(summary.syncStats.skipped)),
                                                        L"%c", numberTo<std::wstring>(summary.syncStats.failed)),
                                             L"%d", numberTo<std::wstring>(summary.syncStats.dirsCreated))) + '\n';

    if (!cfg.logFilePath.empty())
        try
        {
            saveLogFile(cfg.logFilePath, summary, statusHandler.getErrorLog()); //throw FileError
        }
        catch (const FileError& e)
        {
            std::cerr << utfTo<std::string>(_("Error") + L": " + e.toString()) + '\n';
            if (summary.result == TaskResult::success)
                return SiteSyncExitCode::errors;
        }

    return mapToExitCode(summary.result);
}
}


int main(int argc, char* argv[])
{
    std::vector<Zstring> commandArgs;
    for (int i = 1; i < argc; ++i)
        commandArgs.push_back(argv[i]);

    std::optional<CommandLineConfig> cfg;
    try
    {
        cfg = parseCommandLine(commandArgs); //throw SysError
    }
    catch (const SysError& e)
    {
        std::cerr << utfTo<std::string>(_("Error") + L": " + e.toString()) + "\n\n";
        showSyntaxHelp();
        return static_cast<int>(SiteSyncExitCode::invalidArgs);
    }

    if (!cfg)
    {
        showSyntaxHelp();
        return static_cast<int>(SiteSyncExitCode::success);
    }

    return static_cast<int>(runSync(*cfg));
}
