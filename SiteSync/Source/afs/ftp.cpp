// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "ftp.h"
#include <ctime>
#include <exception>
#include <libcurl/curl_wrap.h> //DON'T include <curl/curl.h> directly!
#include "ftp_listing.h"

    #include <fcntl.h>

using namespace zen;
using namespace sitesync;


namespace
{
const Zchar ftpPrefix[] = Zstr("ftp:");


std::wstring formatFtpStatus(int sc)
{
    const wchar_t* statusText = [&] //https://en.wikipedia.org/wiki/List_of_FTP_server_return_codes
    {
        switch (sc)
        {
            //*INDENT-OFF*
            case 421: return L"Service not available, closing control connection.";
            case 425: return L"Cannot open data connection.";
            case 426: return L"Connection closed; transfer aborted.";
            case 430: return L"Invalid username or password.";
            case 450: return L"Requested file action not taken.";
            case 451: return L"Local error in processing.";
            case 452: return L"Insufficient storage space in system.";

            case 500: return L"Syntax error, command unrecognized.";
            case 501: return L"Syntax error in parameters or arguments.";
            case 502: return L"Command not implemented.";
            case 503: return L"Bad sequence of commands.";
            case 504: return L"Command not implemented for that parameter.";
            case 530: return L"User not logged in.";
            case 532: return L"Need account for storing files.";
            case 533: return L"Command protection level denied for policy reasons.";
            case 534: return L"Could not connect to server; issue regarding SSL.";
            case 535: return L"Failed security check.";
            case 550: return L"File unavailable, e.g. file not found, no access.";
            case 552: return L"Requested file action aborted. Exceeded storage allocation.";
            case 553: return L"File name not allowed.";

            default:  return L"";
            //*INDENT-ON*
        }
    }();

    if (strLength(statusText) == 0)
        return replaceCpy<std::wstring>(L"FTP status %x.", L"%x", numberTo<std::wstring>(sc));
    else
        return replaceCpy<std::wstring>(L"FTP status %x: ", L"%x", numberTo<std::wstring>(sc)) + statusText;
}


//retrying won't help
bool isPermanentFtpStatus(long ftpStatusCode)
{
    switch (ftpStatusCode)
    {
        case 530: //not logged in
        case 532:
        case 533:
        case 534:
        case 535:
        case 550: //no access or not found
        case 552: //quota exceeded
        case 553: //file name not allowed
            return true;
    }
    return false;
}


bool isConnectionFailure(CURLcode rc)
{
    switch (rc)
    {
        case CURLE_COULDNT_RESOLVE_PROXY:
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_CONNECT:
        case CURLE_FTP_WEIRD_SERVER_REPLY:
        case CURLE_FTP_ACCEPT_TIMEOUT:
        case CURLE_FTP_CANT_GET_HOST:
        case CURLE_OPERATION_TIMEDOUT:
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_GOT_NOTHING:
        case CURLE_SEND_ERROR:
        case CURLE_RECV_ERROR:
            return true;
        default:
            return false;
    }
}

//================================================================================================================

struct SysErrorFtpProtocol : public zen::SysError
{
    SysErrorFtpProtocol(const std::wstring& msg, long ftpError) : SysError(msg), ftpErrorCode(ftpError) {}

    long ftpErrorCode;
};

DEFINE_NEW_SYS_ERROR(SysErrorPassword)
DEFINE_NEW_SYS_ERROR(SysErrorConnectionLost)


std::wstring getCurlDisplayPath(const FtpLogin& login, const Zstring& itemPath)
{
    Zstring displayPath = Zstring(ftpPrefix) + Zstr("//");

    if (!login.username.empty())
        displayPath += login.username + Zstr('@');

    displayPath += login.server;

    if (login.portCfg > 0 && login.portCfg != DEFAULT_PORT_FTP)
        displayPath += Zstr(':') + numberTo<Zstring>(login.portCfg);

    if (!itemPath.empty() && itemPath != Zstr("/"))
    {
        if (!startsWith(itemPath, FILE_NAME_SEPARATOR))
            displayPath += FILE_NAME_SEPARATOR;
        displayPath += itemPath;
    }
    return utfTo<std::wstring>(displayPath);
}


//map transport errors onto the sync error taxonomy
template <class Function> inline
auto runFtpOperation(const std::wstring& errorMsg, Function fun) //throw FileError, ErrorConnection, ErrorTransferPermanent
{
    try
    {
        return fun(); //throw SysError, SysErrorPassword, SysErrorFtpProtocol, SysErrorConnectionLost
    }
    catch (const SysErrorPassword& e) { throw ErrorTransferPermanent(errorMsg, e.toString()); }
    catch (const SysErrorConnectionLost& e) { throw ErrorConnection(errorMsg, e.toString()); }
    catch (const SysErrorFtpProtocol& e)
    {
        if (isPermanentFtpStatus(e.ftpErrorCode))
            throw ErrorTransferPermanent(errorMsg, e.toString());
        throw FileError(errorMsg, e.toString());
    }
    catch (const SysError& e) { throw FileError(errorMsg, e.toString()); }
}

//================================================================================================================

class FtpSession : public RemoteSession
{
public:
    explicit FtpSession(const FtpLogin& login) : login_(login) {}

    ~FtpSession()
    {
        if (easyHandle_)
            ::curl_easy_cleanup(easyHandle_);
    }

    void connect() //throw SysError, SysErrorPassword, SysErrorFtpProtocol, SysErrorConnectionLost
    {
        /*  FEAT is not supported by all servers (e.g. "550 FEAT: Operation not permitted")
            => '*' prefix: *any* FTP response proves the login succeeded    */
        const std::string featBuf = runSingleFtpCommand("*FEAT"); //throw SysError, SysErrorPassword, SysErrorFtpProtocol, SysErrorConnectionLost

        const std::vector<std::string_view> lines = splitFtpResponse(featBuf);
        if (std::none_of(lines.begin(), lines.end(), [](const std::string_view& line)
    {
        return startsWith(line, "211 ") ||
               startsWith(line, "500 ") ||
               startsWith(line, "550 ");
        }))
        throw SysError(L"Unexpected FTP response. (" + utfTo<std::wstring>(featBuf) + L')');

        features_ = parseFeatResponse(featBuf);

        if (features_.utf8) //RFC 2640; Microsoft FTP Service requires this explicitly
            runSingleFtpCommand("*OPTS UTF8 ON"); //throw SysError, SysErrorPassword, SysErrorFtpProtocol, SysErrorConnectionLost
    }

    std::wstring getDisplayPath(const Zstring& itemPath) const override { return getCurlDisplayPath(login_, itemPath); }

    std::optional<ItemType> getItemTypeIfExists(const Zstring& itemPath) override //throw FileError
    {
        const std::optional<Zstring> parentPath = getParentFolderPath(itemPath);
        if (!parentPath) //root
            return ItemType::folder;

        const Zstring itemName = getItemName(itemPath);

        return runFtpOperation(replaceCpy(_("Cannot read file attributes of %x."), L"%x", fmtPath(getDisplayPath(itemPath))), [&]() -> std::optional<ItemType>
        {
            try
            {
                //no standard FTP command for a single item's type: search the parent listing instead
                for (const RemoteItem& item : listFolder(*parentPath)) //throw SysError, SysErrorPassword, SysErrorFtpProtocol, SysErrorConnectionLost
                    if (item.itemName == itemName)
                        return item.type;
                return std::nullopt;
            }
            catch (const SysErrorFtpProtocol& e)
            {
                if (e.ftpErrorCode == 550) //parent folder not existing
                    return std::nullopt;
                throw;
            }
        });
    }

    std::vector<RemoteItem> readFolder(const Zstring& folderPath) override //throw FileError
    {
        return runFtpOperation(replaceCpy(_("Cannot read directory %x."), L"%x", fmtPath(getDisplayPath(folderPath))), [&]
        {
            return listFolder(folderPath); //throw SysError, SysErrorPassword, SysErrorFtpProtocol, SysErrorConnectionLost
        });
    }

    std::optional<time_t> getModTime(const Zstring& filePath) override //throw FileError
    {
        return runFtpOperation(replaceCpy(_("Cannot read modification time of %x."), L"%x", fmtPath(getDisplayPath(filePath))), [&]() -> std::optional<time_t>
        {
            std::string mdtmBuf;
            try
            {
                mdtmBuf = runSingleFtpCommand("MDTM " + getServerPath(filePath)); //throw SysError, SysErrorPassword, SysErrorFtpProtocol, SysErrorConnectionLost
            }
            catch (const SysErrorFtpProtocol& e)
            {
                if (e.ftpErrorCode == 500 || //MDTM not supported
                    e.ftpErrorCode == 502 ||
                    e.ftpErrorCode == 504)
                    return std::nullopt;
                throw;
            }
            //https://tools.ietf.org/html/rfc3659#section-3.1
            return parseFtpTimeVal(getFtpReplyValue(mdtmBuf, "213 ")); //throw SysError
        });
    }

    uint64_t getFileSize(const Zstring& filePath) override //throw FileError
    {
        return runFtpOperation(replaceCpy(_("Cannot read file attributes of %x."), L"%x", fmtPath(getDisplayPath(filePath))), [&]
        {
            //some servers return the ASCII size unless "TYPE I" is active
            runSingleFtpCommand("TYPE I"); //throw SysError, SysErrorPassword, SysErrorFtpProtocol, SysErrorConnectionLost

            const std::string sizeBuf = runSingleFtpCommand("SIZE " + getServerPath(filePath)); //throw SysError, SysErrorPassword, SysErrorFtpProtocol, SysErrorConnectionLost
            const std::string_view sizeStr = getFtpReplyValue(sizeBuf, "213 "); //throw SysError

            if (sizeStr.empty() || !std::all_of(sizeStr.begin(), sizeStr.end(), &isDigit<char>))
                throw SysError(L"Unexpected FTP response. (" + utfTo<std::wstring>(sizeBuf) + L')');

            return stringTo<uint64_t>(sizeStr);
        });
    }

    void createFolder(const Zstring& folderPath) override //throw FileError, ErrorTargetExisting
    {
        const std::wstring errorMsg = replaceCpy(_("Cannot create directory %x."), L"%x", fmtPath(getDisplayPath(folderPath)));
        try
        {
            runFtpOperation(errorMsg, [&]
            {
                runSingleFtpCommand("MKD " + getServerPath(folderPath)); //throw SysError, SysErrorPassword, SysErrorFtpProtocol, SysErrorConnectionLost
            });
        }
        catch (const ErrorTransferPermanent& e) //550 is also reported for an existing folder
        {
            if (getItemTypeIfExists(folderPath)) //throw FileError
                throw ErrorTargetExisting(errorMsg, e.toString());
            throw;
        }
    }

    void removeFile(const Zstring& filePath) override //throw FileError
    {
        //symlinks: Linux servers remove the link via DELE
        runFtpOperation(replaceCpy(_("Cannot delete file %x."), L"%x", fmtPath(getDisplayPath(filePath))), [&]
        {
            runSingleFtpCommand("DELE " + getServerPath(filePath)); //throw SysError, SysErrorPassword, SysErrorFtpProtocol, SysErrorConnectionLost
        });
    }

    void removeFolder(const Zstring& folderPath) override //throw FileError
    {
        runFtpOperation(replaceCpy(_("Cannot delete directory %x."), L"%x", fmtPath(getDisplayPath(folderPath))), [&]
        {
            runSingleFtpCommand("RMD " + getServerPath(folderPath)); //throw SysError, SysErrorPassword, SysErrorFtpProtocol, SysErrorConnectionLost
        });
    }

    /*  RNTO with existing target is undefined: Linux servers overwrite, Windows IIS and FileZilla Server fail
        => delete target first ('*': ignore failure if not existing)             */
    void moveAndRename(const Zstring& pathFrom, const Zstring& pathTo) override //throw FileError
    {
        runFtpOperation(replaceCpy(replaceCpy(_("Cannot move file %x to %y."),
                                              L"%x", L'\n' + fmtPath(getDisplayPath(pathFrom))),
                                   L"%y", L'\n' + fmtPath(getDisplayPath(pathTo))), [&]
        {
            curl_slist* quote = nullptr;
            ZEN_ON_SCOPE_EXIT(::curl_slist_free_all(quote));
            quote = ::curl_slist_append(quote, ("*DELE " + getServerPath(pathTo  )).c_str());
            quote = ::curl_slist_append(quote, ( "RNFR " + getServerPath(pathFrom)).c_str());
            quote = ::curl_slist_append(quote, ( "RNTO " + getServerPath(pathTo  )).c_str());

            perform(Zstring(), true /*isDir*/, CURLFTPMETHOD_NOCWD, //avoid needless CWDs
            {
                {CURLOPT_NOBODY, 1L},
                {CURLOPT_QUOTE, quote},
            }); //throw SysError, SysErrorPassword, SysErrorFtpProtocol, SysErrorConnectionLost
        });
    }

    void setBinaryMode() override //throw FileError
    {
        runFtpOperation(replaceCpy(_("Cannot access %x."), L"%x", fmtPath(getDisplayPath(Zstr("/")))), [&]
        {
            runSingleFtpCommand("TYPE I"); //throw SysError, SysErrorPassword, SysErrorFtpProtocol, SysErrorConnectionLost
        });
    }

    void downloadFile(const Zstring& filePath, const std::function<void(const void* buffer, size_t bytesToWrite)>& writeBlock /*throw X*/) override //throw FileError, X
    {
        std::exception_ptr exception;

        auto onBytesReceived = [&](const void* buffer, size_t bytesToWrite)
        {
            try
            {
                writeBlock(buffer, bytesToWrite); //throw X
                return bytesToWrite;
            }
            catch (...)
            {
                exception = std::current_exception();
                return bytesToWrite + 1; //signal error condition => CURLE_WRITE_ERROR
            }
        };
        curl_write_callback onBytesReceivedWrapper = [](char* buffer, size_t size, size_t nitems, void* callbackData)
        {
            return (*static_cast<decltype(onBytesReceived)*>(callbackData))(buffer, size * nitems);
        };

        try
        {
            runFtpOperation(replaceCpy(_("Cannot read file %x."), L"%x", fmtPath(getDisplayPath(filePath))), [&]
            {
                perform(filePath, false /*isDir*/, CURLFTPMETHOD_NOCWD,
                {
                    {CURLOPT_WRITEDATA, &onBytesReceived},
                    {CURLOPT_WRITEFUNCTION, onBytesReceivedWrapper},
                    {CURLOPT_IGNORE_CONTENT_LENGTH, 1L}, //skip SIZE: download until actual EOF
                }); //throw SysError, SysErrorPassword, SysErrorFtpProtocol, SysErrorConnectionLost
            });
        }
        catch (const FileError&)
        {
            if (exception)
                std::rethrow_exception(exception);
            throw;
        }
    }

    //existing file: overwritten by all common servers
    void uploadFile(const Zstring& filePath, const std::function<size_t(void* buffer, size_t bytesToRead)>& readBlock /*throw X*/) override //throw FileError, X
    {
        std::exception_ptr exception;

        auto getBytesToSend = [&](void* buffer, size_t bytesToRead) -> size_t
        {
            try
            {
                //libcurl calls back until 0 bytes are returned
                return readBlock(buffer, bytesToRead); //throw X
            }
            catch (...)
            {
                exception = std::current_exception();
                return CURL_READFUNC_ABORT; //signal error condition => CURLE_ABORTED_BY_CALLBACK
            }
        };
        curl_read_callback getBytesToSendWrapper = [](char* buffer, size_t size, size_t nitems, void* callbackData)
        {
            return (*static_cast<decltype(getBytesToSend)*>(callbackData))(buffer, size * nitems);
        };

        try
        {
            runFtpOperation(replaceCpy(_("Cannot write file %x."), L"%x", fmtPath(getDisplayPath(filePath))), [&]
            {
                perform(filePath, false /*isDir*/, CURLFTPMETHOD_NOCWD,
                {
                    {CURLOPT_UPLOAD, 1L},
                    {CURLOPT_READDATA, &getBytesToSend},
                    {CURLOPT_READFUNCTION, getBytesToSendWrapper},
                }); //throw SysError, SysErrorPassword, SysErrorFtpProtocol, SysErrorConnectionLost
            });
        }
        catch (const FileError&)
        {
            if (exception)
                std::rethrow_exception(exception);
            throw;
        }
    }

private:
    FtpSession           (const FtpSession&) = delete;
    FtpSession& operator=(const FtpSession&) = delete;

    std::vector<RemoteItem> listFolder(const Zstring& folderPath) //throw SysError, SysErrorPassword, SysErrorFtpProtocol, SysErrorConnectionLost
    {
        std::string rawListing;

        curl_write_callback onBytesReceived = [](char* buffer, size_t size, size_t nitems, void* callbackData)
        {
            auto& listing = *static_cast<std::string*>(callbackData);
            listing.append(buffer, size * nitems);
            return size * nitems;
        };

        std::vector<CurlOption> options =
        {
            {CURLOPT_WRITEDATA, &rawListing},
            {CURLOPT_WRITEFUNCTION, onBytesReceived},
        };
        curl_ftpmethod pathMethod = CURLFTPMETHOD_SINGLECWD;

        if (features_.mlsd)
        {
            options.emplace_back(CURLOPT_CUSTOMREQUEST, "MLSD");

            //some servers apply globbing to the MLSD argument: fall back to CWD for paths with wildcard chars
            const bool pathHasWildcards =
                contains(afterFirst(folderPath, Zstr('['), IfNotFoundReturn::none), Zstr(']')) ||
                contains(folderPath, Zstr('*')) ||
                contains(folderPath, Zstr('?'));

            if (!pathHasWildcards)
                pathMethod = CURLFTPMETHOD_NOCWD;
        }
        //else: plain LIST without parameters: https://cr.yp.to/ftp/list.html

        perform(folderPath, true /*isDir*/, pathMethod, options); //throw SysError, SysErrorPassword, SysErrorFtpProtocol, SysErrorConnectionLost

        if (features_.mlsd)
            return parseMlsdListing(rawListing); //throw SysError

        return parseListListing(rawListing, std::time(nullptr)); //throw SysError
    }

    //returns server response (header data)
    std::string runSingleFtpCommand(const std::string& ftpCmd) //throw SysError, SysErrorPassword, SysErrorFtpProtocol, SysErrorConnectionLost
    {
        curl_slist* quote = nullptr;
        ZEN_ON_SCOPE_EXIT(::curl_slist_free_all(quote));
        quote = ::curl_slist_append(quote, ftpCmd.c_str());

        return perform(Zstring(), true /*isDir*/, CURLFTPMETHOD_NOCWD /*avoid needless CWDs*/,
        {
            {CURLOPT_NOBODY, 1L},
            {CURLOPT_QUOTE, quote},
        }); //throw SysError, SysErrorPassword, SysErrorFtpProtocol, SysErrorConnectionLost
    }

    //returns server response (header data)
    std::string perform(const Zstring& itemPath /*optional*/, bool isDir, curl_ftpmethod pathMethod,
                        const std::vector<CurlOption>& extraOptions) //throw SysError, SysErrorPassword, SysErrorFtpProtocol, SysErrorConnectionLost
    {
        if (!easyHandle_)
        {
            easyHandle_ = ::curl_easy_init();
            if (!easyHandle_)
                throw SysError(formatSystemError("curl_easy_init", formatCurlStatusCode(CURLE_OUT_OF_MEMORY), L""));
        }
        else
            ::curl_easy_reset(easyHandle_); //keeps the live connection

        auto setCurlOption = [easyHandle = easyHandle_](const CurlOption& curlOpt) //throw SysError
        {
            if (const CURLcode rc = ::curl_easy_setopt(easyHandle, curlOpt.option, curlOpt.value);
                rc != CURLE_OK)
                throw SysError(formatSystemError("curl_easy_setopt(" + numberTo<std::string>(static_cast<int>(curlOpt.option)) + ")",
                                                 formatCurlStatusCode(rc), utfTo<std::wstring>(::curl_easy_strerror(rc))));
        };

        char curlErrorBuf[CURL_ERROR_SIZE] = {};
        setCurlOption({CURLOPT_ERRORBUFFER, curlErrorBuf}); //throw SysError

        std::string headerData;
        curl_write_callback onHeaderReceived = [](char* buffer, size_t size, size_t nitems, void* callbackData)
        {
            auto& output = *static_cast<std::string*>(callbackData);
            output.append(buffer, size * nitems);
            return size * nitems;
        };
        setCurlOption({CURLOPT_HEADERDATA, &headerData}); //throw SysError
        setCurlOption({CURLOPT_HEADERFUNCTION, onHeaderReceived}); //throw SysError

        setCurlOption({CURLOPT_URL, getCurlUrlPath(itemPath, isDir).c_str()}); //throw SysError

        setCurlOption({CURLOPT_FTP_FILEMETHOD, pathMethod}); //throw SysError

        if (!login_.username.empty()) //else: libcurl defaults to "anonymous"
        {
            setCurlOption({CURLOPT_USERNAME, utfTo<std::string>(login_.username).c_str()}); //throw SysError
            setCurlOption({CURLOPT_PASSWORD, utfTo<std::string>(login_.password).c_str()}); //throw SysError
        }

        setCurlOption({CURLOPT_PORT, login_.portCfg > 0 ? login_.portCfg : DEFAULT_PORT_FTP}); //throw SysError

        //thread-safety: https://curl.haxx.se/libcurl/c/threadsafe.html
        setCurlOption({CURLOPT_NOSIGNAL, 1}); //throw SysError

        setCurlOption({CURLOPT_CONNECTTIMEOUT, login_.timeoutSec}); //throw SysError

        //no CURLOPT_TIMEOUT: hard limit on total transfer time
        setCurlOption({CURLOPT_LOW_SPEED_TIME, login_.timeoutSec}); //throw SysError
        setCurlOption({CURLOPT_LOW_SPEED_LIMIT, 1 /*[bytes]*/}); //throw SysError

        setCurlOption({CURLOPT_SERVER_RESPONSE_TIMEOUT, login_.timeoutSec}); //throw SysError

        //long-running uploads need keep-alives for the idle control connection
        setCurlOption({CURLOPT_TCP_KEEPALIVE, 1}); //throw SysError

        std::optional<SysError> socketException;
        //libcurl does *not* set FD_CLOEXEC for us! https://github.com/curl/curl/issues/2252
        auto onSocketCreate = [&](curl_socket_t curlfd, curlsocktype purpose)
        {
            if (::fcntl(curlfd, F_SETFD, FD_CLOEXEC) == -1)
            {
                socketException = SysError(formatSystemError("fcntl(FD_CLOEXEC)", errno));
                return CURL_SOCKOPT_ERROR;
            }
            return CURL_SOCKOPT_OK;
        };

        using SocketCbType = decltype(onSocketCreate);
        using SocketCbWrapperType = int (*)(SocketCbType* clientp, curl_socket_t curlfd, curlsocktype purpose); //needed for cdecl function pointer cast
        SocketCbWrapperType onSocketCreateWrapper = [](SocketCbType* clientp, curl_socket_t curlfd, curlsocktype purpose)
        {
            return (*clientp)(curlfd, purpose);
        };

        setCurlOption({CURLOPT_SOCKOPTFUNCTION, onSocketCreateWrapper}); //throw SysError
        setCurlOption({CURLOPT_SOCKOPTDATA, &onSocketCreate}); //throw SysError

        //no certificate checking for FTPS (same as FileZilla's default)
        setCurlOption({CURLOPT_CAINFO, 0}); //throw SysError
        setCurlOption({CURLOPT_SSL_VERIFYPEER, 0}); //throw SysError
        setCurlOption({CURLOPT_SSL_VERIFYHOST, 0}); //throw SysError

        if (login_.useTls) //https://tools.ietf.org/html/rfc4217
        {
            //require SSL for both control and data:
            setCurlOption({CURLOPT_USE_SSL,    CURLUSESSL_ALL}); //throw SysError
            setCurlOption({CURLOPT_FTPSSLAUTH, CURLFTPAUTH_TLS}); //throw SysError
        }

        for (const CurlOption& option : extraOptions)
            setCurlOption(option); //throw SysError

        //=======================================================================================================
        const CURLcode rcPerf = ::curl_easy_perform(easyHandle_);
        //curl_easy_perform() considers FTP response codes >= 400 as failure

        if (socketException)
            throw *socketException; //throw SysError
        //=======================================================================================================

        if (rcPerf != CURLE_OK)
        {
            std::wstring errorMsg = trimCpy(utfTo<std::wstring>(curlErrorBuf)); //optional

            if (const std::vector<std::string_view>& headerLines = splitFtpResponse(headerData);
                !headerLines.empty())
                if (const std::string_view& response = trimCpy(headerLines.back()); //that *should* be the server's error response
                    !response.empty())
                    errorMsg += (errorMsg.empty() ? L"" : L"\n") + utfTo<std::wstring>(response);

            const std::wstring details = formatSystemError("curl_easy_perform", formatCurlStatusCode(rcPerf), errorMsg);

            if (rcPerf == CURLE_LOGIN_DENIED)
                throw SysErrorPassword(details);

            if (isConnectionFailure(rcPerf))
                throw SysErrorConnectionLost(details);

            long ftpStatusCode = 0; //optional
            /*const CURLcode rc =*/ ::curl_easy_getinfo(easyHandle_, CURLINFO_RESPONSE_CODE, &ftpStatusCode);
            //https://en.wikipedia.org/wiki/List_of_FTP_server_return_codes
            if (400 <= ftpStatusCode && ftpStatusCode < 600)
                throw SysErrorFtpProtocol(details + L'\n' + formatFtpStatus(static_cast<int>(ftpStatusCode)), ftpStatusCode);

            throw SysError(details);
        }
        return headerData;
    }

    std::string getServerPath(const Zstring& itemPath) const
    {
        if (startsWith(itemPath, FILE_NAME_SEPARATOR))
            return utfTo<std::string>(itemPath);
        return FILE_NAME_SEPARATOR + utfTo<std::string>(itemPath);
    }

    std::string getCurlUrlPath(const Zstring& itemPath /*optional*/, bool isDir) //throw SysError
    {
        std::string curlRelPath; //libcurl expects encoded paths (except for '/' char!!!)

        split(utfTo<std::string>(itemPath), '/', [&](std::string_view comp)
        {
            if (!comp.empty())
            {
                char* compFmt = ::curl_easy_escape(easyHandle_, comp.data(), static_cast<int>(comp.size()));
                if (!compFmt)
                    throw SysError(formatSystemError("curl_easy_escape(" + std::string(comp) + ')', L"", L"Conversion failure"));
                ZEN_ON_SCOPE_EXIT(::curl_free(compFmt));

                if (!curlRelPath.empty())
                    curlRelPath += '/';
                curlRelPath += compFmt;
            }
        });

        if (trimCpy(login_.server).empty())
            throw SysError(_("Server name must not be empty."));

        /*  CURLFTPMETHOD_NOCWD requires absolute paths to skip CWDs unconditionally
            => use "//" because "/%2f" had bugs: https://curl.se/docs/faq.html#How_do_I_list_the_root_directory    */
        std::string path = utfTo<std::string>(Zstring(ftpPrefix) + Zstr("//") + login_.server) + "//" + curlRelPath;

        if (isDir && !endsWith(path, '/')) //curl-FTP needs directory paths to end with a slash
            path += '/';
        return path;
    }

    const FtpLogin login_;
    CURL* easyHandle_ = nullptr;
    FtpFeatures features_;
};

//================================================================================================================

class FtpConnectionFactory : public ConnectionFactory
{
public:
    explicit FtpConnectionFactory(const FtpLogin& login) : login_(login) {}

    std::unique_ptr<RemoteSession> openSession() const override //throw ErrorConnection
    {
        auto session = std::make_unique<FtpSession>(login_);
        try
        {
            session->connect(); //throw SysError, SysErrorPassword, SysErrorFtpProtocol, SysErrorConnectionLost
        }
        catch (const SysError& e)
        {
            throw ErrorConnection(replaceCpy(_("Unable to connect to %x."), L"%x", fmtPath(getDisplayName())), e.toString());
        }
        return session;
    }

    std::wstring getDisplayName() const override { return getCurlDisplayPath(login_, Zstring()); }

private:
    const FtpLogin login_;
};
}


void sitesync::ftpInit() //throw SysError
{
    libcurlInit(); //throw SysError
}


void sitesync::ftpTeardown()
{
    libcurlTearDown();
}


bool sitesync::acceptsPathPhraseFtp(const Zstring& pathPhrase) //noexcept
{
    return startsWithAsciiNoCase(trimCpy(pathPhrase), ftpPrefix); //check for explicit FTP path
}


FtpPathPhrase sitesync::parseFtpPathPhrase(const Zstring& pathPhrase) //throw SysError
{
    Zstring phrase = trimCpy(pathPhrase);

    if (!startsWithAsciiNoCase(phrase, ftpPrefix))
        throw SysError(replaceCpy<std::wstring>(L"Not an FTP path: %x", L"%x", fmtPath(pathPhrase)));

    phrase = phrase.substr(strLength(ftpPrefix));
    trim(phrase, TrimSide::left, [](Zchar c) { return c == Zstr('/') || c == Zstr('\\'); });

    //password may contain '@': split at last '@' before the path
    const ZstringView phraseView = phrase;
    const auto itPathBegin = std::find_if(phraseView.begin(), phraseView.end(), [](Zchar c) { return c == '/' || c == '\\' || c == '|'; });
    const ZstringView authority = makeStringView(phraseView.begin(), itPathBegin);
    const ZstringView pathOpt   = makeStringView(itPathBegin, phraseView.end());

    const ZstringView credentials = beforeLast(authority, Zstr('@'), IfNotFoundReturn::none);
    const ZstringView serverPort  =  afterLast(authority, Zstr('@'), IfNotFoundReturn::all);

    FtpPathPhrase output;
    output.login.username = Zstring(beforeFirst(credentials, Zstr(':'), IfNotFoundReturn::all));
    output.login.password = Zstring( afterFirst(credentials, Zstr(':'), IfNotFoundReturn::none));

    output.login.server = Zstring(beforeLast(serverPort, Zstr(':'), IfNotFoundReturn::all));
    const ZstringView port =       afterLast(serverPort, Zstr(':'), IfNotFoundReturn::none);
    if (!std::all_of(port.begin(), port.end(), &isDigit<Zchar>))
        throw SysError(replaceCpy<std::wstring>(L"Invalid port number: %x", L"%x", fmtPath(utfTo<std::wstring>(port))));
    output.login.portCfg = stringTo<int>(port); //0 if empty

    if (trimCpy(output.login.server).empty())
        throw SysError(_("Server name must not be empty."));

    const ZstringView folderPath = beforeFirst(pathOpt, Zstr('|'), IfNotFoundReturn::all);
    const ZstringView options    =  afterFirst(pathOpt, Zstr('|'), IfNotFoundReturn::none);

    //normalize: absolute, '/'-separated, no trailing separator
    split(folderPath, Zstr('/'), [&](ZstringView comp)
    {
        split(comp, Zstr('\\'), [&](ZstringView subComp)
        {
            if (!subComp.empty() && subComp != Zstr("."))
                output.folderPath += FILE_NAME_SEPARATOR + Zstring(subComp);
        });
    });
    if (output.folderPath.empty())
        output.folderPath = FILE_NAME_SEPARATOR;

    split(options, Zstr('|'), [&](ZstringView optPhrase)
    {
        optPhrase = trimCpy(optPhrase);
        if (!optPhrase.empty())
        {
            if (startsWith(optPhrase, Zstr("timeout=")))
                output.login.timeoutSec = std::max(1, stringTo<int>(afterFirst(optPhrase, Zstr('='), IfNotFoundReturn::none)));
            else if (optPhrase == Zstr("ssl"))
                output.login.useTls = true;
            else
                throw SysError(replaceCpy<std::wstring>(L"Unknown FTP option: %x", L"%x", fmtPath(utfTo<std::wstring>(optPhrase))));
        }
    });
    return output;
}


std::unique_ptr<ConnectionFactory> sitesync::createFtpConnectionFactory(const FtpLogin& login)
{
    return std::make_unique<FtpConnectionFactory>(login);
}
