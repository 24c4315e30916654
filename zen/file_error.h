// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef FILE_ERROR_H_839567308565656789
#define FILE_ERROR_H_839567308565656789

#include "sys_error.h" //we'll need this later anyway!


namespace zen
{
class FileError //A high-level exception class giving detailed context information for end users
{
public:
    explicit FileError(const std::wstring& msg) : msg_(msg) {}
    FileError(const std::wstring& msg, const std::wstring& details) : msg_(msg + L"\n\n" + details) {}
    virtual ~FileError() {}

    const std::wstring& toString() const { return msg_; }

private:
    std::wstring msg_;
};

#define DEFINE_NEW_FILE_ERROR(X) struct X : public zen::FileError { X(const std::wstring& msg) : FileError(msg) {} X(const std::wstring& msg, const std::wstring& descr) : FileError(msg, descr) {} };

DEFINE_NEW_FILE_ERROR(ErrorTargetExisting)
DEFINE_NEW_FILE_ERROR(ErrorAccessDenied)      //EACCES, EPERM, EROFS: retrying won't help
DEFINE_NEW_FILE_ERROR(ErrorInsufficientSpace) //ENOSPC, EDQUOT, EFBIG: dito


[[noreturn]] void throwFileError(const std::wstring& msg, const std::string& functionName, ErrorCode ec); //throw FileError

//errno is easily overwritten => evaluate *before* making any (indirect) system calls, e.g. memory allocation for the exception object
#define THROW_LAST_FILE_ERROR(msg, functionName)                           \
    do { const ErrorCode ecInternal = getLastError(); zen::throwFileError(msg, functionName, ecInternal); } while (false)

//----------- facilitate usage of std::wstring for error messages --------------------

inline std::wstring fmtPath(const std::wstring& displayPath) { return L'"' + displayPath + L'"'; }
inline std::wstring fmtPath(const Zstring& displayPath) { return fmtPath(utfTo<std::wstring>(displayPath)); }
inline std::wstring fmtPath(const wchar_t* displayPath) { return fmtPath(std::wstring(displayPath)); } //resolve overload ambiguity




//######################## implementation ########################
inline
void throwFileError(const std::wstring& msg, const std::string& functionName, ErrorCode ec) //throw FileError
{
    const std::wstring details = formatSystemError(functionName, ec);
    switch (ec)
    {
        case EEXIST:
            throw ErrorTargetExisting(msg, details);
        case EACCES:
        case EPERM:
        case EROFS:
            throw ErrorAccessDenied(msg, details);
        case ENOSPC:
        case EDQUOT:
        case EFBIG:
            throw ErrorInsufficientSpace(msg, details);
    }
    throw FileError(msg, details);
}
}

#endif //FILE_ERROR_H_839567308565656789
