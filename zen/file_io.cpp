// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "file_io.h"
#include <algorithm>
#include <cstdio>
#include <stdexcept>
#include "file_access.h"

    #include <sys/stat.h>
    #include <fcntl.h>  //open
    #include <unistd.h> //close, read, write

using namespace zen;


namespace
{
const size_t CONTENT_BLOCK_SIZE = 128 * 1024;


void logCleanupError(const std::wstring& msg) //nowhere to report from a destructor
{
    ::fprintf(stderr, "%s\n", utfTo<std::string>(msg).c_str());
}
}


FileBase::~FileBase()
{
    if (hFile_ != invalidFileHandle)
        try
        {
            close(); //throw FileError
        }
        catch (const FileError& e) { logCleanupError(e.toString()); }
}


void FileBase::close() //throw FileError
{
    try
    {
        if (hFile_ == invalidFileHandle)
            throw SysError(L"Contract error: close() called more than once.");
        if (::close(hFile_) != 0)
            THROW_LAST_SYS_ERROR("close");
        hFile_ = invalidFileHandle; //do NOT set on error! => ~FileOutput() still wants to delete the file!
    }
    catch (const SysError& e) { throw FileError(replaceCpy(_("Cannot write file %x."), L"%x", fmtPath(getFilePath())), e.toString()); }
}

//----------------------------------------------------------------------------------------------------

namespace
{
FileBase::FileHandle openHandleForRead(const Zstring& filePath) //throw FileError
{
    try
    {
        //caveat: open() blocks on FIFOs and devices
        struct stat fileInfo = {};
        if (::stat(filePath.c_str(), &fileInfo) != 0) //follows symlinks
            THROW_LAST_SYS_ERROR("stat");

        if (!S_ISREG(fileInfo.st_mode))
            throw SysError(_("Unsupported item type."));

        const int fdFile = ::open(filePath.c_str(), O_RDONLY | O_CLOEXEC);
        if (fdFile == -1) //don't check "< 0" -> docu seems to allow "-2" to be a valid file handle
            THROW_LAST_SYS_ERROR("open");
        return fdFile; //pass ownership
    }
    catch (const SysError& e) { throw FileError(replaceCpy(_("Cannot open file %x."), L"%x", fmtPath(filePath)), e.toString()); }
}
}


FileInput::FileInput(const Zstring& filePath) : FileBase(openHandleForRead(filePath), filePath) //throw FileError
{
    //optimize read-ahead on input file:
    if (::posix_fadvise(getHandle(), 0 /*offset*/, 0 /*len*/, POSIX_FADV_SEQUENTIAL) != 0)
        THROW_LAST_FILE_ERROR(replaceCpy(_("Cannot read file %x."), L"%x", fmtPath(filePath)), "posix_fadvise(POSIX_FADV_SEQUENTIAL)");
}


size_t FileInput::tryRead(void* buffer, size_t bytesToRead) //throw FileError
{
    if (bytesToRead == 0) //"read() with a count of 0 returns zero" => indistinguishable from end of file! => check!
        throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation!");
    try
    {
        ssize_t bytesRead = 0;
        do
        {
            bytesRead = ::read(getHandle(), buffer, bytesToRead);
        }
        while (bytesRead < 0 && errno == EINTR);

        if (bytesRead < 0)
            THROW_LAST_SYS_ERROR("read");
        ASSERT_SYSERROR(static_cast<size_t>(bytesRead) <= bytesToRead);
        return bytesRead; //"zero indicates end of file"
    }
    catch (const SysError& e) { throw FileError(replaceCpy(_("Cannot read file %x."), L"%x", fmtPath(getFilePath())), e.toString()); }
}


size_t FileInput::read(void* buffer, size_t bytesToRead) //throw FileError
{
    auto it = static_cast<std::byte*>(buffer);
    const auto itEnd = it + bytesToRead;
    while (it != itEnd)
    {
        const size_t bytesRead = tryRead(it, itEnd - it); //throw FileError
        if (bytesRead == 0) //EOF
            break;
        it += bytesRead;
    }
    return it - static_cast<std::byte*>(buffer);
}


uint64_t FileInput::getFileSize() //throw FileError
{
    struct stat fileInfo = {};
    if (::fstat(getHandle(), &fileInfo) != 0)
        THROW_LAST_FILE_ERROR(replaceCpy(_("Cannot read file attributes of %x."), L"%x", fmtPath(getFilePath())), "fstat");
    return fileInfo.st_size;
}

//----------------------------------------------------------------------------------------------------

namespace
{
FileBase::FileHandle openHandleForWrite(const Zstring& filePath) //throw FileError, ErrorTargetExisting
{
    const mode_t fileMode = S_IRUSR | S_IWUSR | S_IRGRP | S_IWGRP | S_IROTH | S_IWOTH; //0666 => umask will be applied implicitly!

    const int fdFile = ::open(filePath.c_str(), O_CREAT | O_EXCL | O_WRONLY | O_CLOEXEC, fileMode);
    if (fdFile == -1)
        THROW_LAST_FILE_ERROR(replaceCpy(_("Cannot write file %x."), L"%x", fmtPath(filePath)), "open"); //EEXIST => ErrorTargetExisting
    return fdFile; //pass ownership
}
}


FileOutput::FileOutput(const Zstring& filePath) : FileBase(openHandleForWrite(filePath), filePath) {} //throw FileError, ErrorTargetExisting


FileOutput::~FileOutput()
{
    if (getHandle() != invalidFileHandle) //not finalized => clean up garbage
        try
        {
            if (::unlink(getFilePath().c_str()) != 0)
                THROW_LAST_SYS_ERROR("unlink");
        }
        catch (const SysError& e)
        {
            logCleanupError(replaceCpy(_("Cannot delete file %x."), L"%x", fmtPath(getFilePath())) + L"\n\n" + e.toString());
        }
}


size_t FileOutput::tryWrite(const void* buffer, size_t bytesToWrite) //throw FileError
{
    if (bytesToWrite == 0)
        throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation!");

    ssize_t bytesWritten = 0;
    do
    {
        bytesWritten = ::write(getHandle(), buffer, bytesToWrite);
    }
    while (bytesWritten < 0 && errno == EINTR);

    if (bytesWritten <= 0)
    {
        if (bytesWritten == 0) //comment in safe-read.c suggests to treat this as an error due to buggy drivers
            errno = ENOSPC;
        THROW_LAST_FILE_ERROR(replaceCpy(_("Cannot write file %x."), L"%x", fmtPath(getFilePath())), "write");
    }
    return bytesWritten;
}


void FileOutput::write(const void* buffer, size_t bytesToWrite) //throw FileError, ErrorInsufficientSpace
{
    auto it = static_cast<const std::byte*>(buffer);
    const auto itEnd = it + bytesToWrite;
    while (it != itEnd)
    {
        const size_t written = tryWrite(it, itEnd - it); //throw FileError
        it += written;
        bytesWritten_ += written;
    }
}

//----------------------------------------------------------------------------------------------------

std::string zen::getFileContent(const Zstring& filePath, const IoCallback& notifyUnbufferedIO /*throw X*/) //throw FileError, X
{
    FileInput fileIn(filePath); //throw FileError

    std::string output;
    for (;;)
    {
        const size_t oldSize = output.size();
        output.resize(oldSize + CONTENT_BLOCK_SIZE);

        const size_t bytesRead = fileIn.read(output.data() + oldSize, CONTENT_BLOCK_SIZE); //throw FileError
        output.resize(oldSize + bytesRead);

        if (notifyUnbufferedIO) notifyUnbufferedIO(bytesRead); //throw X

        if (bytesRead < CONTENT_BLOCK_SIZE) //EOF
            return output;
    }
}


void zen::setFileContent(const Zstring& filePath, const std::string_view bytes, const IoCallback& notifyUnbufferedIO /*throw X*/) //throw FileError, X
{
    const Zstring tmpFilePath = filePath + Zstr(".tmp");
    {
        FileOutput tmpFile(tmpFilePath); //throw FileError, (ErrorTargetExisting)
        for (size_t pos = 0; pos < bytes.size(); pos += CONTENT_BLOCK_SIZE)
        {
            const size_t blockSize = std::min(CONTENT_BLOCK_SIZE, bytes.size() - pos);
            tmpFile.write(bytes.data() + pos, blockSize); //throw FileError
            if (notifyUnbufferedIO) notifyUnbufferedIO(blockSize); //throw X
        }
        tmpFile.finalize(); //throw FileError
    }
    //take over ownership:
    ZEN_ON_SCOPE_FAIL( try { removeFilePlain(tmpFilePath); /*throw FileError*/ }
    catch (const FileError& e) { logCleanupError(e.toString()); });

    //operation finished: move temp file transactionally
    moveAndRenameItem(tmpFilePath, filePath, true /*replaceExisting*/); //throw FileError
}
