// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef FILE_IO_H_89578342758342572345
#define FILE_IO_H_89578342758342572345

#include <functional>
#include "file_error.h"


namespace zen
{
const Zchar LINE_BREAK[] = Zstr("\n");

//OS-buffered file I/O
class FileBase
{
public:
    using FileHandle = int;
    static const int invalidFileHandle = -1;

    FileHandle getHandle() { return hFile_; }

    const Zstring& getFilePath() const { return filePath_; }

    void close(); //throw FileError -> good place to catch errors when closing stream, otherwise called in ~FileBase()!

protected:
    FileBase(FileHandle handle, const Zstring& filePath) : hFile_(handle), filePath_(filePath) {}
    ~FileBase();

private:
    FileBase           (const FileBase&) = delete;
    FileBase& operator=(const FileBase&) = delete;

    FileHandle hFile_ = invalidFileHandle;
    const Zstring filePath_;
};

//-----------------------------------------------------------------------------------------------

class FileInput : public FileBase
{
public:
    explicit FileInput(const Zstring& filePath); //throw FileError

    //returns "bytesToRead", unless end of file! CONTRACT: bytesToRead > 0
    size_t read(void* buffer, size_t bytesToRead); //throw FileError

    uint64_t getFileSize(); //throw FileError

private:
    size_t tryRead(void* buffer, size_t bytesToRead); //throw FileError; may return short, only 0 means EOF!
};


class FileOutput : public FileBase
{
public:
    explicit FileOutput(const Zstring& filePath); //throw FileError, ErrorTargetExisting
    ~FileOutput(); //not finalized => delete file

    void write(const void* buffer, size_t bytesToWrite); //throw FileError, ErrorInsufficientSpace

    void finalize() { close(); } //throw FileError

    uint64_t getBytesWritten() const { return bytesWritten_; }

private:
    size_t tryWrite(const void* buffer, size_t bytesToWrite); //throw FileError; may return short! CONTRACT: bytesToWrite > 0

    uint64_t bytesWritten_ = 0;
};

//-----------------------------------------------------------------------------------------------

using IoCallback = std::function<void(int64_t bytesDelta)>; //throw X

std::string getFileContent(const Zstring& filePath, const IoCallback& notifyUnbufferedIO /*throw X*/); //throw FileError, X

//overwrites if existing + transactional! :)
void setFileContent(const Zstring& filePath, const std::string_view bytes, const IoCallback& notifyUnbufferedIO /*throw X*/); //throw FileError, X
}

#endif //FILE_IO_H_89578342758342572345
