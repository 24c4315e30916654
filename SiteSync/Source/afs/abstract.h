// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef ABSTRACT_H_873450978453042524534234
#define ABSTRACT_H_873450978453042524534234

#include <functional>
#include <memory>
#include <vector>
#include <zen/file_access.h> //ItemType
#include <zen/file_error.h>
#include <zen/file_path.h>


namespace sitesync
{
//remote-side error taxonomy: everything else is a transient zen::FileError
DEFINE_NEW_FILE_ERROR(ErrorConnection)        //cannot establish/keep the session (transient)
DEFINE_NEW_FILE_ERROR(ErrorScan)              //directory traversal failed
DEFINE_NEW_FILE_ERROR(ErrorRemoteNotFound)    //scan root does not exist
DEFINE_NEW_FILE_ERROR(ErrorTransferPermanent) //permission denied, name not allowed, quota exceeded: retrying won't help
DEFINE_NEW_FILE_ERROR(ErrorVerification)      //transferred size differs from expected (transient)
DEFINE_NEW_FILE_ERROR(ErrorPurge)


struct RemoteItem
{
    Zstring itemName;
    zen::ItemType type = zen::ItemType::file;
    uint64_t fileSize = 0; //files only
    std::optional<time_t> modTime; //number of seconds since Jan. 1st 1970 GMT; none if not reported by the server
};


//one authenticated connection: NOT thread-safe => owned by exactly one thread at a time
//item paths are absolute and '/'-separated
class RemoteSession
{
public:
    virtual ~RemoteSession() {}

    virtual std::wstring getDisplayPath(const Zstring& itemPath) const = 0;

    //symlinks are not followed
    virtual std::optional<zen::ItemType> getItemTypeIfExists(const Zstring& itemPath) = 0; //throw FileError

    //"." and ".." are never reported
    virtual std::vector<RemoteItem> readFolder(const Zstring& folderPath) = 0; //throw FileError

    //none if the server cannot tell
    virtual std::optional<time_t> getModTime(const Zstring& filePath) = 0; //throw FileError
    virtual uint64_t getFileSize(const Zstring& filePath) = 0; //throw FileError

    virtual void createFolder(const Zstring& folderPath) = 0; //throw FileError, ErrorTargetExisting
    virtual void removeFile  (const Zstring& filePath  ) = 0; //throw FileError; symlinks, too
    virtual void removeFolder(const Zstring& folderPath) = 0; //throw FileError; must be empty

    //replaces an existing target file
    virtual void moveAndRename(const Zstring& pathFrom, const Zstring& pathTo) = 0; //throw FileError

    //switch to image mode: call before every transfer
    virtual void setBinaryMode() = 0; //throw FileError

    //writeBlock: all bytes must be consumed
    virtual void downloadFile(const Zstring& filePath, const std::function<void(const void* buffer, size_t bytesToWrite)>& writeBlock /*throw X*/) = 0; //throw FileError, X

    //readBlock: returns 0 at end of stream; overwrites an existing file
    virtual void uploadFile(const Zstring& filePath, const std::function<size_t(void* buffer, size_t bytesToRead)>& readBlock /*throw X*/) = 0; //throw FileError, X
};


//THREAD-SAFETY: openSession() is called concurrently by all transfer workers
class ConnectionFactory
{
public:
    virtual ~ConnectionFactory() {}

    virtual std::unique_ptr<RemoteSession> openSession() const = 0; //throw ErrorConnection

    virtual std::wstring getDisplayName() const = 0;
};

//------------------------------------------------------------------------------------------

//"mkdir -p": returns number of folders created; tolerates concurrent creation
size_t createFolderIfMissingRecursion(RemoteSession& session, const Zstring& folderPath); //throw FileError

inline Zstring appendRemotePath(const Zstring& basePath, const Zstring& relPath) { return zen::appendPath(basePath, relPath); }
}

#endif //ABSTRACT_H_873450978453042524534234
