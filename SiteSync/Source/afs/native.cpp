// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "native.h"
#include <cstddef>
#include <zen/file_io.h>
#include <zen/file_traverser.h>

using namespace zen;
using namespace sitesync;


namespace
{
class NativeSession : public RemoteSession
{
public:
    explicit NativeSession(const Zstring& rootPath) : rootPath_(rootPath) {}

    std::wstring getDisplayPath(const Zstring& itemPath) const override { return utfTo<std::wstring>(getNativePath(itemPath)); }

    std::optional<ItemType> getItemTypeIfExists(const Zstring& itemPath) override //throw FileError
    {
        return zen::getItemTypeIfExists(getNativePath(itemPath)); //throw FileError
    }

    std::vector<RemoteItem> readFolder(const Zstring& folderPath) override //throw FileError
    {
        std::vector<RemoteItem> items;

        traverseFolder(getNativePath(folderPath),
        [&](const FileInfo& fi) { items.push_back({fi.itemName, ItemType::file, fi.fileSize, fi.modTime}); },
        [&](const FolderInfo& fi) { items.push_back({fi.itemName, ItemType::folder}); },
        [&](const SymlinkInfo& si) { items.push_back({si.itemName, ItemType::symlink}); }); //throw FileError

        return items;
    }

    std::optional<time_t> getModTime(const Zstring& filePath) override //throw FileError
    {
        return getFileModTime(getNativePath(filePath)); //throw FileError
    }

    uint64_t getFileSize(const Zstring& filePath) override //throw FileError
    {
        return zen::getFileSize(getNativePath(filePath)); //throw FileError
    }

    void createFolder(const Zstring& folderPath) override //throw FileError, ErrorTargetExisting
    {
        createDirectory(getNativePath(folderPath)); //throw FileError, ErrorTargetExisting
    }

    void removeFile(const Zstring& filePath) override //throw FileError
    {
        const Zstring nativePath = getNativePath(filePath);

        if (getItemType(nativePath) == ItemType::symlink) //throw FileError
            removeSymlinkPlain(nativePath); //throw FileError
        else
            removeFilePlain(nativePath); //throw FileError
    }

    void removeFolder(const Zstring& folderPath) override //throw FileError
    {
        removeDirectoryPlain(getNativePath(folderPath)); //throw FileError
    }

    void moveAndRename(const Zstring& pathFrom, const Zstring& pathTo) override //throw FileError
    {
        moveAndRenameItem(getNativePath(pathFrom), getNativePath(pathTo), true /*replaceExisting*/); //throw FileError, (ErrorTargetExisting)
    }

    void setBinaryMode() override {} //local files have no transfer mode

    void downloadFile(const Zstring& filePath, const std::function<void(const void* buffer, size_t bytesToWrite)>& writeBlock /*throw X*/) override //throw FileError, X
    {
        FileInput fileIn(getNativePath(filePath)); //throw FileError

        std::vector<std::byte> buffer(blockSize_);
        for (;;)
        {
            const size_t bytesRead = fileIn.read(buffer.data(), buffer.size()); //throw FileError
            if (bytesRead > 0)
                writeBlock(buffer.data(), bytesRead); //throw X

            if (bytesRead != buffer.size()) //end of file
                break;
        }
    }

    void uploadFile(const Zstring& filePath, const std::function<size_t(void* buffer, size_t bytesToRead)>& readBlock /*throw X*/) override //throw FileError, X
    {
        const Zstring nativePath = getNativePath(filePath);

        if (zen::getItemTypeIfExists(nativePath) == ItemType::file) //throw FileError
            removeFilePlain(nativePath); //throw FileError

        FileOutput fileOut(nativePath); //throw FileError, ErrorTargetExisting

        std::vector<std::byte> buffer(blockSize_);
        while (const size_t bytesRead = readBlock(buffer.data(), buffer.size())) //throw X
            fileOut.write(buffer.data(), bytesRead); //throw FileError, ErrorInsufficientSpace

        fileOut.finalize(); //throw FileError
    }

private:
    Zstring getNativePath(const Zstring& itemPath) const
    {
        Zstring relPath = itemPath;
        trim(relPath, TrimSide::both, [](Zchar c) { return c == FILE_NAME_SEPARATOR; });
        return appendPath(rootPath_, relPath);
    }

    const Zstring rootPath_;
    const size_t blockSize_ = 64 * 1024;
};


class NativeConnectionFactory : public ConnectionFactory
{
public:
    explicit NativeConnectionFactory(const Zstring& rootPath) : rootPath_(rootPath) {}

    std::unique_ptr<RemoteSession> openSession() const override //throw ErrorConnection
    {
        try
        {
            if (getItemType(rootPath_) != ItemType::folder) //throw FileError
                throw FileError(replaceCpy(_("Cannot find folder %x."), L"%x", fmtPath(rootPath_)));
        }
        catch (const FileError& e)
        {
            throw ErrorConnection(replaceCpy(_("Unable to connect to %x."), L"%x", fmtPath(getDisplayName())), e.toString());
        }
        return std::make_unique<NativeSession>(rootPath_);
    }

    std::wstring getDisplayName() const override { return utfTo<std::wstring>(rootPath_); }

private:
    const Zstring rootPath_;
};
}


std::unique_ptr<ConnectionFactory> sitesync::createNativeConnectionFactory(const Zstring& rootPath)
{
    Zstring path = trimCpy(rootPath);
    if (path.size() > 1 && endsWith(path, FILE_NAME_SEPARATOR))
        path.pop_back();

    return std::make_unique<NativeConnectionFactory>(path);
}


bool sitesync::acceptsPathPhraseNative(const Zstring& pathPhrase) //noexcept
{
    const Zstring path = trimCpy(pathPhrase);
    return startsWith(path, FILE_NAME_SEPARATOR) || startsWith(path, Zstr("./")) || path == Zstr(".");
}
