// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef TEST_UTIL_H_23948572093485
#define TEST_UTIL_H_23948572093485

#include <algorithm>
#include <atomic>
#include <cassert>
#include <cstdlib>
#include <iostream>
#include <map>
#include <mutex>
#include <set>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include <zen/file_access.h>
#include <zen/file_io.h>
#include <zen/thread.h>
#include "../SiteSync/Source/afs/native.h"
#include "../SiteSync/Source/base/structures.h"
#include "../SiteSync/Source/base/status_handler_impl.h"


namespace sitesync::test
{
//fresh folder below /tmp, deleted on scope exit
class TempFolder
{
public:
    TempFolder()
    {
        char pathTmpl[] = "/tmp/sitesync_test_XXXXXX";
        const char* path = ::mkdtemp(pathTmpl);
        assert(path);
        path_ = path;
    }

    ~TempFolder()
    {
        try { zen::removeDirectoryPlainRecursion(path_); } //throw FileError
        catch (const zen::FileError& e) { std::cerr << zen::utfTo<std::string>(e.toString()) << std::endl; }
    }

    const Zstring& path() const { return path_; }

    Zstring operator/(const Zstring& relPath) const { return zen::appendPath(path_, relPath); }

private:
    TempFolder           (const TempFolder&) = delete;
    TempFolder& operator=(const TempFolder&) = delete;

    Zstring path_;
};


inline void writeFile(const Zstring& filePath, const std::string& content) //throw FileError
{
    if (const std::optional<Zstring> parentPath = zen::getParentFolderPath(filePath))
        zen::createDirectoryIfMissingRecursion(*parentPath); //throw FileError
    zen::setFileContent(filePath, content, nullptr); //throw FileError
}


inline std::string readFile(const Zstring& filePath) //throw FileError
{
    return zen::getFileContent(filePath, nullptr); //throw FileError
}


inline bool exists(const Zstring& itemPath) { return zen::itemExists(itemPath); } //throw FileError


inline void setModTime(const Zstring& itemPath, time_t modTime)
{
    const timespec times[2] = {{modTime, 0}, {modTime, 0}};
    [[maybe_unused]] const int rv = ::utimensat(AT_FDCWD, itemPath.c_str(), times, AT_SYMLINK_NOFOLLOW);
    assert(rv == 0);
}


inline std::string makeContent(size_t size, char seed)
{
    std::string content(size, '\0');
    for (size_t i = 0; i < size; ++i)
        content[i] = static_cast<char>(seed + i % 61);
    return content;
}

//------------------------------------------------------------------------------------------

//errors to raise on file transfers, by file name (without ".in." prefix)
class FaultPlan
{
public:
    void addPermanentFailure(const Zstring& fileName) { std::lock_guard dummy(lock_); permanent_.insert(fileName); }
    void addTransientFailures(const Zstring& fileName, int count) { std::lock_guard dummy(lock_); transient_[fileName] += count; }

    void checkTransfer(const Zstring& itemPath) //throw FileError, ErrorTransferPermanent
    {
        Zstring fileName = zen::getItemName(itemPath);
        if (isTempMarkerName(fileName))
            fileName = fileName.substr(zen::strLength(TEMP_MARKER_PREFIX));

        std::lock_guard dummy(lock_);
        if (permanent_.contains(fileName))
            throw ErrorTransferPermanent(zen::replaceCpy<std::wstring>(L"Cannot write file %x.", L"%x", zen::fmtPath(itemPath)), L"550 Permission denied.");

        if (auto it = transient_.find(fileName);
            it != transient_.end() && it->second > 0)
        {
            --it->second;
            throw zen::FileError(zen::replaceCpy<std::wstring>(L"Cannot write file %x.", L"%x", zen::fmtPath(itemPath)), L"Connection reset by peer.");
        }
    }

    void addModTimeFailure(const Zstring& fileName) { std::lock_guard dummy(lock_); modTimeFailing_.insert(fileName); }
    void addRemoveFailure (const Zstring& fileName) { std::lock_guard dummy(lock_); removeFailing_ .insert(fileName); }

    //emulate servers listing no times: scanner has to ask for each file
    void setListingWithoutTimes(bool noTimes) { listingWithoutTimes_ = noTimes; }
    bool isListingWithoutTimes() const { return listingWithoutTimes_; }

    void notifyItemTypeRequest() { ++itemTypeRequests_; }
    int getItemTypeRequests() const { return itemTypeRequests_; }

    void checkModTime(const Zstring& itemPath) //throw ErrorTransferPermanent
    {
        ++modTimeRequests_;
        std::lock_guard dummy(lock_);
        if (modTimeFailing_.contains(zen::getItemName(itemPath)))
            throw ErrorTransferPermanent(zen::replaceCpy<std::wstring>(L"Cannot read modification time of %x.", L"%x", zen::fmtPath(itemPath)), L"550 Permission denied.");
    }

    void checkRemove(const Zstring& itemPath) //throw FileError
    {
        std::lock_guard dummy(lock_);
        if (removeFailing_.contains(zen::getItemName(itemPath)))
            throw zen::FileError(zen::replaceCpy<std::wstring>(L"Cannot delete file %x.", L"%x", zen::fmtPath(itemPath)), L"550 Permission denied.");
    }

    void notifySessionOpened() { ++sessionsOpened_; }
    int getSessionsOpened() const { return sessionsOpened_; }
    int getModTimeRequests() const { return modTimeRequests_; }

private:
    std::mutex lock_;
    std::set<Zstring> permanent_;
    std::map<Zstring, int> transient_;
    std::set<Zstring> modTimeFailing_;
    std::set<Zstring> removeFailing_;
    std::atomic<bool> listingWithoutTimes_{false};
    std::atomic<int> sessionsOpened_{0};
    std::atomic<int> modTimeRequests_{0};
    std::atomic<int> itemTypeRequests_{0};
};


class FaultySession : public RemoteSession
{
public:
    FaultySession(std::unique_ptr<RemoteSession>&& session, FaultPlan& plan) : session_(std::move(session)), plan_(plan) {}

    std::wstring getDisplayPath(const Zstring& itemPath) const override { return session_->getDisplayPath(itemPath); }
    std::optional<zen::ItemType> getItemTypeIfExists(const Zstring& itemPath) override
    {
        plan_.notifyItemTypeRequest();
        return session_->getItemTypeIfExists(itemPath);
    }
    std::vector<RemoteItem> readFolder(const Zstring& folderPath) override
    {
        std::vector<RemoteItem> items = session_->readFolder(folderPath);
        if (plan_.isListingWithoutTimes())
            for (RemoteItem& item : items)
                item.modTime.reset();
        return items;
    }

    std::optional<time_t> getModTime(const Zstring& filePath) override
    {
        plan_.checkModTime(filePath); //throw ErrorTransferPermanent
        return session_->getModTime(filePath);
    }
    uint64_t getFileSize(const Zstring& filePath) override { return session_->getFileSize(filePath); }
    void createFolder(const Zstring& folderPath) override { session_->createFolder(folderPath); }
    void removeFile  (const Zstring& filePath  ) override { plan_.checkRemove(filePath); session_->removeFile(filePath); }
    void removeFolder(const Zstring& folderPath) override { session_->removeFolder(folderPath); }
    void moveAndRename(const Zstring& pathFrom, const Zstring& pathTo) override { session_->moveAndRename(pathFrom, pathTo); }
    void setBinaryMode() override { session_->setBinaryMode(); }

    void downloadFile(const Zstring& filePath, const std::function<void(const void* buffer, size_t bytesToWrite)>& writeBlock) override
    {
        plan_.checkTransfer(filePath); //throw FileError
        session_->downloadFile(filePath, writeBlock);
    }

    void uploadFile(const Zstring& filePath, const std::function<size_t(void* buffer, size_t bytesToRead)>& readBlock) override
    {
        plan_.checkTransfer(filePath); //throw FileError
        session_->uploadFile(filePath, readBlock);
    }

private:
    const std::unique_ptr<RemoteSession> session_;
    FaultPlan& plan_;
};


//native backend with injected transfer errors
class FaultyConnectionFactory : public ConnectionFactory
{
public:
    FaultyConnectionFactory(const Zstring& rootPath, FaultPlan& plan) : factory_(createNativeConnectionFactory(rootPath)), plan_(plan) {}

    std::unique_ptr<RemoteSession> openSession() const override
    {
        plan_.notifySessionOpened();
        return std::make_unique<FaultySession>(factory_->openSession(), plan_);
    }

    std::wstring getDisplayName() const override { return factory_->getDisplayName(); }

private:
    const std::unique_ptr<ConnectionFactory> factory_;
    FaultPlan& plan_;
};

//------------------------------------------------------------------------------------------

struct TestCallback : public ProcessCallback
{
    void initNewPhase(int itemsTotal, int64_t bytesTotal, ProcessPhase phaseId) override { phases.push_back(phaseId); }

    void updateDataProcessed(int itemsDelta, int64_t bytesDelta) override { itemsProcessed += itemsDelta; bytesProcessed += bytesDelta; }
    void updateDataTotal    (int itemsDelta, int64_t bytesDelta) override {}
    void requestUiUpdate(bool force) override {}
    void updateStatus(const std::wstring& msg) override {}

    void logMessage(const std::wstring& msg, MsgType type) override
    {
        switch (type)
        {
            case MsgType::info:
                break;
            case MsgType::warning:
                ++warnings;
                break;
            case MsgType::error:
                ++errors;
                break;
        }
        messages.push_back(msg);
    }

    void reportFatalError(const std::wstring& msg) override { logMessage(msg, MsgType::error); }

    std::vector<ProcessPhase> phases;
    std::vector<std::wstring> messages;
    int warnings = 0;
    int errors   = 0;
    int itemsProcessed = 0;
    int64_t bytesProcessed = 0;
};


//run "fun" on a single worker thread while this (main) thread forwards its log messages
template <class Function>
void runOnWorkerThread(Function fun, PhaseCallback& cb)
{
    AsyncCallback acb(1);

    zen::InterruptibleThread worker([&]
    {
        ZEN_ON_SCOPE_EXIT(acb.notifyWorkEnd());
        fun(acb); //throw ThreadStopRequest
    });

    acb.waitUntilDone(std::chrono::milliseconds(10), cb);
}
}

#endif //TEST_UTIL_H_23948572093485
