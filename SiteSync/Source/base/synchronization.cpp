// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "synchronization.h"
#include <algorithm>
#include <deque>
#include <unordered_map>
#include <zen/file_access.h>
#include "sync_decision.h"
#include "tree_scanner.h"
#include "transfer_worker.h"
#include "remote_purger.h"

using namespace zen;
using namespace sitesync;


namespace
{
//FIFO of not yet started transfers: shared by all workers
class Workload
{
public:
    explicit Workload(std::vector<TransferTask>&& tasks) : pendingTasks_(tasks.begin(), tasks.end()) {}

    //context of worker thread: none if all tasks are taken
    std::optional<TransferTask> getNext() //throw ThreadStopRequest
    {
        interruptionPoint(); //throw ThreadStopRequest; cancel between files, never in the middle of one

        std::lock_guard dummy(lockWork_);
        if (pendingTasks_.empty())
            return std::nullopt;

        TransferTask task = std::move(pendingTasks_.front());
        pendingTasks_.pop_front();
        return task;
    }

private:
    Workload           (const Workload&) = delete;
    Workload& operator=(const Workload&) = delete;

    std::mutex lockWork_;
    std::deque<TransferTask> pendingTasks_;
};


Zstring appendRelPath(const Zstring& basePath, const Zstring& relPath)
{
    return relPath.empty() ? basePath : appendPath(basePath, relPath);
}


struct ScanResult
{
    std::vector<TransferTask> tasks;
    uint64_t skipped  = 0;
    uint64_t conflicts = 0; //destination name taken by a folder or symlink
    uint64_t dirsCreated = 0;
};


template <class Scanner>
ScanResult buildTaskList(Scanner& scanner, const Zstring& remoteRoot, const Zstring& localRoot, const SyncConfig& cfg, ProcessCallback& cb) //throw ErrorRemoteNotFound, ErrorScan, X
{
    ScanResult result;

    while (const std::optional<FolderListing> folder = scanner.next()) //throw ErrorRemoteNotFound, ErrorScan
    {
        const Zstring remoteFolderPath = appendRelPath(remoteRoot, folder->relPath);
        const Zstring localFolderPath  = appendRelPath(localRoot,  folder->relPath);

        cb.updateStatus(replaceCpy(_("Scanning:") + L" %x", L"%x", fmtPath(cfg.direction == SyncDirection::download ? remoteFolderPath : localFolderPath))); //throw X

        for (const FileMetadata& source : folder->sourceFiles)
        {
            const Zstring itemName = getItemName(source.path);

            bool targetExists = false;
            std::optional<time_t> targetModTime;

            if (!cfg.purgeBefore) //destination was cleared: its state is irrelevant
                if (auto it = folder->targetItems.find(itemName);
                    it != folder->targetItems.end())
                {
                    if (it->second.type != ItemType::file)
                    {
                        cb.logMessage(replaceCpy(_("Cannot copy file %x."), L"%x", fmtPath(source.path)) + L"\n\n" +
                                      replaceCpy(_("The name %x is already used by another item."), L"%x", fmtPath(itemName)), PhaseCallback::MsgType::error); //throw X
                        ++result.conflicts;
                        continue;
                    }
                    targetExists  = true;
                    targetModTime = it->second.modTime;
                }

            if (shouldTransfer(targetExists, targetModTime, source.modTime))
            {
                TransferTask task{appendRemotePath(remoteFolderPath, itemName),
                                  appendPath(localFolderPath, itemName),
                                  source.sizeBytes,
                                  cfg.direction};
                if (cfg.direction == SyncDirection::upload && !cfg.dryRun) //remote folder was listed: spare the worker another listing
                    task.staleMarkerFound = folder->targetItems.contains(getTempMarkerName(itemName));

                result.tasks.push_back(std::move(task));
            }
            else
                ++result.skipped;
        }

        cb.updateDataProcessed(static_cast<int>(folder->sourceFiles.size()), 0); //noexcept
        cb.requestUiUpdate(); //throw X
    }

    result.dirsCreated = scanner.getDirsCreated();
    return result;
}


//several upload sources may map to the same remote file: the later source wins
void mergeScanResult(ScanResult& total, ScanResult&& part, ProcessCallback& cb) //throw X
{
    std::unordered_map<Zstring, size_t> taskIdxByRemotePath;
    for (size_t i = 0; i < total.tasks.size(); ++i)
        taskIdxByRemotePath.emplace(total.tasks[i].remotePath, i);

    for (TransferTask& task : part.tasks)
        if (auto it = taskIdxByRemotePath.find(task.remotePath);
            it != taskIdxByRemotePath.end())
        {
            TransferTask& taskOld = total.tasks[it->second];
            cb.logMessage(replaceCpy(replaceCpy(_("File %x is replaced by %y from another source folder."),
                                                L"%x", fmtPath(taskOld.localPath)),
                                     L"%y", fmtPath(task.localPath)), PhaseCallback::MsgType::warning); //throw X
            taskOld = std::move(task);
            ++total.skipped;
        }
        else
        {
            taskIdxByRemotePath.emplace(task.remotePath, total.tasks.size());
            total.tasks.push_back(std::move(task));
        }

    total.skipped     += part.skipped;
    total.conflicts   += part.conflicts;
    total.dirsCreated += part.dirsCreated;
}
}


bool sitesync::isSyncSuccessful(const SyncStats& stats, double successThreshold)
{
    const uint64_t attempted = stats.transferred + stats.failed;
    if (attempted == 0) //nothing to transfer
        return true;

    return static_cast<double>(stats.transferred) / static_cast<double>(attempted) >= successThreshold;
}


SyncResult sitesync::synchronize(const ConnectionFactory& connFactory, const SyncConfig& cfg, ProcessCallback& callback) //throw ErrorConnection, ErrorRemoteNotFound, ErrorScan, ErrorPurge, X
{
    const std::vector<std::pair<Zstring, Zstring>> uploadPairs = cfg.direction == SyncDirection::upload ? getUploadFolderPairs(cfg) : std::vector<std::pair<Zstring, Zstring>>();

    std::wstring localDisplay = fmtPath(cfg.localRoot);
    if (!uploadPairs.empty())
    {
        localDisplay.clear();
        for (const auto& [localPath, remotePath] : uploadPairs)
            localDisplay += (localDisplay.empty() ? L"" : L", ") + fmtPath(localPath);
    }

    callback.logMessage(replaceCpy(replaceCpy(replaceCpy(_("Starting %x: %y <-> %z"),
                                                         L"%x", getDirectionName(cfg.direction)),
                                              L"%y", connFactory.getDisplayName()),
                                   L"%z", localDisplay), PhaseCallback::MsgType::info); //throw X

    if (cfg.dryRun)
        callback.logMessage(_("Dry run: nothing will be changed"), PhaseCallback::MsgType::info); //throw X

    //------------------- scan connection -------------------
    std::unique_ptr<RemoteSession> scanSession = connFactory.openSession(); //throw ErrorConnection

    //check source root *before* deleting anything at the destination
    if (cfg.direction == SyncDirection::download)
    {
        std::optional<ItemType> rootType;
        try { rootType = scanSession->getItemTypeIfExists(cfg.remoteRoot); } //throw FileError
        catch (const FileError& e) { throw ErrorScan(e.toString()); }

        if (!rootType)
            throw ErrorRemoteNotFound(replaceCpy(_("Cannot find folder %x."), L"%x", fmtPath(scanSession->getDisplayPath(cfg.remoteRoot))));
    }
    else
        for (const auto& [localPath, remotePath] : uploadPairs)
        {
            std::optional<ItemType> rootType;
            try { rootType = getItemTypeIfExists(localPath); } //throw FileError
            catch (const FileError& e) { throw ErrorScan(e.toString()); }

            if (!rootType)
                throw ErrorScan(replaceCpy(_("Cannot find folder %x."), L"%x", fmtPath(localPath)));
        }

    //------------------- purge -------------------
    if (cfg.purgeBefore)
    {
        const std::wstring purgeFolderDisplay = cfg.direction == SyncDirection::download ?
                                                fmtPath(cfg.localRoot) : fmtPath(scanSession->getDisplayPath(cfg.remoteRoot));
        if (cfg.dryRun)
            callback.logMessage(replaceCpy(_("Dry run: all items in %x would be deleted"), L"%x", purgeFolderDisplay), PhaseCallback::MsgType::info); //throw X
        else
        {
            callback.initNewPhase(-1, -1, ProcessPhase::purge); //throw X

            auto onBeforeDelete = [&](const std::wstring& displayPath)
            {
                callback.updateStatus(replaceCpy(_("Deleting %x"), L"%x", fmtPath(displayPath))); //throw X
                callback.updateDataProcessed(1, 0); //noexcept
                callback.requestUiUpdate(); //throw X
            };

            if (cfg.direction == SyncDirection::download)
            {
                callback.logMessage(replaceCpy(_("Purging local folder %x"), L"%x", purgeFolderDisplay), PhaseCallback::MsgType::info); //throw X
                purgeLocalFolder(cfg.localRoot, onBeforeDelete); //throw ErrorPurge, X
            }
            else
            {
                callback.logMessage(replaceCpy(_("Purging remote folder %x"), L"%x", purgeFolderDisplay), PhaseCallback::MsgType::info); //throw X
                purgeRemoteFolder(*scanSession, cfg.remoteRoot, onBeforeDelete); //throw ErrorPurge, X
            }
        }
    }

    //------------------- scan -------------------
    callback.initNewPhase(-1, -1, ProcessPhase::scan); //throw X

    ScanResult scan;
    if (cfg.direction == SyncDirection::download)
    {
        RemoteTreeScanner scanner(*scanSession, cfg.remoteRoot, cfg.localRoot, !cfg.dryRun);
        scan = buildTaskList(scanner, cfg.remoteRoot, cfg.localRoot, cfg, callback); //throw ErrorRemoteNotFound, ErrorScan, X
    }
    else
        for (const auto& [localPath, remotePath] : uploadPairs)
        {
            if (uploadPairs.size() > 1)
                callback.logMessage(replaceCpy(replaceCpy(_("Source folder %x to %y"), L"%x", fmtPath(localPath)),
                                               L"%y", fmtPath(scanSession->getDisplayPath(remotePath))), PhaseCallback::MsgType::info); //throw X

            LocalTreeScanner scanner(*scanSession, localPath, remotePath, !cfg.dryRun);
            mergeScanResult(scan, buildTaskList(scanner, remotePath, localPath, cfg, callback), callback); //throw ErrorScan, X
        }
    scanSession.reset(); //workers use their own connections

    //small files first
    std::stable_sort(scan.tasks.begin(), scan.tasks.end(), [](const TransferTask& lhs, const TransferTask& rhs) { return lhs.sizeBytes < rhs.sizeBytes; });

    SyncStats stats;
    stats.skipped     = scan.skipped;
    stats.failed      = scan.conflicts;
    stats.dirsCreated = scan.dirsCreated;

    callback.logMessage(replaceCpy(replaceCpy(_("Files to copy: %x, up to date: %y"),
                                              L"%x", numberTo<std::wstring>(scan.tasks.size())),
                                   L"%y", numberTo<std::wstring>(scan.skipped)), PhaseCallback::MsgType::info); //throw X

    //------------------- transfer -------------------
    int64_t bytesTotal = 0;
    for (const TransferTask& task : scan.tasks)
        bytesTotal += static_cast<int64_t>(task.sizeBytes);

    callback.initNewPhase(static_cast<int>(scan.tasks.size()), bytesTotal, ProcessPhase::sync); //throw X

    if (cfg.dryRun)
        for (const TransferTask& task : scan.tasks)
            callback.logMessage(replaceCpy(task.direction == SyncDirection::download ? _("Dry run: would download file %x") : _("Dry run: would upload file %x"),
                                           L"%x", fmtPath(task.direction == SyncDirection::download ? task.localPath : task.remotePath)), PhaseCallback::MsgType::info); //throw X
    else if (!scan.tasks.empty())
    {
        const size_t threadCount = std::min(std::max<size_t>(cfg.settings.maxWorkers, 1), scan.tasks.size());

        Protected<std::vector<TransferOutcome>> outcomes; //completion order

        AsyncCallback acb(threadCount);       //
        Workload workload(std::move(scan.tasks)); //manage life time: enclose InterruptibleThread's!!!

        std::vector<InterruptibleThread> worker;
        ZEN_ON_SCOPE_EXIT( for (InterruptibleThread& wt : worker) wt.requestStop(); ); //stop *all* at the same time before join!

        for (size_t threadIdx = 0; threadIdx < threadCount; ++threadIdx)
        {
            Zstring threadName = Zstr("Transfer[") + numberTo<Zstring>(threadIdx + 1) + Zstr('/') + numberTo<Zstring>(threadCount) + Zstr(']');

            worker.emplace_back([&connFactory, &cfg, &acb, &workload, &outcomes, threadName = std::move(threadName)]
            {
                setCurrentThreadName(threadName);
                ZEN_ON_SCOPE_EXIT(acb.notifyWorkEnd());

                TransferWorker transferWorker(connFactory, cfg.settings, acb); //owns this thread's connection

                while (std::optional<TransferTask> task = workload.getNext()) //throw ThreadStopRequest
                {
                    acb.notifyTaskBegin();
                    ZEN_ON_SCOPE_EXIT(acb.notifyTaskEnd());

                    TransferOutcome outcome = transferWorker.transfer(*task); //throw ThreadStopRequest
                    outcomes.access([&](std::vector<TransferOutcome>& o) { o.push_back(std::move(outcome)); });
                }
            });
        }

        acb.waitUntilDone(UI_UPDATE_INTERVAL / 2 /*every ~50 ms*/, callback); //throw X

        //all workers are done: aggregate on this thread only
        outcomes.access([&](const std::vector<TransferOutcome>& o)
        {
            for (const TransferOutcome& outcome : o)
                if (outcome.success)
                    ++stats.transferred;
                else
                    ++stats.failed;
        });
    }

    SyncResult result{isSyncSuccessful(stats, cfg.settings.successThreshold), stats};

    const std::wstring summary = replaceCpy(replaceCpy(replaceCpy(replaceCpy(_("Transferred: %a, skipped: %b, failed: %c, folders created: %d"),
                                                                             L"%a", numberTo<std::wstring>(stats.transferred)),
                                                                  L"%b", numberTo<std::wstring>(stats.skipped)),
                                                       L"%c", numberTo<std::wstring>(stats.failed)),
                                            L"%d", numberTo<std::wstring>(stats.dirsCreated));

    callback.logMessage(summary, result.success ? PhaseCallback::MsgType::info : PhaseCallback::MsgType::error); //throw X
    return result;
}
