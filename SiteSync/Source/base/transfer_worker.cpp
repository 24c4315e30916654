// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "transfer_worker.h"
#include <zen/file_io.h>
#include "tree_scanner.h" //createLocalFolderIfMissingRecursion

using namespace zen;
using namespace sitesync;


namespace
{
const size_t MAX_BACKOFF_EXPONENT = 10;
const int MARKER_NAME_VARIANTS_MAX = 10;

//variant > 0: ".in.<name>.<variant>"
Zstring getMarkerPath(const Zstring& filePath, int variant)
{
    Zstring markerName = getTempMarkerName(getItemName(filePath));
    if (variant > 0)
        markerName += Zstr('.') + numberTo<Zstring>(variant);

    if (const std::optional<Zstring> parentPath = getParentFolderPath(filePath);
        parentPath && !parentPath->empty())
        return appendPath(*parentPath, markerName);
    return markerName;
}


/*  remove a stale marker left by an interrupted run
    an undeletable one (e.g. a folder of the same name) is reported and the next marker name is used instead  */
template <class GetItemTypeIfExists, class RemoveFile>
Zstring prepareMarkerPath(const Zstring& filePath, bool staleMarkerPossible,
                          GetItemTypeIfExists getItemTypeIfExists, RemoveFile removeFile, AsyncCallback& acb) //throw FileError, ThreadStopRequest
{
    for (int variant = 0;; ++variant)
    {
        const Zstring markerPath = getMarkerPath(filePath, variant);

        if (variant == 0 && !staleMarkerPossible)
            return markerPath;
        try
        {
            if (getItemTypeIfExists(markerPath)) //throw FileError
                removeFile(markerPath); //throw FileError
            return markerPath;
        }
        catch (const ErrorConnection&) { throw; }
        catch (const FileError& e)
        {
            if (variant + 1 >= MARKER_NAME_VARIANTS_MAX)
                throw;
            acb.logMessage(e.toString(), PhaseCallback::MsgType::warning); //throw ThreadStopRequest
        }
    }
}


std::wstring getVerificationError(const std::wstring& displayPath, uint64_t sizeExpected, uint64_t sizeActual)
{
    return replaceCpy(replaceCpy(replaceCpy(_("File %x has an invalid size. Expected: %y bytes, actual: %z bytes."),
                                            L"%x", fmtPath(displayPath)),
                                 L"%y", numberTo<std::wstring>(sizeExpected)),
                      L"%z", numberTo<std::wstring>(sizeActual));
}
}


RemoteSession& TransferWorker::getSession() //throw ErrorConnection
{
    if (!session_)
        session_ = connFactory_.openSession(); //throw ErrorConnection
    return *session_;
}


TransferOutcome TransferWorker::transfer(const TransferTask& task) //throw ThreadStopRequest
{
    const Zstring& targetPath = task.direction == SyncDirection::download ? task.localPath : task.remotePath;

    acb_.updateStatus(replaceCpy(task.direction == SyncDirection::download ? _("Downloading file %x") : _("Uploading file %x"),
                                 L"%x", fmtPath(targetPath))); //throw ThreadStopRequest
    TransferOutcome outcome{task};

    for (size_t attempt = 0; attempt < settings_.retry.attempts; ++attempt)
    {
        TransferTask attemptTask = task;
        if (attempt > 0) //a failed attempt may have left a marker: what the scan found is outdated
            attemptTask.staleMarkerFound.reset();

        const AttemptResult result = attemptTransfer(attemptTask); //throw ThreadStopRequest
        outcome.attempts = attempt + 1;
        outcome.errorMsg = result.errorMsg;

        switch (result.status)
        {
            case AttemptStatus::success:
                outcome.success = true;
                acb_.updateDataProcessed(1, static_cast<int64_t>(task.sizeBytes));
                acb_.logMessage(replaceCpy(task.direction == SyncDirection::download ? _("Downloaded file %x") : _("Uploaded file %x"),
                                           L"%x", fmtPath(targetPath)), PhaseCallback::MsgType::info); //throw ThreadStopRequest
                return outcome;

            case AttemptStatus::fatal:
                outcome.permanent = true;
                acb_.updateDataProcessed(1, 0);
                acb_.logMessage(result.errorMsg, PhaseCallback::MsgType::error); //throw ThreadStopRequest
                return outcome;

            case AttemptStatus::retryable:
                break;
        }

        if (attempt + 1 < settings_.retry.attempts)
        {
            const auto delay = settings_.retry.baseDelay * (int64_t(1) << std::min<size_t>(attempt, MAX_BACKOFF_EXPONENT));

            acb_.logMessage(result.errorMsg + L"\n\n" +
                            replaceCpy(replaceCpy(_("Retrying operation after %x ms... (attempt %y)"),
                                                  L"%x", numberTo<std::wstring>(delay.count())),
                                       L"%y", numberTo<std::wstring>(attempt + 2)), PhaseCallback::MsgType::warning); //throw ThreadStopRequest

            interruptibleSleep(delay); //throw ThreadStopRequest
        }
    }

    acb_.updateDataProcessed(1, 0);
    acb_.logMessage(outcome.errorMsg, PhaseCallback::MsgType::error); //throw ThreadStopRequest
    return outcome;
}


AttemptResult TransferWorker::attemptTransfer(const TransferTask& task) //throw ThreadStopRequest
{
    AttemptResult result;
    try
    {
        RemoteSession& session = getSession(); //throw ErrorConnection

        if (task.direction == SyncDirection::download)
            download(session, task); //throw FileError, ThreadStopRequest
        else
            upload(session, task); //throw FileError, ThreadStopRequest

        return result;
    }
    catch (const ErrorTransferPermanent& e) { result = {AttemptStatus::fatal, e.toString()}; }
    catch (const ErrorAccessDenied&      e) { result = {AttemptStatus::fatal, e.toString()}; }
    catch (const ErrorInsufficientSpace& e) { result = {AttemptStatus::fatal, e.toString()}; }
    catch (const FileError&              e) { result = {AttemptStatus::retryable, e.toString()}; }

    //state of the connection is unknown after any error: always start over
    session_.reset();
    return result;
}


void TransferWorker::download(RemoteSession& session, const TransferTask& task) //throw FileError, ThreadStopRequest
{
    if (const std::optional<Zstring> parentPath = getParentFolderPath(task.localPath);
        parentPath && !parentPath->empty())
        createLocalFolderIfMissingRecursion(*parentPath); //throw FileError

    const Zstring markerPath = prepareMarkerPath(task.localPath, task.staleMarkerFound.value_or(true),
    [](const Zstring& itemPath) { return getItemTypeIfExists(itemPath); }, //throw FileError
    [](const Zstring& itemPath) { removeFilePlain(itemPath); }, acb_); //throw FileError, ThreadStopRequest

    session.setBinaryMode(); //throw FileError

    FileOutput fileOut(markerPath); //throw FileError, ErrorTargetExisting

    if (task.sizeBytes > settings_.chunk.largeFileThreshold)
        session.downloadFile(task.remotePath, [&](const void* buffer, size_t bytesToWrite)
    {
        fileOut.write(buffer, bytesToWrite); //throw FileError, ErrorInsufficientSpace
    }); //throw FileError
    else
    {
        std::string buffer;
        buffer.reserve(task.sizeBytes);

        session.downloadFile(task.remotePath, [&](const void* data, size_t bytesToWrite)
        {
            buffer.append(static_cast<const char*>(data), bytesToWrite);
        }); //throw FileError

        if (!buffer.empty())
            fileOut.write(buffer.data(), buffer.size()); //throw FileError, ErrorInsufficientSpace
    }
    fileOut.finalize(); //throw FileError
    //------------------------------------------------------------------------------

    if (const uint64_t sizeActual = getFileSize(markerPath); //throw FileError
        sizeActual != task.sizeBytes)
    {
        const std::wstring errorMsg = getVerificationError(utfTo<std::wstring>(markerPath), task.sizeBytes, sizeActual);
        try { removeFilePlain(markerPath); /*throw FileError*/ }
        catch (const FileError& e) { throw ErrorVerification(errorMsg, e.toString()); }

        throw ErrorVerification(errorMsg);
    }

    moveAndRenameItem(markerPath, task.localPath, true /*replaceExisting*/); //throw FileError, (ErrorTargetExisting)
}


void TransferWorker::upload(RemoteSession& session, const TransferTask& task) //throw FileError, ThreadStopRequest
{
    if (!task.staleMarkerFound) //else: the scan has listed the parent folder, so it exists
        if (const std::optional<Zstring> parentPath = getParentFolderPath(task.remotePath);
            parentPath && !parentPath->empty())
            createFolderIfMissingRecursion(session, *parentPath); //throw FileError

    const Zstring markerPath = prepareMarkerPath(task.remotePath, task.staleMarkerFound.value_or(true),
    [&](const Zstring& itemPath) { return session.getItemTypeIfExists(itemPath); }, //throw FileError
    [&](const Zstring& itemPath) { session.removeFile(itemPath); }, acb_); //throw FileError, ThreadStopRequest

    session.setBinaryMode(); //throw FileError

    if (task.sizeBytes > settings_.chunk.largeFileThreshold)
    {
        FileInput fileIn(task.localPath); //throw FileError

        session.uploadFile(markerPath, [&](void* buffer, size_t bytesToRead)
        {
            return fileIn.read(buffer, std::min(bytesToRead, settings_.chunk.blockSize)); //throw FileError
        }); //throw FileError
    }
    else
    {
        const std::string content = getFileContent(task.localPath, nullptr /*notifyUnbufferedIO*/); //throw FileError
        size_t bytesSent = 0;

        session.uploadFile(markerPath, [&](void* buffer, size_t bytesToRead)
        {
            const size_t bytesToCopy = std::min(bytesToRead, content.size() - bytesSent);
            std::copy(content.data() + bytesSent, content.data() + bytesSent + bytesToCopy, static_cast<char*>(buffer));
            bytesSent += bytesToCopy;
            return bytesToCopy;
        }); //throw FileError
    }
    //------------------------------------------------------------------------------

    if (const uint64_t sizeActual = session.getFileSize(markerPath); //throw FileError
        sizeActual != task.sizeBytes)
        throw ErrorVerification(getVerificationError(session.getDisplayPath(markerPath), task.sizeBytes, sizeActual));

    session.moveAndRename(markerPath, task.remotePath); //throw FileError
}
