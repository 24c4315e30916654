// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef STRUCTURES_H_8210478915019450901745
#define STRUCTURES_H_8210478915019450901745

#include <chrono>
#include <optional>
#include <vector>
#include <zen/zstring.h>


namespace sitesync
{
enum class SyncDirection
{
    download, //remote -> local
    upload,   //local -> remote
};

std::wstring getDirectionName(SyncDirection direction);


//partially written target; never reported by the tree scanners
const Zchar TEMP_MARKER_PREFIX[] = Zstr(".in.");

inline Zstring getTempMarkerName(const Zstring& itemName) { return TEMP_MARKER_PREFIX + itemName; }
inline bool isTempMarkerName(const Zstring& itemName) { return zen::startsWith(itemName, TEMP_MARKER_PREFIX); }


struct FileMetadata
{
    Zstring path;
    uint64_t sizeBytes = 0;
    std::optional<time_t> modTime; //none: server cannot tell
};


//one file to copy: consumed by exactly one transfer worker
struct TransferTask
{
    Zstring remotePath; //absolute, '/'-separated
    Zstring localPath;
    uint64_t sizeBytes = 0;
    SyncDirection direction = SyncDirection::download;

    //the scan has listed the destination folder: it exists, and we know about a stale ".in.<name>" marker
    //none: check at the destination
    std::optional<bool> staleMarkerFound;
};


struct SyncStats
{
    uint64_t transferred = 0;
    uint64_t skipped     = 0;
    uint64_t failed      = 0;
    uint64_t dirsCreated = 0;

    bool operator==(const SyncStats&) const = default;
};


struct SyncResult
{
    bool success = false; //nothing to transfer or success rate >= threshold
    SyncStats stats;
};

//------------------------------------------------------------------------------------------

struct RetrySettings
{
    size_t attempts = 3; //in total, including the first one
    std::chrono::milliseconds baseDelay{1000}; //wait "baseDelay * 2^attempt" before the next attempt
};


struct ChunkSettings
{
    uint64_t largeFileThreshold = 10 * 1024 * 1024; //files above are streamed
    size_t blockSize = 64 * 1024;
};


//resolved configuration record
struct SyncSettings
{
    size_t maxWorkers = 4;
    RetrySettings retry;
    ChunkSettings chunk;
    double successThreshold = 0.9; //transferred / (transferred + failed)
};


struct UploadSource
{
    Zstring localPath;
    bool keepFolderName = false; //copy into "<remote root>/<folder name>" instead of the remote root itself
};


struct SyncConfig
{
    Zstring remoteRoot; //absolute, '/'-separated
    Zstring localRoot;  //download: destination; upload: source if "uploadSources" is empty
    std::vector<UploadSource> uploadSources; //upload only: several source folders into one remote root
    SyncDirection direction = SyncDirection::download;
    bool purgeBefore = false; //clear the destination before any transfer
    bool dryRun = false; //scan and decide, but change nothing
    SyncSettings settings;
};

//upload: each source folder with the remote folder receiving its content
std::vector<std::pair<Zstring /*local*/, Zstring /*remote*/>> getUploadFolderPairs(const SyncConfig& cfg);
}

#endif //STRUCTURES_H_8210478915019450901745
