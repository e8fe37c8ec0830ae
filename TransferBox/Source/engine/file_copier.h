// *****************************************************************************
// * This file is part of the TransferBox project. It is distributed under     *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) TransferBox authors - All Rights Reserved                   *
// *****************************************************************************

#ifndef FILE_COPIER_H_1290384756120938
#define FILE_COPIER_H_1290384756120938

#include <functional>
#include <stop_token>
#include <tbx/file_io.h>
#include "progress_tracker.h"
#include "structures.h"
#include "transfer_log.h"


namespace xfer
{
const Zchar* const TEMP_FILE_ENDING = Zstr(".tbpart"); //don't use Zstring as global constant: avoid static initialization order problem in global namespace!

const std::chrono::hours ORPHANED_TEMP_FILE_MAX_AGE(24);


struct CopyOptions
{
    size_t bufferSize = DEFAULT_BUFFER_SIZE; //same size for every chunk
    bool verifyChecksum = true;
    bool overwrite = false;
    bool preservePermissions = true;
    bool preserveModTime = true;
    HashAlgorithm hashAlgorithm = HashAlgorithm::sha256;

    std::function<void(const ProgressSample& sample)> onProgress; //optional; throttled, called from the copying thread
    std::stop_token stopToken; //polled between chunks
};


/*  atomic copy: target is either absent or complete and verified
    1. stream source into "<target>.<crc>.tbpart" next to the target, hashing every chunk
    2. check byte counts, apply attributes, fsync
    3. re-read the temp file and compare hashes
    4. rename temp file to the target name

    temp file is removed on every failure path, including cancellation   */
class FileCopier
{
public:
    FileCopier() {}
    virtual ~FileCopier() {}

    //never throws for I/O problems: failures and cancellation are returned as result
    FileTransferResult copy(const Zstring& sourcePath, const Zstring& targetPath, const CopyOptions& options) const;

    //same as copy(), but failures are thrown: used for retry
    FileTransferResult copyFile(const Zstring& sourcePath, const Zstring& targetPath, const CopyOptions& options) const; //throw TransferError, FileError, ThreadStopRequest

protected:
    //write one chunk; returns number of bytes written
    virtual size_t writeChunk(tbx::FileOutputPlain& fileOut, const void* buffer, size_t bytesToWrite) const; //throw FileError

private:
    FileCopier           (const FileCopier&) = delete;
    FileCopier& operator=(const FileCopier&) = delete;
};


//recursively delete "*.tbpart" files older than maxAge left behind by a crash or power loss; returns number of files deleted
size_t cleanupOrphanedTempFiles(const Zstring& folderPath, std::chrono::seconds maxAge, TransferLog& log); //throw FileError
}

#endif //FILE_COPIER_H_1290384756120938
