// *****************************************************************************
// * This file is part of the TransferBox project. It is distributed under     *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) TransferBox authors - All Rights Reserved                   *
// *****************************************************************************

#include "file_copier.h"
#include <vector>
#include <tbx/extra_log.h>
#include <tbx/file_traverser.h>
#include <tbx/stop_watch.h>
#include <tbx/thread.h>

using namespace tbx;
using namespace xfer;


size_t FileCopier::writeChunk(FileOutputPlain& fileOut, const void* buffer, size_t bytesToWrite) const //throw FileError
{
    auto it = static_cast<const std::byte*>(buffer);
    const auto itEnd = it + bytesToWrite;

    while (it != itEnd)
        it += fileOut.tryWrite(it, itEnd - it); //throw FileError; may return short! CONTRACT: bytesToWrite > 0

    return bytesToWrite;
}


FileTransferResult FileCopier::copyFile(const Zstring& sourcePath, const Zstring& targetPath, const CopyOptions& options) const //throw TransferError, FileError, ThreadStopRequest
{
    const StopWatch stopWatch;

    if (options.bufferSize < MIN_BUFFER_SIZE || options.bufferSize > MAX_BUFFER_SIZE)
        throw TransferError(replaceCpy(_("Cannot copy file %x."), L"%x", fmtPath(sourcePath)),
                            replaceCpy(_("Invalid buffer size: %x bytes"), L"%x", numberTo<std::wstring>(options.bufferSize)), ErrorKind::unknown);

    interruptionPoint(options.stopToken); //throw ThreadStopRequest

    FileInputPlain fileIn(sourcePath); //throw FileError; regular files only
    const struct stat sourceInfo = fileIn.getStatBuffered(); //throw FileError
    const uint64_t sourceSize = sourceInfo.st_size;

    if (!options.overwrite && itemExists(targetPath)) //throw FileError
        throw TransferError(replaceCpy(_("Cannot copy file %x."), L"%x", fmtPath(sourcePath)),
                            replaceCpy(_("The file %x already exists."), L"%x", fmtPath(targetPath)), ErrorKind::unknown, EEXIST);

    const std::optional<Zstring> targetFolderPath = getParentFolderPath(targetPath);
    if (!targetFolderPath)
        throw TransferError(replaceCpy(_("Cannot copy file %x."), L"%x", fmtPath(sourcePath)),
                            replaceCpy(_("Invalid target path %x."), L"%x", fmtPath(targetPath)), ErrorKind::unknown);

    createDirectoryIfMissingRecursion(*targetFolderPath); //throw FileError

    //check early: avoid filling the device and failing late
    if (const int64_t freeSpace = getFreeDiskSpace(*targetFolderPath); //throw FileError
        freeSpace >= 0 && static_cast<uint64_t>(freeSpace) < sourceSize) //-1 if not available
        throw insufficientSpace(*targetFolderPath, sourceSize, freeSpace);

    const Zstring tmpPath = getPathWithTempName(targetPath, TEMP_FILE_ENDING);

    ChecksumStream sourceHash = [&]
    {
        try { return ChecksumStream(options.hashAlgorithm); /*throw SysError*/ }
        catch (const SysError& e) { throw FileError(replaceCpy(_("Cannot calculate checksum of %x."), L"%x", fmtPath(sourcePath)), e); }
    }();
    ProgressTracker tracker(sourceSize);
    uint64_t bytesWritten = 0;
    try
    {
        FileOutputPlain fileOut(tmpPath); //throw FileError, ErrorTargetExisting
        //=> ~FileOutputPlain() deletes the temp file unless closed

        std::vector<std::byte> buffer(options.bufferSize);
        for (;;)
        {
            interruptionPoint(options.stopToken); //throw ThreadStopRequest; never inside a chunk

            const size_t bytesRead = readFull(fileIn, buffer.data(), buffer.size()); //throw FileError
            if (bytesRead == 0) //end of file
                break;

            sourceHash.update(buffer.data(), bytesRead); //throw SysError
            const bool reportDue = tracker.update(bytesRead);

            if (tracker.hasOverflow()) //source grew while copying
                throw sizeMismatch(sourcePath, sourceSize, tracker.getBytesTransferred());

            bytesWritten += writeChunk(fileOut, buffer.data(), bytesRead); //throw FileError

            if (reportDue && options.onProgress)
            {
                options.onProgress(tracker.sample());
                tracker.commit();
            }
        }

        if (tracker.getBytesTransferred() != sourceSize) //source shrunk while copying
            throw sizeMismatch(sourcePath, sourceSize, tracker.getBytesTransferred());

        if (bytesWritten != tracker.getBytesTransferred()) //short write
            throw sizeMismatch(targetPath, tracker.getBytesTransferred(), bytesWritten);

        if (options.preservePermissions)
            fileOut.setPermissions(sourceInfo.st_mode); //throw FileError
        if (options.preserveModTime)
            fileOut.setModTime(sourceInfo.st_mtim); //throw FileError

        fileOut.flushBuffers(); //throw FileError
        fileOut.close();        //throw FileError
    }
    catch (const SysError& e) { throw FileError(replaceCpy(_("Cannot calculate checksum of %x."), L"%x", fmtPath(sourcePath)), e); }

    //temp file is complete: from now on it's our job to remove it on failure
    TBX_ON_SCOPE_FAIL(try { removeFilePlain(tmpPath); }
    catch (const FileError& e) { logExtraError(e.toString()); });

    //what really reached the device:
    if (const uint64_t tmpSize = getFileSize(tmpPath); //throw FileError
        tmpSize != sourceSize)
        throw sizeMismatch(targetPath, sourceSize, tmpSize);

    std::string sourceChecksum;
    try { sourceChecksum = sourceHash.finalizeHex(); /*throw SysError*/ }
    catch (const SysError& e) { throw FileError(replaceCpy(_("Cannot calculate checksum of %x."), L"%x", fmtPath(sourcePath)), e); }

    if (options.verifyChecksum)
    {
        //re-read instead of hashing during write: catches corruption on the write path
        const std::string targetChecksum = getFileChecksum(tmpPath, options.hashAlgorithm, options.bufferSize, options.stopToken, nullptr); //throw FileError, ThreadStopRequest
        if (targetChecksum != sourceChecksum)
            throw checksumMismatch(targetPath, sourceChecksum, targetChecksum);
    }

    interruptionPoint(options.stopToken); //throw ThreadStopRequest; last chance before the target becomes visible

    moveAndRenameItem(tmpPath, targetPath, options.overwrite); //throw FileError, ErrorMoveUnsupported, ErrorTargetExisting

    if (options.onProgress)
        options.onProgress(tracker.getFinalSample());

    FileTransferResult result;
    result.success          = true;
    result.sourcePath       = sourcePath;
    result.targetPath       = targetPath;
    result.bytesTransferred = sourceSize;
    result.checksum         = sourceChecksum;
    result.checksumVerified = options.verifyChecksum;
    result.duration         = stopWatch.elapsedMs();
    return result;
}


FileTransferResult FileCopier::copy(const Zstring& sourcePath, const Zstring& targetPath, const CopyOptions& options) const
{
    const StopWatch stopWatch;
    try
    {
        return copyFile(sourcePath, targetPath, options); //throw TransferError, FileError, ThreadStopRequest
    }
    catch (const FileError& e) //includes TransferError
    {
        return makeFailureResult(sourcePath, targetPath, wrapError(e), stopWatch.elapsedMs());
    }
    catch (ThreadStopRequest&)
    {
        return makeFailureResult(sourcePath, targetPath, cancelled(), stopWatch.elapsedMs());
    }
}


size_t xfer::cleanupOrphanedTempFiles(const Zstring& folderPath, std::chrono::seconds maxAge, TransferLog& log) //throw FileError
{
    const time_t timeLimit = std::time(nullptr) - maxAge.count();
    size_t itemsDeleted = 0;

    std::vector<Zstring> folderPaths{folderPath};
    while (!folderPaths.empty())
    {
        const Zstring curFolderPath = std::move(folderPaths.back());
        folderPaths.pop_back();

        traverseFolder(curFolderPath, [&](const FileInfo& fi)
        {
            if (endsWith(fi.itemName, TEMP_FILE_ENDING) && fi.modTime < timeLimit)
                try
                {
                    removeFilePlain(fi.fullPath); //throw FileError
                    ++itemsDeleted;
                    log.logInfo(replaceCpy(_("Deleted orphaned temporary file %x."), L"%x", fmtPath(fi.fullPath)));
                }
                catch (const FileError& e) { log.logWarning(e.toString()); } //e.g. in use by a parallel transfer: don't stop
        },
        [&](const FolderInfo& fi) { folderPaths.push_back(fi.fullPath); },
        nullptr /*onSymlink: don't follow*/); //throw FileError
    }
    return itemsDeleted;
}
