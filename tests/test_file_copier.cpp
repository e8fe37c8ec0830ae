// *****************************************************************************
// * This file is part of the TransferBox project. It is distributed under     *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) TransferBox authors - All Rights Reserved                   *
// *****************************************************************************

#include "test_context.h"
#include <sys/stat.h>
#include <unistd.h>
#include "../TransferBox/Source/engine/file_copier.h"

using namespace tbx;
using namespace xfer;
using test::TestContext;


namespace
{
//simulates a device silently dropping data: only half of the first chunk is written
class TruncatingCopier : public FileCopier
{
protected:
    size_t writeChunk(FileOutputPlain& fileOut, const void* buffer, size_t bytesToWrite) const override
    {
        if (!truncated_ && bytesToWrite > 1)
        {
            truncated_ = true;
            return FileCopier::writeChunk(fileOut, buffer, bytesToWrite / 2);
        }
        return FileCopier::writeChunk(fileOut, buffer, bytesToWrite);
    }

private:
    mutable bool truncated_ = false;
};


//simulates bit rot on the write path: correct length, one byte flipped in the first chunk
class CorruptingCopier : public FileCopier
{
protected:
    size_t writeChunk(FileOutputPlain& fileOut, const void* buffer, size_t bytesToWrite) const override
    {
        if (!corrupted_ && bytesToWrite > 0)
        {
            corrupted_ = true;
            std::vector<std::byte> copy(static_cast<const std::byte*>(buffer), static_cast<const std::byte*>(buffer) + bytesToWrite);
            copy[bytesToWrite / 2] ^= std::byte{0x01};
            return FileCopier::writeChunk(fileOut, copy.data(), copy.size());
        }
        return FileCopier::writeChunk(fileOut, buffer, bytesToWrite);
    }

private:
    mutable bool corrupted_ = false;
};


void test_copy_and_verify(TestContext& t)
{
    const test::TempFolder tmp;
    const std::string data = test::makeTestData(5 * 1024 * 1024 + 123);
    const Zstring sourcePath = tmp / Zstr("DCIM/IMG_0001.JPG");
    const Zstring targetPath = tmp / Zstr("Photos/2024/06/IMG_0001.JPG"); //folders don't exist yet

    createDirectoryIfMissingRecursion(tmp / Zstr("DCIM"));
    test::writeTestFile(sourcePath, data);

    std::vector<ProgressSample> samples;
    CopyOptions options;
    options.bufferSize = 256 * 1024;
    options.onProgress = [&](const ProgressSample& sample) { samples.push_back(sample); };

    const FileTransferResult result = FileCopier().copy(sourcePath, targetPath, options);

    t.check(result.success, "copy succeeds");
    t.check(!result.errorKind && !result.errorMsg, "no error on success");
    t.check(result.bytesTransferred == data.size(), "all bytes transferred");
    t.check(result.checksumVerified, "checksum was verified");
    t.check(result.checksum && *result.checksum == getFileChecksum(targetPath, HashAlgorithm::sha256, 4096, std::stop_token(), nullptr),
            "reported checksum equals checksum of the target file");
    t.check(test::readTestFile(targetPath) == data, "target content equals source content");
    t.check(!test::containsTempFile(*getParentFolderPath(targetPath)), "no temp file left behind");

    t.check(!samples.empty(), "progress was reported");
    t.check(!samples.empty() && samples.back().bytesTransferred == data.size() && samples.back().percentage == 100, "final progress sample is complete");
    for (size_t i = 1; i < samples.size(); ++i)
        t.check(samples[i - 1].bytesTransferred <= samples[i].bytesTransferred, "progress is monotonous");
}


void test_attributes_are_preserved(TestContext& t)
{
    const test::TempFolder tmp;
    const Zstring sourcePath = tmp / Zstr("clip.mov");
    const Zstring targetPath = tmp / Zstr("out/clip.mov");
    const time_t modTime = 1500000000;
    test::writeTestFile(sourcePath, test::makeTestData(10000), modTime);
    t.check(::chmod(sourcePath.c_str(), 0640) == 0, "chmod source");

    const FileTransferResult result = FileCopier().copy(sourcePath, targetPath, CopyOptions());
    t.check(result.success, "copy succeeds");

    struct stat targetInfo = {};
    t.check(::stat(targetPath.c_str(), &targetInfo) == 0, "target exists");
    t.check((targetInfo.st_mode & 07777) == 0640, "permissions are preserved");
    t.check(targetInfo.st_mtime == modTime, "modification time is preserved");
}


void test_existing_target(TestContext& t)
{
    const test::TempFolder tmp;
    const Zstring sourcePath = tmp / Zstr("a.jpg");
    const Zstring targetPath = tmp / Zstr("b.jpg");
    const std::string data = test::makeTestData(300000, 7);
    test::writeTestFile(sourcePath, data);
    test::writeTestFile(targetPath, "old content");

    CopyOptions options;
    options.overwrite = false;
    const FileTransferResult refused = FileCopier().copy(sourcePath, targetPath, options);
    t.check(!refused.success && refused.errorKind == ErrorKind::unknown, "existing target without overwrite fails with Unknown");
    t.check(test::readTestFile(targetPath) == "old content", "existing target is untouched");

    //idempotent: copying twice with overwrite yields the same checksum
    options.overwrite = true;
    const FileTransferResult first  = FileCopier().copy(sourcePath, targetPath, options);
    const FileTransferResult second = FileCopier().copy(sourcePath, targetPath, options);
    t.check(first.success && second.success, "overwrite succeeds");
    t.check(first.checksum && first.checksum == second.checksum, "re-copy produces the same checksum");
    t.check(test::readTestFile(targetPath) == data, "target was replaced");
    t.check(!test::containsTempFile(tmp.path()), "no temp file left behind");
}


void test_truncated_write(TestContext& t)
{
    const test::TempFolder tmp;
    const Zstring sourcePath = tmp / Zstr("big.mp4");
    const Zstring targetPath = tmp / Zstr("dest/big.mp4");
    test::writeTestFile(sourcePath, test::makeTestData(10 * 1000 * 1000));

    CopyOptions options;
    options.bufferSize = 1024 * 1024;
    const FileTransferResult result = TruncatingCopier().copy(sourcePath, targetPath, options);

    t.check(!result.success, "truncated write fails");
    t.check(result.errorKind == ErrorKind::checksumMismatch, "truncated write is reported as ChecksumMismatch");
    t.check(!result.checksum, "no checksum on failure");
    t.check(!itemExists(targetPath), "no file at the target path");
    t.check(!test::containsTempFile(tmp / Zstr("dest")), "temp file was removed");
}


void test_corrupted_write(TestContext& t)
{
    const test::TempFolder tmp;
    const Zstring sourcePath = tmp / Zstr("clip.mp4");
    const Zstring targetPath = tmp / Zstr("dest/clip.mp4");
    test::writeTestFile(sourcePath, test::makeTestData(3 * 1024 * 1024 + 5));

    CopyOptions options;
    options.bufferSize = 256 * 1024;
    const FileTransferResult result = CorruptingCopier().copy(sourcePath, targetPath, options);

    t.check(!result.success, "corrupted write fails");
    t.check(result.errorKind == ErrorKind::checksumMismatch, "corrupted write is reported as ChecksumMismatch");
    t.check(!result.checksumVerified && !result.checksum, "no verified checksum on failure");
    t.check(result.errorMsg && contains(*result.errorMsg, L"dest/clip.mp4"), "error message names the target");
    t.check(!itemExists(targetPath), "no file at the target path");
    t.check(!test::containsTempFile(tmp / Zstr("dest")), "temp file was removed");
}


void test_cancel_mid_copy(TestContext& t)
{
    const test::TempFolder tmp;
    const Zstring sourcePath = tmp / Zstr("huge.mp4");
    const Zstring targetPath = tmp / Zstr("dest/huge.mp4");
    test::writeTestFile(sourcePath, test::makeTestData(20 * 1000 * 1000));

    std::stop_source stopSource;
    size_t reports = 0;

    CopyOptions options;
    options.bufferSize = 64 * 1024;
    options.stopToken = stopSource.get_token();
    options.onProgress = [&](const ProgressSample& sample)
    {
        ++reports;
        if (sample.bytesTransferred < sample.totalBytes)
            stopSource.request_stop();
    };

    const FileTransferResult result = FileCopier().copy(sourcePath, targetPath, options);

    t.check(!result.success, "cancelled copy is not a success");
    t.check(result.isCancelled(), "result is Cancelled");
    t.check(reports == 1, "copy stopped at the next chunk boundary");
    t.check(!itemExists(targetPath), "no file at the target path");
    t.check(!test::containsTempFile(tmp / Zstr("dest")), "temp file was removed");

    //stop requested before start
    const FileTransferResult early = FileCopier().copy(sourcePath, tmp / Zstr("dest/early.mp4"), options);
    t.check(early.isCancelled(), "copy with stop already requested is Cancelled");
}


void test_source_errors(TestContext& t)
{
    const test::TempFolder tmp;

    const FileTransferResult missing = FileCopier().copy(tmp / Zstr("missing.jpg"), tmp / Zstr("out.jpg"), CopyOptions());
    t.check(!missing.success && missing.errorKind == ErrorKind::sourceDisconnected, "vanished source is SourceDisconnected");
    t.check(missing.errorMsg && !missing.errorMsg->empty(), "error message is filled");

    createDirectory(tmp / Zstr("folder"));
    const FileTransferResult folder = FileCopier().copy(tmp / Zstr("folder"), tmp / Zstr("out.jpg"), CopyOptions());
    t.check(!folder.success && folder.errorKind == ErrorKind::unknown, "directory as source is rejected");

    test::writeTestFile(tmp / Zstr("a.jpg"), "abc");
    CopyOptions options;
    options.bufferSize = 100; //< 1 KiB
    const FileTransferResult badBuffer = FileCopier().copy(tmp / Zstr("a.jpg"), tmp / Zstr("out.jpg"), options);
    t.check(!badBuffer.success && badBuffer.errorKind == ErrorKind::unknown, "invalid buffer size is rejected");
    t.check(!itemExists(tmp / Zstr("out.jpg")), "nothing was written");

    //symlinks are not followed, even when pointing to a regular file
    const std::string data = test::makeTestData(5000);
    test::writeTestFile(tmp / Zstr("real.jpg"), data);
    t.check(::symlink((tmp / Zstr("real.jpg")).c_str(), (tmp / Zstr("link.jpg")).c_str()) == 0, "create symlink");

    const FileTransferResult viaLink = FileCopier().copy(tmp / Zstr("link.jpg"), tmp / Zstr("copy.jpg"), CopyOptions());
    t.check(!viaLink.success && viaLink.errorKind == ErrorKind::unknown, "symlink as source is rejected");
    t.check(viaLink.errorMsg && contains(*viaLink.errorMsg, L"symbolic link"), "error message names the item type");
    t.check(!itemExists(tmp / Zstr("copy.jpg")), "nothing was written for the symlink");
    t.check(test::readTestFile(tmp / Zstr("real.jpg")) == data, "symlink target is untouched");
}


void test_empty_file(TestContext& t)
{
    const test::TempFolder tmp;
    test::writeTestFile(tmp / Zstr("empty.txt"), "");

    const FileTransferResult result = FileCopier().copy(tmp / Zstr("empty.txt"), tmp / Zstr("copy.txt"), CopyOptions());
    t.check(result.success && result.bytesTransferred == 0, "empty file is copied");
    t.check(result.checksum == std::string("e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855"), "SHA-256 of empty file");
    t.check(itemExists(tmp / Zstr("copy.txt")), "empty target exists");
}


void test_orphan_cleanup(TestContext& t)
{
    const test::TempFolder tmp;
    createDirectoryIfMissingRecursion(tmp / Zstr("2024/06"));

    const time_t oldTime = std::time(nullptr) - 2 * 24 * 3600;
    test::writeTestFile(tmp / Zstr("2024/06/a.jpg.1f2e.tbpart"), "stale", oldTime);
    test::writeTestFile(tmp / Zstr("b.jpg.0a0b.tbpart"), "stale", oldTime);
    test::writeTestFile(tmp / Zstr("c.jpg.3c4d.tbpart"), "in progress"); //fresh: may belong to a running transfer
    test::writeTestFile(tmp / Zstr("2024/06/a.jpg"), "keep", oldTime);

    TransferLog log;
    const size_t deleted = cleanupOrphanedTempFiles(tmp.path(), ORPHANED_TEMP_FILE_MAX_AGE, log);

    t.check(deleted == 2, "two stale temp files deleted");
    t.check(!itemExists(tmp / Zstr("2024/06/a.jpg.1f2e.tbpart")), "nested stale temp file is gone");
    t.check( itemExists(tmp / Zstr("c.jpg.3c4d.tbpart")), "fresh temp file is kept");
    t.check( itemExists(tmp / Zstr("2024/06/a.jpg")), "regular files are kept");
    t.check(log.getStats().info == 2, "each deletion is logged");
}
}


int main()
{
    TestContext t;
    try
    {
        test_copy_and_verify(t);
        test_attributes_are_preserved(t);
        test_existing_target(t);
        test_truncated_write(t);
        test_corrupted_write(t);
        test_cancel_mid_copy(t);
        test_source_errors(t);
        test_empty_file(t);
        test_orphan_cleanup(t);
    }
    catch (const FileError& e) { t.check(false, "unexpected FileError: " + utfTo<std::string>(e.toString())); }
    return t.finish("file_copier_tests");
}
