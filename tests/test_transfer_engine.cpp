// *****************************************************************************
// * This file is part of the TransferBox project. It is distributed under     *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) TransferBox authors - All Rights Reserved                   *
// *****************************************************************************

#include "test_context.h"
#include <algorithm>
#include <atomic>
#include <cerrno>
#include <set>
#include <thread>
#include "../TransferBox/Source/engine/transfer_engine.h"

using namespace tbx;
using namespace xfer;
using test::TestContext;
using std::chrono::milliseconds;


namespace
{
//device hiccup: the 40th chunk written by this copier fails with EIO, every other chunk succeeds
class FlakyCopier : public FileCopier
{
protected:
    size_t writeChunk(FileOutputPlain& fileOut, const void* buffer, size_t bytesToWrite) const override
    {
        if (++chunksWritten_ == 40)
            throw FileError(L"Cannot write file.", L"EIO: Input/output error [write]", EIO);
        return FileCopier::writeChunk(fileOut, buffer, bytesToWrite);
    }

private:
    mutable std::atomic<int> chunksWritten_{0};
};


TransferSettings fastSettings()
{
    TransferSettings settings;
    settings.bufferSize = 64 * 1024;
    settings.retry = {2, milliseconds(1), milliseconds(1)};
    return settings;
}


//"count" source files "file<i>.jpg" of different sizes
std::vector<TransferTask> makeBatch(const test::TempFolder& tmp, size_t count, size_t fileSize)
{
    createDirectoryIfMissingRecursion(tmp / Zstr("card"));

    std::vector<std::pair<Zstring, Zstring>> paths;
    for (size_t i = 0; i < count; ++i)
    {
        const Zstring itemName = Zstr("file") + numberTo<Zstring>(i) + Zstr(".jpg");
        test::writeTestFile(tmp / (Zstr("card/") + itemName), test::makeTestData(fileSize + i * 1000, static_cast<unsigned int>(i + 1)));
        paths.emplace_back(tmp / (Zstr("card/") + itemName), tmp / (Zstr("backup/") + itemName));
    }
    return makeTransferTasks(paths);
}


void test_settings_validation(TestContext& t)
{
    TransferSettings settings;
    t.check(validateSettings(settings).empty(), "defaults are valid");
    t.check(settings.concurrencyLimit == 3 && settings.bufferSize == 4 * 1024 * 1024 && settings.verifyChecksum && !settings.overwrite && !settings.continueOnError,
            "documented defaults");

    settings.concurrencyLimit = 0;
    settings.bufferSize = 11 * 1024 * 1024;
    settings.retry.maxAttempts = 0;
    const std::vector<std::wstring> warnings = validateSettings(settings);

    t.check(warnings.size() == 3, "one warning per invalid value");
    t.check(settings.concurrencyLimit == DEFAULT_CONCURRENCY, "concurrency falls back to default");
    t.check(settings.bufferSize == DEFAULT_BUFFER_SIZE, "buffer size falls back to default");
    t.check(settings.retry.maxAttempts == RetryConfig().maxAttempts, "retry attempts fall back to default");
}


void test_batch_success(TestContext& t)
{
    const test::TempFolder tmp;
    const std::vector<TransferTask> tasks = makeBatch(tmp, 5, 500 * 1000);

    std::mutex lockCallbacks;
    std::multiset<size_t> completedIndexes;
    std::optional<BatchProgress> lastProgress;

    TransferCallbacks callbacks;
    callbacks.onFileComplete = [&](size_t index, const FileTransferResult& result)
    {
        std::lock_guard dummy(lockCallbacks);
        completedIndexes.insert(index);
        t.check(result.success, "completion callback sees the result");
    };
    callbacks.onBatchProgress = [&](const BatchProgress& progress)
    {
        std::lock_guard dummy(lockCallbacks);
        lastProgress = progress;
    };

    TransferLog log;
    TransferEngine engine(log);
    const BatchOutcome outcome = engine.transferFiles(tasks, fastSettings(), callbacks);

    t.check(outcome.status == BatchStatus::completed, "batch completed");
    t.check(!outcome.abortError, "no abort error");
    t.check(outcome.results.size() == 5, "one result per task");

    for (size_t i = 0; i < outcome.results.size(); ++i)
    {
        const std::optional<FileTransferResult>& r = outcome.results[i];
        t.check(r && r->success && r->sourcePath == tasks[i].sourcePath && r->targetPath == tasks[i].targetPath,
                "results[" + numberTo<std::string>(i) + "] belongs to task " + numberTo<std::string>(i));
        t.check(r && r->checksum && *r->checksum == getFileChecksum(tasks[i].targetPath, HashAlgorithm::sha256, 4096, std::stop_token(), nullptr),
                "source checksum equals target checksum");
    }

    t.check(completedIndexes == std::multiset<size_t>({0, 1, 2, 3, 4}), "completion callback once per file");
    t.check(lastProgress && lastProgress->filesCompleted == 5 && lastProgress->filesTotal == 5, "final batch progress counts all files");
    t.check(lastProgress && lastProgress->bytesTransferred == lastProgress->bytesTotal, "final batch progress is complete");
    t.check(lastProgress && lastProgress->activeFiles.empty(), "no active files at the end");
    t.check(log.getStats().error == 0, "no errors logged");
    t.check(log.getStats().info >= 6, "each file and the summary are logged");
}


void test_batch_continue_on_error(TestContext& t)
{
    const test::TempFolder tmp;
    std::vector<TransferTask> tasks = makeBatch(tmp, 5, 10000);
    tasks[2].sourcePath = tmp / Zstr("card/removed.jpg"); //card pulled: ENOENT => retried, then reported
    tasks[4].sourcePath = tmp / Zstr("card/removed2.jpg");

    TransferSettings settings = fastSettings();
    settings.concurrencyLimit = 2;
    settings.continueOnError = true;

    TransferLog log;
    TransferEngine engine(log);
    const BatchOutcome outcome = engine.transferFiles(tasks, settings, {});

    t.check(outcome.status == BatchStatus::completedWithErrors, "batch completed with errors");
    t.check(outcome.results[0]->success && outcome.results[1]->success && outcome.results[3]->success, "other files were transferred");
    t.check(!outcome.results[2]->success && outcome.results[2]->errorKind == ErrorKind::sourceDisconnected, "failed file reports its kind");
    t.check(!outcome.results[4]->success, "second failed file");
    t.check(!itemExists(tasks[2].targetPath), "no target for the failed file");

    const ErrorLog entries = log.getEntries();
    const bool retryLogged = std::any_of(entries.begin(), entries.end(), [](const LogEntry& e) { return e.type == MSG_TYPE_WARNING; });
    t.check(retryLogged, "retry attempts are logged");
    t.check(log.getStats().error >= 2, "failures are logged");
}


void test_batch_abort_on_first_error(TestContext& t)
{
    const test::TempFolder tmp;
    std::vector<TransferTask> tasks = makeBatch(tmp, 3, 10000);
    test::writeTestFile(tmp / Zstr("backup_file1"), "x");
    tasks[1].targetPath = tmp / Zstr("backup_file1/file1.jpg"); //parent is a file: cannot be created

    TransferSettings settings = fastSettings();
    settings.concurrencyLimit = 1;
    settings.continueOnError = false;

    TransferLog log;
    TransferEngine engine(log);
    const BatchOutcome outcome = engine.transferFiles(tasks, settings, {});

    t.check(outcome.status == BatchStatus::aborted, "batch was aborted");
    t.check(outcome.abortError.has_value(), "abort error is reported");
    t.check(outcome.results.size() == 3, "result list has one slot per task");
    t.check(outcome.results[0] && outcome.results[0]->success, "first file succeeded");
    t.check(outcome.results[1] && !outcome.results[1]->success, "second file failed");
    t.check(outcome.results[1] && outcome.abortError && outcome.results[1]->errorKind == outcome.abortError->getKind(), "abort error is the second file's error");
    t.check(!outcome.results[2], "third file was never started");
    t.check(!itemExists(tasks[2].targetPath), "third file was not copied");
}


void test_batch_stop(TestContext& t)
{
    const test::TempFolder tmp;
    const std::vector<TransferTask> tasks = makeBatch(tmp, 4, 20 * 1000 * 1000);

    TransferLog log;
    TransferEngine engine(log);

    TransferCallbacks callbacks;
    callbacks.onFileProgress = [&](size_t /*index*/, const Zstring& /*sourcePath*/, const ProgressSample& /*sample*/) { engine.stop(); };

    TransferSettings settings = fastSettings();
    settings.concurrencyLimit = 2;
    const BatchOutcome outcome = engine.transferFiles(tasks, settings, callbacks);

    t.check(outcome.status == BatchStatus::cancelled, "batch was cancelled");
    t.check(!outcome.abortError, "cancellation is not an abort");

    for (size_t i = 0; i < tasks.size(); ++i)
    {
        const std::optional<FileTransferResult>& r = outcome.results[i];
        t.check(!r || r->isCancelled() || r->success, "file is either cancelled, complete or never started");
        if (!r || !r->success)
            t.check(!itemExists(tasks[i].targetPath), "no target for unfinished file " + numberTo<std::string>(i));
    }
    t.check(!test::containsTempFile(tmp / Zstr("backup")), "no temp files left behind");
    t.check(log.getStats().error == 0, "cancellation is not logged as error");
}


void test_batch_stop_during_preparation(TestContext& t)
{
    const test::TempFolder tmp;
    const std::vector<TransferTask> tasks = makeBatch(tmp, 3, 100000);

    TransferLog log;
    TransferEngine engine(log);

    bool batchStarted = false;
    TransferCallbacks callbacks;
    callbacks.onBatchStart = [&](uint64_t bytesTotal, size_t filesTotal)
    {
        batchStarted = true;
        t.check(filesTotal == 3 && bytesTotal == 3 * 100000 + 1000 + 2000, "batch start reports the totals");
        std::thread([&] { engine.stop(); }).join(); //the queue doesn't exist yet
    };

    const BatchOutcome outcome = engine.transferFiles(tasks, fastSettings(), callbacks);

    t.check(batchStarted, "batch start was notified");
    t.check(outcome.status == BatchStatus::cancelled, "stop() before the first file cancels the batch");
    for (size_t i = 0; i < tasks.size(); ++i)
    {
        t.check(!outcome.results[i], "file " + numberTo<std::string>(i) + " was never started");
        t.check(!itemExists(tasks[i].targetPath), "no target for file " + numberTo<std::string>(i));
    }

    //stop() belongs to the batch it was issued for
    const BatchOutcome next = engine.transferFiles(tasks, fastSettings(), {});
    t.check(next.status == BatchStatus::completed, "next batch is not affected");
}


void test_retry_resets_batch_progress(TestContext& t)
{
    const test::TempFolder tmp;
    const std::vector<TransferTask> tasks = makeBatch(tmp, 1, 5 * 1024 * 1024);

    std::vector<BatchProgress> reports;
    TransferCallbacks callbacks;
    callbacks.onBatchProgress = [&](const BatchProgress& progress) { reports.push_back(progress); };

    TransferLog log;
    TransferEngine engine(log, std::make_unique<const FlakyCopier>());
    const FileTransferResult result = engine.transferFile(tasks[0], fastSettings(), callbacks);

    t.check(result.success && result.checksumVerified, "second attempt succeeds");
    t.check(log.getStats().warning == 1, "failed attempt is logged as warning");
    t.check(test::readTestFile(tasks[0].targetPath) == test::readTestFile(tasks[0].sourcePath), "target is complete");

    const auto itPartial = std::find_if(reports.begin(), reports.end(), [](const BatchProgress& p) { return p.bytesTransferred > 0 && !p.activeFiles.empty(); });
    t.check(itPartial != reports.end(), "first attempt reported progress");
    t.check(itPartial != reports.end() &&
            std::any_of(itPartial + 1, reports.end(), [](const BatchProgress& p) { return p.bytesTransferred == 0 && p.activeFiles.empty(); }),
            "bytes of the failed attempt are dropped when retrying");
}


void test_single_file(TestContext& t)
{
    const test::TempFolder tmp;
    const std::vector<TransferTask> tasks = makeBatch(tmp, 1, 100000);

    size_t progressCalls = 0;
    TransferCallbacks callbacks;
    callbacks.onFileProgress = [&](size_t index, const Zstring& sourcePath, const ProgressSample&)
    {
        ++progressCalls;
        t.check(index == 0 && sourcePath == tasks[0].sourcePath, "progress names the file");
    };

    TransferLog log;
    TransferEngine engine(log);
    const FileTransferResult result = engine.transferFile(tasks[0], fastSettings(), callbacks);
    t.check(result.success && result.checksumVerified, "single file transfer succeeds");
    t.check(progressCalls > 0, "progress is reported");

    //same target again without overwrite: fails, not retried
    const FileTransferResult again = engine.transferFile(tasks[0], fastSettings(), {});
    t.check(!again.success && again.errorKind == ErrorKind::unknown, "existing target is reported");
    t.check(log.getStats().warning == 0, "non-retryable error is not retried");
}


void test_index_contract(TestContext& t)
{
    const test::TempFolder tmp;
    std::vector<TransferTask> tasks = makeBatch(tmp, 2, 100);
    tasks[1].index = 5;

    TransferLog log;
    TransferEngine engine(log);
    bool threw = false;
    try { engine.transferFiles(tasks, fastSettings(), {}); }
    catch (const std::logic_error&) { threw = true; }
    t.check(threw, "task index must match its position");

    const BatchOutcome empty = engine.transferFiles({}, fastSettings(), {});
    t.check(empty.results.empty() && empty.status == BatchStatus::completed, "empty batch completes immediately");
}


void test_log_format(TestContext& t)
{
    std::vector<LogEntry> forwarded;
    TransferLog log([&](const LogEntry& entry) { forwarded.push_back(entry); });
    log.logInfo(L"Transferred file");
    log.logError(L"Cannot copy file.\n\n\nDevice not ready");

    t.check(forwarded.size() == 2, "each entry is forwarded");

    const std::string errorsOnly = log.formatLog(MSG_TYPE_ERROR);
    t.check(errorsOnly.find("Transferred file") == std::string::npos, "filter excludes info entries");

    const size_t posBreak = errorsOnly.find('\n');
    t.check(posBreak != std::string::npos && errorsOnly.find("Cannot copy file.") < posBreak, "first line holds the message start");
    //"[HH:MM:SS]  Error:  " is 20 characters
    t.check(errorsOnly.substr(posBreak + 1) == std::string(20, ' ') + "Device not ready\n", "continuation line is indented, blank lines dropped");

    t.check(log.formatLog().find("Transferred file") != std::string::npos, "unfiltered output has all entries");
}


void test_orphan_cleanup(TestContext& t)
{
    const test::TempFolder tmp;
    test::writeTestFile(tmp / Zstr("x.jpg.abcd.tbpart"), "stale", std::time(nullptr) - 3 * 24 * 3600);

    TransferLog log;
    TransferEngine engine(log);
    t.check(engine.cleanupOrphanedTempFiles(tmp.path()) == 1, "stale temp file removed");
    t.check(engine.cleanupOrphanedTempFiles(tmp.path()) == 0, "nothing left to remove");
}
}


int main()
{
    TestContext t;
    try
    {
        test_settings_validation(t);
        test_batch_success(t);
        test_batch_continue_on_error(t);
        test_batch_abort_on_first_error(t);
        test_batch_stop(t);
        test_batch_stop_during_preparation(t);
        test_retry_resets_batch_progress(t);
        test_single_file(t);
        test_index_contract(t);
        test_log_format(t);
        test_orphan_cleanup(t);
    }
    catch (const FileError& e) { t.check(false, "unexpected FileError: " + utfTo<std::string>(e.toString())); }
    return t.finish("transfer_engine_tests");
}
