// *****************************************************************************
// * This file is part of the TransferBox project. It is distributed under     *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) TransferBox authors - All Rights Reserved                   *
// *****************************************************************************

#include "transfer_engine.h"
#include <cmath>
#include <map>
#include <numeric>
#include <tbx/format_unit.h>
#include <tbx/stop_watch.h>
#include "retry_strategy.h"
#include "speed_test.h"

using namespace tbx;
using namespace xfer;


namespace
{
//aggregate per-file progress into batch totals; also serializes all user callbacks
class BatchReporter
{
public:
    BatchReporter(const std::vector<TransferTask>& tasks, const std::vector<uint64_t>& fileSizes, const TransferCallbacks& callbacks) :
        tasks_(tasks),
        bytesTotal_(std::accumulate(fileSizes.begin(), fileSizes.end(), uint64_t(0))),
        callbacks_(callbacks) {}

    void fileProgress(size_t index, const ProgressSample& sample)
    {
        {
            std::lock_guard dummy(lockState_);
            activeFiles_[index] = sample;
        }
        if (callbacks_.onFileProgress)
        {
            std::lock_guard dummy(lockCallback_);
            callbacks_.onFileProgress(index, tasks_[index].sourcePath, sample);
        }
        reportBatch(false /*force*/);
    }

    void fileCompleted(size_t index, const FileTransferResult& result)
    {
        {
            std::lock_guard dummy(lockState_);
            activeFiles_.erase(index);
            ++filesCompleted_;
            if (result.success)
                bytesCompleted_ += result.bytesTransferred;
        }
        if (callbacks_.onFileComplete)
        {
            std::lock_guard dummy(lockCallback_);
            callbacks_.onFileComplete(index, result);
        }
        reportBatch(false /*force*/);
    }

    //a failed attempt is retried from scratch: its bytes no longer count
    void fileRestarting(size_t index)
    {
        {
            std::lock_guard dummy(lockState_);
            activeFiles_.erase(index);
        }
        reportBatch(true /*force*/);
    }

    void reportBatch(bool force)
    {
        if (!callbacks_.onBatchProgress)
            return;

        std::lock_guard dummy(lockCallback_); //lock order: lockCallback_ before lockState_
        BatchProgress progress;
        {
            std::lock_guard dummy2(lockState_);
            const std::chrono::nanoseconds timeElapsed = stopWatch_.elapsed();
            if (!force && lastReport_ && timeElapsed - *lastReport_ < BATCH_PROGRESS_INTERVAL)
                return;
            lastReport_ = timeElapsed;

            progress.bytesTransferred = bytesCompleted_;
            progress.bytesTotal       = bytesTotal_;
            progress.filesCompleted   = filesCompleted_;
            progress.filesTotal       = tasks_.size();

            for (const auto& [index, sample] : activeFiles_)
            {
                progress.bytesTransferred += sample.bytesTransferred;
                progress.activeFiles.push_back({index, tasks_[index].sourcePath, sample});
            }

            speedTest_.addSample(timeElapsed, static_cast<int>(filesCompleted_), static_cast<int64_t>(progress.bytesTransferred));
            progress.bytesPerSec = speedTest_.getBytesPerSec();
            if (progress.bytesTotal >= progress.bytesTransferred)
                progress.remainingSec = speedTest_.getRemainingSec(static_cast<int64_t>(progress.bytesTotal - progress.bytesTransferred));
        }
        callbacks_.onBatchProgress(progress);
    }

private:
    const std::vector<TransferTask>& tasks_;
    const uint64_t bytesTotal_;
    const TransferCallbacks& callbacks_;

    std::mutex lockState_;
    std::map<size_t, ProgressSample> activeFiles_;
    uint64_t bytesCompleted_ = 0;
    size_t filesCompleted_ = 0;
    SpeedTest speedTest_{BATCH_SPEED_WINDOW};
    const StopWatch stopWatch_;
    std::optional<std::chrono::nanoseconds> lastReport_;

    std::mutex lockCallback_;
};


//the target folder may not exist yet: check the closest existing parent
bool isNetworkTarget(const Zstring& targetPath) //throw FileError
{
    std::optional<Zstring> folderPath = getParentFolderPath(targetPath);
    while (folderPath && !itemExists(*folderPath)) //throw FileError
        folderPath = getParentFolderPath(*folderPath);

    return folderPath && isNetworkFileSystem(*folderPath); //throw FileError
}
}


std::wstring xfer::getBatchStatusLabel(BatchStatus status)
{
    switch (status)
    {
        case BatchStatus::completed:
            return _("Completed successfully");
        case BatchStatus::completedWithErrors:
            return _("Completed with errors");
        case BatchStatus::aborted:
            return _("Stopped after an error");
        case BatchStatus::cancelled:
            return _("Stopped");
    }
    assert(false);
    return std::wstring();
}


TransferEngine::TransferEngine(TransferLog& log, std::unique_ptr<const FileCopier>&& copier) :
    log_(log),
    copier_(std::move(copier))
{
    if (!copier_)
        throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation!");
}


size_t TransferEngine::getBufferSize(const Zstring& targetPath, const TransferSettings& settings)
{
    if (settings.adaptToNetworkTarget)
        try
        {
            if (isNetworkTarget(targetPath)) //throw FileError
                return settings.networkBufferSize;
        }
        catch (const FileError& e) { log_.logWarning(e.toString()); } //not critical: the copy will report real problems

    return settings.bufferSize;
}


FileTransferResult TransferEngine::runTransfer(const TransferTask& task, const TransferSettings& settings,
                                               const std::function<void(const ProgressSample& sample)>& onProgress,
                                               const std::function<void()>& onRetry,
                                               const std::stop_token& stopToken) //throw TransferError, ThreadStopRequest
{
    CopyOptions options;
    options.bufferSize          = getBufferSize(task.targetPath, settings);
    options.verifyChecksum      = settings.verifyChecksum;
    options.overwrite           = settings.overwrite;
    options.preservePermissions = settings.preservePermissions;
    options.preserveModTime     = settings.preserveModTime;
    options.hashAlgorithm       = settings.hashAlgorithm;
    options.onProgress          = onProgress;
    options.stopToken           = stopToken;

    return withRetry([&] { return copier_->copyFile(task.sourcePath, task.targetPath, options); }, //throw TransferError, FileError, ThreadStopRequest
                     settings.retry, stopToken,
                     [&](size_t attempt, const TransferError& e, std::chrono::milliseconds delay)
    {
        log_.logWarning(replaceCpy(replaceCpy(replaceCpy(_("Attempt %x of %y failed. Retrying in %z..."),
                                                         L"%x", numberTo<std::wstring>(attempt)),
                                              L"%y", numberTo<std::wstring>(settings.retry.maxAttempts)),
                                   L"%z", formatRemainingTime(std::chrono::duration<double>(delay).count())) + L"\n\n" + e.toString());
        if (onRetry)
            onRetry();
    }); //throw TransferError, ThreadStopRequest
}


void TransferEngine::logResult(const FileTransferResult& result)
{
    if (result.success)
    {
        std::wstring msg = replaceCpy(_("Transferred file %x"), L"%x", fmtPath(result.targetPath)) + L" (" + formatFilesizeShort(static_cast<int64_t>(result.bytesTransferred));
        if (result.duration.count() > 0)
            msg += L", " + replaceCpy(_("%x/sec"), L"%x", formatFilesizeShort(std::llround(result.bytesTransferred * 1000.0 / result.duration.count())));
        msg += L')';
        log_.logInfo(msg);
    }
    else if (result.isCancelled())
        log_.logInfo(replaceCpy(_("Cancelled transfer of %x"), L"%x", fmtPath(result.sourcePath)));
    else
        log_.logError(result.errorMsg ? *result.errorMsg : replaceCpy(_("Cannot copy file %x."), L"%x", fmtPath(result.sourcePath)));
}


FileTransferResult TransferEngine::transferFile(const TransferTask& task, const TransferSettings& settings, const TransferCallbacks& callbacks,
                                                const std::stop_token& stopToken)
{
    TransferSettings cfg = settings;
    for (const std::wstring& msg : validateSettings(cfg))
        log_.logWarning(msg);

    const std::vector<TransferTask> tasks{task};
    BatchReporter reporter(tasks, {task.expectedSize.value_or(0)}, callbacks);

    const StopWatch stopWatch;
    FileTransferResult result;
    try
    {
        result = runTransfer(task, cfg,
                             [&](const ProgressSample& sample) { reporter.fileProgress(0, sample); },
                             [&] { reporter.fileRestarting(0); }, stopToken); //throw TransferError, ThreadStopRequest
        result.duration = stopWatch.elapsedMs(); //including retries
    }
    catch (const TransferError& e) { result = makeFailureResult(task.sourcePath, task.targetPath, e, stopWatch.elapsedMs()); }
    catch (ThreadStopRequest&) { result = makeFailureResult(task.sourcePath, task.targetPath, cancelled(), stopWatch.elapsedMs()); }

    logResult(result);
    reporter.fileCompleted(0, result);

    log_.mergeExtraLog();
    return result;
}


BatchOutcome TransferEngine::transferFiles(const std::vector<TransferTask>& tasks, const TransferSettings& settings, const TransferCallbacks& callbacks)
{
    BatchOutcome outcome;
    outcome.results.resize(tasks.size());

    if (tasks.empty())
        return outcome;

    for (size_t i = 0; i < tasks.size(); ++i)
        if (tasks[i].index != i)
            throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation!");

    {
        std::lock_guard dummy(lockActiveQueue_);
        stopRequested_ = false; //stop() only ever affects the batch it was called for
    }

    TransferSettings cfg = settings;
    for (const std::wstring& msg : validateSettings(cfg))
        log_.logWarning(msg);

    std::vector<uint64_t> fileSizes;
    for (const TransferTask& task : tasks)
        if (task.expectedSize)
            fileSizes.push_back(*task.expectedSize);
        else
            try { fileSizes.push_back(getFileSize(task.sourcePath)); /*throw FileError*/ }
            catch (FileError&) { fileSizes.push_back(0); } //the copy itself will report the error

    BatchReporter reporter(tasks, fileSizes, callbacks);

    if (callbacks.onBatchStart)
        callbacks.onBatchStart(std::accumulate(fileSizes.begin(), fileSizes.end(), uint64_t(0)), tasks.size());

    auto settle = [&](size_t index, const FileTransferResult& result)
    {
        logResult(result);
        outcome.results[index] = result; //each slot is written by its own task only
        reporter.fileCompleted(index, result);
    };

    TransferQueueOptions queueOptions;
    queueOptions.concurrencyLimit = cfg.concurrencyLimit;
    queueOptions.continueOnError  = cfg.continueOnError;
    queueOptions.log              = &log_;

    TransferQueue<FileTransferResult> queue(queueOptions);
    {
        std::vector<QueueTask<FileTransferResult>> queueTasks;
        for (const TransferTask& task : tasks)
            queueTasks.push_back({task.index, [&](const std::stop_token& stopToken) //throw TransferError, ThreadStopRequest
            {
                const StopWatch stopWatch;
                try
                {
                    FileTransferResult result = runTransfer(task, cfg,
                                                            [&](const ProgressSample& sample) { reporter.fileProgress(task.index, sample); },
                                                            [&] { reporter.fileRestarting(task.index); }, stopToken);
                    result.duration = stopWatch.elapsedMs();
                    settle(task.index, result);
                    return result;
                }
                catch (const TransferError& e)
                {
                    settle(task.index, makeFailureResult(task.sourcePath, task.targetPath, e, stopWatch.elapsedMs()));
                    throw;
                }
                catch (ThreadStopRequest&)
                {
                    settle(task.index, makeFailureResult(task.sourcePath, task.targetPath, cancelled(), stopWatch.elapsedMs()));
                    throw;
                }
            }});
        queue.addTasks(std::move(queueTasks));
    }

    {
        std::lock_guard dummy(lockActiveQueue_);
        activeQueue_ = &queue;
        if (stopRequested_) //stop() during preparation
            queue.stop();
    }
    TBX_ON_SCOPE_EXIT(std::lock_guard dummy(lockActiveQueue_); activeQueue_ = nullptr);

    const StopWatch stopWatch;
    try
    {
        queue.execute(); //throw TransferError
        outcome.status = queue.getErrors().empty() ? BatchStatus::completed : BatchStatus::completedWithErrors;
    }
    catch (const TransferError& e)
    {
        if (e.getKind() == ErrorKind::cancelled)
            outcome.status = BatchStatus::cancelled;
        else
        {
            outcome.status = BatchStatus::aborted;
            outcome.abortError = e;
        }
    }
    reporter.reportBatch(true /*force*/);

    //summary
    size_t filesOk = 0;
    uint64_t bytesOk = 0;
    for (const std::optional<FileTransferResult>& result : outcome.results)
        if (result && result->success)
        {
            ++filesOk;
            bytesOk += result->bytesTransferred;
        }

    log_.logMessage(getBatchStatusLabel(outcome.status) + L": " +
                    replaceCpy(replaceCpy(_("%x of %y files transferred"), L"%x", numberTo<std::wstring>(filesOk)), L"%y", numberTo<std::wstring>(tasks.size())) +
                    L" (" + formatFilesizeShort(static_cast<int64_t>(bytesOk)) + L", " +
                    formatRemainingTime(std::chrono::duration<double>(stopWatch.elapsed()).count()) + L')',
                    outcome.status == BatchStatus::completed || outcome.status == BatchStatus::cancelled ? MSG_TYPE_INFO : MSG_TYPE_ERROR);

    log_.mergeExtraLog();
    return outcome;
}


void TransferEngine::stop()
{
    std::lock_guard dummy(lockActiveQueue_);
    stopRequested_ = true;
    if (activeQueue_)
        activeQueue_->stop();
}


size_t TransferEngine::cleanupOrphanedTempFiles(const Zstring& folderPath, std::chrono::seconds maxAge) //throw FileError
{
    const size_t itemsDeleted = xfer::cleanupOrphanedTempFiles(folderPath, maxAge, log_); //throw FileError
    log_.mergeExtraLog();
    return itemsDeleted;
}
