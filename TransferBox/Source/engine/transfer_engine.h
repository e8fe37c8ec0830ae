// *****************************************************************************
// * This file is part of the TransferBox project. It is distributed under     *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) TransferBox authors - All Rights Reserved                   *
// *****************************************************************************

#ifndef TRANSFER_ENGINE_H_6129038475610293
#define TRANSFER_ENGINE_H_6129038475610293

#include <memory>
#include "file_copier.h"
#include "transfer_queue.h"


namespace xfer
{
const std::chrono::milliseconds BATCH_PROGRESS_INTERVAL(100);
const std::chrono::seconds      BATCH_SPEED_WINDOW(10);


struct ActiveFileProgress
{
    size_t index = 0;
    Zstring sourcePath;
    ProgressSample sample;
};

struct BatchProgress
{
    uint64_t bytesTransferred = 0;
    uint64_t bytesTotal = 0;
    size_t filesCompleted = 0; //succeeded or failed
    size_t filesTotal = 0;
    std::vector<ActiveFileProgress> activeFiles; //ordered by index
    std::optional<double> bytesPerSec;  //sliding window
    std::optional<double> remainingSec; //
};


//all optional; serialized with each other; called from worker threads
struct TransferCallbacks
{
    std::function<void(uint64_t bytesTotal, size_t filesTotal)> onBatchStart; //transferFiles(): sizes are known, no file started yet
    std::function<void(size_t index, const Zstring& sourcePath, const ProgressSample& sample)> onFileProgress; //throttled per file
    std::function<void(const BatchProgress& progress)> onBatchProgress; //at most every BATCH_PROGRESS_INTERVAL
    std::function<void(size_t index, const FileTransferResult& result)> onFileComplete; //once per started file
};


enum class BatchStatus
{
    completed,
    completedWithErrors, //continueOnError: some files failed, the rest continued
    aborted,             //first failure stopped the batch
    cancelled,
};

struct BatchOutcome
{
    std::vector<std::optional<FileTransferResult>> results; //results[i] for tasks[i]; empty if never started
    BatchStatus status = BatchStatus::completed;
    std::optional<TransferError> abortError; //BatchStatus::aborted only
};

std::wstring getBatchStatusLabel(BatchStatus status);


//owned by the application and passed to whoever transfers files
class TransferEngine
{
public:
    explicit TransferEngine(TransferLog& log, std::unique_ptr<const FileCopier>&& copier = std::make_unique<const FileCopier>());

    //copy + verify + retry for a single file; never throws for I/O problems
    FileTransferResult transferFile(const TransferTask& task, const TransferSettings& settings, const TransferCallbacks& callbacks,
                                    const std::stop_token& stopToken = {});

    //CONTRACT: tasks[i].index == i
    BatchOutcome transferFiles(const std::vector<TransferTask>& tasks, const TransferSettings& settings, const TransferCallbacks& callbacks);

    void stop(); //thread-safe; cancels the running batch (if any), including its preparation

    size_t cleanupOrphanedTempFiles(const Zstring& folderPath, std::chrono::seconds maxAge = ORPHANED_TEMP_FILE_MAX_AGE); //throw FileError

private:
    TransferEngine           (const TransferEngine&) = delete;
    TransferEngine& operator=(const TransferEngine&) = delete;

    FileTransferResult runTransfer(const TransferTask& task, const TransferSettings& settings,
                                   const std::function<void(const ProgressSample& sample)>& onProgress,
                                   const std::function<void()>& onRetry, //progress of the failed attempt is void
                                   const std::stop_token& stopToken); //throw TransferError, ThreadStopRequest

    size_t getBufferSize(const Zstring& targetPath, const TransferSettings& settings);

    void logResult(const FileTransferResult& result);

    TransferLog& log_;
    const std::unique_ptr<const FileCopier> copier_;

    std::mutex lockActiveQueue_;
    TransferQueue<FileTransferResult>* activeQueue_ = nullptr;
    bool stopRequested_ = false; //stop() for the current batch, possibly before its queue exists
};
}

#endif //TRANSFER_ENGINE_H_6129038475610293
