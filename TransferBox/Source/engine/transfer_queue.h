// *****************************************************************************
// * This file is part of the TransferBox project. It is distributed under     *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) TransferBox authors - All Rights Reserved                   *
// *****************************************************************************

#ifndef TRANSFER_QUEUE_H_8901273465091827
#define TRANSFER_QUEUE_H_8901273465091827

#include <functional>
#include <optional>
#include <stop_token>
#include <vector>
#include <tbx/thread.h>
#include "structures.h"
#include "transfer_log.h"


namespace xfer
{
struct TransferQueueOptions
{
    size_t concurrencyLimit = DEFAULT_CONCURRENCY; //[1, 10], otherwise default
    bool continueOnError = false;

    //optional; serialized, at most once per task; must not throw
    std::function<void(size_t index)> onTaskStart;
    std::function<void(size_t index, bool success)> onTaskComplete;

    TransferLog* log = nullptr; //optional
};


template <class T>
struct QueueTask
{
    size_t index = 0; //unique, < number of tasks
    std::function<T(const std::stop_token& stopToken)> run; //throw FileError, ThreadStopRequest
};


struct QueueError
{
    size_t index = 0;
    TransferError error;
};


/*  bounded concurrency: at most "concurrencyLimit" tasks are running; a finished task immediately makes room for the next one

    continueOnError == false: first failure stops scheduling; in-flight tasks are awaited, then execute() throws that error
    continueOnError == true:  failures leave an empty result slot, see getErrors()

    stop(): cooperative; no new tasks are started, running tasks see their stop token => execute() throws ErrorKind::cancelled  */
template <class T>
class TransferQueue
{
public:
    explicit TransferQueue(const TransferQueueOptions& options);

    void addTasks(std::vector<QueueTask<T>> tasks); //not while execute() is running

    //results[i] belongs to the task with index i; empty if failed or never started
    std::vector<std::optional<T>> execute(); //throw TransferError

    void stop(); //thread-safe

    //CONTRACT: not while execute() is running
    void reset();

    size_t getActiveCount    () const { std::lock_guard dummy(lock_); return activeCount_; }
    size_t getCompletedCount () const { std::lock_guard dummy(lock_); return completedCount_; }
    size_t getPeakActiveCount() const { std::lock_guard dummy(lock_); return peakActiveCount_; }
    size_t getTotalCount     () const { std::lock_guard dummy(lock_); return tasks_.size(); }
    bool   isStopped         () const { std::lock_guard dummy(lock_); return stopped_; }
    std::vector<QueueError> getErrors() const { std::lock_guard dummy(lock_); return errors_; } //in order of occurrence

    size_t getConcurrencyLimit() const { return concurrencyLimit_; }

private:
    TransferQueue           (const TransferQueue&) = delete;
    TransferQueue& operator=(const TransferQueue&) = delete;

    void runTask(const QueueTask<T>& task, const std::stop_token& stopToken); //context of worker thread

    template <class Function>
    void notify(Function fun) { std::lock_guard dummy(lockCallback_); fun(); }

    const TransferQueueOptions options_;
    const size_t concurrencyLimit_;

    mutable std::mutex lock_;
    std::vector<QueueTask<T>> tasks_;
    std::vector<std::optional<T>> results_;
    std::vector<QueueError> errors_;
    std::optional<TransferError> firstError_;
    size_t activeCount_     = 0;
    size_t completedCount_  = 0;
    size_t peakActiveCount_ = 0;
    bool stopped_ = false;
    bool running_ = false;
    std::stop_source stopSource_;

    std::mutex lockCallback_;
};








//######################## implementation ##############################
namespace impl
{
inline
size_t getValidConcurrency(size_t concurrencyLimit, TransferLog* log)
{
    if (MIN_CONCURRENCY <= concurrencyLimit && concurrencyLimit <= MAX_CONCURRENCY)
        return concurrencyLimit;

    if (log)
        log->logWarning(tbx::replaceCpy(tbx::replaceCpy(_("Invalid concurrency limit %x. Using default %y instead."),
                                                        L"%x", tbx::numberTo<std::wstring>(concurrencyLimit)),
                                        L"%y", tbx::numberTo<std::wstring>(DEFAULT_CONCURRENCY)));
    return DEFAULT_CONCURRENCY;
}
}


template <class T> inline
TransferQueue<T>::TransferQueue(const TransferQueueOptions& options) :
    options_(options),
    concurrencyLimit_(impl::getValidConcurrency(options.concurrencyLimit, options.log)) {}


template <class T> inline
void TransferQueue<T>::addTasks(std::vector<QueueTask<T>> tasks)
{
    std::lock_guard dummy(lock_);
    if (running_)
        throw std::logic_error(std::string(__FILE__) + '[' + tbx::numberTo<std::string>(__LINE__) + "] Contract violation!");

    for (QueueTask<T>& task : tasks)
        tasks_.push_back(std::move(task));
}


template <class T> inline
void TransferQueue<T>::stop()
{
    std::lock_guard dummy(lock_);
    stopped_ = true;
    stopSource_.request_stop();
}


template <class T> inline
void TransferQueue<T>::reset()
{
    std::lock_guard dummy(lock_);
    if (running_)
        throw std::logic_error(std::string(__FILE__) + '[' + tbx::numberTo<std::string>(__LINE__) + "] Contract violation!");

    tasks_.clear();
    results_.clear();
    errors_.clear();
    firstError_.reset();
    activeCount_ = completedCount_ = peakActiveCount_ = 0;
    stopped_ = false;
    stopSource_ = std::stop_source();
}


template <class T> inline
std::vector<std::optional<T>> TransferQueue<T>::execute() //throw TransferError
{
    std::stop_token stopToken;
    {
        std::lock_guard dummy(lock_);
        if (running_)
            throw std::logic_error(std::string(__FILE__) + '[' + tbx::numberTo<std::string>(__LINE__) + "] Contract violation!");

        if (tasks_.empty())
            return {};

        //each index must address exactly one result slot
        std::vector<bool> indexUsed(tasks_.size());
        for (const QueueTask<T>& task : tasks_)
        {
            if (task.index >= tasks_.size() || indexUsed[task.index])
                throw std::logic_error(std::string(__FILE__) + '[' + tbx::numberTo<std::string>(__LINE__) + "] Contract violation!");
            indexUsed[task.index] = true;
        }

        results_.assign(tasks_.size(), std::nullopt);
        errors_.clear();
        firstError_.reset();
        activeCount_ = completedCount_ = peakActiveCount_ = 0;
        running_ = true;

        stopSource_ = std::stop_source();
        if (stopped_) //stop() before execute()
            stopSource_.request_stop();
        stopToken = stopSource_.get_token();
    }
    TBX_ON_SCOPE_EXIT(std::lock_guard dummy(lock_); running_ = false);

    {
        tbx::ThreadGroup<std::function<void()>> workers(std::min(concurrencyLimit_, tasks_.size()), Zstr("Transfer"));

        for (const QueueTask<T>& task : tasks_)
            workers.run([this, &task, stopToken] { runTask(task, stopToken); });

        workers.wait(); //all tasks settled: started ones ran to completion, the rest was skipped
    }

    std::lock_guard dummy(lock_);
    if (stopped_)
        throw TransferError(_("Transfer queue was cancelled."), ErrorKind::cancelled);

    if (firstError_ && !options_.continueOnError)
        throw *firstError_;

    return results_;
}


template <class T> inline
void TransferQueue<T>::runTask(const QueueTask<T>& task, const std::stop_token& stopToken) //context of worker thread
{
    {
        std::lock_guard dummy(lock_);
        if (stopped_ || (firstError_ && !options_.continueOnError))
            return; //never started: result slot stays empty

        ++activeCount_;
        peakActiveCount_ = std::max(peakActiveCount_, activeCount_);
        assert(activeCount_ <= concurrencyLimit_);
    }

    if (options_.onTaskStart)
        notify([&] { options_.onTaskStart(task.index); });

    std::optional<T> result;
    std::optional<TransferError> error;
    try
    {
        result = task.run(stopToken); //throw FileError, ThreadStopRequest
    }
    catch (const tbx::FileError& e) { error = wrapError(e); }
    catch (tbx::ThreadStopRequest&) {} //cancelled: not an error

    {
        std::lock_guard dummy(lock_);
        --activeCount_;
        ++completedCount_;

        if (result)
            results_[task.index] = std::move(*result);
        else if (error && error->getKind() != ErrorKind::cancelled)
        {
            errors_.push_back({task.index, *error});
            if (!firstError_)
                firstError_ = *error;
        }
    }

    if (options_.onTaskComplete)
        notify([&] { options_.onTaskComplete(task.index, static_cast<bool>(result)); });
}
}

#endif //TRANSFER_QUEUE_H_8901273465091827
