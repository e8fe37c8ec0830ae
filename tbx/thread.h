// *****************************************************************************
// * This file is part of the TransferBox project. It is distributed under     *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju and TransferBox authors - All Rights Reserved         *
// *****************************************************************************

#ifndef THREAD_H_09127834560918273
#define THREAD_H_09127834560918273

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <stop_token>
#include <thread>
#include <vector>
#include "string_tools.h"
#include "zstring.h"


namespace tbx
{
//thrown by the task itself after observing its own stop token: never injected from outside
class ThreadStopRequest {};

//context of worker thread:
inline
void interruptionPoint(const std::stop_token& stopToken) //throw ThreadStopRequest
{
    if (stopToken.stop_requested())
        throw ThreadStopRequest();
}

template <class Rep, class Period>
void interruptibleSleep(const std::chrono::duration<Rep, Period>& relTime, const std::stop_token& stopToken); //throw ThreadStopRequest

void setCurrentThreadName(const Zstring& threadName);

//------------------------------------------------------------------------------------------

//value reachable only while holding its mutex: log.access([&](ErrorLog& l) { ... });
template <class T>
class Protected
{
public:
    Protected() {}

    template <class Function>
    auto access(Function fun)
    {
        std::lock_guard dummy(lockValue_);
        return fun(value_);
    }

private:
    Protected           (const Protected&) = delete;
    Protected& operator=(const Protected&) = delete;

    std::mutex lockValue_;
    T value_{};
};

//------------------------------------------------------------------------------------------

/*  fixed-size worker pool: at most threadCountMax tasks run at the same time, the rest waits FIFO
    - worker threads are created lazily, never more than tasks were submitted
    - tasks must not throw: catch what you expect inside the task!                          */
template <class Function>
class ThreadGroup
{
public:
    ThreadGroup(size_t threadCountMax, const Zstring& groupName) : threadCountMax_(threadCountMax), groupName_(groupName)
    { if (threadCountMax == 0) throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation!"); }

    ~ThreadGroup()
    {
        for (std::jthread& w : worker_)
            w.request_stop(); //stop *all* at the same time before join!
    } //~jthread() joins: running tasks are completed, pending ones are dropped

    //context of controlling thread, non-blocking:
    void run(Function&& wi)
    {
        {
            std::lock_guard dummy(workLoad_->lock);

            workLoad_->tasks.push_back(std::move(wi));
            const size_t tasksPending = ++(workLoad_->tasksPending);

            if (worker_.size() < std::min(tasksPending, threadCountMax_))
                addWorkerThread();
        }
        workLoad_->conditionNewTask.notify_all();
    }

    //context of controlling thread, blocking:
    void wait()
    {
        std::unique_lock dummy(workLoad_->lock);
        workLoad_->conditionAllDone.wait(dummy, [&wl = *workLoad_] { return wl.tasksPending == 0; });
    }


private:
    ThreadGroup           (const ThreadGroup&) = delete;
    ThreadGroup& operator=(const ThreadGroup&) = delete;

    void addWorkerThread()
    {
        Zstring threadName = groupName_ + Zstr('[') + numberTo<Zstring>(worker_.size() + 1) + Zstr('/') + numberTo<Zstring>(threadCountMax_) + Zstr(']');

        worker_.emplace_back([workLoad = workLoad_ /*share ownership!*/, threadName = std::move(threadName)](std::stop_token stopToken)
        {
            setCurrentThreadName(threadName);
            WorkLoad& wl = *workLoad;

            std::unique_lock dummy(wl.lock);
            for (;;)
            {
                if (!wl.conditionNewTask.wait(dummy, stopToken, [&tasks = wl.tasks] { return !tasks.empty(); }))
                    return; //stop requested

                Function task = std::move(wl.tasks.    front()); //noexcept thanks to move
                /**/                      wl.tasks.pop_front();  //

                dummy.unlock();
                task();
                dummy.lock();

                if (--(wl.tasksPending) == 0)
                    wl.conditionAllDone.notify_all();
            }
        });
    }

    struct WorkLoad
    {
        std::mutex lock;
        std::deque<Function> tasks; //FIFO! :)
        size_t tasksPending = 0;
        std::condition_variable_any conditionNewTask;
        std::condition_variable_any conditionAllDone;
    };

    const std::shared_ptr<WorkLoad> workLoad_ = std::make_shared<WorkLoad>();
    std::vector<std::jthread> worker_;
    const size_t threadCountMax_;
    const Zstring groupName_;
};








//###################### implementation ######################

template <class Rep, class Period> inline
void interruptibleSleep(const std::chrono::duration<Rep, Period>& relTime, const std::stop_token& stopToken) //throw ThreadStopRequest
{
    std::mutex dummyMutex;
    std::condition_variable_any dummyCondition;
    std::unique_lock dummy(dummyMutex);

    //returns early only if stop is requested
    dummyCondition.wait_for(dummy, stopToken, relTime, [] { return false; });
    interruptionPoint(stopToken); //throw ThreadStopRequest
}
}

#endif //THREAD_H_09127834560918273
