// *****************************************************************************
// * This file is part of the FtpDuo project. It is distributed under          *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef THREAD_H_5512093847710293
#define THREAD_H_5512093847710293

#include <atomic>
#include <cassert>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>


namespace duo
{
class ThreadStopRequest {};

//std::thread which is asked to stop and joined on destruction
class InterruptibleThread
{
public:
    template <class Function>
    explicit InterruptibleThread(Function&& f);

    ~InterruptibleThread()
    {
        requestStop();
        join();
    }

    void requestStop() { *stopRequested_ = true; }
    void join() { if (stdThread_.joinable()) stdThread_.join(); }

private:
    InterruptibleThread           (const InterruptibleThread&) = delete;
    InterruptibleThread& operator=(const InterruptibleThread&) = delete;

    const std::shared_ptr<std::atomic<bool>> stopRequested_ = std::make_shared<std::atomic<bool>>(false);
    std::thread stdThread_;
};

//context of InterruptibleThread only:
void interruptionPoint(); //throw ThreadStopRequest

void setCurrentThreadName(const std::string& threadName);

//------------------------------------------------------------------------------------------

/*  run on a new detached thread: unlike std::async() the returned future does not block in its destructor

    Example:
            auto ft = duo::runAsync([=]{ return listenSocket->accept(30, nullptr); });
            std::unique_ptr<Socket> socket = ft.get(); //throw SysError                 */
template <class Function>
auto runAsync(Function&& fun);

//------------------------------------------------------------------------------------------

//value associated with mutex and guaranteed protected access:
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










//###################### implementation ######################
namespace impl
{
inline thread_local const std::atomic<bool>* threadStopRequested = nullptr;
}


inline
void interruptionPoint() //throw ThreadStopRequest
{
    assert(impl::threadStopRequested);
    if (impl::threadStopRequested && *impl::threadStopRequested)
        throw ThreadStopRequest();
}


template <class Function> inline
InterruptibleThread::InterruptibleThread(Function&& f) :
    stdThread_([f = std::forward<Function>(f), stopRequested = stopRequested_]() mutable
{
    impl::threadStopRequested = stopRequested.get();
    try
    {
        f(); //throw ThreadStopRequest
    }
    catch (const ThreadStopRequest&) {}
}) {}


template <class Function> inline
auto runAsync(Function&& fun)
{
    std::packaged_task<decltype(fun())()> task(std::forward<Function>(fun));
    auto result = task.get_future();
    std::thread(std::move(task)).detach(); //[thread.thread.destr]: ~thread() calls std::terminate() if joinable()
    return result;
}
}

#endif //THREAD_H_5512093847710293
