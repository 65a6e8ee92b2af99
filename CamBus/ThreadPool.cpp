///////////////////////////////////////////////////////////////////////////////
// FILE:          ThreadPool.cpp
// PROJECT:       CamBus
// SUBSYSTEM:     CamBus
//-----------------------------------------------------------------------------
// DESCRIPTION:   A class executing queued tasks on separate threads.
//
// LICENSE:       This file is distributed under the "Lesser GPL" (LGPL) license.
//                License text is included with the source distribution.
//
//                This file is distributed in the hope that it will be useful,
//                but WITHOUT ANY WARRANTY; without even the implied warranty
//                of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.
//
//                IN NO EVENT SHALL THE COPYRIGHT OWNER OR
//                CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT,
//                INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES.

#include "ThreadPool.h"

#include "Task.h"

#include <algorithm>
#include <mutex>
#include <thread>

namespace cambus {

ThreadPool::ThreadPool(size_t threadCount)
{
    const size_t count = std::max<size_t>(1, threadCount);
    for (size_t n = 0; n < count; ++n)
    {
        auto thread = std::make_unique<std::thread>(&ThreadPool::ThreadFunc, this);
        threads_.push_back(std::move(thread));
    }
}

ThreadPool::~ThreadPool()
{
    Abort();
}

size_t ThreadPool::GetSize() const
{
    return threads_.size();
}

bool ThreadPool::Execute(Task* task)
{
    {
        std::lock_guard<std::mutex> lock(mx_);
        if (abortFlag_)
            return false;
        queue_.push_back(task);
    }
    cv_.notify_one();
    return true;
}

void ThreadPool::Abort()
{
    {
        std::lock_guard<std::mutex> lock(mx_);
        if (abortFlag_)
            return;
        abortFlag_ = true;
    }
    cv_.notify_all();

    for (const auto& thread : threads_)
        thread->join();
}

bool ThreadPool::IsAborted() const
{
    std::lock_guard<std::mutex> lock(mx_);
    return abortFlag_;
}

void ThreadPool::ThreadFunc()
{
    for (;;)
    {
        Task* task = nullptr;
        {
            std::unique_lock<std::mutex> lock(mx_);
            cv_.wait(lock, [&]() { return abortFlag_ || !queue_.empty(); });
            // Someone is waiting on every queued task
            if (queue_.empty())
                break;
            task = queue_.front();
            queue_.pop_front();
        }
        task->Execute();
        task->Done();
    }
}

} // namespace cambus
