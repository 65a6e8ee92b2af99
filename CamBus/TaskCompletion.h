///////////////////////////////////////////////////////////////////////////////
// FILE:          TaskCompletion.h
// PROJECT:       CamBus
// SUBSYSTEM:     CamBus
//-----------------------------------------------------------------------------
// DESCRIPTION:   One-shot signal from a worker task to the thread waiting
//                for it.
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

#pragma once

#include <condition_variable>
#include <mutex>

namespace cambus {

class TaskCompletion final
{
public:
    TaskCompletion() = default;

    TaskCompletion(const TaskCompletion&) = delete;
    TaskCompletion& operator=(const TaskCompletion&) = delete;

    // Called once by the worker when the task has finished
    void Signal();
    bool IsSignaled() const;
    // Block until Signal() has been called
    void Wait();

private:
    bool signaled_{ false };
    mutable std::mutex mx_{};
    std::condition_variable cv_{};
};

} // namespace cambus
