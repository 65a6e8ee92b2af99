///////////////////////////////////////////////////////////////////////////////
// FILE:          TaskCompletion.cpp
// PROJECT:       CamBus
// SUBSYSTEM:     CamBus
//-----------------------------------------------------------------------------
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

#include "TaskCompletion.h"

namespace cambus {

void TaskCompletion::Signal()
{
    {
        std::lock_guard<std::mutex> lock(mx_);
        signaled_ = true;
    }
    cv_.notify_all();
}

bool TaskCompletion::IsSignaled() const
{
    std::lock_guard<std::mutex> lock(mx_);
    return signaled_;
}

void TaskCompletion::Wait()
{
    std::unique_lock<std::mutex> lock(mx_);
    cv_.wait(lock, [this]() { return signaled_; });
}

} // namespace cambus
