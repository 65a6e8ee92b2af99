///////////////////////////////////////////////////////////////////////////////
// FILE:          Task.cpp
// PROJECT:       CamBus
// SUBSYSTEM:     CamBus
//-----------------------------------------------------------------------------
// DESCRIPTION:   Unit of work executed by a ThreadPool.
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

#include "Task.h"

#include "TaskCompletion.h"

#include <utility>

namespace cambus {

Task::Task(TaskCompletion& completion)
    : completion_(completion)
{
}

void Task::Done()
{
    completion_.Signal();
}

FunctionTask::FunctionTask(TaskCompletion& completion,
        std::function<void()> work)
    : Task(completion),
      work_(std::move(work))
{
}

void FunctionTask::Execute()
{
    try
    {
        work_();
    }
    catch (...)
    {
        // Transported to the waiting thread by RethrowIfFailed()
        exception_ = std::current_exception();
    }
}

void FunctionTask::RethrowIfFailed() const
{
    if (exception_)
        std::rethrow_exception(exception_);
}

} // namespace cambus
