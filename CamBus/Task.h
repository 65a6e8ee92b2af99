///////////////////////////////////////////////////////////////////////////////
// FILE:          Task.h
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

#pragma once

#include <exception>
#include <functional>

namespace cambus {

class TaskCompletion;

class Task
{
public:
    explicit Task(TaskCompletion& completion);
    virtual ~Task() = default;

    virtual void Execute() = 0;
    // Signal the completion given to the constructor
    void Done();

private:
    TaskCompletion& completion_;
};

/**
 * Task running a function. An exception thrown by the function is kept so
 * that the thread waiting for the task can rethrow it.
 */
class FunctionTask final : public Task
{
public:
    FunctionTask(TaskCompletion& completion, std::function<void()> work);

    void Execute() override;

    bool Failed() const { return static_cast<bool>(exception_); }
    void RethrowIfFailed() const;

private:
    std::function<void()> work_;
    std::exception_ptr exception_{};
};

} // namespace cambus
