///////////////////////////////////////////////////////////////////////////////
// FILE:          ScopedTaskRunner.cpp
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

#include "ScopedTaskRunner.h"

#include "CoreUtils.h"
#include "Error.h"
#include "Task.h"
#include "TaskCompletion.h"

#include <utility>

namespace cambus {

namespace {

class BusyGuard
{
   std::mutex& mutex_;
   bool& busy_;

public:
   BusyGuard(std::mutex& mutex, bool& busy) : mutex_(mutex), busy_(busy) {}
   ~BusyGuard()
   {
      std::lock_guard<std::mutex> lock(mutex_);
      busy_ = false;
   }
};

} // anonymous namespace

ScopedTaskRunner::ScopedTaskRunner(const std::string& ownerName,
      logging::Logger logger) :
   ownerName_(ownerName),
   logger_(logger),
   busy_(false),
   pool_(1)
{}

bool
ScopedTaskRunner::Run(Message& msg, std::function<void()> work)
{
   {
      std::lock_guard<std::mutex> lock(mutex_);
      if (busy_)
         throw CamBusError("Cannot run a task for " +
               ToQuotedString(msg.GetType()) + ": " + ownerName_ +
               " already has a task in flight", CAMBUS_ERR_TASK_BUSY);
      busy_ = true;
   }
   BusyGuard guard(mutex_, busy_);

   TaskCompletion done;
   FunctionTask task(done, std::move(work));
   if (!pool_.Execute(&task))
      throw CamBusError("Task runner of " + ownerName_ + " has been stopped",
            CAMBUS_ERR_BUS_STATE);

   LOG_TRACE(logger_) << "Waiting for task for " <<
      ToQuotedString(msg.GetType());
   done.Wait();

   try
   {
      task.RethrowIfFailed();
   }
   catch (const CamBusError& e)
   {
      LOG_ERROR(logger_) << "Task for " << ToQuotedString(msg.GetType()) <<
         " failed: " << e.getFullMsg();
      msg.AddError(MessageError(ownerName_, e.getFullMsg(), e.getCode()));
      return false;
   }
   return true;
}

bool
ScopedTaskRunner::IsBusy() const
{
   std::lock_guard<std::mutex> lock(mutex_);
   return busy_;
}

void
ScopedTaskRunner::Abort()
{
   pool_.Abort();
}

} // namespace cambus
