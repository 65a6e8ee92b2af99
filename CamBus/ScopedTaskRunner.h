///////////////////////////////////////////////////////////////////////////////
// FILE:          ScopedTaskRunner.h
// PROJECT:       CamBus
// SUBSYSTEM:     CamBus
//-----------------------------------------------------------------------------
// DESCRIPTION:   Runs blocking work for a module off the dispatch path.
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

#include "Logging/Logger.h"
#include "Message.h"
#include "ThreadPool.h"

#include <functional>
#include <mutex>
#include <string>

namespace cambus {

/**
 * One worker thread, at most one task in flight.
 */
class ScopedTaskRunner
{
public:
   ScopedTaskRunner(const std::string& ownerName, logging::Logger logger);

   ScopedTaskRunner(const ScopedTaskRunner&) = delete;
   ScopedTaskRunner& operator=(const ScopedTaskRunner&) = delete;

   /**
    * Run work on the worker thread and wait for it to finish.
    *
    * If work throws CamBusError, the error is recorded on msg as a failure
    * of the owner and false is returned. Other exceptions are rethrown on the
    * calling thread.
    *
    * Throws CamBusError (CAMBUS_ERR_TASK_BUSY) if a task is already in
    * flight, and (CAMBUS_ERR_BUS_STATE) after Abort().
    */
   bool Run(Message& msg, std::function<void()> work);

   bool IsBusy() const;

   // Join the worker thread. Run() fails afterwards.
   void Abort();

private:
   const std::string ownerName_;
   logging::Logger logger_;

   mutable std::mutex mutex_;
   bool busy_;

   ThreadPool pool_;
};

} // namespace cambus
