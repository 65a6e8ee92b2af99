///////////////////////////////////////////////////////////////////////////////
// FILE:          MessageBus.h
// PROJECT:       CamBus
// SUBSYSTEM:     CamBus
//-----------------------------------------------------------------------------
// DESCRIPTION:   In-process message bus delivering every message to every
//                module, in the order the modules were added.
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

#include "LogManager.h"
#include "Logging/Logger.h"
#include "Message.h"
#include "MessageRegistry.h"
#include "Module.h"

#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace cambus {

/**
 * Messages are dispatched one at a time, either on the bus's own dispatch
 * thread (between Start() and Stop()) or on the calling thread by
 * DispatchAll().
 */
class MessageBus
{
public:
   MessageBus();
   // Shuts the bus down if Shutdown() was not called
   ~MessageBus();

   MessageBus(const MessageBus&) = delete;
   MessageBus& operator=(const MessageBus&) = delete;

   LogManager& GetLogManager() { return logManager_; }
   MessageRegistry& GetRegistry() { return registry_; }
   const MessageRegistry& GetRegistry() const { return registry_; }

   /**
    * Add a module. Its RegisterMessages() is called before this returns.
    * Throws CamBusError if a module with the same name is already attached.
    */
   void AddModule(std::shared_ptr<Module> module);
   std::shared_ptr<Module> GetModule(const std::string& name) const;
   std::vector<std::string> GetModuleNames() const;

   /**
    * Queue a message for delivery. The payload is validated against the
    * registry first; CamBusError is thrown (and nothing is queued) if the
    * type is unknown or the payload does not fit.
    */
   void Send(std::shared_ptr<Message> msg);

   /**
    * Deliver queued messages on the calling thread, including messages
    * emitted while doing so, until the queue is empty. Returns the number of
    * messages delivered. Not allowed while the dispatch thread is running.
    */
   size_t DispatchAll();

   void Start();
   // Deliver the messages still queued, then stop the dispatch thread.
   void Stop();
   bool IsRunning() const;

   /**
    * Stop dispatching and call CleanUp() on every module. The bus accepts
    * no more messages afterwards.
    */
   void Shutdown();

private:
   void DispatchThreadFunc();
   void Dispatch(std::shared_ptr<Message> msg);
   void CheckAddressing(Message& msg,
         const std::vector<std::shared_ptr<Module>>& modules);
   std::vector<std::shared_ptr<Module>> GetModulesSnapshot() const;

   LogManager logManager_;
   logging::Logger logger_;
   MessageRegistry registry_;

   mutable std::mutex modulesMutex_;
   std::vector<std::shared_ptr<Module>> modules_;

   mutable std::mutex queueMutex_;
   std::condition_variable queueCondVar_;
   std::deque<std::shared_ptr<Message>> queue_;
   bool running_;
   bool stopRequested_;
   bool shutDown_;
   std::thread dispatchThread_;

   // Serializes Dispatch(); held while one message is being delivered
   std::mutex dispatchMutex_;
};

} // namespace cambus
