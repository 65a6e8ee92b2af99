///////////////////////////////////////////////////////////////////////////////
// FILE:          MessageBus.cpp
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

#include "MessageBus.h"

#include "BusFeatures.h"
#include "CoreUtils.h"
#include "Error.h"

#include <algorithm>
#include <exception>
#include <utility>

namespace cambus {

MessageBus::MessageBus() :
   logger_(logManager_.NewLogger("bus")),
   running_(false),
   stopRequested_(false),
   shutDown_(false)
{
   RegisterStandardMessages(registry_);
}

MessageBus::~MessageBus()
{
   Shutdown();
}

void
MessageBus::AddModule(std::shared_ptr<Module> module)
{
   if (!module)
      throw CamBusError("Null module");

   {
      std::lock_guard<std::mutex> lock(modulesMutex_);
      for (const std::shared_ptr<Module>& existing : modules_)
      {
         if (existing->GetName() == module->GetName())
            throw CamBusError("A module named " +
                  ToQuotedString(module->GetName()) +
                  " is already attached to the bus",
                  CAMBUS_ERR_DUPLICATE_MODULE);
      }
   }

   module->RegisterMessages(registry_);

   {
      std::lock_guard<std::mutex> lock(modulesMutex_);
      module->bus_ = this;
      modules_.push_back(module);
   }
   LOG_DEBUG(logger_) << "Added module " << module->GetName();
}

std::shared_ptr<Module>
MessageBus::GetModule(const std::string& name) const
{
   std::lock_guard<std::mutex> lock(modulesMutex_);
   for (const std::shared_ptr<Module>& module : modules_)
   {
      if (module->GetName() == name)
         return module;
   }
   return std::shared_ptr<Module>();
}

std::vector<std::string>
MessageBus::GetModuleNames() const
{
   std::lock_guard<std::mutex> lock(modulesMutex_);
   std::vector<std::string> names;
   for (const std::shared_ptr<Module>& module : modules_)
      names.push_back(module->GetName());
   return names;
}

std::vector<std::shared_ptr<Module>>
MessageBus::GetModulesSnapshot() const
{
   std::lock_guard<std::mutex> lock(modulesMutex_);
   return modules_;
}

void
MessageBus::Send(std::shared_ptr<Message> msg)
{
   if (!msg)
      throw CamBusError("Null message");

   try
   {
      registry_.ValidateData(msg->GetType(), msg->GetData());
   }
   catch (const CamBusError& e)
   {
      LOG_ERROR(logger_) << "Rejected message " <<
         ToQuotedString(msg->GetType()) << " from " << msg->GetSource() <<
         ": " << e.getMsg();
      throw;
   }
   msg->AttachRegistry(&registry_);

   {
      std::lock_guard<std::mutex> lock(queueMutex_);
      if (shutDown_)
         throw CamBusError("Cannot send message " +
               ToQuotedString(msg->GetType()) + ": the bus is shut down",
               CAMBUS_ERR_BUS_STATE);
      queue_.push_back(msg);
   }
   LOG_TRACE(logger_) << "Queued message " << ToQuotedString(msg->GetType()) <<
      " from " << msg->GetSource();
   queueCondVar_.notify_one();
}

size_t
MessageBus::DispatchAll()
{
   size_t count = 0;
   for (;;)
   {
      std::shared_ptr<Message> msg;
      {
         std::lock_guard<std::mutex> lock(queueMutex_);
         if (running_)
            throw CamBusError("Cannot dispatch on the calling thread while "
                  "the dispatch thread is running", CAMBUS_ERR_BUS_STATE);
         if (queue_.empty())
            break;
         msg = queue_.front();
         queue_.pop_front();
      }
      Dispatch(msg);
      ++count;
   }
   return count;
}

void
MessageBus::Start()
{
   std::lock_guard<std::mutex> lock(queueMutex_);
   if (shutDown_)
      throw CamBusError("Cannot start a bus that has been shut down",
            CAMBUS_ERR_BUS_STATE);
   if (running_)
      return;
   running_ = true;
   stopRequested_ = false;
   dispatchThread_ = std::thread(&MessageBus::DispatchThreadFunc, this);
   LOG_INFO(logger_) << "Dispatch thread started";
}

void
MessageBus::Stop()
{
   {
      std::lock_guard<std::mutex> lock(queueMutex_);
      if (!running_)
         return;
      stopRequested_ = true;
   }
   queueCondVar_.notify_all();
   dispatchThread_.join();

   {
      std::lock_guard<std::mutex> lock(queueMutex_);
      running_ = false;
      stopRequested_ = false;
   }
   LOG_INFO(logger_) << "Dispatch thread stopped";
}

bool
MessageBus::IsRunning() const
{
   std::lock_guard<std::mutex> lock(queueMutex_);
   return running_;
}

void
MessageBus::Shutdown()
{
   Stop();
   {
      std::lock_guard<std::mutex> lock(queueMutex_);
      if (shutDown_)
         return;
      shutDown_ = true;
      if (!queue_.empty())
         LOG_WARNING(logger_) << "Shutting down with " << queue_.size() <<
            " undelivered message(s)";
      queue_.clear();
   }

   for (const std::shared_ptr<Module>& module : GetModulesSnapshot())
   {
      try
      {
         module->CleanUp();
      }
      catch (const CamBusError& e)
      {
         LOG_ERROR(logger_) << "Error cleaning up module " <<
            module->GetName() << ": " << e.getFullMsg();
      }
      catch (const std::exception& e)
      {
         LOG_ERROR(logger_) << "Error cleaning up module " <<
            module->GetName() << ": " << e.what();
      }
   }
   LOG_INFO(logger_) << "Bus shut down";
   logManager_.Flush();
}

void
MessageBus::DispatchThreadFunc()
{
   for (;;)
   {
      std::shared_ptr<Message> msg;
      {
         std::unique_lock<std::mutex> lock(queueMutex_);
         queueCondVar_.wait(lock,
               [&] { return stopRequested_ || !queue_.empty(); });
         if (queue_.empty())
            break; // Stop requested and everything delivered
         msg = queue_.front();
         queue_.pop_front();
      }
      Dispatch(msg);
   }
}

void
MessageBus::Dispatch(std::shared_ptr<Message> msg)
{
   std::lock_guard<std::mutex> dispatchLock(dispatchMutex_);

   LOG_DEBUG(logger_) << "Dispatching " << ToQuotedString(msg->GetType()) <<
      " from " << msg->GetSource();

   const std::vector<std::shared_ptr<Module>> modules = GetModulesSnapshot();
   for (const std::shared_ptr<Module>& module : modules)
   {
      try
      {
         module->ProcessMessage(*msg);
      }
      catch (const CamBusError& e)
      {
         msg->AddError(MessageError(module->GetName(), e.getFullMsg(),
                  e.getCode()));
      }
      catch (const std::exception& e)
      {
         msg->AddError(MessageError(module->GetName(), e.what(),
                  CAMBUS_ERR_GENERIC));
      }
   }

   if (features::flags().strictAddressing)
      CheckAddressing(*msg, modules);

   for (const MessageError& error : msg->GetErrors())
   {
      LOG_ERROR(logger_) << "Message " << ToQuotedString(msg->GetType()) <<
         " from " << msg->GetSource() << " failed in " << error.source <<
         " (code " << error.code << "): " << error.text;
   }

   try
   {
      msg->RunFinalizer();
   }
   catch (const CamBusError& e)
   {
      LOG_ERROR(logger_) << "Finalizer of message " <<
         ToQuotedString(msg->GetType()) << " failed: " << e.getFullMsg();
   }
   catch (const std::exception& e)
   {
      LOG_ERROR(logger_) << "Finalizer of message " <<
         ToQuotedString(msg->GetType()) << " failed: " << e.what();
   }

   std::shared_ptr<Module> sender;
   for (const std::shared_ptr<Module>& module : modules)
   {
      if (module->GetName() == msg->GetSource())
         sender = module;
   }
   if (sender)
   {
      try
      {
         sender->HandleResponses(*msg);
      }
      catch (const CamBusError& e)
      {
         LOG_ERROR(logger_) << "Module " << sender->GetName() <<
            " failed to handle responses to " <<
            ToQuotedString(msg->GetType()) << ": " << e.getFullMsg();
      }
      catch (const std::exception& e)
      {
         LOG_ERROR(logger_) << "Module " << sender->GetName() <<
            " failed to handle responses to " <<
            ToQuotedString(msg->GetType()) << ": " << e.what();
      }
   }

   msg->MarkComplete();
}

void
MessageBus::CheckAddressing(Message& msg,
      const std::vector<std::shared_ptr<Module>>& modules)
{
   const MessageData& data = msg.GetData();
   if (!data.Has(field::Camera) ||
         data.Get(field::Camera).GetType() != FieldValue::TypeString)
      return;

   const std::string& camera = data.GetString(field::Camera);
   for (const std::shared_ptr<Module>& module : modules)
   {
      if (module->GetName() == camera)
         return;
   }
   msg.AddError(MessageError("bus", "No module named " +
            ToQuotedString(camera) + " is attached to the bus",
            CAMBUS_ERR_NO_SUCH_DEVICE));
}

} // namespace cambus
