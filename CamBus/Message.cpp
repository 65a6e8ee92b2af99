///////////////////////////////////////////////////////////////////////////////
// FILE:          Message.cpp
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

#include "Message.h"

#include "BusFeatures.h"
#include "MessageRegistry.h"

#include <utility>

namespace cambus {

Message::Message(const std::string& source, const std::string& type,
      const MessageData& data) :
   source_(source),
   type_(type),
   kind_(KindForType(type)),
   data_(data),
   registry_(nullptr),
   complete_(false)
{}

Message::Message(const std::string& source, MessageKind kind,
      const MessageData& data) :
   source_(source),
   type_(TypeForKind(kind)),
   kind_(kind),
   data_(data),
   registry_(nullptr),
   complete_(false)
{}

void
Message::AddResponse(const Response& response)
{
   std::lock_guard<std::mutex> lock(mutex_);
   if (registry_ && features::flags().strictResponseValidation)
      registry_->ValidateResponse(type_, response.data);
   responses_.push_back(response);
}

std::vector<Response>
Message::GetResponses() const
{
   std::lock_guard<std::mutex> lock(mutex_);
   return responses_;
}

void
Message::AddError(const MessageError& error)
{
   std::lock_guard<std::mutex> lock(mutex_);
   errors_.push_back(error);
}

bool
Message::HasErrors() const
{
   std::lock_guard<std::mutex> lock(mutex_);
   return !errors_.empty();
}

std::vector<MessageError>
Message::GetErrors() const
{
   std::lock_guard<std::mutex> lock(mutex_);
   return errors_;
}

void
Message::SetFinalizer(Finalizer finalizer)
{
   std::lock_guard<std::mutex> lock(mutex_);
   finalizer_ = std::move(finalizer);
}

bool
Message::IsComplete() const
{
   std::lock_guard<std::mutex> lock(mutex_);
   return complete_;
}

void
Message::WaitForCompletion() const
{
   std::unique_lock<std::mutex> lock(mutex_);
   completeCondVar_.wait(lock, [this] { return complete_; });
}

void
Message::AttachRegistry(const MessageRegistry* registry)
{
   std::lock_guard<std::mutex> lock(mutex_);
   registry_ = registry;
}

void
Message::RunFinalizer()
{
   Finalizer finalizer;
   {
      std::lock_guard<std::mutex> lock(mutex_);
      finalizer = finalizer_;
   }
   // Called without the lock; the finalizer reads responses and errors
   if (finalizer)
      finalizer(*this);
}

void
Message::MarkComplete()
{
   {
      std::lock_guard<std::mutex> lock(mutex_);
      complete_ = true;
   }
   completeCondVar_.notify_all();
}

} // namespace cambus
