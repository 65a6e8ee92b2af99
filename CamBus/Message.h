///////////////////////////////////////////////////////////////////////////////
// FILE:          Message.h
// PROJECT:       CamBus
// SUBSYSTEM:     CamBus
//-----------------------------------------------------------------------------
// DESCRIPTION:   Messages exchanged by modules on the bus, and the responses
//                and errors that modules attach to them.
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

#include "MessageData.h"
#include "MessageTypes.h"

#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace cambus {

class MessageBus;
class MessageRegistry;

struct Response
{
   std::string source;
   MessageData data;

   Response(const std::string& src, const MessageData& d) :
      source(src), data(d)
   {}
};

/**
 * A failed outcome of handling a message in one module.
 */
struct MessageError
{
   std::string source;
   std::string text;
   int code;

   MessageError(const std::string& src, const std::string& t, int c) :
      source(src), text(t), code(c)
   {}
};


class Message
{
public:
   typedef std::function<void(const Message&)> Finalizer;

   Message(const std::string& source, const std::string& type,
         const MessageData& data = MessageData());
   Message(const std::string& source, MessageKind kind,
         const MessageData& data = MessageData());

   Message(const Message&) = delete;
   Message& operator=(const Message&) = delete;

   const std::string& GetSource() const { return source_; }
   const std::string& GetType() const { return type_; }
   MessageKind GetKind() const { return kind_; }
   bool IsType(const std::string& type) const { return type_ == type; }
   const MessageData& GetData() const { return data_; }

   /**
    * Append a response. Once the message has been sent, the response is
    * checked against the registered response shape (unless the
    * StrictResponseValidation feature is disabled) and CamBusError is thrown
    * if it does not fit.
    */
   void AddResponse(const Response& response);
   std::vector<Response> GetResponses() const;

   void AddError(const MessageError& error);
   bool HasErrors() const;
   std::vector<MessageError> GetErrors() const;

   /**
    * Set a function to run once all modules have handled the message.
    * Must be called before the message is sent.
    */
   void SetFinalizer(Finalizer finalizer);

   bool IsComplete() const;
   void WaitForCompletion() const;

private:
   friend class MessageBus;

   void AttachRegistry(const MessageRegistry* registry);
   void RunFinalizer();
   void MarkComplete();

   const std::string source_;
   const std::string type_;
   const MessageKind kind_;
   const MessageData data_;

   mutable std::mutex mutex_;
   const MessageRegistry* registry_;
   std::vector<Response> responses_;
   std::vector<MessageError> errors_;
   Finalizer finalizer_;

   mutable std::condition_variable completeCondVar_;
   bool complete_;
};

} // namespace cambus
