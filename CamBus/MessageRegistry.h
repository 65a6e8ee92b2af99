///////////////////////////////////////////////////////////////////////////////
// FILE:          MessageRegistry.h
// PROJECT:       CamBus
// SUBSYSTEM:     CamBus
//-----------------------------------------------------------------------------
// DESCRIPTION:   Registered message types and their payload shapes.
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

#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace cambus {

struct FieldSpec
{
   bool required;
   FieldValue::Type type;

   FieldSpec(bool req, FieldValue::Type t) : required(req), type(t) {}
};

typedef std::map<std::string, FieldSpec> FieldShape;

/**
 * Allowed payload of a message type (data) and of each response to it.
 */
struct MessageShape
{
   FieldShape data;
   FieldShape response;

   MessageShape() {}
   MessageShape(const FieldShape& d, const FieldShape& r) :
      data(d), response(r)
   {}
};


/**
 * Message types known to one bus. Thread-safe.
 */
class MessageRegistry
{
public:
   /**
    * Register a message type.
    *
    * With checkExists, registering a type twice is an error
    * (CAMBUS_ERR_DUPLICATE_MESSAGE). Without it, a repeated registration
    * replaces the shape; this is how several modules declare the same type.
    */
   void RegisterMessage(const std::string& type, const MessageShape& shape,
         bool checkExists = true);

   bool IsRegistered(const std::string& type) const;
   std::vector<std::string> GetRegisteredTypes() const;
   MessageShape GetShape(const std::string& type) const;

   // Throw CamBusError if the type is not registered
   // (CAMBUS_ERR_UNKNOWN_MESSAGE) or if data does not fit the registered
   // shape (CAMBUS_ERR_PROTOCOL).
   void ValidateData(const std::string& type, const MessageData& data) const;
   void ValidateResponse(const std::string& type,
         const MessageData& data) const;

private:
   const MessageShape& FindShape(const std::string& type) const;

   mutable std::mutex mutex_;
   std::map<std::string, MessageShape> shapes_;
};

/**
 * Register the message types of the camera subsystem.
 */
void RegisterStandardMessages(MessageRegistry& registry);

} // namespace cambus
