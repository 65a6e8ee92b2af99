///////////////////////////////////////////////////////////////////////////////
// FILE:          MessageRegistry.cpp
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

#include "MessageRegistry.h"

#include "CoreUtils.h"
#include "Error.h"
#include "MessageTypes.h"

namespace cambus {

namespace {

void CheckShape(const std::string& what, const FieldShape& shape,
      const MessageData& data)
{
   for (const auto& entry : shape)
   {
      if (!data.Has(entry.first))
      {
         if (entry.second.required)
            throw CamBusError(what + " is missing required field " +
                  ToQuotedString(entry.first), CAMBUS_ERR_PROTOCOL);
         continue;
      }
      FieldValue::Type actual = data.Get(entry.first).GetType();
      if (actual != entry.second.type)
         throw CamBusError(what + " field " + ToQuotedString(entry.first) +
               " is of type " + TypeName(actual) + ", expected " +
               TypeName(entry.second.type), CAMBUS_ERR_PROTOCOL);
   }

   for (const std::string& name : data.GetFieldNames())
   {
      if (shape.find(name) == shape.end())
         throw CamBusError(what + " has unexpected field " +
               ToQuotedString(name), CAMBUS_ERR_PROTOCOL);
   }
}

} // anonymous namespace


void
MessageRegistry::RegisterMessage(const std::string& type,
      const MessageShape& shape, bool checkExists)
{
   std::lock_guard<std::mutex> lock(mutex_);
   std::map<std::string, MessageShape>::iterator it = shapes_.find(type);
   if (it != shapes_.end())
   {
      if (checkExists)
         throw CamBusError("Message type " + ToQuotedString(type) +
               " is already registered", CAMBUS_ERR_DUPLICATE_MESSAGE);
      it->second = shape;
      return;
   }
   shapes_.insert(std::make_pair(type, shape));
}

bool
MessageRegistry::IsRegistered(const std::string& type) const
{
   std::lock_guard<std::mutex> lock(mutex_);
   return shapes_.find(type) != shapes_.end();
}

std::vector<std::string>
MessageRegistry::GetRegisteredTypes() const
{
   std::lock_guard<std::mutex> lock(mutex_);
   std::vector<std::string> types;
   for (const auto& entry : shapes_)
      types.push_back(entry.first);
   return types;
}

MessageShape
MessageRegistry::GetShape(const std::string& type) const
{
   std::lock_guard<std::mutex> lock(mutex_);
   return FindShape(type);
}

const MessageShape&
MessageRegistry::FindShape(const std::string& type) const
{
   std::map<std::string, MessageShape>::const_iterator it = shapes_.find(type);
   if (it == shapes_.end())
      throw CamBusError("Unknown message type " + ToQuotedString(type),
            CAMBUS_ERR_UNKNOWN_MESSAGE);
   return it->second;
}

void
MessageRegistry::ValidateData(const std::string& type,
      const MessageData& data) const
{
   std::lock_guard<std::mutex> lock(mutex_);
   CheckShape("Message " + ToQuotedString(type), FindShape(type).data, data);
}

void
MessageRegistry::ValidateResponse(const std::string& type,
      const MessageData& data) const
{
   std::lock_guard<std::mutex> lock(mutex_);
   CheckShape("Response to " + ToQuotedString(type),
         FindShape(type).response, data);
}


void RegisterStandardMessages(MessageRegistry& registry)
{
   const FieldSpec cameraName(true, FieldValue::TypeString);
   const FieldSpec requiredParameters(true, FieldValue::TypeParameters);
   const FieldSpec optionalParameters(false, FieldValue::TypeParameters);

   registry.RegisterMessage(msgtype::ConfigureInitial, MessageShape());

   registry.RegisterMessage(msgtype::InitialParameters, MessageShape(
            { { field::Parameters, requiredParameters } },
            {}));

   registry.RegisterMessage(msgtype::FilmTiming, MessageShape(
            { { field::Functionality,
                  FieldSpec(true, FieldValue::TypeFunctionality) } },
            {}));

   registry.RegisterMessage(msgtype::GetFunctionality, MessageShape(
            { { field::Camera, cameraName },
              { field::ExtraData, FieldSpec(false, FieldValue::TypeString) } },
            { { field::Functionality,
                  FieldSpec(true, FieldValue::TypeFunctionality) } }));

   // Each camera responds twice: once with the old and once with the new
   // parameters.
   registry.RegisterMessage(msgtype::NewParameters, MessageShape(
            { { field::Parameters, requiredParameters } },
            { { field::OldParameters, optionalParameters },
              { field::NewParameters, optionalParameters } }));

   registry.RegisterMessage(msgtype::ShutterClicked, MessageShape(
            { { field::Camera, cameraName } },
            {}));

   registry.RegisterMessage(msgtype::StartCamera, MessageShape(
            { { field::Camera, cameraName } },
            {}));

   registry.RegisterMessage(msgtype::StartFilm, MessageShape(
            { { field::FilmSettings,
                  FieldSpec(true, FieldValue::TypeFilmSettings) } },
            {}));

   registry.RegisterMessage(msgtype::StopCamera, MessageShape(
            { { field::Camera, cameraName } },
            {}));

   registry.RegisterMessage(msgtype::StopFilm, MessageShape(
            { { field::FilmSettings,
                  FieldSpec(false, FieldValue::TypeFilmSettings) } },
            { { field::Parameters, requiredParameters } }));
}

} // namespace cambus
