///////////////////////////////////////////////////////////////////////////////
// FILE:          MessageData.h
// PROJECT:       CamBus
// SUBSYSTEM:     CamBus
//-----------------------------------------------------------------------------
// DESCRIPTION:   Typed payload of messages and responses.
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

#include "../CamDevice/CameraFunctionality.h"
#include "../CamDevice/FilmSettings.h"
#include "../CamDevice/ParameterSet.h"

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace cambus {

/**
 * One value of a message payload.
 */
class FieldValue
{
public:
   enum Type
   {
      TypeString,
      TypeInteger,
      TypeBoolean,
      TypeParameters,
      TypeFunctionality,
      TypeFilmSettings,
   };

   FieldValue(const std::string& value);
   FieldValue(const char* value);
   FieldValue(long value);
   FieldValue(int value);
   FieldValue(bool value);
   FieldValue(const camdev::ParameterSet& value);
   FieldValue(std::shared_ptr<const camdev::CameraFunctionality> value);
   FieldValue(const camdev::FilmSettings& value);

   Type GetType() const { return type_; }

   // Each accessor throws CamBusError (CAMBUS_ERR_PROTOCOL) if the value is
   // of another type.
   const std::string& AsString() const;
   long AsInteger() const;
   bool AsBoolean() const;
   const camdev::ParameterSet& AsParameters() const;
   std::shared_ptr<const camdev::CameraFunctionality> AsFunctionality() const;
   const camdev::FilmSettings& AsFilmSettings() const;

private:
   void CheckType(Type expected) const;

   Type type_;
   std::string string_;
   long integer_;
   bool boolean_;
   camdev::ParameterSet parameters_;
   std::shared_ptr<const camdev::CameraFunctionality> functionality_;
   std::shared_ptr<const camdev::FilmSettings> filmSettings_;
};

const char* TypeName(FieldValue::Type type);


/**
 * Field name to value map.
 */
class MessageData
{
public:
   MessageData() {}

   MessageData& Set(const std::string& name, const FieldValue& value);

   bool Has(const std::string& name) const;
   bool Empty() const { return fields_.empty(); }
   std::vector<std::string> GetFieldNames() const;

   // Throws CamBusError (CAMBUS_ERR_PROTOCOL) if the field is missing.
   const FieldValue& Get(const std::string& name) const;

   const std::string& GetString(const std::string& name) const
   { return Get(name).AsString(); }
   long GetInteger(const std::string& name) const
   { return Get(name).AsInteger(); }
   bool GetBoolean(const std::string& name) const
   { return Get(name).AsBoolean(); }
   const camdev::ParameterSet& GetParameters(const std::string& name) const
   { return Get(name).AsParameters(); }
   std::shared_ptr<const camdev::CameraFunctionality>
   GetFunctionality(const std::string& name) const
   { return Get(name).AsFunctionality(); }
   const camdev::FilmSettings& GetFilmSettings(const std::string& name) const
   { return Get(name).AsFilmSettings(); }

private:
   std::map<std::string, FieldValue> fields_;
};

} // namespace cambus
