///////////////////////////////////////////////////////////////////////////////
// FILE:          MessageData.cpp
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

#include "MessageData.h"

#include "CoreUtils.h"
#include "Error.h"

namespace cambus {

const char* TypeName(FieldValue::Type type)
{
   switch (type)
   {
      case FieldValue::TypeString: return "string";
      case FieldValue::TypeInteger: return "integer";
      case FieldValue::TypeBoolean: return "boolean";
      case FieldValue::TypeParameters: return "parameters";
      case FieldValue::TypeFunctionality: return "functionality";
      case FieldValue::TypeFilmSettings: return "film settings";
      default: return "(unknown)";
   }
}


FieldValue::FieldValue(const std::string& value) :
   type_(TypeString), string_(value), integer_(0), boolean_(false)
{}

FieldValue::FieldValue(const char* value) :
   type_(TypeString), string_(value ? value : ""), integer_(0), boolean_(false)
{}

FieldValue::FieldValue(long value) :
   type_(TypeInteger), integer_(value), boolean_(false)
{}

FieldValue::FieldValue(int value) :
   type_(TypeInteger), integer_(value), boolean_(false)
{}

FieldValue::FieldValue(bool value) :
   type_(TypeBoolean), integer_(0), boolean_(value)
{}

FieldValue::FieldValue(const camdev::ParameterSet& value) :
   type_(TypeParameters), integer_(0), boolean_(false), parameters_(value)
{}

FieldValue::FieldValue(
      std::shared_ptr<const camdev::CameraFunctionality> value) :
   type_(TypeFunctionality), integer_(0), boolean_(false),
   functionality_(value)
{
   if (!functionality_)
      throw CamBusError("Null camera functionality in message data",
            CAMBUS_ERR_PROTOCOL);
}

FieldValue::FieldValue(const camdev::FilmSettings& value) :
   type_(TypeFilmSettings), integer_(0), boolean_(false),
   filmSettings_(std::make_shared<camdev::FilmSettings>(value))
{}


void
FieldValue::CheckType(Type expected) const
{
   if (type_ != expected)
      throw CamBusError(std::string("Field value is of type ") +
            TypeName(type_) + ", not " + TypeName(expected),
            CAMBUS_ERR_PROTOCOL);
}

const std::string&
FieldValue::AsString() const
{
   CheckType(TypeString);
   return string_;
}

long
FieldValue::AsInteger() const
{
   CheckType(TypeInteger);
   return integer_;
}

bool
FieldValue::AsBoolean() const
{
   CheckType(TypeBoolean);
   return boolean_;
}

const camdev::ParameterSet&
FieldValue::AsParameters() const
{
   CheckType(TypeParameters);
   return parameters_;
}

std::shared_ptr<const camdev::CameraFunctionality>
FieldValue::AsFunctionality() const
{
   CheckType(TypeFunctionality);
   return functionality_;
}

const camdev::FilmSettings&
FieldValue::AsFilmSettings() const
{
   CheckType(TypeFilmSettings);
   return *filmSettings_;
}


MessageData&
MessageData::Set(const std::string& name, const FieldValue& value)
{
   std::map<std::string, FieldValue>::iterator it = fields_.find(name);
   if (it != fields_.end())
      it->second = value;
   else
      fields_.insert(std::make_pair(name, value));
   return *this;
}

bool
MessageData::Has(const std::string& name) const
{
   return fields_.find(name) != fields_.end();
}

std::vector<std::string>
MessageData::GetFieldNames() const
{
   std::vector<std::string> names;
   for (const auto& field : fields_)
      names.push_back(field.first);
   return names;
}

const FieldValue&
MessageData::Get(const std::string& name) const
{
   std::map<std::string, FieldValue>::const_iterator it = fields_.find(name);
   if (it == fields_.end())
      throw CamBusError("Message data has no field " + ToQuotedString(name),
            CAMBUS_ERR_PROTOCOL);
   return it->second;
}

} // namespace cambus
