///////////////////////////////////////////////////////////////////////////////
// FILE:          MessageTypes.cpp
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

#include "MessageTypes.h"

#include "Error.h"

#include <map>

namespace cambus {

namespace {

const std::map<std::string, MessageKind>& kindMap()
{
   static const std::map<std::string, MessageKind> map = {
      { msgtype::ConfigureInitial, MessageKind::ConfigureInitial },
      { msgtype::InitialParameters, MessageKind::InitialParameters },
      { msgtype::FilmTiming, MessageKind::FilmTiming },
      { msgtype::GetFunctionality, MessageKind::GetFunctionality },
      { msgtype::NewParameters, MessageKind::NewParameters },
      { msgtype::ShutterClicked, MessageKind::ShutterClicked },
      { msgtype::StartCamera, MessageKind::StartCamera },
      { msgtype::StartFilm, MessageKind::StartFilm },
      { msgtype::StopCamera, MessageKind::StopCamera },
      { msgtype::StopFilm, MessageKind::StopFilm },
   };
   return map;
}

} // anonymous namespace

MessageKind KindForType(const std::string& type)
{
   std::map<std::string, MessageKind>::const_iterator it = kindMap().find(type);
   if (it == kindMap().end())
      return MessageKind::Other;
   return it->second;
}

std::string TypeForKind(MessageKind kind)
{
   for (const auto& entry : kindMap())
   {
      if (entry.second == kind)
         return entry.first;
   }
   throw CamBusError("Message kind has no type tag");
}

} // namespace cambus
