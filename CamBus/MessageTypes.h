///////////////////////////////////////////////////////////////////////////////
// FILE:          MessageTypes.h
// PROJECT:       CamBus
// SUBSYSTEM:     CamBus
//-----------------------------------------------------------------------------
// DESCRIPTION:   Message type tags and payload field names.
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

#include <string>

namespace cambus {

/**
 * The message types the camera controller understands. Any other tag that a
 * module registers with the bus maps onto Other.
 */
enum class MessageKind
{
   ConfigureInitial,
   InitialParameters,
   FilmTiming,
   GetFunctionality,
   NewParameters,
   ShutterClicked,
   StartCamera,
   StartFilm,
   StopCamera,
   StopFilm,
   Other,
};

namespace msgtype {
   const char* const ConfigureInitial = "configure1";
   const char* const InitialParameters = "initial parameters";
   const char* const FilmTiming = "film timing";
   const char* const GetFunctionality = "get camera functionality";
   const char* const NewParameters = "new parameters";
   const char* const ShutterClicked = "shutter clicked";
   const char* const StartCamera = "start camera";
   const char* const StartFilm = "start film";
   const char* const StopCamera = "stop camera";
   const char* const StopFilm = "stop film";
} // namespace msgtype

namespace field {
   const char* const Camera = "camera";
   const char* const Parameters = "parameters";
   const char* const Functionality = "functionality";
   const char* const FilmSettings = "film settings";
   const char* const OldParameters = "old parameters";
   const char* const NewParameters = "new parameters";
   const char* const ExtraData = "extra data";
} // namespace field

MessageKind KindForType(const std::string& type);

// Tag string of a kind; throws CamBusError for MessageKind::Other.
std::string TypeForKind(MessageKind kind);

} // namespace cambus
