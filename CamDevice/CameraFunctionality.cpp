///////////////////////////////////////////////////////////////////////////////
// FILE:          CameraFunctionality.cpp
// PROJECT:       CamBus
// SUBSYSTEM:     CamDevice - Camera driver kit
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

#include "CameraFunctionality.h"

#include "ParameterSet.h"

namespace camdev {

CameraFunctionality::CameraFunctionality(const Attributes& attributes) :
   attributes_(attributes)
{
   if (attributes_.cameraName.empty())
      throw ParameterError("Camera functionality requires a camera name");
   if (attributes_.timeBase.empty())
      attributes_.timeBase = attributes_.cameraName;
}


nlohmann::json
CameraFunctionality::ToJson() const
{
   nlohmann::json j;
   j["camera"] = attributes_.cameraName;
   j["time_base"] = attributes_.timeBase;
   j["master"] = attributes_.isMaster;
   j["has_shutter"] = attributes_.hasShutter;
   j["has_temperature_control"] = attributes_.hasTemperatureControl;
   j["max_intensity"] = attributes_.maxIntensity;
   j["frame_width"] = attributes_.frameWidth;
   j["frame_height"] = attributes_.frameHeight;
   j["frame_rate"] = attributes_.frameRate;
   return j;
}

} // namespace camdev
