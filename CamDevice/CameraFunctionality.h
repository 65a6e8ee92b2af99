///////////////////////////////////////////////////////////////////////////////
// FILE:          CameraFunctionality.h
// PROJECT:       CamBus
// SUBSYSTEM:     CamDevice - Camera driver kit
//-----------------------------------------------------------------------------
// DESCRIPTION:   Capability handle describing one camera or feed.
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

#include <nlohmann/json.hpp>

#include <string>

namespace camdev {

/**
 * What other modules may know about a camera without controlling it.
 *
 * Instances are immutable and are handed around as
 * std::shared_ptr<const CameraFunctionality>.
 */
class CameraFunctionality
{
public:
   struct Attributes
   {
      std::string cameraName;
      // Module whose clock or trigger sets the frame timing of this feed.
      // Empty means the camera itself.
      std::string timeBase;
      bool isMaster = false;
      bool hasShutter = false;
      bool hasTemperatureControl = false;
      long maxIntensity = 0;
      long frameWidth = 0;
      long frameHeight = 0;
      double frameRate = 0.0;
   };

   explicit CameraFunctionality(const Attributes& attributes);

   const std::string& GetCameraName() const { return attributes_.cameraName; }
   const std::string& GetTimeBase() const { return attributes_.timeBase; }
   bool IsMaster() const { return attributes_.isMaster; }
   bool HasShutter() const { return attributes_.hasShutter; }
   bool HasTemperatureControl() const
   { return attributes_.hasTemperatureControl; }
   long GetMaxIntensity() const { return attributes_.maxIntensity; }
   long GetFrameWidth() const { return attributes_.frameWidth; }
   long GetFrameHeight() const { return attributes_.frameHeight; }
   double GetFrameRate() const { return attributes_.frameRate; }

   nlohmann::json ToJson() const;

private:
   Attributes attributes_;
};

} // namespace camdev
