///////////////////////////////////////////////////////////////////////////////
// FILE:          DeviceBase.h
// PROJECT:       CamBus
// SUBSYSTEM:     CamDevice - Camera driver kit
//-----------------------------------------------------------------------------
// DESCRIPTION:   Generic functionality for implementing camera drivers.
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

#include "CamDevice.h"

#include <map>
#include <string>

namespace camdev {

/**
 * Base class for camera drivers. Keeps the camera name given by the
 * configuration and a table of error texts; the standard CAMDEV_ codes come
 * pre-populated.
 */
class CameraBase : public Camera
{
public:
   explicit CameraBase(const CameraConfig& config);

   std::string GetName() const override { return config_.cameraName; }
   bool GetErrorText(int errorCode, std::string& text) const override;

protected:
   void SetErrorText(int errorCode, const std::string& text);

   const CameraConfig& GetConfig() const { return config_; }
   bool IsMaster() const { return config_.isMaster; }

private:
   CameraConfig config_;
   std::map<int, std::string> errorTexts_;
};

} // namespace camdev
