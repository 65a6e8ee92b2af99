///////////////////////////////////////////////////////////////////////////////
// FILE:          DeviceBase.cpp
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

#include "DeviceBase.h"

namespace camdev {

CameraBase::CameraBase(const CameraConfig& config) :
   config_(config)
{
   SetErrorText(CAMDEV_ERR, "Unspecified camera error");
   SetErrorText(CAMDEV_NOT_CONNECTED, "Camera is not connected");
   SetErrorText(CAMDEV_INVALID_PARAMETER, "Invalid camera parameter");
   SetErrorText(CAMDEV_BUSY, "Camera is busy");
   SetErrorText(CAMDEV_TIMEOUT, "Timed out waiting for the camera");
   SetErrorText(CAMDEV_NOT_RUNNING, "Camera is not running");
   SetErrorText(CAMDEV_NOT_SUPPORTED, "Operation not supported by this camera");
}


bool
CameraBase::GetErrorText(int errorCode, std::string& text) const
{
   std::map<int, std::string>::const_iterator it = errorTexts_.find(errorCode);
   if (it == errorTexts_.end())
      return false;
   text = it->second;
   return true;
}


void
CameraBase::SetErrorText(int errorCode, const std::string& text)
{
   errorTexts_[errorCode] = text;
}

} // namespace camdev
