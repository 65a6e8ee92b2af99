///////////////////////////////////////////////////////////////////////////////
// FILE:          DemoCameraModule.cpp
// PROJECT:       CamBus
// SUBSYSTEM:     DeviceAdapters
//-----------------------------------------------------------------------------
// DESCRIPTION:   Module initialization and device factory for DemoCamera adapter
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

#include "DemoCamera.h"

// External names used by the rest of the system
// to create particular devices from the DemoCamera adapter
const char* g_CameraDeviceName = "DCam";

void DemoCameraAdapter::InitializeModuleData(RegisterDeviceFunc registerDevice)
{
   registerDevice(g_CameraDeviceName, "Demo camera");
}

std::unique_ptr<camdev::Camera>
DemoCameraAdapter::CreateCamera(const std::string& deviceName,
      const camdev::CameraConfig& config)
{
   // decide which device class to create based on the deviceName parameter
   if (deviceName == g_CameraDeviceName)
   {
      // create camera
      return std::unique_ptr<camdev::Camera>(new DemoCamera(config));
   }

   // ...supplied name not recognized
   return std::unique_ptr<camdev::Camera>();
}
