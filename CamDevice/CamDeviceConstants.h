///////////////////////////////////////////////////////////////////////////////
// FILE:          CamDeviceConstants.h
// PROJECT:       CamBus
// SUBSYSTEM:     CamDevice - Camera driver kit
//-----------------------------------------------------------------------------
// DESCRIPTION:   Global constants shared by camera drivers and the bus core.
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

// Driver status codes. Drivers may define their own codes starting at
// CAMDEV_FIRST_DRIVER_ERROR and supply text for them through GetErrorText().
#define CAMDEV_OK                     0
#define CAMDEV_ERR                    1
#define CAMDEV_NOT_CONNECTED          2
#define CAMDEV_INVALID_PARAMETER      3
#define CAMDEV_BUSY                   4
#define CAMDEV_TIMEOUT                5
#define CAMDEV_NOT_RUNNING            6
#define CAMDEV_NOT_SUPPORTED          7

#define CAMDEV_FIRST_DRIVER_ERROR     100

namespace camdev {

   // Names of the parameters every camera driver exposes in its parameter set
   namespace keyword {
      const char* const ExposureTime = "exposure_time";
      const char* const XPixels = "x_pixels";
      const char* const YPixels = "y_pixels";
      const char* const XBin = "x_bin";
      const char* const YBin = "y_bin";
      const char* const MaxIntensity = "max_intensity";
      const char* const Fps = "fps";
   } // namespace keyword

} // namespace camdev
