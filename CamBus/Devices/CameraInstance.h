///////////////////////////////////////////////////////////////////////////////
// FILE:          CameraInstance.h
// PROJECT:       CamBus
// SUBSYSTEM:     CamBus
//-----------------------------------------------------------------------------
// DESCRIPTION:   Bus-side wrapper of a camera driver.
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

#include "../../CamDevice/CamDevice.h"
#include "../Logging/Logger.h"

#include <memory>
#include <mutex>
#include <string>

namespace cambus {

/**
 * Owns a driver and calls into it one call at a time. Driver error codes
 * are turned into CamBusError (CAMBUS_ERR_DEVICE) carrying the driver's
 * error text as the underlying error.
 */
class CameraInstance
{
public:
   CameraInstance(std::unique_ptr<camdev::Camera> driver,
         const std::string& label, logging::Logger logger);

   CameraInstance(const CameraInstance&) = delete;
   CameraInstance& operator=(const CameraInstance&) = delete;

   const std::string& GetLabel() const { return label_; }
   std::string GetName() const;

   // The driver's live parameters
   camdev::ParameterSet GetParameters();
   void NewParameters(const camdev::ParameterSet& parameters);
   std::shared_ptr<const camdev::CameraFunctionality> GetCameraFunctionality();

   void SetFilmLength(long frames);
   void StartCamera();
   void StopCamera();
   void StopFilm();
   void ToggleShutter();
   void CleanUp();

private:
   void ThrowIfError(int code, const std::string& msg) const;
   std::string GetErrorText(int code) const;

   std::unique_ptr<camdev::Camera> driver_;
   const std::string label_;
   logging::Logger logger_;
   mutable std::mutex mutex_;
};

} // namespace cambus
