///////////////////////////////////////////////////////////////////////////////
// FILE:          CamDevice.h
// PROJECT:       CamBus
// SUBSYSTEM:     CamDevice - Camera driver kit
//-----------------------------------------------------------------------------
// DESCRIPTION:   Camera driver interface. Drivers implement camdev::Camera and
//                are handed to the bus core through a camdev::DeviceAdapter.
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

#include "CamDeviceConstants.h"
#include "CameraFunctionality.h"
#include "ParameterSet.h"

#include <functional>
#include <memory>
#include <string>

namespace camdev {

/**
 * Camera driver.
 *
 * All functions returning int return CAMDEV_OK on success or an error code.
 * Any function may block for as long as the hardware requires. The bus core
 * never calls into one driver from two threads at once.
 */
class Camera
{
public:
   virtual ~Camera() {}

   virtual std::string GetName() const = 0;

   /**
    * Text for an error code returned by this driver. Returns false if the
    * code is unknown to the driver.
    */
   virtual bool GetErrorText(int errorCode, std::string& text) const = 0;

   /**
    * Return the driver's live parameter set. Callers that need a snapshot
    * must Copy() it.
    */
   virtual int GetParameters(ParameterSet& parameters) = 0;
   virtual int NewParameters(const ParameterSet& parameters) = 0;
   virtual int GetCameraFunctionality(
         std::shared_ptr<const CameraFunctionality>& functionality) = 0;

   virtual int SetFilmLength(long frames) = 0;
   virtual int StartCamera() = 0;
   virtual int StopCamera() = 0;
   virtual int StopFilm() = 0;
   virtual int ToggleShutter() = 0;

   /**
    * Release the hardware. Called once, when the application shuts down.
    */
   virtual int CleanUp() = 0;
};


/**
 * What the configuration says about the camera a driver is created for.
 */
struct CameraConfig
{
   std::string cameraName;
   ParameterSet parameters;
   bool isMaster;

   CameraConfig() : isMaster(false) {}
   CameraConfig(const std::string& name, const ParameterSet& params,
         bool master) :
      cameraName(name), parameters(params), isMaster(master)
   {}
};


/**
 * A collection of drivers, registered under an adapter name.
 */
class DeviceAdapter
{
public:
   typedef std::function<void(const char* deviceName,
         const char* description)> RegisterDeviceFunc;

   virtual ~DeviceAdapter() {}

   virtual void InitializeModuleData(RegisterDeviceFunc registerDevice) = 0;

   /**
    * Create a driver. Returns null if deviceName is not provided by this
    * adapter.
    */
   virtual std::unique_ptr<Camera> CreateCamera(const std::string& deviceName,
         const CameraConfig& config) = 0;
};

} // namespace camdev
