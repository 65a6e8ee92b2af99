///////////////////////////////////////////////////////////////////////////////
// FILE:          DemoCamera.h
// PROJECT:       CamBus
// SUBSYSTEM:     DeviceAdapters
//-----------------------------------------------------------------------------
// DESCRIPTION:   Simulated camera. Lets the rest of the system run without
//                camera hardware.
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

#include "../../CamDevice/DeviceBase.h"

#include <map>
#include <memory>
#include <string>

//////////////////////////////////////////////////////////////////////////////
// Error codes
//
#define ERR_UNKNOWN_PARAMETER       101
#define ERR_READ_ONLY_PARAMETER     102
#define ERR_PARAMETER_TYPE          103
#define ERR_PARAMETER_RANGE         104
#define ERR_CAMERA_RUNNING          105
#define ERR_CLEANED_UP              106

extern const char* g_CameraDeviceName;


class DemoCamera : public camdev::CameraBase
{
public:
   enum Operation
   {
      OpNewParameters,
      OpSetFilmLength,
      OpStartCamera,
      OpStopCamera,
      OpStopFilm,
      OpToggleShutter,
      OpCleanUp,
   };

   // Throws camdev::ParameterError if the configured parameters are invalid
   explicit DemoCamera(const camdev::CameraConfig& config);

   int GetParameters(camdev::ParameterSet& parameters) override;
   int NewParameters(const camdev::ParameterSet& parameters) override;
   int GetCameraFunctionality(
         std::shared_ptr<const camdev::CameraFunctionality>& functionality) override;

   int SetFilmLength(long frames) override;
   int StartCamera() override;
   int StopCamera() override;
   int StopFilm() override;
   int ToggleShutter() override;
   int CleanUp() override;

   // Make the next call of op fail with code (CAMDEV_OK to clear).
   void InjectError(Operation op, int code);

   bool IsRunning() const { return running_; }
   bool IsShutterOpen() const { return shutterOpen_; }
   // 0 when the camera runs until stopped
   long GetFilmLength() const { return filmLength_; }

private:
   int CheckParameters(const nlohmann::json& values) const;
   void ApplyParameters(const nlohmann::json& values);
   void UpdateFunctionality();
   int TakeInjectedError(Operation op);

   camdev::ParameterSet parameters_;
   std::shared_ptr<const camdev::CameraFunctionality> functionality_;
   std::map<Operation, int> injectedErrors_;
   bool running_;
   bool shutterOpen_;
   bool cleanedUp_;
   long filmLength_;
};


class DemoCameraAdapter : public camdev::DeviceAdapter
{
public:
   void InitializeModuleData(RegisterDeviceFunc registerDevice) override;
   std::unique_ptr<camdev::Camera> CreateCamera(const std::string& deviceName,
         const camdev::CameraConfig& config) override;
};
