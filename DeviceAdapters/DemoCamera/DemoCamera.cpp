///////////////////////////////////////////////////////////////////////////////
// FILE:          DemoCamera.cpp
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

#include "DemoCamera.h"

#include <string>

using namespace camdev;

namespace {

const double g_DefaultExposureTime = 0.1; // seconds
const long g_DefaultPixels = 512;
const long g_DefaultMaxIntensity = 4096;

bool IsIntegerParameter(const std::string& name)
{
   return name == keyword::XPixels || name == keyword::YPixels ||
      name == keyword::XBin || name == keyword::YBin ||
      name == keyword::MaxIntensity;
}

} // anonymous namespace


///////////////////////////////////////////////////////////////////////////////
// DemoCamera implementation
// ~~~~~~~~~~~~~~~~~~~~~~~~~

DemoCamera::DemoCamera(const CameraConfig& config) :
   CameraBase(config),
   parameters_(config.cameraName),
   running_(false),
   shutterOpen_(false),
   cleanedUp_(false),
   filmLength_(0)
{
   SetErrorText(ERR_UNKNOWN_PARAMETER, "The demo camera has no such parameter");
   SetErrorText(ERR_READ_ONLY_PARAMETER, "The parameter is read-only");
   SetErrorText(ERR_PARAMETER_TYPE, "The parameter value has the wrong type");
   SetErrorText(ERR_PARAMETER_RANGE, "The parameter value is out of range");
   SetErrorText(ERR_CAMERA_RUNNING,
         "Cannot change the camera while it is running");
   SetErrorText(ERR_CLEANED_UP, "The camera has been cleaned up");

   parameters_.SetValue(keyword::ExposureTime, g_DefaultExposureTime);
   parameters_.SetValue(keyword::XPixels, g_DefaultPixels);
   parameters_.SetValue(keyword::YPixels, g_DefaultPixels);
   parameters_.SetValue(keyword::XBin, 1L);
   parameters_.SetValue(keyword::YBin, 1L);
   parameters_.SetValue(keyword::MaxIntensity, g_DefaultMaxIntensity);
   parameters_.SetValue(keyword::Fps, 1.0 / g_DefaultExposureTime);

   const nlohmann::json configured = config.parameters.ToJson();
   int ret = CheckParameters(configured);
   if (ret != CAMDEV_OK)
   {
      std::string text;
      GetErrorText(ret, text);
      throw ParameterError("Invalid configuration of camera " +
            config.cameraName + ": " + text);
   }
   ApplyParameters(configured);
}

int DemoCamera::TakeInjectedError(Operation op)
{
   std::map<Operation, int>::iterator it = injectedErrors_.find(op);
   if (it == injectedErrors_.end())
      return CAMDEV_OK;
   int code = it->second;
   injectedErrors_.erase(it);
   return code;
}

void DemoCamera::InjectError(Operation op, int code)
{
   if (code == CAMDEV_OK)
      injectedErrors_.erase(op);
   else
      injectedErrors_[op] = code;
}

int DemoCamera::CheckParameters(const nlohmann::json& values) const
{
   for (nlohmann::json::const_iterator it = values.begin();
         it != values.end(); ++it)
   {
      const std::string& name = it.key();
      if (!parameters_.Has(name))
         return ERR_UNKNOWN_PARAMETER;
      if (name == keyword::Fps)
         return ERR_READ_ONLY_PARAMETER;

      const nlohmann::json& value = it.value();
      if (IsIntegerParameter(name))
      {
         if (!value.is_number_integer())
            return ERR_PARAMETER_TYPE;
         if (value.get<long>() < 1)
            return ERR_PARAMETER_RANGE;
      }
      else if (name == keyword::ExposureTime)
      {
         if (!value.is_number())
            return ERR_PARAMETER_TYPE;
         if (value.get<double>() <= 0.0)
            return ERR_PARAMETER_RANGE;
      }
   }

   // Binning must divide the sensor
   const long xPixels = values.value(keyword::XPixels,
         parameters_.GetValue<long>(keyword::XPixels));
   const long yPixels = values.value(keyword::YPixels,
         parameters_.GetValue<long>(keyword::YPixels));
   const long xBin = values.value(keyword::XBin,
         parameters_.GetValue<long>(keyword::XBin));
   const long yBin = values.value(keyword::YBin,
         parameters_.GetValue<long>(keyword::YBin));
   if (xPixels % xBin != 0 || yPixels % yBin != 0)
      return ERR_PARAMETER_RANGE;

   return CAMDEV_OK;
}

// values must have passed CheckParameters()
void DemoCamera::ApplyParameters(const nlohmann::json& values)
{
   for (nlohmann::json::const_iterator it = values.begin();
         it != values.end(); ++it)
   {
      if (it.value().is_number_integer())
         parameters_.SetValue(it.key(), it.value().get<long>());
      else
         parameters_.SetValue(it.key(), it.value().get<double>());
   }

   parameters_.SetValue(keyword::Fps,
         1.0 / parameters_.GetValue<double>(keyword::ExposureTime));
   UpdateFunctionality();
}

void DemoCamera::UpdateFunctionality()
{
   CameraFunctionality::Attributes attributes;
   attributes.cameraName = GetName();
   attributes.isMaster = IsMaster();
   attributes.hasShutter = true;
   attributes.hasTemperatureControl = false;
   attributes.maxIntensity = parameters_.GetValue<long>(keyword::MaxIntensity);
   attributes.frameWidth = parameters_.GetValue<long>(keyword::XPixels) /
      parameters_.GetValue<long>(keyword::XBin);
   attributes.frameHeight = parameters_.GetValue<long>(keyword::YPixels) /
      parameters_.GetValue<long>(keyword::YBin);
   attributes.frameRate = parameters_.GetValue<double>(keyword::Fps);
   functionality_ = std::make_shared<CameraFunctionality>(attributes);
}

int DemoCamera::GetParameters(ParameterSet& parameters)
{
   parameters = parameters_;
   return CAMDEV_OK;
}

int DemoCamera::NewParameters(const ParameterSet& parameters)
{
   int ret = TakeInjectedError(OpNewParameters);
   if (ret != CAMDEV_OK)
      return ret;
   if (cleanedUp_)
      return ERR_CLEANED_UP;
   if (running_)
      return ERR_CAMERA_RUNNING;

   const nlohmann::json values = parameters.ToJson();
   ret = CheckParameters(values);
   if (ret != CAMDEV_OK)
      return ret;

   ApplyParameters(values);
   return CAMDEV_OK;
}

int DemoCamera::GetCameraFunctionality(
      std::shared_ptr<const CameraFunctionality>& functionality)
{
   if (!functionality_)
      UpdateFunctionality();
   functionality = functionality_;
   return CAMDEV_OK;
}

int DemoCamera::SetFilmLength(long frames)
{
   int ret = TakeInjectedError(OpSetFilmLength);
   if (ret != CAMDEV_OK)
      return ret;
   if (cleanedUp_)
      return ERR_CLEANED_UP;
   if (frames < 0)
      return CAMDEV_INVALID_PARAMETER;
   if (running_)
      return ERR_CAMERA_RUNNING;
   filmLength_ = frames;
   return CAMDEV_OK;
}

int DemoCamera::StartCamera()
{
   int ret = TakeInjectedError(OpStartCamera);
   if (ret != CAMDEV_OK)
      return ret;
   if (cleanedUp_)
      return ERR_CLEANED_UP;
   running_ = true;
   return CAMDEV_OK;
}

int DemoCamera::StopCamera()
{
   int ret = TakeInjectedError(OpStopCamera);
   if (ret != CAMDEV_OK)
      return ret;
   running_ = false;
   return CAMDEV_OK;
}

int DemoCamera::StopFilm()
{
   int ret = TakeInjectedError(OpStopFilm);
   if (ret != CAMDEV_OK)
      return ret;
   filmLength_ = 0;
   return CAMDEV_OK;
}

int DemoCamera::ToggleShutter()
{
   int ret = TakeInjectedError(OpToggleShutter);
   if (ret != CAMDEV_OK)
      return ret;
   if (cleanedUp_)
      return ERR_CLEANED_UP;
   shutterOpen_ = !shutterOpen_;
   return CAMDEV_OK;
}

int DemoCamera::CleanUp()
{
   int ret = TakeInjectedError(OpCleanUp);
   if (ret != CAMDEV_OK)
      return ret;
   running_ = false;
   shutterOpen_ = false;
   cleanedUp_ = true;
   return CAMDEV_OK;
}
