///////////////////////////////////////////////////////////////////////////////
// FILE:          CameraInstance.cpp
// PROJECT:       CamBus
// SUBSYSTEM:     CamBus
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

#include "CameraInstance.h"

#include "../CoreUtils.h"
#include "../Error.h"

#include <utility>

namespace cambus {

CameraInstance::CameraInstance(std::unique_ptr<camdev::Camera> driver,
      const std::string& label, logging::Logger logger) :
   driver_(std::move(driver)),
   label_(label),
   logger_(logger)
{
   if (!driver_)
      throw CamBusError("No driver given for camera " + ToQuotedString(label),
            CAMBUS_ERR_NO_SUCH_DEVICE);
}

std::string
CameraInstance::GetErrorText(int code) const
{
   std::string text;
   if (driver_->GetErrorText(code, text) && !text.empty())
      return text;
   return "Error code " + ToString(code) + " (no description available)";
}

void
CameraInstance::ThrowIfError(int code, const std::string& msg) const
{
   if (code == CAMDEV_OK)
      return;

   CamBusError driverError(GetErrorText(code), code);
   LOG_ERROR(logger_) << msg << ": " << driverError.getMsg() <<
      " (code " << code << ")";
   throw CamBusError(msg + " (" + label_ + ")", CAMBUS_ERR_DEVICE,
         driverError);
}

std::string
CameraInstance::GetName() const
{
   std::lock_guard<std::mutex> lock(mutex_);
   return driver_->GetName();
}

camdev::ParameterSet
CameraInstance::GetParameters()
{
   std::lock_guard<std::mutex> lock(mutex_);
   camdev::ParameterSet parameters;
   int err = driver_->GetParameters(parameters);
   ThrowIfError(err, "Cannot get camera parameters");
   return parameters;
}

void
CameraInstance::NewParameters(const camdev::ParameterSet& parameters)
{
   std::lock_guard<std::mutex> lock(mutex_);
   LOG_DEBUG(logger_) << "Will apply new parameters " << parameters.Dump();
   int err = driver_->NewParameters(parameters);
   ThrowIfError(err, "Cannot apply new camera parameters");
}

std::shared_ptr<const camdev::CameraFunctionality>
CameraInstance::GetCameraFunctionality()
{
   std::lock_guard<std::mutex> lock(mutex_);
   std::shared_ptr<const camdev::CameraFunctionality> functionality;
   int err = driver_->GetCameraFunctionality(functionality);
   ThrowIfError(err, "Cannot get camera functionality");
   if (!functionality)
      throw CamBusError("Driver returned no camera functionality (" +
            label_ + ")", CAMBUS_ERR_DEVICE);
   return functionality;
}

void
CameraInstance::SetFilmLength(long frames)
{
   std::lock_guard<std::mutex> lock(mutex_);
   LOG_DEBUG(logger_) << "Will set film length to " << frames;
   int err = driver_->SetFilmLength(frames);
   ThrowIfError(err, "Cannot set film length to " + ToString(frames));
}

void
CameraInstance::StartCamera()
{
   std::lock_guard<std::mutex> lock(mutex_);
   LOG_DEBUG(logger_) << "Will start camera";
   int err = driver_->StartCamera();
   ThrowIfError(err, "Cannot start camera");
   LOG_DEBUG(logger_) << "Did start camera";
}

void
CameraInstance::StopCamera()
{
   std::lock_guard<std::mutex> lock(mutex_);
   LOG_DEBUG(logger_) << "Will stop camera";
   int err = driver_->StopCamera();
   ThrowIfError(err, "Cannot stop camera");
   LOG_DEBUG(logger_) << "Did stop camera";
}

void
CameraInstance::StopFilm()
{
   std::lock_guard<std::mutex> lock(mutex_);
   int err = driver_->StopFilm();
   ThrowIfError(err, "Cannot stop film");
}

void
CameraInstance::ToggleShutter()
{
   std::lock_guard<std::mutex> lock(mutex_);
   int err = driver_->ToggleShutter();
   ThrowIfError(err, "Cannot toggle shutter");
}

void
CameraInstance::CleanUp()
{
   std::lock_guard<std::mutex> lock(mutex_);
   LOG_DEBUG(logger_) << "Will clean up";
   int err = driver_->CleanUp();
   ThrowIfError(err, "Cannot clean up camera");
}

} // namespace cambus
