// Stub camera driver for CamBus unit tests. Records every call it receives
// and fails an operation on demand.

#pragma once

#include "DeviceBase.h"

#include <map>
#include <memory>
#include <string>
#include <vector>

const int STUB_ERR = 4000;

struct StubCamera : camdev::CameraBase {
   // Live parameter set; handed out by GetParameters()
   camdev::ParameterSet parameters;
   std::string timeBase;

   std::vector<std::string> calls;
   std::vector<camdev::ParameterSet> appliedParameters;
   std::vector<long> filmLengths;
   bool running = false;
   bool shutterOpen = false;

   // Operation name -> error code returned on every call
   std::map<std::string, int> failures;

   explicit StubCamera(const std::string& name, bool master = false) :
      camdev::CameraBase(camdev::CameraConfig(name,
               camdev::ParameterSet(name), master)),
      parameters(name)
   {
      parameters.SetValue("exposure_time", 0.1);
      parameters.SetValue("x_pixels", 512L);
      SetErrorText(STUB_ERR, "Stub failure");
   }

   int Record(const std::string& op) {
      calls.push_back(op);
      auto it = failures.find(op);
      return it == failures.end() ? CAMDEV_OK : it->second;
   }

   bool WasCalled(const std::string& op) const {
      for (const std::string& call : calls)
         if (call == op)
            return true;
      return false;
   }

   int GetParameters(camdev::ParameterSet& p) override {
      int err = Record("GetParameters");
      if (err == CAMDEV_OK)
         p = parameters;
      return err;
   }

   int NewParameters(const camdev::ParameterSet& p) override {
      int err = Record("NewParameters");
      if (err != CAMDEV_OK)
         return err;
      appliedParameters.push_back(p);
      const nlohmann::json values = p.ToJson();
      for (auto it = values.begin(); it != values.end(); ++it)
         parameters.SetValue(it.key(), it.value());
      return CAMDEV_OK;
   }

   int GetCameraFunctionality(
         std::shared_ptr<const camdev::CameraFunctionality>& f) override {
      int err = Record("GetCameraFunctionality");
      if (err != CAMDEV_OK)
         return err;
      camdev::CameraFunctionality::Attributes attrs;
      attrs.cameraName = GetName();
      attrs.timeBase = timeBase;
      attrs.isMaster = IsMaster();
      attrs.hasShutter = true;
      attrs.frameWidth = 512;
      attrs.frameHeight = 512;
      f = std::make_shared<camdev::CameraFunctionality>(attrs);
      return CAMDEV_OK;
   }

   int SetFilmLength(long frames) override {
      int err = Record("SetFilmLength");
      if (err == CAMDEV_OK)
         filmLengths.push_back(frames);
      return err;
   }

   int StartCamera() override {
      int err = Record("StartCamera");
      if (err == CAMDEV_OK)
         running = true;
      return err;
   }

   int StopCamera() override {
      int err = Record("StopCamera");
      if (err == CAMDEV_OK)
         running = false;
      return err;
   }

   int StopFilm() override { return Record("StopFilm"); }

   int ToggleShutter() override {
      int err = Record("ToggleShutter");
      if (err == CAMDEV_OK)
         shutterOpen = !shutterOpen;
      return err;
   }

   int CleanUp() override { return Record("CleanUp"); }
};
