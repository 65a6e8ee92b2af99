///////////////////////////////////////////////////////////////////////////////
// FILE:          BusConfiguration.cpp
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

#include "BusConfiguration.h"

#include "BusFeatures.h"
#include "CameraController.h"
#include "CoreUtils.h"
#include "DeviceAdapterRegistry.h"
#include "Error.h"
#include "LogManager.h"
#include "MessageBus.h"

#include <fstream>
#include <set>
#include <sstream>
#include <utility>

namespace cambus {

namespace {

using nlohmann::json;

const json& RequireMember(const json& object, const std::string& key,
      const std::string& where)
{
   json::const_iterator it = object.find(key);
   if (it == object.end())
      throw CamBusError(where + " is missing " + ToQuotedString(key),
            CAMBUS_ERR_CONFIG);
   return *it;
}

std::string GetString(const json& object, const std::string& key,
      const std::string& where)
{
   const json& value = RequireMember(object, key, where);
   if (!value.is_string())
      throw CamBusError(where + ": " + ToQuotedString(key) +
            " must be a string", CAMBUS_ERR_CONFIG);
   return value.get<std::string>();
}

bool GetBoolean(const json& value, const std::string& key,
      const std::string& where)
{
   if (!value.is_boolean())
      throw CamBusError(where + ": " + ToQuotedString(key) +
            " must be true or false", CAMBUS_ERR_CONFIG);
   return value.get<bool>();
}

LoggingConfig ParseLogging(const json& node)
{
   const std::string where = "Logging configuration";
   if (!node.is_object())
      throw CamBusError(where + " must be an object", CAMBUS_ERR_CONFIG);

   LoggingConfig config;
   if (node.contains("level"))
      config.level = LogLevelFromString(GetString(node, "level", where));
   if (node.contains("stderr"))
      config.useStdErr = GetBoolean(node["stderr"], "stderr", where);
   if (node.contains("file"))
      config.filename = GetString(node, "file", where);
   return config;
}

CameraModuleConfig ParseCamera(const json& node, size_t index)
{
   std::string where = "Camera entry " + ToString(index);
   if (!node.is_object())
      throw CamBusError(where + " must be an object", CAMBUS_ERR_CONFIG);

   CameraModuleConfig config;
   config.name = GetString(node, "name", where);
   if (config.name.empty())
      throw CamBusError(where + " has an empty name", CAMBUS_ERR_CONFIG);
   where = "Camera " + ToQuotedString(config.name);

   config.adapter = GetString(node, "adapter", where);
   config.device = GetString(node, "device", where);
   if (node.contains("master"))
      config.master = GetBoolean(node["master"], "master", where);
   if (node.contains("parameters"))
   {
      const json& parameters = node["parameters"];
      if (!parameters.is_object())
         throw CamBusError(where + ": \"parameters\" must be an object",
               CAMBUS_ERR_CONFIG);
      config.parameters = parameters;
   }
   return config;
}

} // anonymous namespace


BusConfiguration
BusConfiguration::FromJson(const nlohmann::json& root)
{
   if (!root.is_object())
      throw CamBusError("Configuration must be a JSON object",
            CAMBUS_ERR_CONFIG);

   BusConfiguration config;

   if (root.contains("logging"))
      config.logging_ = ParseLogging(root["logging"]);

   if (root.contains("features"))
   {
      const json& features = root["features"];
      if (!features.is_object())
         throw CamBusError("\"features\" must be an object",
               CAMBUS_ERR_CONFIG);
      for (json::const_iterator it = features.begin();
            it != features.end(); ++it)
      {
         config.features_[it.key()] =
            GetBoolean(it.value(), it.key(), "Features");
      }
   }

   const json& cameras = RequireMember(root, "cameras", "Configuration");
   if (!cameras.is_array())
      throw CamBusError("\"cameras\" must be an array", CAMBUS_ERR_CONFIG);

   std::set<std::string> names;
   for (size_t i = 0; i < cameras.size(); ++i)
   {
      CameraModuleConfig camera = ParseCamera(cameras[i], i);
      if (!names.insert(camera.name).second)
         throw CamBusError("Camera name " + ToQuotedString(camera.name) +
               " is used more than once", CAMBUS_ERR_CONFIG);
      config.cameras_.push_back(camera);
   }
   return config;
}

BusConfiguration
BusConfiguration::Parse(const std::string& text)
{
   json root;
   try
   {
      root = json::parse(text);
   }
   catch (const json::parse_error& e)
   {
      throw CamBusError(std::string("Cannot parse configuration: ") +
            e.what(), CAMBUS_ERR_CONFIG);
   }
   return FromJson(root);
}

BusConfiguration
BusConfiguration::LoadFile(const std::string& filename)
{
   std::ifstream file(filename.c_str());
   if (!file)
      throw CamBusError("Cannot open configuration file " +
            ToQuotedString(filename), CAMBUS_ERR_FILE_OPEN_FAILED);

   std::ostringstream contents;
   contents << file.rdbuf();
   try
   {
      return Parse(contents.str());
   }
   catch (const CamBusError& e)
   {
      throw CamBusError("Invalid configuration file " +
            ToQuotedString(filename), e);
   }
}


std::vector<std::shared_ptr<CameraController>> ApplyConfiguration(
      const BusConfiguration& config, MessageBus& bus,
      DeviceAdapterRegistry& adapters)
{
   LogManager& logManager = bus.GetLogManager();
   logManager.Configure(config.GetLogging());

   for (const auto& feature : config.GetFeatures())
      features::enableFeature(feature.first, feature.second);

   logging::Logger logger = logManager.NewLogger("config");
   std::vector<std::shared_ptr<CameraController>> controllers;
   for (const CameraModuleConfig& camera : config.GetCameras())
   {
      camdev::CameraConfig cameraConfig(camera.name,
            camdev::ParameterSet::FromJson(camera.name, camera.parameters),
            camera.master);

      std::unique_ptr<camdev::Camera> driver;
      try
      {
         driver = adapters.CreateCamera(camera.adapter, camera.device,
               cameraConfig);
      }
      catch (const CamBusError& e)
      {
         throw CamBusError("Cannot create camera " +
               ToQuotedString(camera.name), e);
      }

      std::shared_ptr<CameraController> controller =
         std::make_shared<CameraController>(camera.name, std::move(driver),
               logManager);
      bus.AddModule(controller);
      controllers.push_back(controller);

      LOG_INFO(logger) << "Added camera " << camera.name << " (" <<
         camera.adapter << "/" << camera.device <<
         (camera.master ? ", master" : "") << ")";
   }
   return controllers;
}

} // namespace cambus
