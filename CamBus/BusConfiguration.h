///////////////////////////////////////////////////////////////////////////////
// FILE:          BusConfiguration.h
// PROJECT:       CamBus
// SUBSYSTEM:     CamBus
//-----------------------------------------------------------------------------
// DESCRIPTION:   JSON configuration of logging, features and cameras.
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

#include "LogManager.h"

#include <nlohmann/json.hpp>

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace cambus {

class CameraController;
class DeviceAdapterRegistry;
class MessageBus;

struct CameraModuleConfig
{
   std::string name;
   std::string adapter;
   std::string device;
   bool master = false;
   nlohmann::json parameters = nlohmann::json::object();
};

/**
 * Parsed configuration file. All parse functions throw CamBusError
 * (CAMBUS_ERR_CONFIG) on malformed input.
 *
 * {
 *   "logging": { "level": "debug", "stderr": true, "file": "cambus.log" },
 *   "features": { "StrictResponseValidation": true },
 *   "cameras": [
 *     { "name": "camera1", "adapter": "DemoCamera", "device": "DCam",
 *       "master": true, "parameters": { "exposure_time": 0.05 } }
 *   ]
 * }
 */
class BusConfiguration
{
public:
   static BusConfiguration FromJson(const nlohmann::json& root);
   static BusConfiguration Parse(const std::string& text);
   static BusConfiguration LoadFile(const std::string& filename);

   const LoggingConfig& GetLogging() const { return logging_; }
   const std::map<std::string, bool>& GetFeatures() const { return features_; }
   const std::vector<CameraModuleConfig>& GetCameras() const
   { return cameras_; }

private:
   LoggingConfig logging_;
   std::map<std::string, bool> features_;
   std::vector<CameraModuleConfig> cameras_;
};

/**
 * Configure logging and features, then create a controller for each camera
 * and add it to the bus, in configuration order.
 */
std::vector<std::shared_ptr<CameraController>> ApplyConfiguration(
      const BusConfiguration& config, MessageBus& bus,
      DeviceAdapterRegistry& adapters);

} // namespace cambus
