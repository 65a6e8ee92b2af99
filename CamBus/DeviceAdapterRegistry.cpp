///////////////////////////////////////////////////////////////////////////////
// FILE:          DeviceAdapterRegistry.cpp
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

#include "DeviceAdapterRegistry.h"

#include "CoreUtils.h"
#include "Error.h"

#include <utility>

namespace cambus {

void
DeviceAdapterRegistry::AddAdapter(const std::string& name,
      std::shared_ptr<camdev::DeviceAdapter> adapter)
{
   if (name.empty())
      throw CamBusError("Empty device adapter name");
   if (!adapter)
      throw CamBusError("Null device adapter " + ToQuotedString(name));
   if (adapters_.find(name) != adapters_.end())
      throw CamBusError("Device adapter with name " + ToQuotedString(name) +
            " is already registered");

   AdapterEntry entry;
   entry.adapter = adapter;
   adapter->InitializeModuleData(
         [&entry](const char* deviceName, const char* description) {
            entry.devices.push_back(std::make_pair(
                     ToString(deviceName), ToString(description)));
         });
   adapters_.insert(std::make_pair(name, entry));
}

std::vector<std::string>
DeviceAdapterRegistry::GetAdapterNames() const
{
   std::vector<std::string> names;
   for (const auto& adapter : adapters_)
      names.push_back(adapter.first);
   return names;
}

const DeviceAdapterRegistry::AdapterEntry&
DeviceAdapterRegistry::GetEntry(const std::string& adapterName) const
{
   std::map<std::string, AdapterEntry>::const_iterator it =
      adapters_.find(adapterName);
   if (it == adapters_.end())
      throw CamBusError("No device adapter named " +
            ToQuotedString(adapterName), CAMBUS_ERR_NO_SUCH_ADAPTER);
   return it->second;
}

std::vector<std::string>
DeviceAdapterRegistry::GetAvailableDevices(const std::string& adapterName) const
{
   std::vector<std::string> names;
   for (const auto& device : GetEntry(adapterName).devices)
      names.push_back(device.first);
   return names;
}

std::string
DeviceAdapterRegistry::GetDeviceDescription(const std::string& adapterName,
      const std::string& deviceName) const
{
   for (const auto& device : GetEntry(adapterName).devices)
   {
      if (device.first == deviceName)
         return device.second;
   }
   throw CamBusError("No device named " + ToQuotedString(deviceName) +
         " in device adapter " + ToQuotedString(adapterName),
         CAMBUS_ERR_NO_SUCH_DEVICE);
}

std::unique_ptr<camdev::Camera>
DeviceAdapterRegistry::CreateCamera(const std::string& adapterName,
      const std::string& deviceName, const camdev::CameraConfig& config)
{
   // Throws if the device is not registered by the adapter
   GetDeviceDescription(adapterName, deviceName);

   std::unique_ptr<camdev::Camera> camera;
   try
   {
      camera = GetEntry(adapterName).adapter->CreateCamera(deviceName, config);
   }
   catch (const camdev::ParameterError& e)
   {
      throw CamBusError("Cannot create device " + ToQuotedString(deviceName) +
            " for camera " + ToQuotedString(config.cameraName) + ": " +
            e.what(), CAMBUS_ERR_CONFIG);
   }
   if (!camera)
      throw CamBusError("Device adapter " + ToQuotedString(adapterName) +
            " failed to create device " + ToQuotedString(deviceName),
            CAMBUS_ERR_NO_SUCH_DEVICE);
   return camera;
}

} // namespace cambus
