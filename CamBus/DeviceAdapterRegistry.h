///////////////////////////////////////////////////////////////////////////////
// FILE:          DeviceAdapterRegistry.h
// PROJECT:       CamBus
// SUBSYSTEM:     CamBus
//-----------------------------------------------------------------------------
// DESCRIPTION:   Device adapters known to the application, by name.
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

#include "../CamDevice/CamDevice.h"

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace cambus {

class DeviceAdapterRegistry
{
public:
   /**
    * Add an adapter under a name. The adapter's InitializeModuleData() is
    * called to learn which devices it provides.
    */
   void AddAdapter(const std::string& name,
         std::shared_ptr<camdev::DeviceAdapter> adapter);

   std::vector<std::string> GetAdapterNames() const;
   std::vector<std::string> GetAvailableDevices(
         const std::string& adapterName) const;
   std::string GetDeviceDescription(const std::string& adapterName,
         const std::string& deviceName) const;

   /**
    * Create a driver. Throws CamBusError if the adapter or device is
    * unknown, or if the adapter fails to create the device.
    */
   std::unique_ptr<camdev::Camera> CreateCamera(const std::string& adapterName,
         const std::string& deviceName, const camdev::CameraConfig& config);

private:
   struct AdapterEntry
   {
      std::shared_ptr<camdev::DeviceAdapter> adapter;
      // Device name to description, in registration order
      std::vector<std::pair<std::string, std::string>> devices;
   };

   const AdapterEntry& GetEntry(const std::string& adapterName) const;

   std::map<std::string, AdapterEntry> adapters_;
};

} // namespace cambus
