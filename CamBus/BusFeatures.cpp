// PROJECT:       CamBus
// SUBSYSTEM:     CamBus
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

#include "BusFeatures.h"

#include "Error.h"

#include <map>
#include <stdexcept>
#include <utility>

// Bus features are named boolean flags that switch between a lenient and a
// strict variant of bus behavior. Either setting must leave well-behaved
// modules working.
//
// How to add a new feature:
// - Add a bool flag to struct cambus::features::Flags (in the .h file), with
//   its default value
// - Add the feature name and getter/setter lambdas in the map inside
//   featureMap() (below)
// - In bus code, query the feature state with: features::flags().name
//
// Feature names must never be removed once added; a feature that is no longer
// switchable keeps its name with a getter returning the fixed value and a
// setter that throws.

namespace cambus {
namespace features {

namespace internal {

Flags g_flags{};

}

namespace {

const auto& featureMap() {
   using GetFunc = bool(*)();
   using SetFunc = void(*)(bool);
   using internal::g_flags;
   static const std::map<std::string, std::pair<GetFunc, SetFunc>> map = {
      {
         "StrictResponseValidation", {
            [] { return g_flags.strictResponseValidation; },
            [](bool e) { g_flags.strictResponseValidation = e; }
            // Responses are checked against the response shape registered
            // for the message type as they are appended.
         }
      },
      {
         "StrictAddressing", {
            [] { return g_flags.strictAddressing; },
            [](bool e) { g_flags.strictAddressing = e; }
            // A message addressed to a camera that no module on the bus
            // claims is reported as an error of the message.
         }
      },
   };
   return map;
}

}

void enableFeature(const std::string& name, bool enable) {
   try {
      featureMap().at(name).second(enable);
   } catch (const std::out_of_range&) {
      throw CamBusError("No such feature: " + name, CAMBUS_ERR_NO_SUCH_FEATURE);
   }
}

bool isFeatureEnabled(const std::string& name) {
   try {
      return featureMap().at(name).first();
   } catch (const std::out_of_range&) {
      throw CamBusError("No such feature: " + name, CAMBUS_ERR_NO_SUCH_FEATURE);
   }
}

} // namespace features
} // namespace cambus
