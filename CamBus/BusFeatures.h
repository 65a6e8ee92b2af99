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

#pragma once

#include <string>

namespace cambus {
namespace features {

struct Flags {
   bool strictResponseValidation = true;
   bool strictAddressing = false;
   // How to add a new bus feature: see the comment in the .cpp file.
};

namespace internal {

extern Flags g_flags;

}

inline const Flags& flags() { return internal::g_flags; }

void enableFeature(const std::string& name, bool enable);
bool isFeatureEnabled(const std::string& name);

} // namespace features
} // namespace cambus
