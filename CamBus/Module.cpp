///////////////////////////////////////////////////////////////////////////////
// FILE:          Module.cpp
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

#include "Module.h"

#include "CoreUtils.h"
#include "Error.h"
#include "MessageBus.h"

#include <utility>

namespace cambus {

Module::Module(const std::string& name) :
   name_(name),
   bus_(nullptr)
{
   if (name_.empty())
      throw CamBusError("Module name must not be empty");
}

void
Module::EmitMessage(std::shared_ptr<Message> msg)
{
   if (!bus_)
      throw CamBusError("Module " + ToQuotedString(name_) +
            " is not attached to a bus", CAMBUS_ERR_BUS_STATE);
   bus_->Send(std::move(msg));
}

} // namespace cambus
