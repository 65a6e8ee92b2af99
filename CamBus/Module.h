///////////////////////////////////////////////////////////////////////////////
// FILE:          Module.h
// PROJECT:       CamBus
// SUBSYSTEM:     CamBus
//-----------------------------------------------------------------------------
// DESCRIPTION:   Base class of everything attached to the message bus.
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

#include "Message.h"

#include <memory>
#include <string>

namespace cambus {

class MessageBus;
class MessageRegistry;

/**
 * A module sees every message sent on its bus and decides for itself which
 * ones concern it. Modules never call each other; they send messages.
 */
class Module
{
public:
   explicit Module(const std::string& name);
   virtual ~Module() {}

   Module(const Module&) = delete;
   Module& operator=(const Module&) = delete;

   const std::string& GetName() const { return name_; }

   /**
    * Called once when the module is added to a bus.
    */
   virtual void RegisterMessages(MessageRegistry&) {}

   /**
    * Handle one message. Called on the bus's dispatch path, never
    * concurrently for one module. Throwing CamBusError records a failed
    * outcome on the message; delivery to other modules continues.
    */
   virtual void ProcessMessage(Message& msg) = 0;

   /**
    * Called for messages sent by this module, after all modules have
    * handled them.
    */
   virtual void HandleResponses(Message&) {}

   virtual void CleanUp() {}

protected:
   /**
    * Send a new message on the bus this module is attached to.
    * Throws CamBusError (CAMBUS_ERR_BUS_STATE) if there is none.
    */
   void EmitMessage(std::shared_ptr<Message> msg);

private:
   friend class MessageBus;

   const std::string name_;
   MessageBus* bus_;
};

} // namespace cambus
