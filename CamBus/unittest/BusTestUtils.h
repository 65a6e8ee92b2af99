// Helpers shared by the CamBus unit tests.

#pragma once

#include "CameraController.h"
#include "Message.h"
#include "MessageBus.h"
#include "Module.h"
#include "StubDevices.h"

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace cambus {

// Remembers the messages it sees and the ones it sent.
class RecordingModule : public Module
{
public:
   std::vector<std::string> seen;
   std::vector<std::string> handled;
   std::vector<std::pair<std::string, std::string>> received; // source, type
   std::vector<MessageData> payloads;

   explicit RecordingModule(const std::string& name = "recorder") :
      Module(name)
   {}

   void ProcessMessage(Message& msg) override
   {
      seen.push_back(msg.GetType());
      received.push_back(std::make_pair(msg.GetSource(), msg.GetType()));
      payloads.push_back(msg.GetData());
   }

   void HandleResponses(Message& msg) override
   {
      handled.push_back(msg.GetType());
   }

   void Emit(std::shared_ptr<Message> msg) { EmitMessage(msg); }
};

inline std::shared_ptr<Message>
SendAndDispatch(MessageBus& bus, const std::string& type,
      const MessageData& data = MessageData(),
      const std::string& source = "test")
{
   auto msg = std::make_shared<Message>(source, type, data);
   bus.Send(msg);
   bus.DispatchAll();
   return msg;
}

inline MessageData
Addressed(const std::string& camera)
{
   MessageData data;
   data.Set(field::Camera, camera);
   return data;
}

inline std::shared_ptr<const camdev::CameraFunctionality>
FunctionalityWithTimeBase(const std::string& camera,
      const std::string& timeBase)
{
   camdev::CameraFunctionality::Attributes attrs;
   attrs.cameraName = camera;
   attrs.timeBase = timeBase;
   return std::make_shared<camdev::CameraFunctionality>(attrs);
}

// A bus with one controller around a stub driver.
struct ControllerFixture
{
   MessageBus bus;
   StubCamera* camera;
   std::shared_ptr<CameraController> controller;

   explicit ControllerFixture(const std::string& name = "cam1")
   {
      std::unique_ptr<StubCamera> stub(new StubCamera(name));
      camera = stub.get();
      controller = std::make_shared<CameraController>(name, std::move(stub),
            bus.GetLogManager());
      bus.AddModule(controller);
   }
};

} // namespace cambus
