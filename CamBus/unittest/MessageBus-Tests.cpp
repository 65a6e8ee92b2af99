#include <catch2/catch_all.hpp>

#include "BusFeatures.h"
#include "BusTestUtils.h"
#include "Error.h"
#include "MessageBus.h"

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace cambus {

namespace {

const char* const PingType = "test ping";

void
RegisterPing(MessageBus& bus)
{
   bus.GetRegistry().RegisterMessage(PingType, MessageShape(
            { { "value", FieldSpec(false, FieldValue::TypeInteger) } },
            { { "echo", FieldSpec(true, FieldValue::TypeInteger) } }));
}

class OrderModule : public Module
{
   std::vector<std::string>& log_;

public:
   OrderModule(const std::string& name, std::vector<std::string>& log) :
      Module(name), log_(log)
   {}

   void ProcessMessage(Message& msg) override
   { log_.push_back(GetName() + ":" + msg.GetType()); }

   void HandleResponses(Message& msg) override
   { log_.push_back(GetName() + ":responses:" + msg.GetType()); }
};

class ThrowingModule : public Module
{
public:
   bool throwStd = false;

   ThrowingModule() : Module("thrower") {}

   void ProcessMessage(Message&) override
   {
      if (throwStd)
         throw std::runtime_error("plain failure");
      throw CamBusError("module failure", CAMBUS_ERR_DEVICE);
   }
};

class EchoModule : public Module
{
public:
   bool malformed = false;
   int cleanUps = 0;

   EchoModule() : Module("echo") {}

   void ProcessMessage(Message& msg) override
   {
      if (!msg.IsType(PingType))
         return;
      MessageData data;
      if (malformed)
         data.Set("unexpected", "text");
      else
         data.Set("echo", msg.GetData().Has("value") ?
               msg.GetData().GetInteger("value") : 0L);
      msg.AddResponse(Response(GetName(), data));
   }

   void CleanUp() override { ++cleanUps; }
};

struct FeatureRestorer
{
   features::Flags saved;
   FeatureRestorer() : saved(features::flags()) {}
   ~FeatureRestorer() { features::internal::g_flags = saved; }
};

} // anonymous namespace

TEST_CASE("modules see messages in the order they were added", "[MessageBus]")
{
   MessageBus bus;
   std::vector<std::string> log;
   bus.AddModule(std::make_shared<OrderModule>("a", log));
   bus.AddModule(std::make_shared<OrderModule>("b", log));
   bus.AddModule(std::make_shared<OrderModule>("c", log));

   CHECK(bus.GetModuleNames() == std::vector<std::string>{ "a", "b", "c" });

   SendAndDispatch(bus, msgtype::ConfigureInitial);
   CHECK(log == std::vector<std::string>{
         "a:configure1", "b:configure1", "c:configure1" });
}

TEST_CASE("messages are delivered in the order sent", "[MessageBus]")
{
   MessageBus bus;
   auto recorder = std::make_shared<RecordingModule>();
   bus.AddModule(recorder);

   bus.Send(std::make_shared<Message>("test", msgtype::StopFilm));
   bus.Send(std::make_shared<Message>("test", msgtype::ConfigureInitial));
   bus.Send(std::make_shared<Message>("test", msgtype::StartCamera,
            Addressed("cam1")));
   CHECK(bus.DispatchAll() == 3);
   CHECK(recorder->seen == std::vector<std::string>{
         msgtype::StopFilm, msgtype::ConfigureInitial, msgtype::StartCamera });
   CHECK(bus.DispatchAll() == 0);
}

TEST_CASE("sender handles responses after everyone else", "[MessageBus]")
{
   MessageBus bus;
   std::vector<std::string> log;
   auto sender = std::make_shared<OrderModule>("a", log);
   bus.AddModule(sender);
   bus.AddModule(std::make_shared<OrderModule>("b", log));

   SendAndDispatch(bus, msgtype::ConfigureInitial, MessageData(), "a");
   CHECK(log == std::vector<std::string>{
         "a:configure1", "b:configure1", "a:responses:configure1" });
}

TEST_CASE("finalizer runs once the message is handled", "[MessageBus]")
{
   MessageBus bus;
   auto echo = std::make_shared<EchoModule>();
   bus.AddModule(echo);
   RegisterPing(bus);

   auto msg = std::make_shared<Message>("test", PingType,
         MessageData().Set("value", 42L));
   size_t responsesAtFinalize = 0;
   msg->SetFinalizer([&](const Message& m) {
      responsesAtFinalize = m.GetResponses().size();
   });
   bus.Send(msg);
   CHECK_FALSE(msg->IsComplete());
   bus.DispatchAll();
   CHECK(msg->IsComplete());
   CHECK(responsesAtFinalize == 1);
   CHECK(msg->GetResponses()[0].data.GetInteger("echo") == 42);
}

TEST_CASE("duplicate module names are rejected", "[MessageBus]")
{
   MessageBus bus;
   bus.AddModule(std::make_shared<RecordingModule>("cam1"));
   try
   {
      bus.AddModule(std::make_shared<RecordingModule>("cam1"));
      FAIL("expected CamBusError");
   }
   catch (const CamBusError& e)
   {
      CHECK(e.getCode() == CAMBUS_ERR_DUPLICATE_MODULE);
   }
   CHECK(bus.GetModuleNames().size() == 1);
   CHECK(bus.GetModule("cam1"));
   CHECK_FALSE(bus.GetModule("cam2"));
}

TEST_CASE("malformed messages are not sent", "[MessageBus]")
{
   MessageBus bus;
   auto recorder = std::make_shared<RecordingModule>();
   bus.AddModule(recorder);

   SECTION("unknown type")
   {
      try
      {
         bus.Send(std::make_shared<Message>("test", "no such message"));
         FAIL("expected CamBusError");
      }
      catch (const CamBusError& e)
      {
         CHECK(e.getCode() == CAMBUS_ERR_UNKNOWN_MESSAGE);
      }
   }

   SECTION("missing required field")
   {
      CHECK_THROWS_AS(bus.Send(std::make_shared<Message>("test",
                  msgtype::StartCamera)), CamBusError);
   }

   SECTION("wrong field type")
   {
      CHECK_THROWS_AS(bus.Send(std::make_shared<Message>("test",
                  msgtype::StartCamera, MessageData().Set(field::Camera, 3))),
            CamBusError);
   }

   SECTION("unexpected field")
   {
      MessageData data = Addressed("cam1");
      data.Set("color", "blue");
      CHECK_THROWS_AS(bus.Send(std::make_shared<Message>("test",
                  msgtype::StartCamera, data)), CamBusError);
   }

   CHECK(bus.DispatchAll() == 0);
   CHECK(recorder->seen.empty());
}

TEST_CASE("module failures do not stop delivery", "[MessageBus]")
{
   MessageBus bus;
   auto thrower = std::make_shared<ThrowingModule>();
   auto recorder = std::make_shared<RecordingModule>();
   bus.AddModule(thrower);
   bus.AddModule(recorder);

   SECTION("bus error")
   {
      auto msg = SendAndDispatch(bus, msgtype::ConfigureInitial);
      REQUIRE(msg->GetErrors().size() == 1);
      CHECK(msg->GetErrors()[0].source == "thrower");
      CHECK(msg->GetErrors()[0].code == CAMBUS_ERR_DEVICE);
      CHECK(msg->GetErrors()[0].text == "module failure");
   }

   SECTION("other exception")
   {
      thrower->throwStd = true;
      auto msg = SendAndDispatch(bus, msgtype::ConfigureInitial);
      REQUIRE(msg->GetErrors().size() == 1);
      CHECK(msg->GetErrors()[0].code == CAMBUS_ERR_GENERIC);
      CHECK(msg->GetErrors()[0].text == "plain failure");
   }

   CHECK(recorder->seen.size() == 1);
}

TEST_CASE("messages emitted during dispatch are delivered", "[MessageBus]")
{
   MessageBus bus;
   auto recorder = std::make_shared<RecordingModule>();
   bus.AddModule(recorder);

   auto first = std::make_shared<Message>("recorder", msgtype::StopFilm);
   first->SetFinalizer([&](const Message&) {
      recorder->Emit(std::make_shared<Message>("recorder",
               msgtype::ConfigureInitial));
   });
   bus.Send(first);
   CHECK(bus.DispatchAll() == 2);
   CHECK(recorder->seen == std::vector<std::string>{
         msgtype::StopFilm, msgtype::ConfigureInitial });
   CHECK(recorder->handled == recorder->seen);
}

TEST_CASE("module must be attached to emit", "[MessageBus]")
{
   RecordingModule loose;
   try
   {
      loose.Emit(std::make_shared<Message>("recorder",
               msgtype::ConfigureInitial));
      FAIL("expected CamBusError");
   }
   catch (const CamBusError& e)
   {
      CHECK(e.getCode() == CAMBUS_ERR_BUS_STATE);
   }
}

TEST_CASE("dispatch thread delivers messages", "[MessageBus]")
{
   MessageBus bus;
   auto echo = std::make_shared<EchoModule>();
   bus.AddModule(echo);
   RegisterPing(bus);

   bus.Start();
   CHECK(bus.IsRunning());
   CHECK_THROWS_AS(bus.DispatchAll(), CamBusError);

   auto msg = std::make_shared<Message>("test", PingType,
         MessageData().Set("value", 7L));
   bus.Send(msg);
   msg->WaitForCompletion();
   REQUIRE(msg->GetResponses().size() == 1);
   CHECK(msg->GetResponses()[0].data.GetInteger("echo") == 7);

   bus.Stop();
   CHECK_FALSE(bus.IsRunning());
}

TEST_CASE("stop delivers what is already queued", "[MessageBus]")
{
   MessageBus bus;
   auto recorder = std::make_shared<RecordingModule>();
   bus.AddModule(recorder);

   bus.Start();
   std::vector<std::shared_ptr<Message>> messages;
   for (int i = 0; i < 20; ++i)
   {
      messages.push_back(std::make_shared<Message>("test",
               msgtype::ConfigureInitial));
      bus.Send(messages.back());
   }
   bus.Stop();
   for (const auto& msg : messages)
      CHECK(msg->IsComplete());
   CHECK(recorder->seen.size() == 20);
}

TEST_CASE("destroying a bus cleans up its modules once", "[MessageBus]")
{
   auto echo = std::make_shared<EchoModule>();
   {
      MessageBus bus;
      bus.AddModule(echo);
   }
   CHECK(echo->cleanUps == 1);

   auto shutDown = std::make_shared<EchoModule>();
   {
      MessageBus bus;
      bus.AddModule(shutDown);
      bus.Shutdown();
   }
   CHECK(shutDown->cleanUps == 1);
}

TEST_CASE("shutdown cleans up modules and closes the bus", "[MessageBus]")
{
   MessageBus bus;
   auto echo = std::make_shared<EchoModule>();
   bus.AddModule(echo);

   bus.Start();
   bus.Shutdown();
   CHECK_FALSE(bus.IsRunning());
   CHECK(echo->cleanUps == 1);

   bus.Shutdown();
   CHECK(echo->cleanUps == 1);

   try
   {
      bus.Send(std::make_shared<Message>("test", msgtype::ConfigureInitial));
      FAIL("expected CamBusError");
   }
   catch (const CamBusError& e)
   {
      CHECK(e.getCode() == CAMBUS_ERR_BUS_STATE);
   }
   CHECK_THROWS_AS(bus.Start(), CamBusError);
}

TEST_CASE("responses are checked against the registered shape",
      "[MessageBus]")
{
   FeatureRestorer restore;
   MessageBus bus;
   auto echo = std::make_shared<EchoModule>();
   echo->malformed = true;
   bus.AddModule(echo);
   RegisterPing(bus);

   SECTION("strict")
   {
      features::enableFeature("StrictResponseValidation", true);
      auto msg = SendAndDispatch(bus, PingType);
      CHECK(msg->GetResponses().empty());
      REQUIRE(msg->GetErrors().size() == 1);
      CHECK(msg->GetErrors()[0].source == "echo");
      CHECK(msg->GetErrors()[0].code == CAMBUS_ERR_PROTOCOL);
   }

   SECTION("lenient")
   {
      features::enableFeature("StrictResponseValidation", false);
      auto msg = SendAndDispatch(bus, PingType);
      CHECK(msg->GetResponses().size() == 1);
      CHECK_FALSE(msg->HasErrors());
   }
}

TEST_CASE("strict addressing reports unknown cameras", "[MessageBus]")
{
   FeatureRestorer restore;
   ControllerFixture f("cam1");

   SECTION("off")
   {
      features::enableFeature("StrictAddressing", false);
      auto msg = SendAndDispatch(f.bus, msgtype::StartCamera,
            Addressed("nobody"));
      CHECK_FALSE(msg->HasErrors());
   }

   SECTION("on")
   {
      features::enableFeature("StrictAddressing", true);
      auto msg = SendAndDispatch(f.bus, msgtype::StartCamera,
            Addressed("nobody"));
      REQUIRE(msg->GetErrors().size() == 1);
      CHECK(msg->GetErrors()[0].source == "bus");
      CHECK(msg->GetErrors()[0].code == CAMBUS_ERR_NO_SUCH_DEVICE);

      auto ok = SendAndDispatch(f.bus, msgtype::StartCamera,
            Addressed("cam1"));
      CHECK_FALSE(ok->HasErrors());
   }
}

} // namespace cambus
