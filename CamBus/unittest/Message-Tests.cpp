#include <catch2/catch_all.hpp>

#include "Error.h"
#include "Message.h"
#include "MessageData.h"

#include <memory>
#include <string>
#include <vector>

namespace cambus {

TEST_CASE("field values keep their type", "[MessageData]")
{
   CHECK(FieldValue("text").GetType() == FieldValue::TypeString);
   CHECK(FieldValue(std::string("text")).GetType() == FieldValue::TypeString);
   CHECK(FieldValue(5).GetType() == FieldValue::TypeInteger);
   CHECK(FieldValue(5L).GetType() == FieldValue::TypeInteger);
   CHECK(FieldValue(true).GetType() == FieldValue::TypeBoolean);
   CHECK(FieldValue(camdev::ParameterSet()).GetType() ==
         FieldValue::TypeParameters);
   CHECK(FieldValue(camdev::FilmSettings::RunTillAbortFilm()).GetType() ==
         FieldValue::TypeFilmSettings);

   CHECK(FieldValue(12).AsInteger() == 12);
   CHECK(FieldValue("abc").AsString() == "abc");
   CHECK(FieldValue(false).AsBoolean() == false);
   CHECK(FieldValue(camdev::FilmSettings::FixedLengthFilm(8))
         .AsFilmSettings().GetFilmLength() == 8);

   CHECK(std::string(TypeName(FieldValue::TypeFilmSettings)) ==
         "film settings");
}

TEST_CASE("wrong field type access throws", "[MessageData]")
{
   FieldValue value(12);
   try
   {
      value.AsString();
      FAIL("expected CamBusError");
   }
   catch (const CamBusError& e)
   {
      CHECK(e.getCode() == CAMBUS_ERR_PROTOCOL);
   }
   CHECK_THROWS_AS(value.AsParameters(), CamBusError);
   CHECK_THROWS_AS(value.AsFunctionality(), CamBusError);
}

TEST_CASE("null functionality is not a field value", "[MessageData]")
{
   std::shared_ptr<const camdev::CameraFunctionality> none;
   CHECK_THROWS_AS(FieldValue(none), CamBusError);
}

TEST_CASE("message data fields", "[MessageData]")
{
   MessageData data;
   CHECK(data.Empty());
   CHECK_FALSE(data.Has(field::Camera));
   CHECK_THROWS_AS(data.Get(field::Camera), CamBusError);

   data.Set(field::Camera, "cam1").Set(field::ExtraData, "more");
   CHECK_FALSE(data.Empty());
   CHECK(data.GetString(field::Camera) == "cam1");
   CHECK(data.GetFieldNames() ==
         std::vector<std::string>{ field::Camera, field::ExtraData });

   data.Set(field::Camera, "cam2");
   CHECK(data.GetString(field::Camera) == "cam2");
   CHECK(data.GetFieldNames().size() == 2);

   CHECK_THROWS_AS(data.GetInteger(field::Camera), CamBusError);
}

TEST_CASE("parameters in message data are shared", "[MessageData]")
{
   camdev::ParameterSet params("parameters");
   MessageData data;
   data.Set(field::Parameters, params);

   params.SetValue("exposure_time", 0.2);
   CHECK(data.GetParameters(field::Parameters)
         .GetValue<double>("exposure_time") == 0.2);
   CHECK(data.GetParameters(field::Parameters).IsSameSet(params));
}

TEST_CASE("message kind follows the type tag", "[Message]")
{
   Message byType("test", "start camera",
         MessageData().Set(field::Camera, "cam1"));
   CHECK(byType.GetKind() == MessageKind::StartCamera);
   CHECK(byType.IsType(msgtype::StartCamera));
   CHECK(byType.GetSource() == "test");

   Message byKind("test", MessageKind::StopFilm);
   CHECK(byKind.GetType() == "stop film");
   CHECK(byKind.GetData().Empty());

   Message other("test", "custom message");
   CHECK(other.GetKind() == MessageKind::Other);
}

TEST_CASE("responses and errors are kept in order", "[Message]")
{
   Message msg("test", MessageKind::StopFilm);
   CHECK(msg.GetResponses().empty());
   CHECK_FALSE(msg.HasErrors());

   // Not sent, so nothing to validate against
   msg.AddResponse(Response("cam1", MessageData().Set("anything", 1)));
   msg.AddResponse(Response("cam2", MessageData()));
   REQUIRE(msg.GetResponses().size() == 2);
   CHECK(msg.GetResponses()[0].source == "cam1");
   CHECK(msg.GetResponses()[1].source == "cam2");

   msg.AddError(MessageError("cam2", "failed", CAMBUS_ERR_DEVICE));
   CHECK(msg.HasErrors());
   REQUIRE(msg.GetErrors().size() == 1);
   CHECK(msg.GetErrors()[0].text == "failed");
}

TEST_CASE("unsent message is not complete", "[Message]")
{
   Message msg("test", MessageKind::ConfigureInitial);
   CHECK_FALSE(msg.IsComplete());
}

} // namespace cambus
