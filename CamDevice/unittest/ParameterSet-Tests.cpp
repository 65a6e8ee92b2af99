#include <catch2/catch_all.hpp>

#include "ParameterSet.h"

#include <string>
#include <vector>

namespace camdev {

TEST_CASE("values and sub-sets", "[ParameterSet]")
{
   ParameterSet params("parameters");
   CHECK(params.GetName() == "parameters");
   CHECK(params.GetNames().empty());

   params.SetValue("exposure_time", 0.25);
   params.SetValue("x_pixels", 256L);
   params.SetValue("mode", std::string("external"));

   CHECK(params.Has("exposure_time"));
   CHECK_FALSE(params.Has("gain"));
   CHECK(params.GetValue<double>("exposure_time") == 0.25);
   CHECK(params.GetValue<long>("x_pixels") == 256);
   CHECK(params.GetValue<std::string>("mode") == "external");

   ParameterSet cam1("cam1");
   cam1.SetValue("x_bin", 2L);
   params.AddSubSet(cam1);

   CHECK(params.HasSubSet("cam1"));
   CHECK_FALSE(params.Has("cam1"));
   CHECK_FALSE(params.HasSubSet("exposure_time"));
   CHECK(params.Get("cam1").GetName() == "cam1");
   CHECK(params.Get("cam1").GetValue<long>("x_bin") == 2);
   CHECK(params.GetNames() == std::vector<std::string>{
         "cam1", "exposure_time", "mode", "x_pixels" });
}

TEST_CASE("parameter lookup errors", "[ParameterSet]")
{
   ParameterSet params("parameters");
   params.SetValue("exposure_time", 0.25);
   params.AddSubSet(ParameterSet("cam1"));

   CHECK_THROWS_AS(params.Get("cam2"), ParameterError);
   CHECK_THROWS_AS(params.Get("exposure_time"), ParameterError);
   CHECK_THROWS_AS(params.GetValue<double>("gain"), ParameterError);
   CHECK_THROWS_AS(params.GetValue<double>("cam1"), ParameterError);
   CHECK_THROWS_AS(params.GetValue<std::string>("exposure_time"),
         ParameterError);
   CHECK_THROWS_AS(params.SetValue("cam1", 3L), ParameterError);
   CHECK_THROWS_AS(params.AddSubSet(ParameterSet()), ParameterError);
}

TEST_CASE("handles share the tree", "[ParameterSet]")
{
   ParameterSet params("parameters");
   params.AddSubSet(ParameterSet("cam1"));

   ParameterSet view = params.Get("cam1");
   ParameterSet other = params;
   view.SetValue("exposure_time", 0.5);
   CHECK(other.Get("cam1").GetValue<double>("exposure_time") == 0.5);

   CHECK(view.IsSameSet(params.Get("cam1")));
   CHECK(other.IsSameSet(params));
   CHECK_FALSE(view.IsSameSet(params));
}

TEST_CASE("copies are independent", "[ParameterSet]")
{
   ParameterSet params("parameters");
   params.SetValue("exposure_time", 0.1);
   params.AddSubSet(ParameterSet("cam1"));

   ParameterSet snapshot = params.Copy();
   CHECK(snapshot == params);
   CHECK_FALSE(snapshot.IsSameSet(params));
   CHECK(snapshot.GetName() == "parameters");

   params.SetValue("exposure_time", 0.2);
   params.Get("cam1").SetValue("x_bin", 4L);
   CHECK(snapshot.GetValue<double>("exposure_time") == 0.1);
   CHECK_FALSE(snapshot.Get("cam1").Has("x_bin"));
   CHECK(snapshot != params);
}

TEST_CASE("added sub-sets are copied", "[ParameterSet]")
{
   ParameterSet params("parameters");
   ParameterSet cam1("cam1");
   cam1.SetValue("x_bin", 1L);
   params.AddSubSet(cam1);

   cam1.SetValue("x_bin", 2L);
   CHECK(params.Get("cam1").GetValue<long>("x_bin") == 1);
}

TEST_CASE("build from JSON", "[ParameterSet]")
{
   ParameterSet params = ParameterSet::Parse("parameters",
         R"({"exposure_time": 0.1, "cam1": {"x_bin": 2}})");
   CHECK(params.GetValue<double>("exposure_time") == 0.1);
   CHECK(params.Get("cam1").GetValue<long>("x_bin") == 2);
   CHECK(params.ToJson()["cam1"]["x_bin"] == 2);
   CHECK(ParameterSet::Parse("p", params.Dump()) == params);

   CHECK_THROWS_AS(ParameterSet::Parse("p", "[1, 2]"), ParameterError);
   CHECK_THROWS_AS(ParameterSet::Parse("p", "{not json"), ParameterError);
   CHECK_THROWS_AS(ParameterSet::FromJson("p", nlohmann::json(3)),
         ParameterError);
}

} // namespace camdev
