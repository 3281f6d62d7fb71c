// test_session.cpp - Unit tests for the synthesis driver
//
#include <gtest/gtest.h>

#include <nlohmann/json.hpp>
#include <sstream>
#include <string>

#include "codesynth/driver/session.hpp"
#include "codesynth/test_support/temp_dir.hpp"

namespace codesynth
{

using test_support::TempDir;

namespace
{

constexpr const char * k_shapes = R"({
  "types": {
    "Main.Point": {"kind": "alias", "type": {"kind": "record", "fields": [
      {"name": "x", "type": {"kind": "opaque", "module": "Basics", "name": "Int"}},
      {"name": "y", "type": {"kind": "opaque", "module": "Basics", "name": "Int"}}]}}
  },
  "requests": [
    {"name": "decodePoints", "annotation": {"kind": "opaque", "module": "Json.Decode",
      "name": "Decoder", "args": [{"kind": "opaque", "module": "List", "name": "List",
        "args": [{"kind": "ref", "module": "Main", "name": "Point"}]}]}}
  ]
})";

constexpr const char * k_random_int = R"({
  "requests": [
    {"name": "randomInt", "annotation": {"kind": "opaque", "module": "Random",
      "name": "Generator", "args": [{"kind": "opaque", "module": "Basics", "name": "Int"}]}}
  ]
})";

constexpr const char * k_generic_box = R"({
  "types": {
    "Main.Box": {"kind": "custom", "generics": ["a"], "constructors": [
      {"name": "Box", "args": [{"kind": "var", "name": "a"}]}]}
  },
  "requests": [
    {"name": "decodeBox", "annotation": {"kind": "opaque", "module": "Json.Decode",
      "name": "Decoder", "args": [{"kind": "opaque", "module": "Main", "name": "Box",
        "args": [{"kind": "opaque", "module": "Basics", "name": "Int"}]}]}}
  ]
})";

}  // namespace

TEST(Session, RunFilesSynthesizesRequestsAndHelpers)
{
  const TempDir dir("codesynth_session_basic");
  const auto input = dir.write("shapes.json", k_shapes);

  const SessionResult result = Session::run_files({input}, SessionOptions{});
  ASSERT_TRUE(result.success);
  ASSERT_EQ(result.outcomes.size(), 1u);
  ASSERT_EQ(result.declarations.size(), 2u);
  EXPECT_EQ(result.declarations[0].name, "decodePoints");
  EXPECT_EQ(result.declarations[1].name, "decodePoint");
}

TEST(Session, ElmOutputSeparatesDeclarations)
{
  const TempDir dir("codesynth_session_elm");
  const auto input = dir.write("shapes.json", k_shapes);

  const SessionResult result = Session::run_files({input}, SessionOptions{});
  ASSERT_TRUE(result.success);
  const std::string text = render_output(result.declarations, OutputFormat::Elm);
  EXPECT_EQ(
    text,
    "decodePoints : Json.Decode.Decoder (List.List Main.Point)\n"
    "decodePoints =\n"
    "    Json.Decode.list decodePoint\n"
    "\n\n"
    "decodePoint : Json.Decode.Decoder Main.Point\n"
    "decodePoint =\n"
    "    Json.Decode.map2 (\\x y -> { x = x, y = y }) (Json.Decode.field \"x\" Json.Decode.int) "
    "(Json.Decode.field \"y\" Json.Decode.int)\n");
}

TEST(Session, JsonOutputIsAnArrayOfDeclarations)
{
  const TempDir dir("codesynth_session_json");
  const auto input = dir.write("shapes.json", k_shapes);

  const SessionResult result = Session::run_files({input}, SessionOptions{});
  ASSERT_TRUE(result.success);
  const auto doc = nlohmann::json::parse(render_output(result.declarations, OutputFormat::Json));
  ASSERT_TRUE(doc.is_array());
  ASSERT_EQ(doc.size(), 2u);
  EXPECT_EQ(doc[0]["name"], "decodePoints");
  EXPECT_EQ(doc[0]["annotation"], "Json.Decode.Decoder (List.List Main.Point)");
  EXPECT_EQ(doc[0]["body"]["type"], "ApplicationExpr");
}

TEST(Session, MissingInputFails)
{
  const TempDir dir("codesynth_session_missing");
  const SessionResult result = Session::run_files({dir.path / "absent.json"}, SessionOptions{});
  EXPECT_FALSE(result.success);
  ASSERT_TRUE(result.diagnostics.has_errors());
  EXPECT_EQ(result.diagnostics.all()[0].code, "E010");
  EXPECT_TRUE(result.outcomes.empty());
}

TEST(Session, NoInputsFails)
{
  const SessionResult result = Session::run_files({}, SessionOptions{});
  EXPECT_FALSE(result.success);
  EXPECT_TRUE(result.diagnostics.has_errors());
}

TEST(Session, AppliedGenericCustomTypeIsRejected)
{
  const TempDir dir("codesynth_session_generic");
  const auto input = dir.write("box.json", k_generic_box);

  const SessionResult result = Session::run_files({input}, SessionOptions{});
  EXPECT_FALSE(result.success);
  ASSERT_TRUE(result.diagnostics.has_errors());
  EXPECT_EQ(result.diagnostics.all()[0].code, "E004");
  EXPECT_TRUE(result.declarations.empty());
}

TEST(Session, CapabilitiesRestrictGenerators)
{
  const TempDir dir("codesynth_session_caps");
  const auto input = dir.write("random.json", k_random_int);

  SessionOptions json_only;
  json_only.capabilities = {"elm/json"};
  const SessionResult restricted = Session::run_files({input}, json_only);
  EXPECT_FALSE(restricted.success);
  EXPECT_EQ(restricted.diagnostics.all()[0].code, "E009");

  const SessionResult defaults = Session::run_files({input}, SessionOptions{});
  EXPECT_TRUE(defaults.success);
}

TEST(Session, RunProjectUsesConfiguredInputs)
{
  const TempDir dir("codesynth_session_project");
  ProjectConfig config;
  config.capabilities = {"elm/json", "NoRedInk/elm-json-decode-pipeline"};
  config.inputs = {dir.write("shapes.json", k_shapes)};

  const SessionResult result = Session::run_project(config, SessionOptions{});
  ASSERT_TRUE(result.success);
  ASSERT_EQ(result.declarations.size(), 2u);
  const std::string text = render_output(result.declarations, OutputFormat::Elm);
  EXPECT_NE(text.find("Json.Decode.Pipeline.required \"x\""), std::string::npos) << text;
}

TEST(Session, VerboseLogsActiveGenerators)
{
  const TempDir dir("codesynth_session_verbose");
  const auto input = dir.write("shapes.json", k_shapes);

  std::ostringstream log;
  SessionOptions options;
  options.verbose = true;
  options.log = &log;
  const SessionResult result = Session::run_files({input}, options);
  ASSERT_TRUE(result.success);
  EXPECT_NE(log.str().find("[codesynth] 4 generator(s) active"), std::string::npos) << log.str();
}

}  // namespace codesynth
