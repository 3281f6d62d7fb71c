// test_type_loader.cpp - Unit tests for loading types and requests from JSON
//
#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include "codesynth/io/type_loader.hpp"
#include "codesynth/test_support/temp_dir.hpp"
#include "codesynth/types/type_utils.hpp"

namespace codesynth
{

using nlohmann::json;

class TypeLoaderTest : public ::testing::Test
{
protected:
  TypeContext types_;

  GenResult<LoadedInput> load(const char * text) { return load_input(json::parse(text), types_); }
};

TEST_F(TypeLoaderTest, RequestWithOpaqueAnnotation)
{
  auto input = load(R"({
    "requests": [{
      "name": "decodeInts",
      "annotation": {"kind": "opaque", "module": "Json.Decode", "name": "Decoder", "args": [
        {"kind": "opaque", "module": "List", "name": "List", "args": [
          {"kind": "opaque", "module": "Basics", "name": "Int"}]}]},
      "params": []
    }]
  })");
  ASSERT_TRUE(input) << input.error().message;
  ASSERT_EQ(input->requests.size(), 1u);
  EXPECT_EQ(input->requests[0].name, "decodeInts");
  EXPECT_EQ(
    render_type(input->requests[0].annotation), "Json.Decode.Decoder (List.List Basics.Int)");
  EXPECT_TRUE(input->requests[0].params.empty());
}

TEST_F(TypeLoaderTest, RecursiveCustomType)
{
  auto input = load(R"({
    "types": {
      "Main.Tree": {"kind": "custom", "constructors": [
        {"name": "Leaf", "args": [{"kind": "opaque", "module": "Basics", "name": "Int"}]},
        {"name": "Node", "args": [{"kind": "ref", "module": "Main", "name": "Tree"},
                                  {"kind": "ref", "module": "Main", "name": "Tree"}]}]}
    },
    "requests": [{"name": "decodeTree", "annotation":
      {"kind": "opaque", "module": "Json.Decode", "name": "Decoder", "args": [
        {"kind": "ref", "module": "Main", "name": "Tree"}]}}]
  })");
  ASSERT_TRUE(input) << input.error().message;

  const ResolvedType * tree = input->requests[0].annotation->args[0];
  ASSERT_EQ(tree->kind, TypeKind::CustomType);
  ASSERT_EQ(tree->constructors.size(), 2u);
  EXPECT_EQ(tree->constructors[0].ref, QualifiedName("Main", "Leaf"));
  ASSERT_EQ(tree->constructors[1].args.size(), 2u);
  EXPECT_EQ(tree->constructors[1].args[0], tree);
}

TEST_F(TypeLoaderTest, RecordAliasAndParams)
{
  auto input = load(R"({
    "types": {
      "Main.Point": {"kind": "alias", "type": {"kind": "record", "fields": [
        {"name": "x", "type": {"kind": "opaque", "module": "Basics", "name": "Float"}},
        {"name": "y", "type": {"kind": "opaque", "module": "Basics", "name": "Float"}}]}}
    },
    "requests": [{"name": "encodePoint", "params": ["point"], "annotation": {"kind": "function",
      "from": {"kind": "ref", "module": "Main", "name": "Point"},
      "to": {"kind": "opaque", "module": "Json.Encode", "name": "Value"}}}]
  })");
  ASSERT_TRUE(input) << input.error().message;

  const SynthesisRequest & request = input->requests[0];
  ASSERT_EQ(request.params.size(), 1u);
  EXPECT_EQ(request.params[0], "point");
  const ResolvedType * point = request.annotation->from();
  ASSERT_EQ(point->kind, TypeKind::TypeAlias);
  ASSERT_NE(point->aliased, nullptr);
  EXPECT_EQ(point->aliased->fields.size(), 2u);
}

TEST_F(TypeLoaderTest, TuplesUnitAndVariables)
{
  auto input = load(R"({
    "requests": [
      {"name": "a", "annotation": {"kind": "tuple", "elements": [
        {"kind": "unit"}, {"kind": "var", "name": "v"}]}}
    ]
  })");
  ASSERT_TRUE(input) << input.error().message;
  EXPECT_EQ(render_type(input->requests[0].annotation), "( (), v )");
}

TEST_F(TypeLoaderTest, Providers)
{
  auto input = load(R"({
    "providers": [{"generator": "elm/json/Json.Decode.Decoder", "module": "Api", "name": "decodeId",
      "type": {"kind": "opaque", "module": "Json.Decode", "name": "Decoder", "args": [
        {"kind": "opaque", "module": "Api", "name": "Id"}]}}]
  })");
  ASSERT_TRUE(input) << input.error().message;
  ASSERT_EQ(input->providers.size(), 1u);
  EXPECT_EQ(input->providers[0].generator_id, "elm/json/Json.Decode.Decoder");
  EXPECT_EQ(input->providers[0].location, QualifiedName("Api", "decodeId"));
}

TEST_F(TypeLoaderTest, UnknownReferenceFails)
{
  auto input = load(R"({
    "requests": [{"name": "x", "annotation": {"kind": "ref", "module": "Main", "name": "Missing"}}]
  })");
  ASSERT_FALSE(input);
  EXPECT_EQ(input.error().kind, GenErrorKind::InvalidInput);
  EXPECT_NE(input.error().message.find("Main.Missing"), std::string::npos);
}

TEST_F(TypeLoaderTest, AppliedGenericTypeResolvesToDeclaration)
{
  auto input = load(R"({
    "types": {
      "Main.Box": {"kind": "custom", "generics": ["a"], "constructors": [
        {"name": "Box", "args": [{"kind": "var", "name": "a"}]}]}
    },
    "requests": [
      {"name": "a", "annotation": {"kind": "opaque", "module": "Main", "name": "Box", "args": [
        {"kind": "opaque", "module": "Basics", "name": "Int"}]}},
      {"name": "b", "annotation": {"kind": "ref", "module": "Main", "name": "Box", "args": [
        {"kind": "opaque", "module": "Basics", "name": "Int"}]}}]
  })");
  ASSERT_TRUE(input) << input.error().message;
  ASSERT_EQ(input->requests.size(), 2u);
  for (const auto & request : input->requests) {
    EXPECT_EQ(request.annotation->kind, TypeKind::CustomType);
    EXPECT_TRUE(request.annotation->has_generics());
  }
}

TEST_F(TypeLoaderTest, NamedTypeArityMismatchFails)
{
  auto input = load(R"({
    "types": {"Main.Id": {"kind": "alias", "type": {"kind": "opaque", "module": "Basics", "name": "Int"}}},
    "requests": [{"name": "x", "annotation": {"kind": "ref", "module": "Main", "name": "Id", "args": [
      {"kind": "opaque", "module": "Basics", "name": "Int"}]}}]
  })");
  ASSERT_FALSE(input);
  EXPECT_EQ(input.error().kind, GenErrorKind::InvalidInput);
  EXPECT_NE(input.error().message.find("Main.Id"), std::string::npos);
}

TEST_F(TypeLoaderTest, UnknownKindFails)
{
  auto input = load(R"({"requests": [{"name": "x", "annotation": {"kind": "mystery"}}]})");
  ASSERT_FALSE(input);
  EXPECT_NE(input.error().message.find("mystery"), std::string::npos);
}

TEST_F(TypeLoaderTest, InvalidNamedKindFails)
{
  auto input = load(R"({"types": {"Main.X": {"kind": "opaque"}}})");
  ASSERT_FALSE(input);
  EXPECT_NE(input.error().message.find("Main.X"), std::string::npos);
}

TEST_F(TypeLoaderTest, RequestWithoutAnnotationFails)
{
  auto input = load(R"({"requests": [{"name": "x"}]})");
  ASSERT_FALSE(input);
  EXPECT_STREQ(input.error().code(), "E010");
}

TEST_F(TypeLoaderTest, NonObjectDocumentFails) { EXPECT_FALSE(load("[1, 2]")); }

TEST_F(TypeLoaderTest, FileErrors)
{
  const test_support::TempDir dir("codesynth_loader_files");
  EXPECT_FALSE(load_input_file(dir.path / "missing.json", types_));

  const auto broken = dir.write("broken.json", "{ \"requests\": [");
  auto result = load_input_file(broken, types_);
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error().kind, GenErrorKind::InvalidInput);
}

}  // namespace codesynth
