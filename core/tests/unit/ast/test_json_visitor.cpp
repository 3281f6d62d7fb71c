// test_json_visitor.cpp - Unit tests for AST JSON serialization
//
#include <gtest/gtest.h>

#include <nlohmann/json.hpp>
#include <string>

#include "codesynth/ast/json_visitor.hpp"
#include "codesynth/test_support/synth_helpers.hpp"

using nlohmann::json;

namespace codesynth
{

class JsonVisitorTest : public ::testing::Test
{
protected:
  test_support::TestWorld w_;
  AstBuilder & b_ = w_.b;
};

TEST_F(JsonVisitorTest, NullNode)
{
  auto j = to_json(static_cast<const AstNode *>(nullptr));
  EXPECT_EQ(j["type"], "Missing");
}

TEST_F(JsonVisitorTest, Reference)
{
  auto j = to_json(b_.ref("Json.Decode", "int"));
  EXPECT_EQ(j["type"], "ReferenceExpr");
  EXPECT_EQ(j["module"], "Json.Decode");
  EXPECT_EQ(j["name"], "int");
}

TEST_F(JsonVisitorTest, Application)
{
  auto j = to_json(b_.apply({"Json.Decode", "field"}, {b_.string("x"), b_.ref("Json.Decode", "int")}));
  EXPECT_EQ(j["type"], "ApplicationExpr");
  EXPECT_EQ(j["fn"]["name"], "field");
  ASSERT_TRUE(j["args"].is_array());
  ASSERT_EQ(j["args"].size(), 2);
  EXPECT_EQ(j["args"][0]["type"], "StringLiteralExpr");
  EXPECT_EQ(j["args"][0]["value"], "x");
}

TEST_F(JsonVisitorTest, LambdaWithPatterns)
{
  auto j = to_json(b_.lambda({b_.tuple_pattern({b_.var("a"), b_.wildcard()})}, b_.local("a")));
  EXPECT_EQ(j["type"], "LambdaExpr");
  ASSERT_EQ(j["params"].size(), 1);
  EXPECT_EQ(j["params"][0]["type"], "TuplePattern");
  EXPECT_EQ(j["params"][0]["elements"][0]["name"], "a");
  EXPECT_EQ(j["params"][0]["elements"][1]["type"], "WildcardPattern");
}

TEST_F(JsonVisitorTest, RecordAndLiterals)
{
  auto j = to_json(b_.record({{"x", b_.integer(3)}, {"y", b_.floating(0.5)}}));
  EXPECT_EQ(j["type"], "RecordExpr");
  ASSERT_EQ(j["fields"].size(), 2);
  EXPECT_EQ(j["fields"][0]["name"], "x");
  EXPECT_EQ(j["fields"][0]["value"]["value"], 3);
  EXPECT_DOUBLE_EQ(j["fields"][1]["value"]["value"].get<double>(), 0.5);
}

TEST_F(JsonVisitorTest, CaseBranches)
{
  auto j = to_json(b_.case_of(
    b_.local("v"), {CaseBranch{b_.ctor_pattern({"Main", "Leaf"}, {b_.var("n")}), b_.local("n")}}));
  EXPECT_EQ(j["type"], "CaseExpr");
  ASSERT_EQ(j["branches"].size(), 1);
  EXPECT_EQ(j["branches"][0]["pattern"]["module"], "Main");
  EXPECT_EQ(j["branches"][0]["pattern"]["name"], "Leaf");
  EXPECT_EQ(j["branches"][0]["body"]["name"], "n");
}

TEST_F(JsonVisitorTest, Declaration)
{
  const Declaration decl{
    "encodeInt", w_.encoder_of(w_.int_t()), {b_.var("value")},
    b_.apply({"Json.Encode", "int"}, {b_.local("value")})};
  auto j = to_json(decl);
  EXPECT_EQ(j["name"], "encodeInt");
  EXPECT_EQ(j["annotation"], "Basics.Int -> Json.Encode.Value");
  ASSERT_EQ(j["params"].size(), 1);
  EXPECT_EQ(j["params"][0]["name"], "value");
  EXPECT_EQ(j["body"]["type"], "ApplicationExpr");
  EXPECT_EQ(j["source"], render_declaration(decl));
}

TEST_F(JsonVisitorTest, DeclarationWithoutAnnotation)
{
  const Declaration decl{"x", nullptr, {}, b_.integer(1)};
  auto j = to_json(decl);
  EXPECT_TRUE(j["annotation"].is_null());
}

}  // namespace codesynth
