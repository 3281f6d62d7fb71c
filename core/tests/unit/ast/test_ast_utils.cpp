// test_ast_utils.cpp - Unit tests for expression queries and rewrites
//
#include <gtest/gtest.h>

#include "codesynth/ast/ast_utils.hpp"
#include "codesynth/test_support/synth_helpers.hpp"

namespace codesynth
{

class AstUtilsTest : public ::testing::Test
{
protected:
  test_support::TestWorld w_;
  AstBuilder & b_ = w_.b;
};

TEST_F(AstUtilsTest, FreeLocalsIgnoreQualifiedReferences)
{
  const Expr * e = b_.apply({"Json.Decode", "map"}, {b_.local("f"), b_.local("g")});
  const NameSet free = free_locals(e);
  EXPECT_EQ(free.size(), 2u);
  EXPECT_EQ(free.count("f"), 1u);
  EXPECT_EQ(free.count("g"), 1u);
}

TEST_F(AstUtilsTest, LambdaParametersAreBound)
{
  const Expr * e = b_.lambda({b_.var("x")}, b_.apply(b_.local("f"), {b_.local("x")}));
  const NameSet free = free_locals(e);
  EXPECT_EQ(free.count("x"), 0u);
  EXPECT_EQ(free.count("f"), 1u);
}

TEST_F(AstUtilsTest, CaseBranchPatternsAreBound)
{
  const Expr * e = b_.case_of(
    b_.local("v"), {CaseBranch{b_.ctor_pattern({"Main", "Leaf"}, {b_.var("n")}), b_.local("n")}});
  const NameSet free = free_locals(e);
  EXPECT_EQ(free.count("v"), 1u);
  EXPECT_EQ(free.count("n"), 0u);
}

TEST_F(AstUtilsTest, EagerReferenceStopsAtLambdas)
{
  const Expr * eager = b_.apply({"Json.Decode", "list"}, {b_.local("decodeTree")});
  const Expr * deferred = b_.apply(
    {"Json.Decode", "lazy"}, {b_.lambda({b_.wildcard()}, b_.local("decodeTree"))});

  EXPECT_TRUE(references_local_eagerly(eager, "decodeTree"));
  EXPECT_FALSE(references_local_eagerly(deferred, "decodeTree"));
  EXPECT_TRUE(references_local(deferred, "decodeTree"));
}

TEST_F(AstUtilsTest, SubstituteReplacesFreeOccurrences)
{
  const Expr * e = b_.apply(b_.local("f"), {b_.local("x")});
  const Expr * out = substitute(b_, e, {{"x", b_.integer(1)}});
  EXPECT_EQ(render_expr(out), "f 1");
}

TEST_F(AstUtilsTest, SubstituteRespectsShadowing)
{
  const Expr * e = b_.tuple({b_.local("x"), b_.lambda({b_.var("x")}, b_.local("x"))});
  const Expr * out = substitute(b_, e, {{"x", b_.integer(1)}});
  EXPECT_EQ(render_expr(out), "( 1, \\x -> x )");
}

TEST_F(AstUtilsTest, SubstituteWithoutMatchesKeepsNode)
{
  const Expr * e = b_.apply(b_.local("f"), {b_.local("y")});
  EXPECT_EQ(substitute(b_, e, {{"x", b_.integer(1)}}), e);
}

TEST_F(AstUtilsTest, RenameLocals)
{
  const Expr * e = b_.apply({"Json.Encode", "int"}, {b_.local("value")});
  const Expr * out = rename_locals(b_, e, {{"value", "n"}});
  EXPECT_EQ(render_expr(out), "Json.Encode.int n");
}

TEST_F(AstUtilsTest, StructuralEquality)
{
  const Expr * a = b_.apply({"Json.Decode", "list"}, {b_.ref("Json.Decode", "int")});
  const Expr * b = b_.apply({"Json.Decode", "list"}, {b_.ref("Json.Decode", "int")});
  const Expr * c = b_.apply({"Json.Decode", "list"}, {b_.ref("Json.Decode", "float")});
  EXPECT_NE(a, b);
  EXPECT_TRUE(structurally_equal(a, b));
  EXPECT_FALSE(structurally_equal(a, c));
}

TEST_F(AstUtilsTest, MapChildrenRebuildsOnlyWhenChanged)
{
  const Expr * e = b_.list({b_.integer(1), b_.integer(2)});
  EXPECT_EQ(map_children(b_, e, [](const Expr * c) { return c; }), e);

  const Expr * one = b_.integer(1);
  const Expr * out = map_children(b_, e, [&](const Expr *) { return one; });
  EXPECT_EQ(render_expr(out), "[ 1, 1 ]");
}

}  // namespace codesynth
