// test_simplifier.cpp - Unit tests for beta/eta simplification
//
#include <gtest/gtest.h>

#include "codesynth/ast/ast_utils.hpp"
#include "codesynth/basic/casting.hpp"
#include "codesynth/synth/simplifier.hpp"
#include "codesynth/test_support/synth_helpers.hpp"

namespace codesynth
{

class SimplifierTest : public ::testing::Test
{
protected:
  test_support::TestWorld w_;
  AstBuilder & b_ = w_.b;

  std::string simplified(const Expr * e) { return render_expr(simplify(b_, e)); }
};

// ============================================================================
// Beta reduction
// ============================================================================

TEST_F(SimplifierTest, BetaSubstitutesArguments)
{
  const Expr * e = b_.apply(
    b_.lambda({b_.var("x")}, b_.op("+", b_.local("x"), b_.integer(1))), {b_.integer(2)});
  EXPECT_EQ(simplified(e), "2 + 1");
}

TEST_F(SimplifierTest, BetaReducesTupleConstructor)
{
  const Expr * ctor = b_.lambda(
    {b_.var("a"), b_.var("b"), b_.var("c")},
    b_.tuple({b_.local("a"), b_.local("b"), b_.local("c")}));
  const Expr * e = b_.apply(ctor, {b_.ref("D", "int"), b_.ref("D", "string"), b_.ref("D", "float")});
  EXPECT_EQ(simplified(e), "( D.int, D.string, D.float )");
}

TEST_F(SimplifierTest, BetaRequiresMatchingArity)
{
  const Expr * e =
    b_.apply(b_.lambda({b_.var("x"), b_.var("y")}, b_.local("x")), {b_.integer(1)});
  EXPECT_EQ(simplified(e), "(\\x y -> x) 1");
}

TEST_F(SimplifierTest, BetaRequiresSimpleParameters)
{
  const Expr * e = b_.apply(
    b_.lambda({b_.tuple_pattern({b_.var("a"), b_.var("b")})}, b_.local("a")),
    {b_.tuple({b_.integer(1), b_.integer(2)})});
  EXPECT_EQ(simplified(e), "(\\( a, b ) -> a) ( 1, 2 )");
}

TEST_F(SimplifierTest, BetaReducesExposedRedex)
{
  // (\f -> f 1) (\x -> x)  ==>  (\x -> x) 1  ==>  1
  const Expr * e = b_.apply(
    b_.lambda({b_.var("f")}, b_.apply(b_.local("f"), {b_.integer(1)})),
    {b_.lambda({b_.var("x")}, b_.local("x"))});
  EXPECT_EQ(simplified(e), "1");
}

TEST_F(SimplifierTest, BetaInsideNestedExpression)
{
  const Expr * inner = b_.apply(b_.lambda({b_.var("v")}, b_.local("v")), {b_.ref("D", "int")});
  const Expr * e = b_.apply({"D", "list"}, {inner});
  EXPECT_EQ(simplified(e), "D.list D.int");
}

// ============================================================================
// Eta reduction
// ============================================================================

TEST_F(SimplifierTest, EtaDropsAllPassThroughParameters)
{
  const Expr * e = b_.lambda(
    {b_.var("x"), b_.var("y")}, b_.apply({"M", "f"}, {b_.local("x"), b_.local("y")}));
  EXPECT_EQ(simplified(e), "M.f");
}

TEST_F(SimplifierTest, EtaKeepsLeadingParameters)
{
  const Expr * e = b_.lambda(
    {b_.var("x"), b_.var("y")},
    b_.apply({"M", "g"}, {b_.local("x"), b_.ref("M", "h"), b_.local("y")}));
  EXPECT_EQ(simplified(e), "\\x -> M.g x M.h");
}

TEST_F(SimplifierTest, EtaSkipsParameterUsedElsewhere)
{
  const Expr * e =
    b_.lambda({b_.var("x")}, b_.apply({"M", "f"}, {b_.local("x"), b_.local("x")}));
  EXPECT_EQ(simplified(e), "\\x -> M.f x x");
}

TEST_F(SimplifierTest, EtaSkipsParameterUsedInFunction)
{
  const Expr * e = b_.lambda(
    {b_.var("x")}, b_.apply(b_.access(b_.local("x"), "run"), {b_.local("x")}));
  EXPECT_EQ(simplified(e), "\\x -> x.run x");
}

TEST_F(SimplifierTest, EtaLeavesNonApplicationBody)
{
  const Expr * e = b_.lambda({b_.var("x")}, b_.local("x"));
  EXPECT_EQ(simplified(e), "\\x -> x");
}

TEST_F(SimplifierTest, EtaInsideArgument)
{
  const Expr * e = b_.apply(
    {"D", "map"},
    {b_.lambda({b_.var("x")}, b_.apply({"M", "f"}, {b_.local("x")})), b_.ref("D", "int")});
  EXPECT_EQ(simplified(e), "D.map M.f D.int");
}

// ============================================================================
// Flattening and fixed point
// ============================================================================

TEST_F(SimplifierTest, NestedApplicationIsFlattened)
{
  const Expr * e = b_.apply(b_.apply({"M", "f"}, {b_.local("a")}), {b_.local("b")});
  const Expr * out = simplify(b_, e);
  const auto * app = dyn_cast<ApplicationExpr>(out);
  ASSERT_NE(app, nullptr);
  EXPECT_EQ(app->args.size(), 2u);
  EXPECT_EQ(render_expr(out), "M.f a b");
}

TEST_F(SimplifierTest, SimplifyIsIdempotent)
{
  const Expr * ctor = b_.lambda(
    {b_.var("x"), b_.var("y")},
    b_.record({{"x", b_.local("x")}, {"y", b_.local("y")}}));
  const Expr * e = b_.apply(
    {"D", "map2"},
    {ctor, b_.lambda({b_.var("v")}, b_.apply({"D", "int"}, {b_.local("v")})),
     b_.apply(b_.lambda({b_.var("z")}, b_.local("z")), {b_.ref("D", "int")})});

  const Expr * once = simplify(b_, e);
  const Expr * twice = simplify(b_, once);
  EXPECT_TRUE(structurally_equal(once, twice));
  EXPECT_EQ(render_expr(once), "D.map2 (\\x y -> { x = x, y = y }) D.int D.int");
}

TEST_F(SimplifierTest, NullExpressionIsReturned) { EXPECT_EQ(simplify(b_, nullptr), nullptr); }

}  // namespace codesynth
