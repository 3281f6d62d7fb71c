// test_recursion.cpp - Unit tests for recursive declaration handling
//
#include <gtest/gtest.h>

#include <string>

#include "codesynth/synth/recursion.hpp"
#include "codesynth/test_support/synth_helpers.hpp"

namespace codesynth
{

class RecursionTest : public ::testing::Test
{
protected:
  test_support::TestWorld w_;
  AstBuilder & b_ = w_.b;

  LambdaBreaker lazy_{[](AstBuilder & b, const Expr * e) -> const Expr * {
    return b.apply({"D", "lazy"}, {b.lambda({b.wildcard()}, e)});
  }};

  static Declaration decl(std::string name, const Expr * body)
  {
    Declaration d;
    d.name = std::move(name);
    d.body = body;
    return d;
  }

  /// `D.oneOf [ D.map Main.Leaf D.int, D.map2 Main.Node self self ]`
  const Expr * tree_body(const char * self)
  {
    return b_.apply(
      {"D", "oneOf"},
      {b_.list({
        b_.apply({"D", "map"}, {b_.ref("Main", "Leaf"), b_.ref("D", "int")}),
        b_.apply({"D", "map2"}, {b_.ref("Main", "Node"), b_.local(self), b_.local(self)}),
      })});
  }
};

// ============================================================================
// Cycle detection
// ============================================================================

TEST_F(RecursionTest, SelfReferenceIsOneCycle)
{
  const auto cycles = find_cycle_references({decl("decodeTree", tree_body("decodeTree"))});
  ASSERT_EQ(cycles.size(), 1u);
  EXPECT_EQ(cycles[0].from, 0u);
  EXPECT_EQ(cycles[0].target, "decodeTree");
  EXPECT_EQ(cycles[0].path, "decodeTree -> decodeTree");
}

TEST_F(RecursionTest, MutualReferenceReportsBackEdge)
{
  const auto cycles = find_cycle_references({
    decl("decodeA", b_.apply({"D", "list"}, {b_.local("decodeB")})),
    decl("decodeB", b_.apply({"D", "maybe"}, {b_.local("decodeA")})),
  });
  ASSERT_EQ(cycles.size(), 1u);
  EXPECT_EQ(cycles[0].from, 1u);
  EXPECT_EQ(cycles[0].target, "decodeA");
  EXPECT_EQ(cycles[0].path, "decodeA -> decodeB -> decodeA");
}

TEST_F(RecursionTest, AcyclicReferencesAreNotCycles)
{
  const auto cycles = find_cycle_references({
    decl("decodeA", b_.apply({"D", "list"}, {b_.local("decodeB")})),
    decl("decodeB", b_.ref("D", "int")),
  });
  EXPECT_TRUE(cycles.empty());
}

TEST_F(RecursionTest, ParametersShadowDeclarations)
{
  Declaration f = decl("f", b_.local("x"));
  f.params = {b_.var("x")};
  const auto cycles = find_cycle_references({decl("x", b_.local("f")), f});
  EXPECT_TRUE(cycles.empty());
}

// ============================================================================
// Breaking
// ============================================================================

TEST_F(RecursionTest, BreakerWrapsCycleReferences)
{
  auto result = break_recursion(b_, {decl("decodeTree", tree_body("decodeTree"))}, &lazy_);
  ASSERT_TRUE(result) << result.error().message;
  EXPECT_EQ(
    render_expr(result->at(0).body),
    "D.oneOf [ D.map Main.Leaf D.int, D.map2 Main.Node (D.lazy (\\_ -> decodeTree)) (D.lazy (\\_ "
    "-> decodeTree)) ]");
}

TEST_F(RecursionTest, BreakerWrapsOnlyClosingReference)
{
  auto result = break_recursion(
    b_,
    {
      decl("decodeA", b_.apply({"D", "list"}, {b_.local("decodeB")})),
      decl("decodeB", b_.apply({"D", "maybe"}, {b_.local("decodeA")})),
    },
    &lazy_);
  ASSERT_TRUE(result) << result.error().message;
  EXPECT_EQ(render_expr(result->at(0).body), "D.list decodeB");
  EXPECT_EQ(render_expr(result->at(1).body), "D.maybe (D.lazy (\\_ -> decodeA))");
}

TEST_F(RecursionTest, NonRecursiveDeclarationsAreUntouched)
{
  const Expr * body = b_.apply({"D", "list"}, {b_.ref("D", "int")});
  auto result = break_recursion(b_, {decl("decodeInts", body)}, &lazy_);
  ASSERT_TRUE(result);
  EXPECT_EQ(result->at(0).body, body);
}

TEST_F(RecursionTest, EagerCycleWithoutBreakerFails)
{
  auto result = break_recursion(b_, {decl("decodeTree", tree_body("decodeTree"))}, nullptr);
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error().kind, GenErrorKind::EagerRecursion);
  EXPECT_STREQ(result.error().code(), "E008");
  EXPECT_NE(result.error().message.find("decodeTree -> decodeTree"), std::string::npos);
}

TEST_F(RecursionTest, CycleUnderLambdaWithoutBreakerIsAccepted)
{
  const Expr * body = b_.lambda(
    {b_.var("value")}, b_.apply({"E", "list"}, {b_.local("encodeTree"), b_.local("value")}));
  auto result = break_recursion(b_, {decl("encodeTree", body)}, nullptr);
  ASSERT_TRUE(result);
  EXPECT_EQ(result->at(0).body, body);
}

TEST_F(RecursionTest, CycleInFunctionDeclarationWithoutBreakerIsAccepted)
{
  Declaration d = decl(
    "encodeTree", b_.apply({"E", "list"}, {b_.local("encodeTree"), b_.local("value")}));
  d.params = {b_.var("value")};
  auto result = break_recursion(b_, {d}, nullptr);
  ASSERT_TRUE(result);
}

}  // namespace codesynth
