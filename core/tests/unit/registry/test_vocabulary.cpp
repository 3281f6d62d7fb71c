// test_vocabulary.cpp - Unit tests for the definition vocabulary
//
#include <gtest/gtest.h>

#include <optional>
#include <variant>

#include "codesynth/registry/vocabulary.hpp"
#include "codesynth/test_support/synth_helpers.hpp"

namespace codesynth
{

class VocabularyTest : public ::testing::Test
{
protected:
  test_support::TestWorld w_;
  AstBuilder & b_ = w_.b;

  const Expr * run_primitive(const Definition & def, const Types & args, const Exprs & children)
  {
    return std::get<PrimitiveResolver>(def.payload).fn(b_, args, children);
  }

  const Expr * run_combiner(
    const Definition & def, const ResolvedType * type, const Expr * ctor, const Exprs & children)
  {
    return std::get<Combiner>(def.payload).fn(b_, type, ctor, children);
  }
};

TEST_F(VocabularyTest, PrimitivesRegisterTheirTypes)
{
  EXPECT_EQ(std::get<PrimitiveResolver>(vocab::int_({"D", "int"}).payload).type.render(), "Basics.Int");
  EXPECT_EQ(std::get<PrimitiveResolver>(vocab::string_({"D", "s"}).payload).type.render(), "String.String");
  EXPECT_EQ(std::get<PrimitiveResolver>(vocab::char_({"D", "c"}).payload).type.render(), "Char.Char");
  EXPECT_EQ(std::get<PrimitiveResolver>(vocab::unit({"D", "u"}).payload).type.render(), "Basics.()");
  EXPECT_EQ(std::get<PrimitiveResolver>(vocab::dict({"D", "d"}).payload).type.render(), "Dict.Dict");
}

TEST_F(VocabularyTest, PrimitiveReturnsImplementation)
{
  const Expr * e = run_primitive(vocab::float_({"Json.Decode", "float"}), {}, {});
  EXPECT_EQ(render_expr(e), "Json.Decode.float");
}

TEST_F(VocabularyTest, PrimitiveFromExpressionFunction)
{
  const auto def = vocab::bool_([](AstBuilder & b) {
    return b.apply({"Random", "uniform"}, {b.ref("Basics", "True"), b.list({b.ref("Basics", "False")})});
  });
  EXPECT_EQ(render_expr(run_primitive(def, {}, {})), "Random.uniform Basics.True [ Basics.False ]");
}

TEST_F(VocabularyTest, ContainerAppliesChildren)
{
  const auto def = vocab::list({"Json.Decode", "list"});
  const Expr * e = run_primitive(def, {w_.int_t()}, {b_.ref("Json.Decode", "int")});
  EXPECT_EQ(render_expr(e), "Json.Decode.list Json.Decode.int");
}

TEST_F(VocabularyTest, ContainerDeclinesWrongArity)
{
  const auto def = vocab::dict({"Json.Decode", "dict"});
  EXPECT_EQ(run_primitive(def, {w_.int_t()}, {b_.ref("Json.Decode", "int")}), nullptr);
}

TEST_F(VocabularyTest, WrapOnlyTakesEmptyConstructors)
{
  const auto def = vocab::wrap({"Json.Decode", "succeed"});
  const auto * unit_ctor = b_.ref("Main", "Empty");
  EXPECT_EQ(render_expr(run_combiner(def, w_.tree_t(), unit_ctor, {})), "Json.Decode.succeed Main.Empty");
  EXPECT_EQ(run_combiner(def, w_.tree_t(), unit_ctor, {b_.ref("Json.Decode", "int")}), nullptr);
}

TEST_F(VocabularyTest, MapTakesExactlyOneChild)
{
  const auto def = vocab::map({"Json.Decode", "map"});
  const auto * ctor = b_.ref("Main", "Leaf");
  EXPECT_EQ(
    render_expr(run_combiner(def, w_.tree_t(), ctor, {b_.ref("Json.Decode", "int")})),
    "Json.Decode.map Main.Leaf Json.Decode.int");
  EXPECT_EQ(run_combiner(def, w_.tree_t(), ctor, {}), nullptr);
}

TEST_F(VocabularyTest, MapNNamesByChildCount)
{
  const auto def = vocab::map_n("Random", "map", 3);
  const auto * ctor = b_.ref("Tuple", "pair");
  const auto * c = b_.ref("Random", "bool");

  EXPECT_EQ(render_expr(run_combiner(def, w_.tree_t(), ctor, {c})), "Random.map Tuple.pair Random.bool");
  EXPECT_EQ(
    render_expr(run_combiner(def, w_.tree_t(), ctor, {c, c, c})),
    "Random.map3 Tuple.pair Random.bool Random.bool Random.bool");
  EXPECT_EQ(run_combiner(def, w_.tree_t(), ctor, {}), nullptr);
  EXPECT_EQ(run_combiner(def, w_.tree_t(), ctor, {c, c, c, c}), nullptr);
}

TEST_F(VocabularyTest, MapNWithCustomNames)
{
  const auto def = vocab::map_n([](size_t n) -> std::optional<QualifiedName> {
    if (n != 2) return std::nullopt;
    return QualifiedName{"Custom", "both"};
  });
  const auto * c = b_.ref("X", "x");
  EXPECT_EQ(render_expr(run_combiner(def, w_.tree_t(), b_.local("f"), {c, c})), "Custom.both f X.x X.x");
  EXPECT_EQ(run_combiner(def, w_.tree_t(), b_.local("f"), {c}), nullptr);
}

TEST_F(VocabularyTest, PipelineChainsSteps)
{
  const auto def = vocab::pipeline(
    [](AstBuilder & b, const Expr * ctor) { return b.apply({"D", "succeed"}, {ctor}); },
    [](AstBuilder & b, const ResolvedType *, size_t index, const Expr * child) {
      return b.apply({"D", "at"}, {b.integer(static_cast<int64_t>(index)), child});
    });
  const auto * c = b_.ref("D", "int");
  const auto * pair = w_.types.tuple({w_.int_t(), w_.int_t()});
  EXPECT_EQ(
    render_expr(run_combiner(def, pair, b_.ref("Tuple", "pair"), {c, c})),
    "D.succeed Tuple.pair |> D.at 0 D.int |> D.at 1 D.int");
}

TEST_F(VocabularyTest, TupleAndTripleCheckArity)
{
  const auto pair_def = vocab::tuple({"Fuzz", "pair"});
  const auto triple_def = vocab::triple({"Fuzz", "triple"});
  const auto * c = b_.ref("Fuzz", "int");
  const auto * pair = w_.types.tuple({w_.int_t(), w_.int_t()});
  const auto * triple = w_.types.tuple({w_.int_t(), w_.int_t(), w_.int_t()});

  EXPECT_EQ(render_expr(run_combiner(pair_def, pair, nullptr, {c, c})), "Fuzz.pair Fuzz.int Fuzz.int");
  EXPECT_EQ(run_combiner(pair_def, triple, nullptr, {c, c, c}), nullptr);
  EXPECT_EQ(
    render_expr(run_combiner(triple_def, triple, nullptr, {c, c, c})),
    "Fuzz.triple Fuzz.int Fuzz.int Fuzz.int");
  EXPECT_EQ(run_combiner(triple_def, pair, nullptr, {c, c}), nullptr);
}

TEST_F(VocabularyTest, ConditionalAddsDependency)
{
  const auto def = vocab::conditional("pkg", vocab::conditional("other", vocab::int_({"D", "int"})));
  EXPECT_FALSE(def.condition.is_met({"pkg"}));
  EXPECT_TRUE(def.condition.is_met({"pkg", "other"}));
  EXPECT_TRUE(vocab::int_({"D", "int"}).condition.is_met({}));
}

TEST_F(VocabularyTest, FreeFormLambdaBreaker)
{
  const auto def = vocab::lambda_breaker([](AstBuilder & b, const Expr * e) {
    return b.apply({"Fuzz", "lazy"}, {b.lambda({b.unit_pattern()}, e)});
  });
  const Expr * e = std::get<LambdaBreaker>(def.payload).fn(b_, b_.local("fuzzTree"));
  EXPECT_EQ(render_expr(e), "Fuzz.lazy (\\() -> fuzzTree)");
}

}  // namespace codesynth
