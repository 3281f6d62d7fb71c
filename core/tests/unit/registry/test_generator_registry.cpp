// test_generator_registry.cpp - Unit tests for generator resolution
//
#include <gtest/gtest.h>

#include <string>
#include <variant>
#include <vector>

#include "codesynth/registry/generator_registry.hpp"
#include "codesynth/registry/vocabulary.hpp"
#include "codesynth/test_support/synth_helpers.hpp"

namespace codesynth
{

namespace
{

/// Primitive fragment tagged by the opaque type name it handles
Definition tagged(const std::string & tag) { return vocab::primitive({"T", tag}, {"Impl", tag}); }

GeneratorDefinition generator(
  const std::string & id, std::vector<Definition> defs, Condition gate = Condition::always())
{
  return define_generator(
    id, std::move(gate), TypePattern::named({"Gen", id}, {TypePattern::hole()}),
    name_with_prefix("gen"), std::move(defs));
}

std::vector<std::string> tags(const ResolvedGenerator & gen)
{
  std::vector<std::string> out;
  for (const auto & r : gen.resolvers) {
    if (const auto * p = std::get_if<PrimitiveResolver>(&r)) {
      out.push_back(p->type.name);
    }
  }
  return out;
}

std::vector<std::string> ids(const std::vector<ResolvedGenerator> & gens)
{
  std::vector<std::string> out;
  for (const auto & g : gens) out.push_back(g.id);
  return out;
}

using Tags = std::vector<std::string>;

}  // namespace

TEST(GeneratorRegistry, LaterFragmentsAreTriedFirst)
{
  const auto gens = resolve_generators({}, {generator("g", {tagged("A"), tagged("B")})});
  ASSERT_EQ(gens.size(), 1u);
  EXPECT_EQ(tags(gens[0]), (Tags{"B", "A"}));
}

TEST(GeneratorRegistry, AmendmentPrecedesBaseResolvers)
{
  const auto gens = resolve_generators(
    {}, {
          generator("g", {tagged("A"), tagged("B")}),
          amend("g", {tagged("C1"), tagged("C2")}),
        });
  ASSERT_EQ(gens.size(), 1u);
  EXPECT_EQ(tags(gens[0]), (Tags{"C2", "C1", "B", "A"}));
}

TEST(GeneratorRegistry, LaterAmendmentBatchIsTriedFirst)
{
  const auto gens = resolve_generators(
    {}, {
          generator("g", {tagged("A")}),
          amend("g", {tagged("First")}),
          amend("g", {tagged("Second")}),
        });
  ASSERT_EQ(gens.size(), 1u);
  EXPECT_EQ(tags(gens[0]), (Tags{"Second", "First", "A"}));
}

TEST(GeneratorRegistry, DeadAmendmentIsNoOp)
{
  const std::vector<GeneratorDefinition> base{
    generator("g", {tagged("A"), tagged("B")}),
    generator("h", {tagged("X")}),
  };
  std::vector<GeneratorDefinition> with_dead = base;
  with_dead.push_back(amend("missing", {tagged("C")}));

  const auto expected = resolve_generators({}, base);
  const auto actual = resolve_generators({}, with_dead);
  ASSERT_EQ(ids(actual), ids(expected));
  for (size_t i = 0; i < actual.size(); ++i) {
    EXPECT_EQ(tags(actual[i]), tags(expected[i]));
  }
}

TEST(GeneratorRegistry, AmendmentBeforeItsGeneratorIsDropped)
{
  const auto gens = resolve_generators(
    {}, {
          amend("g", {tagged("Early")}),
          generator("g", {tagged("A")}),
        });
  ASSERT_EQ(gens.size(), 1u);
  EXPECT_EQ(tags(gens[0]), (Tags{"A"}));
}

TEST(GeneratorRegistry, OutputKeepsDeclarationOrder)
{
  const auto gens = resolve_generators(
    {}, {generator("first", {}), generator("second", {}), generator("third", {})});
  EXPECT_EQ(ids(gens), (Tags{"first", "second", "third"}));
}

TEST(GeneratorRegistry, FragmentConditionGatesResolver)
{
  const std::vector<GeneratorDefinition> defs{
    generator("g", {tagged("A"), vocab::conditional("x", tagged("OnlyWithX"))}),
  };

  const auto without = resolve_generators({}, defs);
  ASSERT_EQ(without.size(), 1u);
  EXPECT_EQ(tags(without[0]), (Tags{"A"}));

  const auto with = resolve_generators({"x"}, defs);
  ASSERT_EQ(with.size(), 1u);
  EXPECT_EQ(tags(with[0]), (Tags{"OnlyWithX", "A"}));
}

TEST(GeneratorRegistry, UnmetGateRemovesGeneratorAndAmendments)
{
  const std::vector<GeneratorDefinition> defs{
    generator("g", {tagged("A")}, Condition::requires_all({"pkg"})),
    amend("g", {tagged("C")}),
    generator("h", {tagged("X")}),
  };

  EXPECT_EQ(ids(resolve_generators({}, defs)), (Tags{"h"}));

  const auto active = resolve_generators({"pkg"}, defs);
  ASSERT_EQ(ids(active), (Tags{"g", "h"}));
  EXPECT_EQ(tags(active[0]), (Tags{"C", "A"}));
}

TEST(GeneratorRegistry, ConditionNeedsEveryDependency)
{
  const Condition both = Condition::requires_all({"a", "b"});
  EXPECT_FALSE(both.is_met({"a"}));
  EXPECT_TRUE(both.is_met({"a", "b", "c"}));
  EXPECT_TRUE(Condition::always().is_met({}));
}

TEST(GeneratorRegistry, FirstActiveLambdaBreakerWins)
{
  test_support::TestWorld w;
  const auto gens = resolve_generators(
    {}, {
          generator("g", {vocab::lambda_breaker(QualifiedName{"Base", "lazy"})}),
          amend("g", {vocab::lambda_breaker(QualifiedName{"Extra", "lazy"})}),
        });
  ASSERT_EQ(gens.size(), 1u);
  ASSERT_TRUE(gens[0].lambda_breaker.has_value());
  EXPECT_TRUE(gens[0].resolvers.empty());

  const Expr * wrapped = gens[0].lambda_breaker->fn(w.b, w.b.local("self"));
  EXPECT_EQ(render_expr(wrapped), "Extra.lazy (\\_ -> self)");
}

TEST(GeneratorRegistry, BlessedImplementationsAreCollected)
{
  const auto gens = resolve_generators(
    {}, {generator("g", {vocab::blessed({"Json.Decode", "value"}), tagged("A")})});
  ASSERT_EQ(gens.size(), 1u);
  ASSERT_EQ(gens[0].blessed.size(), 1u);
  EXPECT_EQ(gens[0].blessed[0].render(), "Json.Decode.value");
  EXPECT_EQ(tags(gens[0]), (Tags{"A"}));
}

TEST(GeneratorRegistry, FindGeneratorByPattern)
{
  test_support::TestWorld w;
  const auto gens = resolve_generators({}, {generator("a", {}), generator("b", {})});

  const auto * b_type = w.types.opaque({"Gen", "b"}, {w.int_t()});
  const auto * found = find_generator(gens, b_type);
  ASSERT_NE(found, nullptr);
  EXPECT_EQ(found->id, "b");

  EXPECT_EQ(find_generator(gens, w.int_t()), nullptr);
}

TEST(GeneratorRegistry, NameWithPrefix)
{
  const NameMaker make = name_with_prefix("decode");
  EXPECT_EQ(make("Point"), "decodePoint");
}

}  // namespace codesynth
