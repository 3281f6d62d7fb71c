// test_type_pattern.cpp - Unit tests for generator search patterns
//
#include <gtest/gtest.h>

#include "codesynth/test_support/synth_helpers.hpp"
#include "codesynth/types/type_pattern.hpp"
#include "codesynth/types/type_utils.hpp"

namespace codesynth
{

class TypePatternTest : public ::testing::Test
{
protected:
  test_support::TestWorld w_;

  TypePattern decoder_ = TypePattern::named({"Json.Decode", "Decoder"}, {TypePattern::hole()});
  TypePattern encoder_ =
    TypePattern::function(TypePattern::hole(), TypePattern::named({"Json.Encode", "Value"}));
};

TEST_F(TypePatternTest, NamedPatternYieldsChild)
{
  const ResolvedType * int_t = w_.int_t();
  EXPECT_EQ(decoder_.match(w_.decoder_of(int_t)), int_t);
}

TEST_F(TypePatternTest, NamedPatternRejectsOtherNames)
{
  EXPECT_EQ(decoder_.match(w_.generator_of(w_.int_t())), nullptr);
  EXPECT_EQ(decoder_.match(w_.int_t()), nullptr);
}

TEST_F(TypePatternTest, ArityMustMatch)
{
  const auto * two = w_.types.opaque({"Json.Decode", "Decoder"}, {w_.int_t(), w_.int_t()});
  EXPECT_EQ(decoder_.match(two), nullptr);
}

TEST_F(TypePatternTest, FunctionPatternYieldsArgument)
{
  const ResolvedType * point = w_.point_t();
  EXPECT_EQ(encoder_.match(w_.encoder_of(point)), point);
}

TEST_F(TypePatternTest, FunctionPatternChecksResult)
{
  const auto * wrong = w_.types.function(w_.int_t(), w_.string_t());
  EXPECT_EQ(encoder_.match(wrong), nullptr);
  EXPECT_EQ(encoder_.match(w_.int_t()), nullptr);
}

TEST_F(TypePatternTest, NullAnnotationNeverMatches)
{
  EXPECT_EQ(decoder_.match(nullptr), nullptr);
}

TEST_F(TypePatternTest, PatternWithoutHoleMatchesWholeAnnotation)
{
  const auto pattern = TypePattern::named({"Json.Encode", "Value"});
  const auto * value = w_.types.opaque({"Json.Encode", "Value"});
  EXPECT_EQ(pattern.match(value), value);
}

TEST_F(TypePatternTest, MatchingIsStructural)
{
  // Distinct but equal annotations give equivalent children.
  const auto * a = decoder_.match(w_.decoder_of(w_.list_of(w_.int_t())));
  const auto * b = decoder_.match(w_.decoder_of(w_.list_of(w_.int_t())));
  ASSERT_NE(a, nullptr);
  ASSERT_NE(b, nullptr);
  EXPECT_TRUE(types_equivalent(a, b));
}

TEST_F(TypePatternTest, RebuildPutsChildIntoHole)
{
  const auto * rebuilt = decoder_.rebuild(w_.types, w_.types.opaque({"Main", "Point"}));
  EXPECT_EQ(render_type(rebuilt), "Json.Decode.Decoder Main.Point");

  const auto * encoder = encoder_.rebuild(w_.types, w_.types.opaque({"Main", "Point"}));
  EXPECT_EQ(render_type(encoder), "Main.Point -> Json.Encode.Value");
}

TEST_F(TypePatternTest, RebuildThenMatchGivesChildBack)
{
  const auto * child = w_.types.opaque({"Main", "Tree"});
  EXPECT_EQ(decoder_.match(decoder_.rebuild(w_.types, child)), child);
}

TEST_F(TypePatternTest, Render)
{
  EXPECT_EQ(decoder_.render(), "Json.Decode.Decoder a");
  EXPECT_EQ(encoder_.render(), "a -> Json.Encode.Value");
}

}  // namespace codesynth
