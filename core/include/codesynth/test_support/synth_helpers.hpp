// codesynth/test_support/synth_helpers.hpp - helpers for unit tests
//
// A TestWorld owns the arenas a synthesis run needs (expressions and
// resolved types) and offers short constructors for the types tests use
// most.
//
#pragma once

#include <string>
#include <utility>
#include <vector>

#include "codesynth/ast/ast_builder.hpp"
#include "codesynth/ast/ast_context.hpp"
#include "codesynth/ast/ast_printer.hpp"
#include "codesynth/types/resolved_type.hpp"

namespace codesynth::test_support
{

struct TestWorld
{
  AstContext ast;
  TypeContext types;
  AstBuilder b{ast};

  const ResolvedType * int_t() { return types.opaque({"Basics", "Int"}); }
  const ResolvedType * float_t() { return types.opaque({"Basics", "Float"}); }
  const ResolvedType * bool_t() { return types.opaque({"Basics", "Bool"}); }
  const ResolvedType * string_t() { return types.opaque({"String", "String"}); }

  const ResolvedType * list_of(const ResolvedType * t) { return types.opaque({"List", "List"}, {t}); }
  const ResolvedType * maybe_of(const ResolvedType * t)
  {
    return types.opaque({"Maybe", "Maybe"}, {t});
  }

  const ResolvedType * decoder_of(const ResolvedType * t)
  {
    return types.opaque({"Json.Decode", "Decoder"}, {t});
  }
  const ResolvedType * encoder_of(const ResolvedType * t)
  {
    return types.function(t, types.opaque({"Json.Encode", "Value"}));
  }
  const ResolvedType * generator_of(const ResolvedType * t)
  {
    return types.opaque({"Random", "Generator"}, {t});
  }
  const ResolvedType * fuzzer_of(const ResolvedType * t)
  {
    return types.opaque({"Fuzz", "Fuzzer"}, {t});
  }

  /// `type Main.Tree = Leaf Int | Node Tree Tree`
  const ResolvedType * tree_t()
  {
    ResolvedType * tree = types.declare_custom_type({"Main", "Tree"});
    types.define_constructors(
      tree, {
              TypeConstructor{{"Main", "Leaf"}, {int_t()}},
              TypeConstructor{{"Main", "Node"}, {tree, tree}},
            });
    return tree;
  }

  /// `type alias Main.Point = { x : Int, y : Int }`
  const ResolvedType * point_t()
  {
    return types.alias(
      {"Main", "Point"}, types.record({TypeField{"x", int_t()}, TypeField{"y", int_t()}}));
  }
};

[[nodiscard]] inline std::string render(const Expr * e) { return render_expr(e); }

}  // namespace codesynth::test_support
