// codesynth/synth/simplifier.hpp - Beta/eta simplification of synthesized code
#pragma once

#include "codesynth/ast/ast.hpp"
#include "codesynth/ast/ast_builder.hpp"

namespace codesynth
{

/**
 * Simplify an expression bottom-up in one traversal.
 *
 * - Beta: `(\a b -> body) x y` becomes `body[a := x, b := y]` when the
 *   parameter and argument counts agree and every parameter is a plain
 *   variable. Substitution is name-indexed; synthesized lambdas bind fresh
 *   names only.
 * - Eta: `\x y -> f a x y` becomes `\x y -> f a` minus the trailing
 *   pass-through parameters, i.e. `f a`, when the dropped names occur
 *   nowhere else in the application.
 *
 * Nested applications `(f a) b` are flattened to `f a b`. The result is a
 * fixed point: simplifying it again returns it unchanged.
 */
[[nodiscard]] const Expr * simplify(AstBuilder & builder, const Expr * expr);

}  // namespace codesynth
