// codesynth/synth/declaration_normalizer.hpp - Hoisting of lambda parameters
#pragma once

#include "codesynth/ast/ast_builder.hpp"
#include "codesynth/ast/declaration.hpp"

namespace codesynth
{

/**
 * Move the parameters of a lambda body into the declaration.
 *
 * - `f = \a b -> body` becomes `f a b = body`.
 * - `f x y = \a b -> body`, all binds simple, becomes `f x y = body` with
 *   `a`, `b` renamed to `x`, `y`.
 * - Anything else is returned unchanged.
 */
[[nodiscard]] Declaration normalize_declaration(AstBuilder & builder, Declaration decl);

}  // namespace codesynth
