// codesynth/ast/ast_printer.hpp - Source rendering of synthesized code
//
// Renders expressions, patterns and declarations in Elm syntax with fully
// qualified references. Parentheses are inserted by precedence only where
// required; case expressions span multiple lines.
//
#pragma once

#include <string>

#include "codesynth/ast/ast.hpp"
#include "codesynth/ast/declaration.hpp"

namespace codesynth
{

/// Render an expression. `indent` is the column of the enclosing line.
[[nodiscard]] std::string render_expr(const Expr * expr, int indent = 0);

[[nodiscard]] std::string render_pattern(const Pattern * pattern);

/**
 * Render a declaration with its annotation:
 *
 * @code
 *   decodePoint : Json.Decode.Decoder Main.Point
 *   decodePoint =
 *       Json.Decode.map2 Main.Point (Json.Decode.field "x" Json.Decode.int) ...
 * @endcode
 */
[[nodiscard]] std::string render_declaration(const Declaration & decl);

}  // namespace codesynth
