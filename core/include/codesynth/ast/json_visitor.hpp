// codesynth/ast/json_visitor.hpp - JSON serialization for synthesized code
//
// Returns nlohmann::json objects for expressions, patterns and
// declarations. Used by `codesynth generate --json`.
//
#pragma once

#include <nlohmann/json.hpp>

#include "codesynth/ast/ast.hpp"
#include "codesynth/ast/declaration.hpp"

namespace codesynth
{

/**
 * Serialize an expression or pattern node to JSON.
 *
 * @param node Any node; nullptr serializes as `{"type": "Missing"}`
 */
[[nodiscard]] nlohmann::json to_json(const AstNode * node);

/// Serialize a declaration including its rendered annotation.
[[nodiscard]] nlohmann::json to_json(const Declaration & decl);

}  // namespace codesynth
