// codesynth/ast/ast_enums.hpp - AST enumeration definitions
//
// This header contains the node kinds of the synthesized expression language
// and the helpers used for range-based classof checks.
//
#pragma once

#include <cstdint>
#include <string_view>

namespace codesynth
{

// ============================================================================
// NodeKind - Identifies all AST node types
// ============================================================================

/**
 * Node kind enumeration for LLVM-style RTTI.
 * Nodes are grouped by category for efficient range-based classof checks.
 * Generated from ast_nodes.def.
 */
enum class NodeKind : uint8_t {
// === Expressions ===
#define AST_NODE_EXPR(Class, Kind, Snake) Kind,
#include "codesynth/ast/ast_nodes.def"

// === Patterns ===
#define AST_NODE_PATTERN(Class, Kind, Snake) Kind,
#include "codesynth/ast/ast_nodes.def"
};

[[nodiscard]] constexpr bool is_expr_kind(NodeKind k) noexcept
{
  return k >= NodeKind::Reference && k <= NodeKind::Case;
}

[[nodiscard]] constexpr bool is_pattern_kind(NodeKind k) noexcept
{
  return k >= NodeKind::VarPattern && k <= NodeKind::ConstructorPattern;
}

[[nodiscard]] constexpr std::string_view to_string(NodeKind k) noexcept
{
  switch (k) {
#define AST_NODE_EXPR(Class, Kind, Snake) \
  case NodeKind::Kind:                    \
    return #Class;
#define AST_NODE_PATTERN(Class, Kind, Snake) \
  case NodeKind::Kind:                       \
    return #Class;
#include "codesynth/ast/ast_nodes.def"
  }
  return "Unknown";
}

}  // namespace codesynth
