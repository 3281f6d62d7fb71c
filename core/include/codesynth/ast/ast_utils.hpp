// codesynth/ast/ast_utils.hpp - Structural queries and rewrites over expressions
#pragma once

#include <functional>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "codesynth/ast/ast.hpp"
#include "codesynth/ast/ast_builder.hpp"

namespace codesynth
{

using NameSet = std::unordered_set<std::string_view>;

/// Local name -> replacement expression
using Substitution = std::unordered_map<std::string_view, const Expr *>;

// ============================================================================
// Queries
// ============================================================================

/// Append every name bound by a pattern (left to right).
void collect_bound_names(const Pattern * pattern, std::vector<std::string_view> & out);

/// True if the pattern is a plain variable bind.
[[nodiscard]] bool is_simple_bind(const Pattern * pattern) noexcept;

/// Local (unqualified) names occurring free in an expression.
[[nodiscard]] NameSet free_locals(const Expr * expr);

/// True if `name` occurs free in `expr`.
[[nodiscard]] bool references_local(const Expr * expr, std::string_view name);

/**
 * True if `name` occurs free in `expr` outside of any anonymous function,
 * i.e. the reference would be evaluated as soon as `expr` is.
 */
[[nodiscard]] bool references_local_eagerly(const Expr * expr, std::string_view name);

/// Call `fn` on each direct child expression (binders are not inspected).
void for_each_child(const Expr * expr, const std::function<void(const Expr *)> & fn);

/// Structural equality of two expression trees.
[[nodiscard]] bool structurally_equal(const Expr * a, const Expr * b);

/// Structural equality of two patterns.
[[nodiscard]] bool structurally_equal(const Pattern * a, const Pattern * b);

// ============================================================================
// Rewrites
// ============================================================================

/**
 * Rebuild `expr` with `fn` applied to each direct child expression.
 *
 * Returns `expr` itself when no child changed. Binders are not inspected;
 * callers needing scope awareness handle LambdaExpr/CaseExpr themselves.
 */
const Expr * map_children(
  AstBuilder & builder, const Expr * expr, const std::function<const Expr *(const Expr *)> & fn);

/**
 * Replace free occurrences of local names by expressions.
 *
 * Substitution is name-indexed: binders that shadow a name stop its
 * replacement below them, but no alpha-renaming is performed.
 */
const Expr * substitute(AstBuilder & builder, const Expr * expr, const Substitution & subst);

/// Rename free local references (old name -> new name).
const Expr * rename_locals(
  AstBuilder & builder, const Expr * expr,
  const std::unordered_map<std::string_view, std::string_view> & renames);

}  // namespace codesynth
