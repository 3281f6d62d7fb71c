// codesynth/ast/ast_builder.hpp - Convenience factory for synthesized expressions
//
// Resolvers, the composer and the rewrite passes build nodes through this
// builder so that every string is interned and every child list lives in the
// owning AstContext.
//
#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_set>
#include <utility>
#include <vector>

#include "codesynth/ast/ast.hpp"
#include "codesynth/ast/ast_context.hpp"
#include "codesynth/basic/qualified_name.hpp"

namespace codesynth
{

class AstBuilder
{
public:
  explicit AstBuilder(AstContext & ctx) : ctx_(ctx) {}

  [[nodiscard]] AstContext & context() noexcept { return ctx_; }

  // ===========================================================================
  // Local names
  // ===========================================================================

  /**
   * A local name this builder has not handed out yet: `base`, then
   * `base1`, `base2`, ... Synthesized lambdas bind fresh names only, so
   * name-indexed substitution never captures.
   */
  std::string_view fresh_name(std::string_view base);

  /// Mark a name as taken (e.g. top-level declarations in scope)
  void reserve_name(std::string_view name) { taken_.emplace(name); }

  // ===========================================================================
  // References and application
  // ===========================================================================

  const ReferenceExpr * ref(std::string_view module, std::string_view name);
  const ReferenceExpr * ref(const QualifiedName & q) { return ref(q.module, q.name); }
  const ReferenceExpr * local(std::string_view name) { return ref({}, name); }

  /// `fn args...`; returns fn unchanged when args is empty
  const Expr * apply(const Expr * fn, const std::vector<const Expr *> & args);
  const Expr * apply(const QualifiedName & fn, const std::vector<const Expr *> & args)
  {
    return apply(ref(fn), args);
  }

  const LambdaExpr * lambda(const std::vector<const Pattern *> & params, const Expr * body);

  const OperatorExpr * op(std::string_view op, const Expr * lhs, const Expr * rhs);

  /// `lhs |> rhs`
  const OperatorExpr * pipe(const Expr * lhs, const Expr * rhs) { return op("|>", lhs, rhs); }

  // ===========================================================================
  // Data
  // ===========================================================================

  const RecordExpr * record(const std::vector<std::pair<std::string_view, const Expr *>> & fields);
  const RecordAccessExpr * access(const Expr * record, std::string_view field);
  const RecordAccessFunctionExpr * access_function(std::string_view field);
  const TupleExpr * tuple(const std::vector<const Expr *> & elements);
  const ListExpr * list(const std::vector<const Expr *> & elements);
  const StringLiteralExpr * string(std::string_view value);
  const IntLiteralExpr * integer(int64_t value);
  const FloatLiteralExpr * floating(double value);
  const UnitExpr * unit();
  const CaseExpr * case_of(const Expr * subject, const std::vector<CaseBranch> & branches);

  // ===========================================================================
  // Patterns
  // ===========================================================================

  const VarPattern * var(std::string_view name);
  const WildcardPattern * wildcard();
  const UnitPattern * unit_pattern();
  const TuplePattern * tuple_pattern(const std::vector<const Pattern *> & elements);
  const ConstructorPattern * ctor_pattern(
    const QualifiedName & ctor, const std::vector<const Pattern *> & args);

private:
  AstContext & ctx_;
  std::unordered_set<std::string> taken_;
};

}  // namespace codesynth
