// codesynth/ast/ast.hpp - Expression and pattern nodes of synthesized code
//
// This header contains the node classes of the small functional expression
// language the engine emits, following the LLVM/Clang style with classof()
// for RTTI support. All nodes are immutable after construction and owned by
// an AstContext arena.
//
#pragma once

#include <cstdint>
#include <gsl/span>
#include <string_view>

#include "codesynth/ast/ast_enums.hpp"
#include "codesynth/basic/casting.hpp"

namespace codesynth
{

// ============================================================================
// Base Classes
// ============================================================================

/**
 * Base class for all AST nodes.
 *
 * Nodes are non-copyable and managed by AstContext.
 */
class AstNode
{
public:
  const NodeKind kind;

  // Non-copyable, non-movable (managed by AstContext)
  AstNode(const AstNode &) = delete;
  AstNode & operator=(const AstNode &) = delete;
  AstNode(AstNode &&) = delete;
  AstNode & operator=(AstNode &&) = delete;

  /// Get the node kind
  [[nodiscard]] NodeKind get_kind() const noexcept { return kind; }

protected:
  explicit AstNode(NodeKind k) : kind(k) {}
  ~AstNode() = default;  // Non-virtual, protected: prevents polymorphic delete
};

// ============================================================================
// CRTP Base for Automatic classof()
// ============================================================================

/**
 * CRTP base class that automatically implements classof().
 *
 * @tparam Derived The concrete node class
 * @tparam Base The base class to inherit from
 * @tparam K The NodeKind for this node type
 */
template <typename Derived, typename Base, NodeKind K>
class NodeBase : public Base
{
public:
  static constexpr NodeKind kind = K;

  static bool classof(const AstNode * node) { return node->get_kind() == K; }

protected:
  NodeBase() : Base(K) {}
};

// ============================================================================
// Category Base Classes
// ============================================================================

/**
 * Base class for expressions.
 */
class Expr : public AstNode
{
public:
  static bool classof(const AstNode * node) { return is_expr_kind(node->kind); }

protected:
  explicit Expr(NodeKind k) : AstNode(k) {}
};

/**
 * Base class for binding patterns (lambda parameters, case branches).
 */
class Pattern : public AstNode
{
public:
  static bool classof(const AstNode * node) { return is_pattern_kind(node->kind); }

protected:
  explicit Pattern(NodeKind k) : AstNode(k) {}
};

// ============================================================================
// Expression Nodes
// ============================================================================

/// Reference to a value: qualified (`Json.Decode.int`) or local (`x`).
class ReferenceExpr : public NodeBase<ReferenceExpr, Expr, NodeKind::Reference>
{
public:
  std::string_view module;  ///< empty for local names
  std::string_view name;

  ReferenceExpr(std::string_view m, std::string_view n) : module(m), name(n) {}

  [[nodiscard]] bool is_local() const noexcept { return module.empty(); }
};

/// Function application: `fn arg1 arg2 ...`
class ApplicationExpr : public NodeBase<ApplicationExpr, Expr, NodeKind::Application>
{
public:
  const Expr * fn;
  gsl::span<const Expr *> args;

  ApplicationExpr(const Expr * f, gsl::span<const Expr *> a) : fn(f), args(a) {}
};

/// Anonymous function: `\p1 p2 -> body`
class LambdaExpr : public NodeBase<LambdaExpr, Expr, NodeKind::Lambda>
{
public:
  gsl::span<const Pattern *> params;
  const Expr * body;

  LambdaExpr(gsl::span<const Pattern *> p, const Expr * b) : params(p), body(b) {}
};

/// Binary operator application: `lhs |> rhs`
class OperatorExpr : public NodeBase<OperatorExpr, Expr, NodeKind::Operator>
{
public:
  std::string_view op;
  const Expr * lhs;
  const Expr * rhs;

  OperatorExpr(std::string_view o, const Expr * l, const Expr * r) : op(o), lhs(l), rhs(r) {}
};

/// Field of a record literal
struct RecordField
{
  std::string_view name;
  const Expr * value = nullptr;
};

/// Record literal: `{ a = x, b = y }`
class RecordExpr : public NodeBase<RecordExpr, Expr, NodeKind::Record>
{
public:
  gsl::span<const RecordField> fields;

  explicit RecordExpr(gsl::span<const RecordField> f) : fields(f) {}
};

/// Record field access: `record.field`
class RecordAccessExpr : public NodeBase<RecordAccessExpr, Expr, NodeKind::RecordAccess>
{
public:
  const Expr * record;
  std::string_view field;

  RecordAccessExpr(const Expr * r, std::string_view f) : record(r), field(f) {}
};

/// Record accessor function: `.field`
class RecordAccessFunctionExpr
: public NodeBase<RecordAccessFunctionExpr, Expr, NodeKind::RecordAccessFunction>
{
public:
  std::string_view field;

  explicit RecordAccessFunctionExpr(std::string_view f) : field(f) {}
};

/// Tuple literal: `( a, b )` or `( a, b, c )`
class TupleExpr : public NodeBase<TupleExpr, Expr, NodeKind::Tuple>
{
public:
  gsl::span<const Expr *> elements;

  explicit TupleExpr(gsl::span<const Expr *> e) : elements(e) {}
};

/// List literal: `[ a, b ]`
class ListExpr : public NodeBase<ListExpr, Expr, NodeKind::List>
{
public:
  gsl::span<const Expr *> elements;

  explicit ListExpr(gsl::span<const Expr *> e) : elements(e) {}
};

/// String literal (value stored unescaped)
class StringLiteralExpr : public NodeBase<StringLiteralExpr, Expr, NodeKind::StringLiteral>
{
public:
  std::string_view value;

  explicit StringLiteralExpr(std::string_view v) : value(v) {}
};

/// Integer literal
class IntLiteralExpr : public NodeBase<IntLiteralExpr, Expr, NodeKind::IntLiteral>
{
public:
  int64_t value;

  explicit IntLiteralExpr(int64_t v) : value(v) {}
};

/// Float literal
class FloatLiteralExpr : public NodeBase<FloatLiteralExpr, Expr, NodeKind::FloatLiteral>
{
public:
  double value;

  explicit FloatLiteralExpr(double v) : value(v) {}
};

/// Unit value: `()`
class UnitExpr : public NodeBase<UnitExpr, Expr, NodeKind::Unit>
{
public:
  UnitExpr() = default;
};

/// One `pattern -> body` branch of a case expression
struct CaseBranch
{
  const Pattern * pattern = nullptr;
  const Expr * body = nullptr;
};

/// Case expression: `case subject of p1 -> e1 ...`
class CaseExpr : public NodeBase<CaseExpr, Expr, NodeKind::Case>
{
public:
  const Expr * subject;
  gsl::span<const CaseBranch> branches;

  CaseExpr(const Expr * s, gsl::span<const CaseBranch> b) : subject(s), branches(b) {}
};

// ============================================================================
// Pattern Nodes
// ============================================================================

/// Simple bind: `x`
class VarPattern : public NodeBase<VarPattern, Pattern, NodeKind::VarPattern>
{
public:
  std::string_view name;

  explicit VarPattern(std::string_view n) : name(n) {}
};

/// `_`
class WildcardPattern : public NodeBase<WildcardPattern, Pattern, NodeKind::WildcardPattern>
{
public:
  WildcardPattern() = default;
};

/// `()`
class UnitPattern : public NodeBase<UnitPattern, Pattern, NodeKind::UnitPattern>
{
public:
  UnitPattern() = default;
};

/// `( a, b )`
class TuplePattern : public NodeBase<TuplePattern, Pattern, NodeKind::TuplePattern>
{
public:
  gsl::span<const Pattern *> elements;

  explicit TuplePattern(gsl::span<const Pattern *> e) : elements(e) {}
};

/// Constructor deconstruction: `Module.Ctor a b`
class ConstructorPattern
: public NodeBase<ConstructorPattern, Pattern, NodeKind::ConstructorPattern>
{
public:
  std::string_view module;
  std::string_view name;
  gsl::span<const Pattern *> args;

  ConstructorPattern(std::string_view m, std::string_view n, gsl::span<const Pattern *> a)
  : module(m), name(n), args(a)
  {
  }
};

}  // namespace codesynth
