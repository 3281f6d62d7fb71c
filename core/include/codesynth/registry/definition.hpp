// codesynth/registry/definition.hpp - Generator definitions and resolver kinds
//
// A generator definition is declared once, as data: its id, a capability
// gate, the search pattern selecting the annotations it implements, a name
// maker for auxiliary declarations, and an ordered list of definition
// fragments. Amendments add fragments to an existing generator id.
//
#pragma once

#include <functional>
#include <initializer_list>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "codesynth/ast/ast.hpp"
#include "codesynth/ast/ast_builder.hpp"
#include "codesynth/basic/qualified_name.hpp"
#include "codesynth/types/resolved_type.hpp"
#include "codesynth/types/type_pattern.hpp"

namespace codesynth
{

// ============================================================================
// Activation
// ============================================================================

/**
 * The optional capabilities (usually installed package names) enabled for
 * one run. Passed explicitly into registry resolution; there is no global
 * toggle.
 */
class ActivationContext
{
public:
  ActivationContext() = default;
  ActivationContext(std::initializer_list<std::string> caps) : capabilities_(caps) {}

  void enable(std::string capability) { capabilities_.insert(std::move(capability)); }

  [[nodiscard]] bool has(std::string_view capability) const
  {
    return capabilities_.find(std::string(capability)) != capabilities_.end();
  }

  [[nodiscard]] const std::set<std::string> & capabilities() const noexcept
  {
    return capabilities_;
  }

private:
  std::set<std::string> capabilities_;
};

/**
 * Applicability condition of a generator or fragment.
 *
 * Met when every listed dependency is active; an empty list always holds.
 */
struct Condition
{
  std::vector<std::string> dependencies;

  static Condition always() { return Condition{}; }
  static Condition requires_all(std::vector<std::string> deps) { return Condition{std::move(deps)}; }

  [[nodiscard]] bool is_met(const ActivationContext & ctx) const
  {
    for (const auto & dep : dependencies) {
      if (!ctx.has(dep)) return false;
    }
    return true;
  }
};

// ============================================================================
// Resolver Kinds
// ============================================================================

using Exprs = std::vector<const Expr *>;
using Types = std::vector<const ResolvedType *>;

/// Generated expression of one custom-type constructor
struct ConstructorExpr
{
  QualifiedName ctor;
  const Expr * expr = nullptr;
};

/**
 * Implements one opaque type by exact qualified name.
 *
 * Receives the type's arguments and the expressions already generated for
 * them; returns nullptr to decline.
 */
struct PrimitiveResolver
{
  using Fn = std::function<const Expr *(AstBuilder &, const Types & args, const Exprs & children)>;

  QualifiedName type;
  Fn fn;
};

/// Escape hatch: arbitrary type to expression, nullptr to decline
struct UniversalResolver
{
  using Fn = std::function<const Expr *(AstBuilder &, const ResolvedType *)>;

  Fn fn;
};

/**
 * Combines a constructor expression with generated child expressions.
 *
 * Used for records, tuples and each custom-type constructor; `type` is the
 * record, tuple or custom type being built. Returns nullptr to decline.
 */
struct Combiner
{
  using Fn = std::function<const Expr *(
    AstBuilder &, const ResolvedType * type, const Expr * ctor, const Exprs & children)>;

  Fn fn;
};

/// Joins per-constructor expressions into one expression for a custom type
struct CustomTypeResolver
{
  using Fn = std::function<const Expr *(
    AstBuilder &, const std::vector<TypeConstructor> & ctors,
    const std::vector<ConstructorExpr> & branches)>;

  Fn fn;
};

/// Defers evaluation of a recursive reference
struct LambdaBreaker
{
  using Fn = std::function<const Expr *(AstBuilder &, const Expr *)>;

  Fn fn;
};

/// External implementation the provider lookup should always consider
struct BlessedImplementation
{
  QualifiedName ref;
};

/// The closed set of resolver kinds, tried in list order by the composer
using Resolver = std::variant<PrimitiveResolver, UniversalResolver, Combiner, CustomTypeResolver>;

// ============================================================================
// Definitions
// ============================================================================

/**
 * One fragment of a generator definition together with its condition.
 */
struct Definition
{
  using Payload = std::variant<
    PrimitiveResolver, UniversalResolver, Combiner, CustomTypeResolver, LambdaBreaker,
    BlessedImplementation>;

  Payload payload;
  Condition condition;
};

/// Type name (e.g. "Person") to auxiliary declaration name (e.g. "decodePerson")
using NameMaker = std::function<std::string(std::string_view type_name)>;

/// A generator with its own pattern
struct GenericGenerator
{
  std::string id;
  Condition gate;
  TypePattern pattern;
  NameMaker make_name;
  std::vector<Definition> definitions;
};

/// Additional fragments for the generator with the same id
struct Amendment
{
  std::string id;
  std::vector<Definition> definitions;
};

using GeneratorDefinition = std::variant<GenericGenerator, Amendment>;

/// Build a generator definition.
[[nodiscard]] GeneratorDefinition define_generator(
  std::string id, Condition gate, TypePattern pattern, NameMaker make_name,
  std::vector<Definition> definitions);

/// Build an amendment of generator `id`.
[[nodiscard]] GeneratorDefinition amend(std::string id, std::vector<Definition> definitions);

/// `prefix` followed by the type name, e.g. name_with_prefix("decode")
[[nodiscard]] NameMaker name_with_prefix(std::string prefix);

// ============================================================================
// Resolved Registry
// ============================================================================

/**
 * A generator ready for composition: only active fragments, in try order.
 */
struct ResolvedGenerator
{
  std::string id;
  TypePattern pattern;
  std::vector<Resolver> resolvers;
  std::optional<LambdaBreaker> lambda_breaker;
  NameMaker make_name;
  std::vector<QualifiedName> blessed;
};

}  // namespace codesynth
