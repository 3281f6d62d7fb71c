// codesynth/registry/vocabulary.hpp - Builders for definition fragments
//
// The vocabulary generator authors write definitions in:
//
// @code
//   define_generator("elm/random/Random.Generator", Condition::requires_all({"elm/random"}),
//     TypePattern::named({"Random", "Generator"}, {TypePattern::hole()}),
//     name_with_prefix("random"),
//     {
//       vocab::int_({"Random", "int"}),
//       vocab::list({"Random", "list"}),
//       vocab::map_n("Random", "map", 5),
//       vocab::lambda_breaker({"Random", "lazy"}),
//     });
// @endcode
//
#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>

#include "codesynth/registry/definition.hpp"

namespace codesynth::vocab
{

/// Expression independent of the matched type
using ExprFn = std::function<const Expr *(AstBuilder &)>;

// ============================================================================
// Primitives
// ============================================================================

/// Opaque type `type` implemented by the function `impl`
[[nodiscard]] Definition primitive(QualifiedName type, QualifiedName impl);
[[nodiscard]] Definition primitive(QualifiedName type, PrimitiveResolver::Fn fn);

[[nodiscard]] Definition bool_(QualifiedName impl);
[[nodiscard]] Definition bool_(ExprFn fn);
[[nodiscard]] Definition int_(QualifiedName impl);
[[nodiscard]] Definition int_(ExprFn fn);
[[nodiscard]] Definition float_(QualifiedName impl);
[[nodiscard]] Definition float_(ExprFn fn);
[[nodiscard]] Definition string_(QualifiedName impl);
[[nodiscard]] Definition string_(ExprFn fn);
[[nodiscard]] Definition char_(QualifiedName impl);
[[nodiscard]] Definition char_(ExprFn fn);
[[nodiscard]] Definition unit(QualifiedName impl);
[[nodiscard]] Definition unit(ExprFn fn);

// ============================================================================
// Containers
// ============================================================================

/// One-argument container: `impl child`
[[nodiscard]] Definition container1(QualifiedName type, QualifiedName impl);

/// Two-argument container: `impl child1 child2`
[[nodiscard]] Definition container2(QualifiedName type, QualifiedName impl);

[[nodiscard]] Definition list(QualifiedName impl);
[[nodiscard]] Definition array(QualifiedName impl);
[[nodiscard]] Definition set(QualifiedName impl);
[[nodiscard]] Definition maybe(QualifiedName impl);
[[nodiscard]] Definition dict(QualifiedName impl);

// ============================================================================
// Combiners
// ============================================================================

/// Constructors without arguments: `impl ctor`
[[nodiscard]] Definition wrap(QualifiedName impl);

/// Exactly one child: `impl ctor child`
[[nodiscard]] Definition map(QualifiedName impl);

/**
 * One to `max` children: `module.base ctor c1` for one child,
 * `module.baseN ctor c1 ... cN` for N children.
 */
[[nodiscard]] Definition map_n(std::string module, std::string base, size_t max);

/// As above with the function chosen per child count; std::nullopt declines
[[nodiscard]] Definition map_n(std::function<std::optional<QualifiedName>(size_t)> name_for);

/// `init ctor |> step c1 |> step c2 ...`; either callback may decline with nullptr
[[nodiscard]] Definition pipeline(
  std::function<const Expr *(AstBuilder &, const Expr * ctor)> init,
  std::function<const Expr *(AstBuilder &, const ResolvedType * type, size_t index, const Expr * child)>
    step);

/// Free-form combiner
[[nodiscard]] Definition combiner(Combiner::Fn fn);

/// Two-tuples only: `impl c1 c2`
[[nodiscard]] Definition tuple(QualifiedName impl);

/// Three-tuples only: `impl c1 c2 c3`
[[nodiscard]] Definition triple(QualifiedName impl);

// ============================================================================
// Others
// ============================================================================

[[nodiscard]] Definition custom_type(CustomTypeResolver::Fn fn);

/// Free-form resolver consulted before every other kind
[[nodiscard]] Definition universal(UniversalResolver::Fn fn);

[[nodiscard]] Definition lambda_breaker(LambdaBreaker::Fn fn);

/// `impl (\_ -> expr)`
[[nodiscard]] Definition lambda_breaker(QualifiedName impl);

[[nodiscard]] Definition blessed(QualifiedName ref);

/// Gate any fragment on an optional capability.
[[nodiscard]] Definition conditional(std::string capability, Definition definition);

}  // namespace codesynth::vocab
