// codesynth/synth/composer.hpp - Recursive composition of resolvers
//
// Given a resolved generator and the child type selected by its pattern,
// builds the expression implementing the generator for that type together
// with the auxiliary declarations nested named types need.
//
#pragma once

#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

#include "codesynth/ast/ast_builder.hpp"
#include "codesynth/basic/qualified_name.hpp"
#include "codesynth/basic/result.hpp"
#include "codesynth/registry/definition.hpp"
#include "codesynth/types/resolved_type.hpp"

namespace codesynth
{

/**
 * A pre-existing implementation usable instead of synthesized code.
 *
 * `declared_type` is the provider's full annotation, e.g.
 * `Json.Decode.Decoder Api.Id`; it is matched against the generator's
 * pattern before comparison.
 */
struct KnownProvider
{
  std::string generator_id;
  QualifiedName location;
  const ResolvedType * declared_type = nullptr;
};

/// A synthesized top-level helper emitted next to the requested expression
struct AuxiliaryDeclaration
{
  std::string name;
  const ResolvedType * annotation = nullptr;  ///< pattern rebuilt around `subject`
  const Expr * body = nullptr;
  const ResolvedType * subject = nullptr;     ///< the named type it implements
};

/// Result of one composition: the expression plus helpers, innermost first
struct Generated
{
  const Expr * expr = nullptr;
  std::vector<AuxiliaryDeclaration> auxiliaries;
};

/**
 * Composition engine for one generator.
 *
 * Nested custom types and record aliases are composed once per composer
 * and referenced by the name of their auxiliary declaration afterwards, so
 * composition terminates on cyclic type graphs.
 */
class Composer
{
public:
  Composer(
    AstBuilder & builder, TypeContext & types, const ResolvedGenerator & generator,
    const std::vector<KnownProvider> & providers);

  /**
   * Generate an expression for `type`.
   *
   * When `is_top_level` is set a custom type or record alias is composed
   * inline instead of being turned into an auxiliary declaration.
   */
  [[nodiscard]] GenResult<Generated> generate(bool is_top_level, const ResolvedType * type);

  /// Make `name` unavailable for auxiliary declarations
  void reserve_name(const std::string & name) { taken_names_.insert(name); }

  /**
   * The declaration being implemented. It provides its own type to nested
   * occurrences only; the top-level call never resolves to itself.
   */
  void set_self(KnownProvider self) { self_ = std::move(self); }

private:
  using Body = GenResult<const Expr *>;

  Body compose(bool is_top_level, const ResolvedType * type);

  const Expr * find_provider(bool is_top_level, const ResolvedType * type);
  [[nodiscard]] bool provides(const KnownProvider & provider, const ResolvedType * type) const;
  const Expr * try_universal(const ResolvedType * type);

  /// Compose the target of a non-record alias; fails on alias cycles
  Body unwrap_alias(bool is_top_level, const ResolvedType * alias);

  Body compose_opaque(const ResolvedType * type);
  Body compose_record(const ResolvedType * record);
  Body compose_tuple(const ResolvedType * tuple);
  Body compose_custom_type(const ResolvedType * custom);

  /// Combiner resolution: generate children, then ask each combiner in turn
  Body combine(const ResolvedType * type, const Expr * ctor, const Types & child_types);

  /// Inline at top level; otherwise emit (once) as an auxiliary declaration
  template <typename Fn>
  Body named(bool is_top_level, const ResolvedType * type, Fn && compose_body);

  std::string unique_declaration_name(const std::string & base);

  AstBuilder & builder_;
  TypeContext & types_;
  const ResolvedGenerator & generator_;
  const std::vector<KnownProvider> & providers_;

  std::optional<KnownProvider> self_;

  std::vector<AuxiliaryDeclaration> auxiliaries_;
  std::unordered_map<QualifiedName, std::string, QualifiedNameHash> named_;
  std::unordered_set<std::string> taken_names_;
  std::unordered_set<const ResolvedType *> unwrapping_;
};

/// Convenience wrapper running one Composer.
[[nodiscard]] GenResult<Generated> generate(
  AstBuilder & builder, TypeContext & types, const ResolvedGenerator & generator,
  const std::vector<KnownProvider> & providers, const ResolvedType * type,
  bool is_top_level = true);

}  // namespace codesynth
