// codesynth/registry/generator_registry.hpp - Resolution of generator definitions
#pragma once

#include <vector>

#include "codesynth/registry/definition.hpp"

namespace codesynth
{

/**
 * Resolve generator definitions against an activation context.
 *
 * - Generators whose gate is unmet are dropped, with their amendments.
 * - Fragments whose condition is unmet are dropped.
 * - Each fragment list is reversed, so the later-registered fragment is
 *   tried first; amendment fragments precede the generator's own, a
 *   later-declared amendment before an earlier one.
 * - An amendment applies to a generator declared before it; amendments
 *   without such a generator are discarded.
 *
 * Never fails. The output keeps the declaration order of generator ids.
 */
[[nodiscard]] std::vector<ResolvedGenerator> resolve_generators(
  const ActivationContext & ctx, const std::vector<GeneratorDefinition> & definitions);

/// First generator whose pattern matches `annotation`, or nullptr
[[nodiscard]] const ResolvedGenerator * find_generator(
  const std::vector<ResolvedGenerator> & generators, const ResolvedType * annotation);

}  // namespace codesynth
