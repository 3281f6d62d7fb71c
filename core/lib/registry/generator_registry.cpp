// codesynth/registry/generator_registry.cpp - Resolution of generator definitions
#include "codesynth/registry/generator_registry.hpp"

#include <algorithm>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <variant>

namespace codesynth
{

namespace
{

/// Append the active fragments of one definition list, latest first.
void append_active(
  const ActivationContext & ctx, const std::vector<Definition> & definitions,
  ResolvedGenerator & out)
{
  for (auto it = definitions.rbegin(); it != definitions.rend(); ++it) {
    if (!it->condition.is_met(ctx)) {
      continue;
    }
    std::visit(
      [&](const auto & payload) {
        using T = std::decay_t<decltype(payload)>;
        if constexpr (std::is_same_v<T, LambdaBreaker>) {
          if (!out.lambda_breaker) {
            out.lambda_breaker = payload;
          }
        } else if constexpr (std::is_same_v<T, BlessedImplementation>) {
          out.blessed.push_back(payload.ref);
        } else {
          out.resolvers.emplace_back(payload);
        }
      },
      it->payload);
  }
}

}  // namespace

GeneratorDefinition define_generator(
  std::string id, Condition gate, TypePattern pattern, NameMaker make_name,
  std::vector<Definition> definitions)
{
  return GenericGenerator{
    std::move(id), std::move(gate), std::move(pattern), std::move(make_name),
    std::move(definitions)};
}

GeneratorDefinition amend(std::string id, std::vector<Definition> definitions)
{
  return Amendment{std::move(id), std::move(definitions)};
}

NameMaker name_with_prefix(std::string prefix)
{
  return [prefix = std::move(prefix)](std::string_view type_name) {
    return prefix + std::string(type_name);
  };
}

std::vector<ResolvedGenerator> resolve_generators(
  const ActivationContext & ctx, const std::vector<GeneratorDefinition> & definitions)
{
  // Amendments seen so far (walking backwards), keyed by target id,
  // latest declaration first.
  std::unordered_map<std::string, std::vector<const Amendment *>> pending;
  std::vector<ResolvedGenerator> out;

  for (auto it = definitions.rbegin(); it != definitions.rend(); ++it) {
    if (const auto * amendment = std::get_if<Amendment>(&*it)) {
      pending[amendment->id].push_back(amendment);
      continue;
    }

    const auto & generic = std::get<GenericGenerator>(*it);
    std::vector<const Amendment *> amendments;
    if (auto found = pending.find(generic.id); found != pending.end()) {
      amendments = std::move(found->second);
      pending.erase(found);
    }

    if (!generic.gate.is_met(ctx)) {
      continue;
    }

    ResolvedGenerator resolved{
      generic.id, generic.pattern, {}, std::nullopt, generic.make_name, {}};
    for (const auto * amendment : amendments) {
      append_active(ctx, amendment->definitions, resolved);
    }
    append_active(ctx, generic.definitions, resolved);
    out.push_back(std::move(resolved));
  }

  // Leftover pending amendments target no generator and are dropped.
  std::reverse(out.begin(), out.end());
  return out;
}

const ResolvedGenerator * find_generator(
  const std::vector<ResolvedGenerator> & generators, const ResolvedType * annotation)
{
  for (const auto & generator : generators) {
    if (generator.pattern.match(annotation)) {
      return &generator;
    }
  }
  return nullptr;
}

}  // namespace codesynth
