// codesynth/synth/synthesizer.cpp - End-to-end synthesis of requested declarations
#include "codesynth/synth/synthesizer.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <utility>

#include "codesynth/registry/generator_registry.hpp"
#include "codesynth/synth/declaration_normalizer.hpp"
#include "codesynth/synth/recursion.hpp"
#include "codesynth/synth/simplifier.hpp"
#include "codesynth/types/type_utils.hpp"

namespace codesynth
{

Synthesizer::Synthesizer(
  AstContext & ast, TypeContext & types, const std::vector<ResolvedGenerator> & generators,
  SynthesisOptions options)
: ast_(ast), types_(types), generators_(generators), options_(options)
{
}

void Synthesizer::add_provider(KnownProvider provider)
{
  providers_.push_back(std::move(provider));
}

void Synthesizer::reserve_name(const std::string & name) { names_.insert(name); }

template <typename... Args>
void Synthesizer::log(const char * format, const Args &... args)
{
  if (!options_.verbose || !options_.log) {
    return;
  }
  fmt::print(*options_.log, "[codesynth] {}\n", fmt::format(fmt::runtime(format), args...));
}

void Synthesizer::fail(
  RequestOutcome & outcome, const GenError & error, const SynthesisRequest & request)
{
  outcome.diagnostics.report_error(request.name, error.message)
    .with_code(error.code())
    .with_note(fmt::format(
      "while generating `{} : {}`", request.name, render_type(request.annotation)));
  log("{}: failed with {}", request.name, error.code());
}

RequestOutcome Synthesizer::synthesize(const SynthesisRequest & request)
{
  RequestOutcome outcome;
  outcome.name = request.name;

  if (names_.count(request.name) > 0) {
    fail(
      outcome,
      make_error(
        GenErrorKind::InvalidInput,
        fmt::format("a declaration named `{}` already exists", request.name)),
      request);
    diagnostics_.merge(outcome.diagnostics);
    return outcome;
  }

  const ResolvedGenerator * generator = find_generator(generators_, request.annotation);
  if (!generator) {
    fail(
      outcome,
      make_error(
        GenErrorKind::NoGenerator,
        fmt::format(
          "no active generator can implement `{}`", render_type(request.annotation))),
      request);
    outcome.diagnostics.report_info(request.name, "check the enabled capabilities")
      .with_help("enable the package providing the generator with --cap <name>");
    diagnostics_.merge(outcome.diagnostics);
    return outcome;
  }
  outcome.generator_id = generator->id;
  log("{}: using generator {}", request.name, generator->id);

  AstBuilder builder(ast_);
  Composer composer(builder, types_, *generator, providers_);
  // The request may refer to itself, e.g. for recursive types.
  composer.set_self(
    KnownProvider{generator->id, QualifiedName::local(request.name), request.annotation});
  for (const auto & name : names_) {
    builder.reserve_name(name);
    composer.reserve_name(name);
  }
  builder.reserve_name(request.name);
  composer.reserve_name(request.name);
  for (const auto & param : request.params) {
    builder.reserve_name(param);
    composer.reserve_name(param);
  }

  GenResult<Generated> generated =
    composer.generate(true, generator->pattern.match(request.annotation));
  if (!generated) {
    fail(outcome, generated.error(), request);
    diagnostics_.merge(outcome.diagnostics);
    return outcome;
  }

  std::vector<Declaration> decls;
  Declaration primary{request.name, request.annotation, {}, generated->expr};
  for (const auto & param : request.params) {
    primary.params.push_back(builder.var(param));
  }
  decls.push_back(std::move(primary));
  for (const auto & aux : generated->auxiliaries) {
    decls.push_back(Declaration{aux.name, aux.annotation, {}, aux.body});
  }

  for (auto & decl : decls) {
    decl.body = simplify(builder, decl.body);
    decl = normalize_declaration(builder, std::move(decl));
  }

  const LambdaBreaker * breaker =
    generator->lambda_breaker ? &*generator->lambda_breaker : nullptr;
  GenResult<std::vector<Declaration>> safe = break_recursion(builder, std::move(decls), breaker);
  if (!safe) {
    fail(outcome, safe.error(), request);
    diagnostics_.merge(outcome.diagnostics);
    return outcome;
  }

  for (const auto & decl : safe.value()) {
    names_.insert(decl.name);
    declarations_.push_back(decl);
    providers_.push_back(
      KnownProvider{generator->id, QualifiedName::local(decl.name), decl.annotation});
  }
  log(
    "{}: emitted {} declaration(s), {} helper(s)", request.name, safe->size(),
    safe->size() - 1);

  outcome.declarations = std::move(safe).value();
  return outcome;
}

std::vector<RequestOutcome> Synthesizer::synthesize_all(
  const std::vector<SynthesisRequest> & requests)
{
  std::vector<RequestOutcome> outcomes;
  outcomes.reserve(requests.size());
  size_t succeeded = 0;
  for (const auto & request : requests) {
    outcomes.push_back(synthesize(request));
    succeeded += outcomes.back().succeeded() ? 1 : 0;
  }
  log("{} of {} request(s) succeeded", succeeded, requests.size());
  return outcomes;
}

}  // namespace codesynth
