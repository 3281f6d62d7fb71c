// codesynth/driver/session.cpp - Synthesis driver implementation
//
#include "codesynth/driver/session.hpp"

#include <fmt/format.h>
#include <fmt/ostream.h>

#include <nlohmann/json.hpp>

#include "codesynth/ast/ast_printer.hpp"
#include "codesynth/ast/json_visitor.hpp"
#include "codesynth/builtins/builtin_generators.hpp"
#include "codesynth/io/type_loader.hpp"
#include "codesynth/registry/generator_registry.hpp"

namespace codesynth
{

namespace
{

ActivationContext make_activation(const std::vector<std::string> & capabilities)
{
  ActivationContext ctx;
  if (capabilities.empty()) {
    for (auto & cap : base_capabilities()) {
      ctx.enable(std::move(cap));
    }
    return ctx;
  }
  for (const auto & cap : capabilities) {
    ctx.enable(cap);
  }
  return ctx;
}

SessionResult run_inputs(
  const std::vector<std::filesystem::path> & inputs, const std::vector<std::string> & capabilities,
  const SessionOptions & options)
{
  SessionResult result;
  result.ast = std::make_unique<AstContext>();
  result.types = std::make_unique<TypeContext>();

  namespace fs = std::filesystem;

  if (inputs.empty()) {
    result.diagnostics.report_error("<inputs>", "no input files given").with_code("E010");
    return result;
  }

  const auto generators = resolve_generators(make_activation(capabilities), builtin_generators());
  if (options.verbose && options.log) {
    fmt::print(*options.log, "[codesynth] {} generator(s) active\n", generators.size());
  }

  // Load every input first so that providers of any file are visible to
  // the requests of every other file.
  std::vector<SynthesisRequest> requests;
  std::vector<KnownProvider> providers;
  for (const auto & input : inputs) {
    if (!fs::exists(input)) {
      result.diagnostics.report_error(input.string(), "file not found: " + input.string())
        .with_code("E010");
      continue;
    }
    auto loaded = load_input_file(input, *result.types);
    if (!loaded) {
      result.diagnostics.report_error(input.string(), loaded.error().message)
        .with_code(loaded.error().code());
      continue;
    }
    for (auto & request : loaded->requests) {
      requests.push_back(std::move(request));
    }
    for (auto & provider : loaded->providers) {
      providers.push_back(std::move(provider));
    }
  }
  if (result.diagnostics.has_errors()) {
    return result;
  }

  SynthesisOptions synth_options;
  synth_options.verbose = options.verbose;
  synth_options.log = options.log;

  Synthesizer synthesizer(*result.ast, *result.types, generators, synth_options);
  for (auto & provider : providers) {
    synthesizer.add_provider(std::move(provider));
  }

  result.outcomes = synthesizer.synthesize_all(requests);
  result.declarations = synthesizer.declarations();
  result.diagnostics.merge(synthesizer.diagnostics());
  result.success = !result.diagnostics.has_errors();
  return result;
}

}  // namespace

SessionResult Session::run_files(
  const std::vector<std::filesystem::path> & inputs, const SessionOptions & options)
{
  return run_inputs(inputs, options.capabilities, options);
}

SessionResult Session::run_project(const ProjectConfig & config, const SessionOptions & options)
{
  std::vector<std::string> capabilities = config.capabilities;
  capabilities.insert(
    capabilities.end(), options.capabilities.begin(), options.capabilities.end());
  return run_inputs(config.inputs, capabilities, options);
}

std::string render_output(const std::vector<Declaration> & declarations, OutputFormat format)
{
  if (format == OutputFormat::Json) {
    nlohmann::json out = nlohmann::json::array();
    for (const auto & decl : declarations) {
      out.push_back(to_json(decl));
    }
    return out.dump(2) + "\n";
  }

  std::string out;
  for (size_t i = 0; i < declarations.size(); ++i) {
    if (i > 0) {
      out += "\n\n";
    }
    out += render_declaration(declarations[i]);
  }
  return out;
}

}  // namespace codesynth
