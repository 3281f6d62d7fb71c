// codesynth/synth/synthesizer.hpp - End-to-end synthesis of requested declarations
//
// Pipeline per request:
//   find generator -> compose -> simplify -> normalize -> break recursion
//
// Emitted declarations accumulate in an ordered arena with unique names;
// helpers emitted for one request are reused by later requests.
//
#pragma once

#include <ostream>
#include <string>
#include <unordered_set>
#include <vector>

#include "codesynth/ast/ast_context.hpp"
#include "codesynth/ast/declaration.hpp"
#include "codesynth/basic/diagnostic.hpp"
#include "codesynth/registry/definition.hpp"
#include "codesynth/synth/composer.hpp"
#include "codesynth/types/resolved_type.hpp"

namespace codesynth
{

/// A declaration to synthesize: `name : annotation`, `name params... = ?`
struct SynthesisRequest
{
  std::string name;
  const ResolvedType * annotation = nullptr;
  std::vector<std::string> params;
};

struct SynthesisOptions
{
  bool verbose = false;
  std::ostream * log = nullptr;  ///< progress lines when verbose
};

/// Outcome of one request
struct RequestOutcome
{
  std::string name;
  std::string generator_id;               ///< empty when no generator matched
  std::vector<Declaration> declarations;  ///< requested declaration first, then helpers
  DiagnosticBag diagnostics;

  [[nodiscard]] bool succeeded() const { return !diagnostics.has_errors(); }
};

class Synthesizer
{
public:
  Synthesizer(
    AstContext & ast, TypeContext & types, const std::vector<ResolvedGenerator> & generators,
    SynthesisOptions options = {});

  /// Make an existing implementation available to every later request
  void add_provider(KnownProvider provider);

  /// Declare a name already taken in the target module
  void reserve_name(const std::string & name);

  /// Synthesize one request. A failing request emits nothing.
  RequestOutcome synthesize(const SynthesisRequest & request);

  /// Synthesize requests in order; failures do not stop later requests.
  std::vector<RequestOutcome> synthesize_all(const std::vector<SynthesisRequest> & requests);

  /// Every declaration emitted so far, in emission order
  [[nodiscard]] const std::vector<Declaration> & declarations() const noexcept
  {
    return declarations_;
  }

  /// Diagnostics of every request so far
  [[nodiscard]] const DiagnosticBag & diagnostics() const noexcept { return diagnostics_; }

private:
  template <typename... Args>
  void log(const char * format, const Args &... args);

  void fail(RequestOutcome & outcome, const GenError & error, const SynthesisRequest & request);

  AstContext & ast_;
  TypeContext & types_;
  const std::vector<ResolvedGenerator> & generators_;
  SynthesisOptions options_;

  std::vector<KnownProvider> providers_;
  std::vector<Declaration> declarations_;
  std::unordered_set<std::string> names_;
  DiagnosticBag diagnostics_;
};

}  // namespace codesynth
