// codesynth/driver/session.hpp - Synthesis driver
//
// Single entry point for the synthesis pipeline.
// Used by the CLI and can be integrated into other tools.
//
#pragma once

#include <filesystem>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

#include "codesynth/ast/ast_context.hpp"
#include "codesynth/ast/declaration.hpp"
#include "codesynth/basic/diagnostic.hpp"
#include "codesynth/project/project_config.hpp"
#include "codesynth/synth/synthesizer.hpp"
#include "codesynth/types/resolved_type.hpp"

namespace codesynth
{

// ============================================================================
// Session Options
// ============================================================================

struct SessionOptions
{
  /// Enabled capabilities (package names), added to those of the project
  std::vector<std::string> capabilities;

  /// Enable verbose output
  bool verbose = false;

  /// Destination of verbose output
  std::ostream * log = nullptr;
};

// ============================================================================
// Session Result
// ============================================================================

struct SessionResult
{
  /// Whether every request succeeded
  bool success = false;

  /// Collected diagnostics (input errors and every request's)
  DiagnosticBag diagnostics;

  /// One outcome per request, in input order
  std::vector<RequestOutcome> outcomes;

  /// Every emitted declaration, in emission order
  std::vector<Declaration> declarations;

  /// Arenas owning the nodes and types referenced by `declarations`
  std::unique_ptr<AstContext> ast;
  std::unique_ptr<TypeContext> types;
};

// ============================================================================
// Session
// ============================================================================

/**
 * Driver that runs the built-in generators over type description files.
 *
 * The pipeline consists of:
 * 1. Generator resolution against the enabled capabilities
 * 2. Loading types, requests and providers from every input
 * 3. Synthesis of every request, sharing helpers across inputs
 */
class Session
{
public:
  /**
   * Synthesize the requests of the given input files.
   *
   * @param inputs Type description files (see io/type_loader.hpp)
   * @param options Session options
   */
  [[nodiscard]] static SessionResult run_files(
    const std::vector<std::filesystem::path> & inputs, const SessionOptions & options);

  /**
   * Synthesize the inputs of a project.
   *
   * Project capabilities and option capabilities are both enabled.
   */
  [[nodiscard]] static SessionResult run_project(
    const ProjectConfig & config, const SessionOptions & options);
};

/**
 * Render emitted declarations.
 *
 * Elm output separates declarations by a blank line; JSON output is an
 * array of declaration objects.
 */
[[nodiscard]] std::string render_output(
  const std::vector<Declaration> & declarations, OutputFormat format);

}  // namespace codesynth
