// codesynth/project/project_config.hpp - Project configuration (codesynth.yaml)
//
// Parses and validates codesynth.yaml project configuration files.
//
#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace codesynth
{

// ============================================================================
// Configuration Structures
// ============================================================================

/**
 * Package metadata section.
 */
struct PackageConfig
{
  std::string name;
  std::string version;
};

/// Output rendering of synthesized declarations
enum class OutputFormat : uint8_t {
  Elm,   ///< source text
  Json,  ///< expression trees as JSON
};

/**
 * Output section.
 */
struct OutputConfig
{
  OutputFormat format = OutputFormat::Elm;

  /// Output file; empty writes to stdout
  std::filesystem::path path;
};

/**
 * Complete project configuration (codesynth.yaml).
 */
struct ProjectConfig
{
  PackageConfig package;

  /// Optional capabilities enabled for every run (package names)
  std::vector<std::string> capabilities;

  /// Type description files (see io/type_loader.hpp)
  std::vector<std::filesystem::path> inputs;

  OutputConfig output;

  /// Directory containing codesynth.yaml (for resolving relative paths)
  std::filesystem::path project_root;
};

// ============================================================================
// Configuration Loading Result
// ============================================================================

/**
 * Result of loading a project configuration file.
 */
struct ConfigLoadResult
{
  /// Loaded configuration (only valid if success == true)
  ProjectConfig config;

  /// Whether loading succeeded
  bool success = false;

  /// Error message if loading failed
  std::string error;

  static ConfigLoadResult ok(ProjectConfig cfg)
  {
    ConfigLoadResult r;
    r.config = std::move(cfg);
    r.success = true;
    return r;
  }

  static ConfigLoadResult fail(std::string msg)
  {
    ConfigLoadResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

// ============================================================================
// Configuration Loading API
// ============================================================================

/**
 * Load a project configuration from a codesynth.yaml file.
 *
 * Relative input and output paths are resolved against the directory of
 * the file.
 */
[[nodiscard]] ConfigLoadResult load_project_config(const std::filesystem::path & config_path);

/**
 * Find codesynth.yaml by searching upward from a directory (or the
 * directory of a file) to the filesystem root.
 */
[[nodiscard]] std::optional<std::filesystem::path> find_project_config(
  const std::filesystem::path & start_dir);

/**
 * Default name of the project configuration file.
 */
inline constexpr const char * k_project_config_file_name = "codesynth.yaml";

}  // namespace codesynth
