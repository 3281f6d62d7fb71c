// codesynth/project/project_config.cpp - Project configuration implementation
//
#include "codesynth/project/project_config.hpp"

#include <yaml-cpp/yaml.h>

namespace codesynth
{

namespace
{

/// Read a list of strings; false if the node is not a sequence of scalars
bool read_string_list(const YAML::Node & node, std::vector<std::string> & out)
{
  if (!node.IsSequence()) {
    return false;
  }
  for (const auto & item : node) {
    if (!item.IsScalar()) {
      return false;
    }
    out.push_back(item.as<std::string>());
  }
  return true;
}

}  // namespace

ConfigLoadResult load_project_config(const std::filesystem::path & config_path)
{
  namespace fs = std::filesystem;

  if (!fs::exists(config_path)) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  YAML::Node root;
  try {
    root = YAML::LoadFile(config_path.string());
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }

  ProjectConfig config;
  config.project_root = fs::absolute(config_path).parent_path();

  if (!root.IsNull() && !root.IsMap()) {
    return ConfigLoadResult::fail("configuration root must be a map");
  }

  try {
    // Parse 'package' section
    if (root["package"]) {
      const auto & pkg = root["package"];
      if (pkg["name"]) {
        config.package.name = pkg["name"].as<std::string>();
      }
      if (pkg["version"]) {
        config.package.version = pkg["version"].as<std::string>();
      }
    }

    // Parse 'capabilities' section
    if (root["capabilities"]) {
      if (!read_string_list(root["capabilities"], config.capabilities)) {
        return ConfigLoadResult::fail("capabilities must be a list of package names");
      }
    }

    // Parse 'inputs' section
    if (root["inputs"]) {
      std::vector<std::string> inputs;
      if (!read_string_list(root["inputs"], inputs)) {
        return ConfigLoadResult::fail("inputs must be a list of paths");
      }
      for (const auto & input : inputs) {
        config.inputs.push_back(config.project_root / input);
      }
    }

    // Parse 'output' section
    if (root["output"]) {
      const auto & out = root["output"];
      if (out["format"]) {
        const auto format = out["format"].as<std::string>();
        if (format == "elm") {
          config.output.format = OutputFormat::Elm;
        } else if (format == "json") {
          config.output.format = OutputFormat::Json;
        } else {
          return ConfigLoadResult::fail(
            "invalid output.format: '" + format + "' (must be 'elm' or 'json')");
        }
      }
      if (out["path"]) {
        config.output.path = config.project_root / out["path"].as<std::string>();
      }
    }
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("invalid configuration: " + std::string(e.what()));
  }

  return ConfigLoadResult::ok(std::move(config));
}

std::optional<std::filesystem::path> find_project_config(const std::filesystem::path & start_dir)
{
  namespace fs = std::filesystem;

  fs::path current = fs::absolute(start_dir);

  // If start_dir is a file, start from its parent
  if (fs::is_regular_file(current)) {
    current = current.parent_path();
  }

  while (true) {
    fs::path candidate = current / k_project_config_file_name;
    if (fs::exists(candidate)) {
      return candidate;
    }

    const fs::path parent = current.parent_path();
    if (parent == current) {
      // Reached filesystem root
      break;
    }
    current = parent;
  }

  return std::nullopt;
}

}  // namespace codesynth
