// oasgen/project/project_config.cpp - Project configuration implementation
//
#include "oasgen/project/project_config.hpp"

#include <yaml-cpp/yaml.h>

namespace oasgen
{

namespace
{

/// Parse the 'resolver' section into config, returning an error message on failure
std::optional<std::string> parse_resolver(const YAML::Node & node, ResolverConfig & config)
{
  if (!node.IsMap()) {
    return std::string("resolver must be a map");
  }

  if (node["base_dir"]) {
    config.base_dir = node["base_dir"].as<std::string>();
  }

  if (!node["schema"]) {
    return std::string("resolver.schema is required");
  }
  config.schema = node["schema"].as<std::string>();

  if (node["components"]) {
    if (!node["components"].IsSequence()) {
      return std::string("resolver.components must be a list");
    }
    for (const auto & component : node["components"]) {
      config.components.emplace_back(component.as<std::string>());
    }
  }

  if (node["max_reference_depth"]) {
    const auto depth = node["max_reference_depth"].as<long long>();
    if (depth <= 0) {
      return std::string("resolver.max_reference_depth must be positive");
    }
    config.max_reference_depth = static_cast<std::size_t>(depth);
  }

  return std::nullopt;
}

}  // namespace

ConfigLoadResult load_project_config(const std::filesystem::path & config_path)
{
  namespace fs = std::filesystem;

  // Check if file exists
  if (!fs::exists(config_path)) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  // Load YAML
  YAML::Node root;
  try {
    root = YAML::LoadFile(config_path.string());
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }

  ProjectConfig config;
  config.project_root = fs::absolute(config_path).parent_path();

  try {
    if (!root.IsMap() || !root["resolver"]) {
      return ConfigLoadResult::fail("missing 'resolver' section");
    }
    if (auto error = parse_resolver(root["resolver"], config.resolver)) {
      return ConfigLoadResult::fail(*error);
    }
  } catch (const YAML::Exception & e) {
    // Bad conversions, e.g. a map where a string is expected
    return ConfigLoadResult::fail("invalid configuration value: " + std::string(e.what()));
  }

  return ConfigLoadResult::ok(std::move(config));
}

std::optional<std::filesystem::path> find_project_config(const std::filesystem::path & start_dir)
{
  namespace fs = std::filesystem;

  fs::path current = fs::absolute(start_dir);

  // If startDir is a file, start from its parent
  if (fs::is_regular_file(current)) {
    current = current.parent_path();
  }

  while (true) {
    fs::path candidate = current / k_project_config_file_name;
    if (fs::exists(candidate)) {
      return candidate;
    }

    // Move up to parent
    const fs::path parent = current.parent_path();
    if (parent == current) {
      // Reached filesystem root
      break;
    }
    current = parent;
  }

  return std::nullopt;
}

}  // namespace oasgen
