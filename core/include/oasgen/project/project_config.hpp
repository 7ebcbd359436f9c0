// oasgen/project/project_config.hpp - Project configuration (oasgen.yaml)
//
// Parses and validates oasgen.yaml project configuration files.
//
#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace oasgen
{

// ============================================================================
// Configuration Structures
// ============================================================================

/**
 * Resolver configuration section.
 */
struct ResolverConfig
{
  /// Directory document paths are relative to (relative to oasgen.yaml)
  std::filesystem::path base_dir = ".";

  /// Root schema document, relative to base_dir
  std::filesystem::path schema;

  /// Component documents loaded alongside the schema, relative to base_dir
  std::vector<std::filesystem::path> components;

  /// Maximum indirections followed for one reference
  std::size_t max_reference_depth = 64;
};

/**
 * Complete project configuration (oasgen.yaml).
 */
struct ProjectConfig
{
  ResolverConfig resolver;

  /// Directory containing oasgen.yaml (for resolving relative paths)
  std::filesystem::path project_root;

  /// base_dir made absolute against project_root
  [[nodiscard]] std::filesystem::path absolute_base_dir() const
  {
    return resolver.base_dir.is_absolute() ? resolver.base_dir
                                           : project_root / resolver.base_dir;
  }
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

  /// Create a successful result
  static ConfigLoadResult ok(ProjectConfig cfg)
  {
    ConfigLoadResult r;
    r.config = std::move(cfg);
    r.success = true;
    return r;
  }

  /// Create a failed result
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
 * Load a project configuration from an oasgen.yaml file.
 *
 * @param config_path Path to oasgen.yaml
 * @return ConfigLoadResult with the loaded config or error message
 */
[[nodiscard]] ConfigLoadResult load_project_config(const std::filesystem::path & config_path);

/**
 * Find a project configuration file by searching upward from a directory.
 *
 * @param start_dir Directory to start searching from
 * @return Path to oasgen.yaml if found, std::nullopt otherwise
 */
[[nodiscard]] std::optional<std::filesystem::path> find_project_config(
  const std::filesystem::path & start_dir);

/**
 * Default name of the project configuration file.
 */
inline constexpr const char * k_project_config_file_name = "oasgen.yaml";

}  // namespace oasgen
