// oasgen/driver/resolver_driver.hpp - Resolver driver
//
// Entry point for the check / dump pipelines.
// Used by the CLI and usable from other tools.
//
#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "oasgen/basic/diagnostic.hpp"
#include "oasgen/project/project_config.hpp"

namespace oasgen
{

// ============================================================================
// Resolve Options
// ============================================================================

struct ResolveOptions
{
  /// Directory document paths are made relative to
  std::filesystem::path base_dir = ".";

  /// Root schema file
  std::filesystem::path schema;

  /// Additional component files loaded up front
  std::vector<std::filesystem::path> components;

  /// Pointer of the fragment to dump (dump only)
  std::string pointer = "/";

  /// Maximum indirections followed for one reference
  std::size_t max_reference_depth = 64;

  /// Log document loads to stderr
  bool verbose = false;

  /// Options equivalent to a project configuration
  [[nodiscard]] static ResolveOptions from_config(const ProjectConfig & config);
};

// ============================================================================
// Resolve Result
// ============================================================================

struct ResolveResult
{
  /// Whether the pipeline succeeded (no errors)
  bool success = false;

  /// Collected diagnostics (errors, warnings, etc.)
  DiagnosticBag diagnostics;

  /// Rendered JSON (dump only)
  std::optional<std::string> output;

  /// Documents loaded while running
  std::size_t documents_loaded = 0;

  /// Indirection nodes visited (check only)
  std::size_t references_checked = 0;
};

// ============================================================================
// Resolver Driver
// ============================================================================

/**
 * Runs the resolution core over a schema and its components.
 *
 * Document paths are derived from file paths relative to the base directory
 * with '/' separators and percent-encoded components, which is the same form
 * relative "$ref" resolution produces, so no document is loaded twice.
 */
class ResolverDriver
{
public:
  /**
   * Resolve every indirection node reachable from the schema and components.
   *
   * Each failing reference is reported as an error diagnostic located at the
   * node that holds the "$ref"; checking continues with the next one.
   */
  [[nodiscard]] static ResolveResult check(const ResolveOptions & options);

  /**
   * Render the fragment at options.pointer as JSON with references inlined.
   *
   * A reference back into a fragment that is still being rendered is
   * emitted as {"$ref": "<document>#<pointer>"}.
   */
  [[nodiscard]] static ResolveResult dump(const ResolveOptions & options);

  /**
   * Document path of file relative to base_dir, percent-encoded.
   *
   * Files outside base_dir get leading ".." segments.
   *
   * @throws LoadError when file has no path relative to base_dir
   */
  [[nodiscard]] static std::string document_key(
    const std::filesystem::path & base_dir, const std::filesystem::path & file);
};

}  // namespace oasgen
