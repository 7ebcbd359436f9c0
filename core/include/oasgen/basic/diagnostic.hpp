// oasgen/basic/diagnostic.hpp - Diagnostic types for document checks
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "oasgen/ref/reference.hpp"

namespace oasgen
{

// ============================================================================
// Core Structures
// ============================================================================

/**
 * Severity level for diagnostics.
 */
enum class Severity : uint8_t {
  Error,
  Warning,
};

struct Diagnostic
{
  Severity severity = Severity::Error;
  std::string code;     // e.g., "E102"
  std::string message;

  /// Coordinate the diagnostic is about, if any
  std::optional<Reference> location;

  std::vector<std::string> notes;
  std::optional<std::string> help_message;
};

// ============================================================================
// Forward Declarations
// ============================================================================

class DiagnosticBag;

// ============================================================================
// DiagnosticBuilder
// ============================================================================

/**
 * Builds a diagnostic fluently and adds it to the bag when destroyed (RAII).
 */
class DiagnosticBuilder
{
public:
  DiagnosticBuilder(DiagnosticBag & bag, Diagnostic diag);

  DiagnosticBuilder(const DiagnosticBuilder &) = delete;
  DiagnosticBuilder & operator=(const DiagnosticBuilder &) = delete;

  DiagnosticBuilder(DiagnosticBuilder && other) noexcept;

  ~DiagnosticBuilder();

  DiagnosticBuilder & with_code(std::string code);

  DiagnosticBuilder & with_note(std::string note);

  DiagnosticBuilder & with_help(std::string help_msg);

private:
  DiagnosticBag & bag_;
  Diagnostic diagnostic_;
  bool active_ = true;
};

// ============================================================================
// DiagnosticBag
// ============================================================================

class DiagnosticBag
{
public:
  DiagnosticBag() = default;

  DiagnosticBag(const DiagnosticBag &) = default;
  DiagnosticBag & operator=(const DiagnosticBag &) = default;
  DiagnosticBag(DiagnosticBag &&) = default;
  DiagnosticBag & operator=(DiagnosticBag &&) = default;

  // Builder Starters
  DiagnosticBuilder report_error(std::optional<Reference> location, std::string message);
  DiagnosticBuilder report_warning(std::optional<Reference> location, std::string message);

  // Add
  void add(Diagnostic && diag);

  // Accessors
  [[nodiscard]] const std::vector<Diagnostic> & all() const { return diagnostics_; }
  [[nodiscard]] bool empty() const { return diagnostics_.empty(); }
  [[nodiscard]] size_t size() const { return diagnostics_.size(); }

  [[nodiscard]] bool has_errors() const;

  [[nodiscard]] auto begin() const { return diagnostics_.begin(); }
  [[nodiscard]] auto end() const { return diagnostics_.end(); }

private:
  std::vector<Diagnostic> diagnostics_;
};

}  // namespace oasgen
