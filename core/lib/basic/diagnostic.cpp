// oasgen/basic/diagnostic.cpp - Diagnostic implementation
#include "oasgen/basic/diagnostic.hpp"

#include <algorithm>
#include <utility>

namespace oasgen
{

namespace
{

Diagnostic make_diagnostic(
  Severity severity, std::optional<Reference> location, std::string message)
{
  Diagnostic d;
  d.severity = severity;
  d.message = std::move(message);
  d.location = std::move(location);
  return d;
}

}  // namespace

// ============================================================================
// DiagnosticBuilder
// ============================================================================

DiagnosticBuilder::DiagnosticBuilder(DiagnosticBag & bag, Diagnostic diag)
: bag_(bag), diagnostic_(std::move(diag))
{
}

DiagnosticBuilder::DiagnosticBuilder(DiagnosticBuilder && other) noexcept
: bag_(other.bag_), diagnostic_(std::move(other.diagnostic_)), active_(other.active_)
{
  other.active_ = false;
}

DiagnosticBuilder::~DiagnosticBuilder()
{
  if (active_) {
    bag_.add(std::move(diagnostic_));
  }
}

DiagnosticBuilder & DiagnosticBuilder::with_code(std::string code)
{
  diagnostic_.code = std::move(code);
  return *this;
}

DiagnosticBuilder & DiagnosticBuilder::with_note(std::string note)
{
  diagnostic_.notes.push_back(std::move(note));
  return *this;
}

DiagnosticBuilder & DiagnosticBuilder::with_help(std::string help_msg)
{
  diagnostic_.help_message = std::move(help_msg);
  return *this;
}

// ============================================================================
// DiagnosticBag
// ============================================================================

DiagnosticBuilder DiagnosticBag::report_error(
  std::optional<Reference> location, std::string message)
{
  return {*this, make_diagnostic(Severity::Error, std::move(location), std::move(message))};
}

DiagnosticBuilder DiagnosticBag::report_warning(
  std::optional<Reference> location, std::string message)
{
  return {*this, make_diagnostic(Severity::Warning, std::move(location), std::move(message))};
}

void DiagnosticBag::add(Diagnostic && diag) { diagnostics_.push_back(std::move(diag)); }

bool DiagnosticBag::has_errors() const
{
  return std::any_of(diagnostics_.begin(), diagnostics_.end(), [](const Diagnostic & d) {
    return d.severity == Severity::Error;
  });
}

}  // namespace oasgen
