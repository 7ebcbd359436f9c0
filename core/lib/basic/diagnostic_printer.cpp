// oasgen/basic/diagnostic_printer.cpp - Rust-style diagnostic output
//
// Uses fmt for formatting and rang for terminal colors.
//
#include "oasgen/basic/diagnostic_printer.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <algorithm>
#include <ostream>
#include <rang.hpp>
#include <string>
#include <vector>

namespace oasgen
{

namespace
{

const char * severity_name(Severity severity)
{
  switch (severity) {
    case Severity::Error:
      return "error";
    case Severity::Warning:
      return "warning";
  }
  return "error";
}

}  // namespace

DiagnosticPrinter::DiagnosticPrinter(std::ostream & os, bool use_color)
: os_(os), use_color_(use_color)
{
  if (!use_color_) {
    rang::setControlMode(rang::control::Off);
  }
}

void DiagnosticPrinter::print(const Diagnostic & diag)
{
  // === Header line: error[CODE]: message ===
  print_severity_header(diag);

  // === Location line: --> document#/pointer ===
  if (diag.location) {
    fmt::print(os_, "{} {}\n", gutter_arrow(), diag.location->to_string());
  }

  for (const auto & note : diag.notes) {
    print_note(note);
  }

  if (diag.help_message) {
    print_help(*diag.help_message);
  }

  // === Trailing empty line for separation ===
  fmt::print(os_, "\n");
}

void DiagnosticPrinter::print_all(const DiagnosticBag & diags)
{
  std::vector<Diagnostic> sorted_diags(diags.begin(), diags.end());

  // Keep reporting order within a document, documents in first-seen order
  std::vector<std::string> documents;
  for (const auto & d : sorted_diags) {
    const std::string doc = d.location ? d.location->document_path() : std::string();
    if (std::find(documents.begin(), documents.end(), doc) == documents.end()) {
      documents.push_back(doc);
    }
  }
  const auto rank = [&documents](const Diagnostic & d) {
    const std::string doc = d.location ? d.location->document_path() : std::string();
    return std::find(documents.begin(), documents.end(), doc) - documents.begin();
  };
  std::stable_sort(
    sorted_diags.begin(), sorted_diags.end(),
    [&rank](const Diagnostic & a, const Diagnostic & b) { return rank(a) < rank(b); });

  for (const auto & d : sorted_diags) {
    print(d);
  }
}

void DiagnosticPrinter::print_summary(const DiagnosticBag & diags)
{
  std::size_t errors = 0;
  std::size_t warnings = 0;
  for (const auto & d : diags) {
    if (d.severity == Severity::Error) {
      ++errors;
    } else if (d.severity == Severity::Warning) {
      ++warnings;
    }
  }
  fmt::print(
    os_, "{} error{}, {} warning{}\n", errors, errors == 1 ? "" : "s", warnings,
    warnings == 1 ? "" : "s");
}

// =============================================================================
// Private helpers
// =============================================================================

void DiagnosticPrinter::print_severity_header(const Diagnostic & diag)
{
  if (use_color_) {
    os_ << rang::style::bold;
    switch (diag.severity) {
      case Severity::Error:
        os_ << rang::fg::red;
        break;
      case Severity::Warning:
        os_ << rang::fg::yellow;
        break;
    }
    os_ << severity_name(diag.severity);
    if (!diag.code.empty()) {
      os_ << "[" << diag.code << "]";
    }
    os_ << rang::fg::reset << ": " << diag.message << rang::style::reset << "\n";
  } else if (!diag.code.empty()) {
    fmt::print(os_, "{}[{}]: {}\n", severity_name(diag.severity), diag.code, diag.message);
  } else {
    fmt::print(os_, "{}: {}\n", severity_name(diag.severity), diag.message);
  }
}

void DiagnosticPrinter::print_help(std::string_view message)
{
  fmt::print(os_, "{}\n", gutter_pipe());

  if (use_color_) {
    os_ << rang::fg::cyan << rang::style::bold << "   = " << rang::style::reset << rang::fg::reset;
    fmt::print(os_, "help: {}\n", message);
  } else {
    fmt::print(os_, "   = help: {}\n", message);
  }
}

void DiagnosticPrinter::print_note(std::string_view message)
{
  fmt::print(os_, "{}\n", gutter_pipe());

  if (use_color_) {
    os_ << rang::fg::cyan << rang::style::bold << "   = " << rang::style::reset << rang::fg::reset;
    fmt::print(os_, "note: {}\n", message);
  } else {
    fmt::print(os_, "   = note: {}\n", message);
  }
}

// =============================================================================
// Gutter helpers (Rust-style)
// =============================================================================

std::string DiagnosticPrinter::gutter_arrow() const
{
  if (use_color_) {
    return fmt::format("{}{} -->{}", "\033[1;36m", " ", "\033[0m");
  }
  return "  -->";
}

std::string DiagnosticPrinter::gutter_pipe() const
{
  if (use_color_) {
    return fmt::format("{}      |{}", "\033[1;36m", "\033[0m");
  }
  return "      |";
}

}  // namespace oasgen
