// oasgen/basic/diagnostic_printer.hpp
//
// Prints diagnostics with their document coordinate in Rust-style format.
//
#pragma once

#include <iosfwd>
#include <string>
#include <string_view>

#include "oasgen/basic/diagnostic.hpp"

namespace oasgen
{

/**
 * Prints diagnostics in Rust-style format.
 *
 * Produces output like:
 *   error[E102]: reference not found: components.yaml#/schemas/Pet
 *     --> api.yaml#/paths/pets/get/responses/200/schema
 *      |
 *      = note: while following "$ref": "components.yaml#/schemas/Pet"
 */
class DiagnosticPrinter
{
public:
  /**
   * Create a diagnostic printer.
   *
   * @param os Output stream (typically std::cerr)
   * @param use_color Whether to use terminal colors
   */
  explicit DiagnosticPrinter(std::ostream & os, bool use_color = true);

  void print(const Diagnostic & diag);

  /// Print every diagnostic, grouped by document in first-seen order
  void print_all(const DiagnosticBag & diags);

  /// "N error(s), M warning(s)" line
  void print_summary(const DiagnosticBag & diags);

private:
  void print_severity_header(const Diagnostic & diag);
  void print_help(std::string_view message);
  void print_note(std::string_view message);

  [[nodiscard]] std::string gutter_arrow() const;
  [[nodiscard]] std::string gutter_pipe() const;

  std::ostream & os_;
  bool use_color_;
};

}  // namespace oasgen
