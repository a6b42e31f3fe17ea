// envres/basic/diagnostic_printer.hpp
//
// Prints diagnostics with document, environment and field path in
// Rust-style format.
//
#pragma once

#include <iosfwd>
#include <string>
#include <string_view>

#include "envres/basic/diagnostic.hpp"

namespace envres
{

/**
 * Prints diagnostics in Rust-style format.
 *
 * Produces output like:
 *   error[E0103]: timeoutSeconds must be in 1..900 (got 901)
 *     --> deploy.json: production.resourceLimits.timeoutSeconds
 *         |
 *         = note: ValidationError
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

  /**
   * Print a single diagnostic.
   *
   * @param source_name Document name shown in the location line
   */
  void print(const Diagnostic & diag, std::string_view source_name);

  /**
   * Print all diagnostics from a DiagnosticBag, errors first.
   */
  void print_all(const DiagnosticBag & diags, std::string_view source_name);

private:
  void print_severity_header(const Diagnostic & diag);
  void print_location(const Diagnostic & diag, std::string_view source_name);
  void print_note(std::string_view message);
  void print_help(std::string_view message);

  // Gutter elements for Rust-style output
  [[nodiscard]] std::string gutter_arrow() const;
  [[nodiscard]] std::string gutter_pipe() const;

  std::ostream & os_;
  bool use_color_;
};

}  // namespace envres
