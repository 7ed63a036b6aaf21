// docschema/basic/diagnostic_printer.hpp
//
// Prints diagnostics with their origin (input file) and the dotted location
// inside the query or document.
//
#pragma once

#include <iosfwd>
#include <string>
#include <string_view>

#include "docschema/basic/diagnostic.hpp"

namespace docschema
{

/**
 * Prints diagnostics in a compact Rust-like format.
 *
 * Produces output like:
 *   error[Q013]: Type mismatch for field 'age': Query uses type 'string', ...
 *     --> query.json @ age
 *         |
 *      = help: ...
 *
 * Info diagnostics are printed as "note".
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
   * @param origin Input the diagnostic refers to (file name), may be empty
   */
  void print(const Diagnostic & diag, std::string_view origin = {});

  /// Print all diagnostics in emission order
  void print_all(const DiagnosticBag & diags, std::string_view origin = {});

  /// Print a one-line summary ("2 errors, 1 warning")
  void print_summary(const DiagnosticBag & diags);

private:
  /// Gutter markers ("-->", "|", "=") are bold cyan when colour is on
  void gutter(std::string_view text);

  std::ostream & os_;
  bool use_color_;
};

}  // namespace docschema
