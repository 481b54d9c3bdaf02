// rule_dsl/basic/diagnostic_printer.hpp
//
// Prints diagnostics with their token-path location and an excerpt of
// the offending token tree in Rust-style format.
//
#pragma once

#include <iosfwd>
#include <string>
#include <string_view>

#include "rule_dsl/basic/diagnostic.hpp"

namespace rule_dsl
{

/**
 * Prints diagnostics in Rust-style format.
 *
 * Produces output like:
 *   error[E001]: type mismatch: expected Character, found i32
 *     --> rules.json#2: Strike.target
 *      |
 *      | Number { value: 5 }
 *      | ^^^^^^^^^^^^^^^^^^^ expected Character
 *      |
 *      = help: use a token that produces Character
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
   * @param diag The diagnostic to print
   * @param origin Name of the rule source (file and rule index), may be empty
   */
  void print(const Diagnostic & diag, std::string_view origin = {});

  /**
   * Print all diagnostics from a DiagnosticBag, errors first.
   */
  void print_all(const DiagnosticBag & diags, std::string_view origin = {});

private:
  void print_severity_header(const Diagnostic & diag);
  void print_location(const Diagnostic & diag, std::string_view origin);
  void print_snippet(std::string_view snippet, const Label * label);
  void print_secondary_label(const Label & label);
  void print_help(std::string_view message);

  // Gutter elements for Rust-style output
  [[nodiscard]] std::string gutter_arrow() const;
  [[nodiscard]] std::string gutter_pipe() const;

  std::ostream & os_;
  bool use_color_;
};

}  // namespace rule_dsl
