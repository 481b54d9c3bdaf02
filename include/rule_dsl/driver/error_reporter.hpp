// rule_dsl/driver/error_reporter.hpp - Human-readable compile error reports
//
#pragma once

#include <string>
#include <vector>

#include "rule_dsl/basic/diagnostic.hpp"
#include "rule_dsl/sema/compile_error.hpp"
#include "rule_dsl/sema/resolution/token_registry.hpp"

namespace rule_dsl
{

/**
 * Renders CompileErrors for rule authors.
 *
 * A report looks like:
 *
 *   Compilation Error
 *   =================
 *
 *   Error: Type mismatch in Strike.target: expected Character, but got i32
 *
 *   Location: Strike.target
 *
 *   Token:
 *     Number { value: 5 }
 *
 *   Suggestion:
 *   ...
 */
class ErrorReporter
{
public:
  explicit ErrorReporter(const TokenRegistry & tokens) : tokens_(tokens) {}

  [[nodiscard]] std::string format_error(const CompileError & err) const;

  /// "Found N compilation error(s):" followed by the reports separated by "---"
  [[nodiscard]] std::string format_errors(const std::vector<CompileError> & errs) const;

  /// "<message>" or "<message> at <location>"
  [[nodiscard]] std::string format_error_oneline(const CompileError & err) const;

  /// Kind-specific hint; undefined tokens list the registered kinds
  [[nodiscard]] std::string suggestion(const CompileError & err) const;

  /// Diagnostic carrying suggestion() as its help text
  [[nodiscard]] Diagnostic to_diagnostic(const CompileError & err) const;

private:
  const TokenRegistry & tokens_;
};

}  // namespace rule_dsl
