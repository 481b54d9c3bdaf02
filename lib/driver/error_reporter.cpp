// rule_dsl/driver/error_reporter.cpp - Human-readable compile error reports
//
#include "rule_dsl/driver/error_reporter.hpp"

#include <fmt/core.h>

#include "rule_dsl/ast/token_dumper.hpp"

namespace rule_dsl
{

namespace
{

std::string indent_lines(const std::string & text, size_t indent)
{
  std::string out(indent, ' ');
  for (char c : text) {
    out += c;
    if (c == '\n') {
      out.append(indent, ' ');
    }
  }
  return out;
}

}  // namespace

std::string ErrorReporter::suggestion(const CompileError & err) const
{
  switch (err.kind()) {
    case CompileErrorKind::TypeMismatch:
      return fmt::format(
        "The {} expects a value of type '{}', but the provided token has type '{}'.\n"
        "  Use a token whose output type matches.",
        err.context(), err.expected(), err.actual());

    case CompileErrorKind::UndefinedToken: {
      std::string names;
      for (const auto & name : tokens_.token_names()) {
        if (!names.empty()) names += ", ";
        names += name;
      }
      return fmt::format(
        "The token '{}' is not recognized. Available tokens: {}, {}", err.subject(), names,
        k_element_token);
    }

    case CompileErrorKind::ArgumentCountMismatch:
      return fmt::format(
        "The token '{}' takes {} argument(s), but {} were provided.", err.subject(),
        err.expected(), err.actual());

    case CompileErrorKind::MissingField:
      return fmt::format(
        "The token '{}' is missing the required field '{}'. Add it with a suitable value.",
        err.subject(), err.detail());

    default:
      return err.suggestion();
  }
}

std::string ErrorReporter::format_error(const CompileError & err) const
{
  std::string out;
  out += "Compilation Error\n";
  out += "=================\n\n";
  out += fmt::format("Error: {}\n", err.message());

  if (!err.path().empty()) {
    out += fmt::format("\nLocation: {}\n", err.location());
  }

  if (err.token() != nullptr) {
    out += fmt::format("\nToken:\n{}\n", indent_lines(dump_token(err.token()), 2));
  }

  out += fmt::format("\nSuggestion:\n{}\n", suggestion(err));
  return out;
}

std::string ErrorReporter::format_errors(const std::vector<CompileError> & errs) const
{
  std::string out = fmt::format("Found {} compilation error(s):\n\n", errs.size());
  for (size_t i = 0; i < errs.size(); ++i) {
    if (i > 0) {
      out += "\n---\n\n";
    }
    out += format_error(errs[i]);
  }
  return out;
}

std::string ErrorReporter::format_error_oneline(const CompileError & err) const
{
  if (err.path().empty()) {
    return err.message();
  }
  return fmt::format("{} at {}", err.message(), err.location());
}

Diagnostic ErrorReporter::to_diagnostic(const CompileError & err) const
{
  Diagnostic d = err.to_diagnostic();
  d.help_message = suggestion(err);
  return d;
}

}  // namespace rule_dsl
