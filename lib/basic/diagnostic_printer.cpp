// rule_dsl/basic/diagnostic_printer.cpp - Rust-style diagnostic output
//
// Uses fmt for formatting and rang for terminal colors.
//
#include "rule_dsl/basic/diagnostic_printer.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <algorithm>
#include <iterator>
#include <ostream>
#include <rang.hpp>
#include <string>
#include <vector>

namespace rule_dsl
{

namespace
{

std::vector<std::string_view> split_lines(std::string_view text)
{
  std::vector<std::string_view> lines;
  size_t start = 0;
  while (start <= text.size()) {
    const size_t nl = text.find('\n', start);
    if (nl == std::string_view::npos) {
      if (start < text.size()) {
        lines.push_back(text.substr(start));
      }
      break;
    }
    lines.push_back(text.substr(start, nl - start));
    start = nl + 1;
  }
  return lines;
}

int severity_rank(Severity s)
{
  switch (s) {
    case Severity::Error:
      return 0;
    case Severity::Warning:
      return 1;
    case Severity::Info:
      return 2;
    case Severity::Hint:
      return 3;
  }
  return 4;
}

}  // namespace

DiagnosticPrinter::DiagnosticPrinter(std::ostream & os, bool use_color)
: os_(os), use_color_(use_color)
{
  if (!use_color_) {
    rang::setControlMode(rang::control::Off);
  }
}

void DiagnosticPrinter::print(const Diagnostic & diag, std::string_view origin)
{
  // === Header line: error[CODE]: message ===
  print_severity_header(diag);

  // === Location line: --> origin: Token.arg -> Token.arg ===
  print_location(diag, origin);

  fmt::print(os_, "{}\n", gutter_pipe());

  // === Token excerpt with the primary label underneath ===
  if (diag.snippet) {
    print_snippet(*diag.snippet, diag.primary_label());
  }

  for (const auto & label : diag.labels) {
    if (label.style == LabelStyle::Secondary) {
      print_secondary_label(label);
    }
  }

  if (diag.help_message) {
    print_help(*diag.help_message);
  }

  fmt::print(os_, "\n");
}

void DiagnosticPrinter::print_all(const DiagnosticBag & diags, std::string_view origin)
{
  std::vector<Diagnostic> sorted_diags;
  sorted_diags.reserve(diags.size());
  std::copy(diags.begin(), diags.end(), std::back_inserter(sorted_diags));

  std::stable_sort(
    sorted_diags.begin(), sorted_diags.end(), [](const Diagnostic & a, const Diagnostic & b) {
      return severity_rank(a.severity) < severity_rank(b.severity);
    });

  for (const auto & d : sorted_diags) {
    print(d, origin);
  }
}

// =============================================================================
// Private helpers
// =============================================================================

void DiagnosticPrinter::print_severity_header(const Diagnostic & diag)
{
  const char * severity_str = "error";
  switch (diag.severity) {
    case Severity::Error:
      severity_str = "error";
      break;
    case Severity::Warning:
      severity_str = "warning";
      break;
    case Severity::Info:
      severity_str = "info";
      break;
    case Severity::Hint:
      severity_str = "hint";
      break;
  }

  if (use_color_) {
    os_ << rang::style::bold;
    switch (diag.severity) {
      case Severity::Error:
        os_ << rang::fg::red;
        break;
      case Severity::Warning:
        os_ << rang::fg::yellow;
        break;
      case Severity::Info:
        os_ << rang::fg::cyan;
        break;
      case Severity::Hint:
        os_ << rang::fg::green;
        break;
    }
    os_ << severity_str;
    if (!diag.code.empty()) {
      os_ << "[" << diag.code << "]";
    }
    os_ << rang::fg::reset << ": " << diag.message << rang::style::reset << "\n";
    return;
  }

  if (!diag.code.empty()) {
    fmt::print(os_, "{}[{}]: {}\n", severity_str, diag.code, diag.message);
  } else {
    fmt::print(os_, "{}: {}\n", severity_str, diag.message);
  }
}

void DiagnosticPrinter::print_location(const Diagnostic & diag, std::string_view origin)
{
  std::string location = diag.primary_location();
  if (location.empty()) {
    location = "<rule root>";
  }

  if (origin.empty()) {
    fmt::print(os_, "{} {}\n", gutter_arrow(), location);
  } else {
    fmt::print(os_, "{} {}: {}\n", gutter_arrow(), origin, location);
  }
}

void DiagnosticPrinter::print_snippet(std::string_view snippet, const Label * label)
{
  const auto lines = split_lines(snippet);
  if (lines.empty()) {
    return;
  }

  for (const auto line : lines) {
    fmt::print(os_, "{} {}\n", gutter_pipe(), line);
  }

  // Underline the first line of the excerpt, which is the offending token's head.
  const size_t marker_len = std::max<size_t>(lines.front().size(), 1);
  fmt::print(os_, "{} ", gutter_pipe());
  if (use_color_) {
    os_ << rang::fg::red << rang::style::bold;
  }
  fmt::print(os_, "{}", std::string(marker_len, '^'));
  if (label != nullptr && !label->message.empty()) {
    fmt::print(os_, " {}", label->message);
  }
  if (use_color_) {
    os_ << rang::style::reset << rang::fg::reset;
  }
  fmt::print(os_, "\n");
}

void DiagnosticPrinter::print_secondary_label(const Label & label)
{
  fmt::print(os_, "{}\n", gutter_pipe());
  if (use_color_) {
    os_ << rang::fg::cyan << rang::style::bold << "   = " << rang::style::reset << rang::fg::reset;
    fmt::print(os_, "note: {} ({})\n", label.message, label.location);
  } else {
    fmt::print(os_, "   = note: {} ({})\n", label.message, label.location);
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

}  // namespace rule_dsl
