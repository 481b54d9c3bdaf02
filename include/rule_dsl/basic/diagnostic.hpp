// rule_dsl/basic/diagnostic.hpp - Diagnostic types for checking/codegen
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace rule_dsl
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
  Info,
  Hint,
};

enum class LabelStyle {
  Primary,    // direct cause
  Secondary,  // related information
};

/**
 * A note attached to a location in a token tree.
 *
 * Token trees have no source text, so the location is the breadcrumb of
 * enclosing (token, argument) pairs, e.g. "Strike.target -> RandomPick.array".
 * An empty location means the rule root.
 */
struct Label
{
  std::string location;
  std::string message;
  LabelStyle style = LabelStyle::Primary;
};

struct Diagnostic
{
  Severity severity = Severity::Error;
  std::string code;     // e.g., "E003"
  std::string message;  // main message

  std::vector<Label> labels;
  std::optional<std::string> help_message;

  /// Optional multi-line excerpt of the offending token tree
  std::optional<std::string> snippet;

  [[nodiscard]] const Label * primary_label() const noexcept;
  [[nodiscard]] std::string primary_location() const;
};

// ============================================================================
// Forward Declarations
// ============================================================================

class DiagnosticBag;

// ============================================================================
// DiagnosticBuilder
// ============================================================================

/**
 * Builds a diagnostic through a fluent interface and registers it with the
 * bag when the builder is destroyed (RAII).
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

  DiagnosticBuilder & with_label(
    std::string location, std::string msg, LabelStyle style = LabelStyle::Primary);

  DiagnosticBuilder & with_secondary_label(std::string location, std::string msg);

  DiagnosticBuilder & with_help(std::string help_msg);

  DiagnosticBuilder & with_snippet(std::string snippet);

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
  DiagnosticBuilder report_error(
    std::string location, std::string message, std::string label_message = "");
  DiagnosticBuilder report_warning(
    std::string location, std::string message, std::string label_message = "");
  DiagnosticBuilder report_info(
    std::string location, std::string message, std::string label_message = "");

  // Add
  void add(Diagnostic && diag);
  void add(const Diagnostic & diag);

  // Accessors
  [[nodiscard]] const std::vector<Diagnostic> & all() const { return diagnostics_; }
  [[nodiscard]] bool empty() const { return diagnostics_.empty(); }
  [[nodiscard]] size_t size() const { return diagnostics_.size(); }

  [[nodiscard]] std::vector<Diagnostic> errors() const;
  [[nodiscard]] std::vector<Diagnostic> warnings() const;
  [[nodiscard]] bool has_errors() const;
  [[nodiscard]] bool has_warnings() const;

  // Utilities
  void merge(DiagnosticBag && other);
  void merge(const DiagnosticBag & other);

  [[nodiscard]] auto begin() const { return diagnostics_.begin(); }
  [[nodiscard]] auto end() const { return diagnostics_.end(); }

private:
  DiagnosticBuilder report(
    Severity severity, std::string location, std::string message, std::string label_message);

  std::vector<Diagnostic> diagnostics_;
};

}  // namespace rule_dsl
