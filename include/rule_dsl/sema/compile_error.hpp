// rule_dsl/sema/compile_error.hpp - Compile-time error values
//
// Every failure of checking or code generation is returned as a
// CompileError value. Errors carry the path of enclosing
// (token kind, argument name) pairs and optionally the offending token.
//
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "rule_dsl/ast/token.hpp"
#include "rule_dsl/basic/diagnostic.hpp"
#include "rule_dsl/sema/types/type.hpp"

namespace rule_dsl
{

// ============================================================================
// Error Kind
// ============================================================================

enum class CompileErrorKind : uint8_t {
  // Checking
  TypeMismatch,
  UndefinedToken,
  MissingField,
  UnresolvedType,
  InfiniteType,
  CyclicReference,
  TraitBoundError,
  ArgumentCountMismatch,

  // Code generation
  NoConverter,
  MissingChild,
  ChildTypeMismatch,
};

/**
 * One step of an error path: the argument `argument` of a `token_type` token.
 */
struct PathSegment
{
  std::string token_type;
  std::string argument;

  [[nodiscard]] std::string to_string() const { return token_type + "." + argument; }
};

// ============================================================================
// CompileError
// ============================================================================

class CompileError
{
public:
  // ===========================================================================
  // Factories
  // ===========================================================================

  static CompileError type_mismatch(const Type * expected, const Type * actual);
  static CompileError undefined_token(std::string_view token_type);
  static CompileError missing_field(std::string_view token_type, std::string_view field);
  static CompileError unresolved_type(std::string context);
  static CompileError infinite_type(const Type * var, const Type * type);
  static CompileError cyclic_reference(std::string_view token_type, std::string cycle);
  static CompileError trait_bound(
    const Type * type, std::string_view trait_name, std::vector<std::string> available_traits);
  static CompileError argument_count(
    std::string_view token_type, size_t expected, size_t actual);
  static CompileError no_converter(std::string_view token_type, std::string target_type);
  static CompileError missing_child(std::string_view token_type, std::string_view child);
  static CompileError child_type_mismatch(
    std::string_view token_type, std::string expected, std::string actual);

  // ===========================================================================
  // Context
  // ===========================================================================

  /// Attach the offending token (kept if one is already attached)
  CompileError & with_token(const Token * token);

  /// Replace the path
  CompileError & with_path(std::vector<PathSegment> path);

  /// Add an enclosing segment in front of the current path
  CompileError & prepend_path(PathSegment segment);

  // ===========================================================================
  // Accessors
  // ===========================================================================

  [[nodiscard]] CompileErrorKind kind() const noexcept { return kind_; }
  [[nodiscard]] const std::vector<PathSegment> & path() const noexcept { return path_; }
  [[nodiscard]] const Token * token() const noexcept { return token_; }

  /// Token kind, field or context the error is about
  [[nodiscard]] const std::string & subject() const noexcept { return subject_; }
  [[nodiscard]] const std::string & detail() const noexcept { return detail_; }
  [[nodiscard]] const std::string & expected() const noexcept { return expected_; }
  [[nodiscard]] const std::string & actual() const noexcept { return actual_; }
  [[nodiscard]] const std::vector<std::string> & available_traits() const noexcept
  {
    return available_traits_;
  }

  [[nodiscard]] bool is_codegen_error() const noexcept
  {
    return kind_ == CompileErrorKind::NoConverter || kind_ == CompileErrorKind::MissingChild ||
           kind_ == CompileErrorKind::ChildTypeMismatch;
  }

  /// Path rendered as "A.arg -> B.arg" (empty for the rule root)
  [[nodiscard]] std::string location() const;

  /// Innermost path segment as "Token.arg", or "rule root"
  [[nodiscard]] std::string context() const;

  /// Main error line, e.g. "Type mismatch in Strike.target: expected Character, but got i32"
  [[nodiscard]] std::string message() const;

  /// Stable diagnostic code ("E001".."E011")
  [[nodiscard]] const char * code() const noexcept;

  /// Kind-specific hint for the rule author
  [[nodiscard]] std::string suggestion() const;

  /**
   * Convert to a Diagnostic for DiagnosticBag / DiagnosticPrinter.
   *
   * The primary label sits at location(); the offending token, if any,
   * becomes the snippet.
   */
  [[nodiscard]] Diagnostic to_diagnostic() const;

private:
  explicit CompileError(CompileErrorKind kind) : kind_(kind) {}

  CompileErrorKind kind_;
  std::string subject_;
  std::string detail_;
  std::string expected_;
  std::string actual_;
  std::vector<std::string> available_traits_;
  std::vector<PathSegment> path_;
  const Token * token_ = nullptr;
};

/// Display name of an error kind (e.g. "TypeMismatch")
[[nodiscard]] const char * to_string(CompileErrorKind kind) noexcept;

}  // namespace rule_dsl
