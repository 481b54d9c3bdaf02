// rule_dsl/driver/compiler.hpp - Rule compiler driver
//
// Single entry point for the check + codegen pipeline.
// Used by the CLI and by tests.
//
#pragma once

#include <optional>
#include <string>
#include <vector>

#include "rule_dsl/ast/token.hpp"
#include "rule_dsl/basic/diagnostic.hpp"
#include "rule_dsl/codegen/converter_registry.hpp"
#include "rule_dsl/runtime/action.hpp"
#include "rule_dsl/runtime/node.hpp"
#include "rule_dsl/sema/compile_error.hpp"
#include "rule_dsl/sema/resolution/token_registry.hpp"
#include "rule_dsl/sema/types/trait_registry.hpp"
#include "rule_dsl/sema/types/type.hpp"
#include "rule_dsl/sema/types/type_checker.hpp"

namespace rule_dsl
{

// ============================================================================
// Compile Options
// ============================================================================

struct CompileOptions
{
  /// Dump the typed AST of each rule to stderr before code generation
  bool debug = false;
};

// ============================================================================
// Compile Result
// ============================================================================

struct CompileResult
{
  /// Whether compilation succeeded (no errors)
  bool success = false;

  /// Collected diagnostics (one error per failed rule)
  DiagnosticBag diagnostics;

  /// The failure, if any
  std::optional<CompileError> error;

  /// Compiled rule (only populated on success)
  NodePtr<ActionPtr> node;
};

/**
 * Result of compiling a batch of rules.
 */
struct BatchCompileResult
{
  bool success = false;
  DiagnosticBag diagnostics;

  /// One entry per failed rule, in input order
  std::vector<CompileError> errors;

  /// Compiled rules, in input order, failed rules omitted
  std::vector<NodePtr<ActionPtr>> rules;
};

// ============================================================================
// Compiler
// ============================================================================

/**
 * Owns the type context, the registries and the converters, and runs
 * checking and code generation for rules.
 *
 * The pipeline for one rule:
 * 1. TypeChecker::check against Action
 * 2. ConverterRegistry::convert<ActionPtr>
 */
class RuleCompiler
{
public:
  explicit RuleCompiler(CompileOptions options = {});

  RuleCompiler(const RuleCompiler &) = delete;
  RuleCompiler & operator=(const RuleCompiler &) = delete;

  /**
   * Type check a rule against Action without generating code.
   */
  [[nodiscard]] CheckResult check(const Token * root);

  /**
   * Check and compile one rule.
   */
  [[nodiscard]] CompileResult compile(const Token * root);

  /**
   * Compile every rule, collecting one error per failed rule instead of
   * stopping at the first.
   */
  [[nodiscard]] BatchCompileResult compile_many(const std::vector<const Token *> & roots);

  [[nodiscard]] TypeContext & types() noexcept { return types_; }
  [[nodiscard]] const TokenRegistry & tokens() const noexcept { return tokens_; }
  [[nodiscard]] const TraitRegistry & traits() const noexcept { return traits_; }
  [[nodiscard]] const ConverterRegistry & converters() const noexcept { return converters_; }

private:
  CompileOptions options_;
  TypeContext types_;
  TraitRegistry traits_;
  TokenRegistry tokens_;
  ConverterRegistry converters_;
  TypeChecker checker_;
};

/**
 * Render a typed AST with one node per line, e.g. `Strike: Action`.
 */
[[nodiscard]] std::string dump_typed_ast(const TypedAst & ast);

}  // namespace rule_dsl
