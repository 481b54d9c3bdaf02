// rule_dsl/sema/types/type_checker.hpp - Unification-based token checker
//
// Turns a raw token tree into a TypedAst. Token signatures are the fact
// base; generic parameters are instantiated per use, argument types are
// collected as deferred constraints, and trait bounds are discharged after
// the substitution is final.
//
#pragma once

#include <optional>
#include <vector>

#include "rule_dsl/ast/token.hpp"
#include "rule_dsl/sema/analysis/trait_bound_checker.hpp"
#include "rule_dsl/sema/compile_error.hpp"
#include "rule_dsl/sema/resolution/token_registry.hpp"
#include "rule_dsl/sema/types/trait_registry.hpp"
#include "rule_dsl/sema/types/type.hpp"
#include "rule_dsl/sema/types/typed_ast.hpp"
#include "rule_dsl/sema/types/unifier.hpp"

namespace rule_dsl
{

/**
 * Outcome of checking one rule.
 */
struct CheckResult
{
  TypedAstPtr ast;
  std::optional<CompileError> error;

  [[nodiscard]] bool success() const noexcept { return !error.has_value(); }

  static CheckResult ok(TypedAstPtr ast)
  {
    CheckResult r;
    r.ast = std::move(ast);
    return r;
  }

  static CheckResult fail(CompileError err)
  {
    CheckResult r;
    r.error = std::move(err);
    return r;
  }
};

/**
 * Type checker for token trees.
 *
 * ## Pipeline
 *
 * 1. Cycle check of the token graph
 * 2. Reset of the unifier and the trait obligations
 * 3. Inference of the root
 * 4. Solving of the remaining constraints
 * 5. Finalization: the substitution is applied to every node; a variable
 *    still unbound becomes Numeric if it carries a Numeric bound
 * 6. Trait bound pass
 * 7. Compatibility of the root with the requested type
 *
 * ## Element context
 *
 * Arguments with an `element_source` (FilterList.condition, Map.transform)
 * are checked with the element type of their source pushed on a stack.
 * `Element` takes the type at the top of that stack.
 *
 * ## Usage
 * ```cpp
 * TypeChecker checker(types, tokens, traits);
 * CheckResult r = checker.check(root, types.action_type());
 * if (!r.success()) report(*r.error);
 * ```
 */
class TypeChecker
{
public:
  TypeChecker(TypeContext & types, const TokenRegistry & tokens, const TraitRegistry & traits);

  /**
   * Check a rule.
   *
   * @param root Root token of the rule
   * @param expected Requested root type, or nullptr for any
   */
  [[nodiscard]] CheckResult check(const Token * root, const Type * expected = nullptr);

private:
  [[nodiscard]] CheckResult infer(const Token * token);
  [[nodiscard]] CheckResult infer_element(const Token * token);

  [[nodiscard]] std::optional<CompileError> constrain_argument(
    const Type * expected, const Type * actual, const Token * child);

  [[nodiscard]] std::optional<CompileError> finalize(TypedAst & node);

  [[nodiscard]] CompileError at_current_path(CompileError err, const Token * token) const;

  TypeContext & types_;
  const TokenRegistry & tokens_;
  Unifier unifier_;
  TraitBoundChecker bounds_;

  std::vector<PathSegment> path_;
  std::vector<const Type *> element_stack_;
};

}  // namespace rule_dsl
