// rule_dsl/sema/analysis/token_cycle_checker.hpp - Token graph cycle detection
//
// Token trees built by hand may share or loop back to a token. Sharing is
// allowed; a token reachable from itself is rejected before inference so
// that no later pass can recurse forever.
//
#pragma once

#include <optional>

#include "rule_dsl/ast/token.hpp"
#include "rule_dsl/sema/compile_error.hpp"

namespace rule_dsl
{

/**
 * Detect cycles in the token graph rooted at one rule.
 */
class TokenCycleChecker
{
public:
  TokenCycleChecker() = default;

  /**
   * Check the graph reachable from `root`.
   *
   * @return A CyclicReference error for the first back edge found, or
   *         std::nullopt if the graph is acyclic
   */
  [[nodiscard]] std::optional<CompileError> check(const Token * root);
};

}  // namespace rule_dsl
