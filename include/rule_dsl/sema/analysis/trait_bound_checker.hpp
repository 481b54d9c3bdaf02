// rule_dsl/sema/analysis/trait_bound_checker.hpp - Post-solve trait bound pass
//
// Trait obligations are collected while inferring (generic bounds, Numeric
// operands whose type is still a variable) and discharged once the
// substitution is final.
//
#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "rule_dsl/sema/compile_error.hpp"
#include "rule_dsl/sema/types/trait_registry.hpp"
#include "rule_dsl/sema/types/unifier.hpp"

namespace rule_dsl
{

/**
 * "`type` must implement `trait`", recorded at `path`.
 */
struct TraitObligation
{
  const Type * type = nullptr;
  std::string trait;
  std::vector<PathSegment> path;
  const Token * token = nullptr;
};

class TraitBoundChecker
{
public:
  explicit TraitBoundChecker(const TraitRegistry & traits) : traits_(traits) {}

  void reset() { obligations_.clear(); }

  void add_obligation(TraitObligation obligation)
  {
    obligations_.push_back(std::move(obligation));
  }

  /**
   * Check whether an obligation for `trait` resolves to the unbound
   * variable `var` under the current substitution.
   */
  [[nodiscard]] bool has_bound(Unifier & unifier, const Type * var, std::string_view trait) const;

  /**
   * Discharge every obligation in recording order.
   *
   * @param unifier Supplies the final substitution
   * @return The first TraitBoundError, or std::nullopt
   */
  [[nodiscard]] std::optional<CompileError> check(Unifier & unifier) const;

  [[nodiscard]] size_t size() const noexcept { return obligations_.size(); }

private:
  const TraitRegistry & traits_;
  std::vector<TraitObligation> obligations_;
};

}  // namespace rule_dsl
