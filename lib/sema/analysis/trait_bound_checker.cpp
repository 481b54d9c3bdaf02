// rule_dsl/sema/analysis/trait_bound_checker.cpp - Post-solve trait bound pass

#include "rule_dsl/sema/analysis/trait_bound_checker.hpp"

namespace rule_dsl
{

bool TraitBoundChecker::has_bound(
  Unifier & unifier, const Type * var, std::string_view trait) const
{
  for (const auto & o : obligations_) {
    if (o.trait == trait && unifier.apply(o.type) == var) {
      return true;
    }
  }
  return false;
}

std::optional<CompileError> TraitBoundChecker::check(Unifier & unifier) const
{
  for (const auto & o : obligations_) {
    const Type * resolved = unifier.apply(o.type);
    if (auto err = traits_.check_bound(resolved, o.trait)) {
      err->with_path(o.path).with_token(o.token);
      return err;
    }
  }
  return std::nullopt;
}

}  // namespace rule_dsl
