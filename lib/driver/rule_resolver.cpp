// rule_dsl/driver/rule_resolver.cpp - Per-turn rule resolution
//
#include "rule_dsl/driver/rule_resolver.hpp"

namespace rule_dsl
{

ResolveResult RuleResolver::resolve(
  const std::vector<NodePtr<ActionPtr>> & rules, EvaluationContext & ctx)
{
  for (const auto & rule : rules) {
    NodeResult<ActionPtr> result = rule->evaluate(ctx);
    if (result) {
      return ResolveResult::ok(std::move(result).value());
    }
    if (result.error().is_break()) {
      continue;
    }
    return ResolveResult::fail(std::move(result).take_error());
  }
  return ResolveResult::ok(nullptr);
}

ResolveResult CharacterRules::resolve(const BattleContext & battle, RandomSource & rng) const
{
  EvaluationContext ctx(battle, rng);
  return RuleResolver::resolve(rules_, ctx);
}

}  // namespace rule_dsl
