// rule_dsl/driver/rule_resolver.hpp - Per-turn rule resolution
//
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "rule_dsl/runtime/action.hpp"
#include "rule_dsl/runtime/battle.hpp"
#include "rule_dsl/runtime/evaluation_context.hpp"
#include "rule_dsl/runtime/node.hpp"

namespace rule_dsl
{

/**
 * Outcome of resolving one turn.
 *
 * On success `action` holds the decided action, or nullptr when no rule
 * applied. On failure `error` holds the evaluation error that stopped
 * resolution.
 */
struct ResolveResult
{
  ActionPtr action;
  std::optional<NodeError> error;

  [[nodiscard]] bool success() const noexcept { return !error.has_value(); }
  [[nodiscard]] bool has_action() const noexcept { return action != nullptr; }

  static ResolveResult ok(ActionPtr action)
  {
    ResolveResult r;
    r.action = std::move(action);
    return r;
  }

  static ResolveResult fail(NodeError error)
  {
    ResolveResult r;
    r.error = std::move(error);
    return r;
  }
};

/**
 * Evaluate an ordered rule list.
 *
 * - the first rule producing an Action wins; later rules are not evaluated
 * - Break moves on to the next rule
 * - an evaluation error stops resolution and is returned
 * - an empty list, or every rule breaking, yields no action
 */
class RuleResolver
{
public:
  [[nodiscard]] static ResolveResult resolve(
    const std::vector<NodePtr<ActionPtr>> & rules, EvaluationContext & ctx);
};

/**
 * A character's compiled rules.
 */
class CharacterRules
{
public:
  CharacterRules(int32_t character_id, std::vector<NodePtr<ActionPtr>> rules)
  : character_id_(character_id), rules_(std::move(rules))
  {
  }

  [[nodiscard]] int32_t character_id() const noexcept { return character_id_; }
  [[nodiscard]] const std::vector<NodePtr<ActionPtr>> & rules() const noexcept { return rules_; }
  [[nodiscard]] size_t size() const noexcept { return rules_.size(); }

  /**
   * Build an evaluation context for `battle` and resolve this turn.
   */
  [[nodiscard]] ResolveResult resolve(const BattleContext & battle, RandomSource & rng) const;

private:
  int32_t character_id_;
  std::vector<NodePtr<ActionPtr>> rules_;
};

}  // namespace rule_dsl
