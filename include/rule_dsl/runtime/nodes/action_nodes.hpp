// rule_dsl/runtime/nodes/action_nodes.hpp - Action-producing nodes
//
#pragma once

#include "rule_dsl/runtime/action.hpp"
#include "rule_dsl/runtime/battle.hpp"
#include "rule_dsl/runtime/node.hpp"

namespace rule_dsl
{

/**
 * Strike the target. Breaks when the acting character is dead; the target
 * is only evaluated once the guard passes.
 */
class StrikeNode : public Node<ActionPtr>
{
public:
  explicit StrikeNode(NodePtr<Character> target) : target_(std::move(target)) {}

  NodeResult<ActionPtr> evaluate(EvaluationContext & ctx) const override;

private:
  NodePtr<Character> target_;
};

/**
 * Heal the target. Breaks unless the acting character is alive and has at
 * least k_heal_mp_cost MP.
 */
class HealNode : public Node<ActionPtr>
{
public:
  explicit HealNode(NodePtr<Character> target) : target_(std::move(target)) {}

  NodeResult<ActionPtr> evaluate(EvaluationContext & ctx) const override;

private:
  NodePtr<Character> target_;
};

/**
 * Evaluate `then_action` if the condition holds, otherwise Break.
 */
class CheckNode : public Node<ActionPtr>
{
public:
  CheckNode(NodePtr<bool> condition, NodePtr<ActionPtr> then_action)
  : condition_(std::move(condition)), then_action_(std::move(then_action))
  {
  }

  NodeResult<ActionPtr> evaluate(EvaluationContext & ctx) const override;

private:
  NodePtr<bool> condition_;
  NodePtr<ActionPtr> then_action_;
};

}  // namespace rule_dsl
