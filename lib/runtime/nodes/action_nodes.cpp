// rule_dsl/runtime/nodes/action_nodes.cpp - Action-producing nodes
//
#include "rule_dsl/runtime/nodes/action_nodes.hpp"

#include "rule_dsl/runtime/evaluation_context.hpp"

namespace rule_dsl
{

NodeResult<ActionPtr> StrikeNode::evaluate(EvaluationContext & ctx) const
{
  if (!ctx.acting_character().is_alive()) {
    return NodeError::brk();
  }

  auto target = target_->evaluate(ctx);
  if (!target) {
    return std::move(target).take_error();
  }
  return ActionPtr(std::make_unique<StrikeAction>(target.value().id));
}

NodeResult<ActionPtr> HealNode::evaluate(EvaluationContext & ctx) const
{
  const Character & acting = ctx.acting_character();
  if (!acting.is_alive() || acting.mp < k_heal_mp_cost) {
    return NodeError::brk();
  }

  auto target = target_->evaluate(ctx);
  if (!target) {
    return std::move(target).take_error();
  }
  return ActionPtr(std::make_unique<HealAction>(target.value().id));
}

NodeResult<ActionPtr> CheckNode::evaluate(EvaluationContext & ctx) const
{
  auto condition = condition_->evaluate(ctx);
  if (!condition) {
    return std::move(condition).take_error();
  }
  if (!condition.value()) {
    return NodeError::brk();
  }
  return then_action_->evaluate(ctx);
}

}  // namespace rule_dsl
