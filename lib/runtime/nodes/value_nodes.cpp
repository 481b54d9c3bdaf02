// rule_dsl/runtime/nodes/value_nodes.cpp - Scalar value nodes
//
#include "rule_dsl/runtime/nodes/value_nodes.hpp"

#include <fmt/core.h>

namespace rule_dsl
{

NodeResult<Character> ActingCharacterNode::evaluate(EvaluationContext & ctx) const
{
  return ctx.acting_character();
}

NodeResult<CharacterHP> CharacterToHpNode::evaluate(EvaluationContext & ctx) const
{
  auto character = character_->evaluate(ctx);
  if (!character) {
    return std::move(character).take_error();
  }
  return CharacterHP::of(character.value());
}

NodeResult<Character> CharacterHpToCharacterNode::evaluate(EvaluationContext & ctx) const
{
  auto hp = character_hp_->evaluate(ctx);
  if (!hp) {
    return std::move(hp).take_error();
  }
  return std::move(hp).value().character;
}

NodeResult<TeamSide> CharacterTeamNode::evaluate(EvaluationContext & ctx) const
{
  auto character = character_->evaluate(ctx);
  if (!character) {
    return std::move(character).take_error();
  }

  TeamSide side = TeamSide::Player;
  if (!ctx.battle().side_of(character.value().id, side)) {
    return NodeError::evaluation(
      fmt::format("Character with ID {} not found in any team", character.value().id));
  }
  return side;
}

}  // namespace rule_dsl
