// rule_dsl/runtime/nodes/array_nodes.cpp - Collection sources
//
#include "rule_dsl/runtime/nodes/array_nodes.hpp"

namespace rule_dsl
{

NodeResult<std::vector<Character>> AllCharactersNode::evaluate(EvaluationContext & ctx) const
{
  return ctx.battle().all_characters();
}

NodeResult<std::vector<Character>> TeamMembersNode::evaluate(EvaluationContext & ctx) const
{
  auto side = team_side_->evaluate(ctx);
  if (!side) {
    return std::move(side).take_error();
  }
  return ctx.battle().team_members(side.value());
}

NodeResult<std::vector<TeamSide>> AllTeamSidesNode::evaluate(EvaluationContext &) const
{
  return std::vector<TeamSide>{TeamSide::Player, TeamSide::Enemy};
}

}  // namespace rule_dsl
