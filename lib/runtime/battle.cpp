// rule_dsl/runtime/battle.cpp - Read-only battle view
//
#include "rule_dsl/runtime/battle.hpp"

namespace rule_dsl
{

std::string_view to_string(TeamSide side) noexcept
{
  switch (side) {
    case TeamSide::Player:
      return "Player";
    case TeamSide::Enemy:
      return "Enemy";
  }
  return "Unknown";
}

std::vector<Character> BattleContext::all_characters() const
{
  std::vector<Character> out;
  out.reserve(player_team.members.size() + enemy_team.members.size());
  out.insert(out.end(), player_team.members.begin(), player_team.members.end());
  out.insert(out.end(), enemy_team.members.begin(), enemy_team.members.end());
  return out;
}

bool BattleContext::side_of(int32_t character_id, TeamSide & out) const noexcept
{
  for (const auto & c : player_team.members) {
    if (c.id == character_id) {
      out = TeamSide::Player;
      return true;
    }
  }
  for (const auto & c : enemy_team.members) {
    if (c.id == character_id) {
      out = TeamSide::Enemy;
      return true;
    }
  }
  return false;
}

}  // namespace rule_dsl
