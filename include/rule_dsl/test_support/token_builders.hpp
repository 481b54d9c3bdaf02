// rule_dsl/test_support/token_builders.hpp - helpers for unit tests
//
// Short constructors for token trees, plus a small battle fixture. Token
// ownership stays with the TokenContext wrapped by RuleBuilder.
//
#pragma once

#include <cstdint>
#include <memory>
#include <random>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "rule_dsl/ast/token.hpp"
#include "rule_dsl/ast/token_context.hpp"
#include "rule_dsl/runtime/battle.hpp"
#include "rule_dsl/runtime/evaluation_context.hpp"

namespace rule_dsl::test_support
{

class RuleBuilder
{
public:
  TokenContext & context() noexcept { return ctx_; }

  const Token * token(std::string_view type, const std::vector<TokenArg> & args = {})
  {
    return ctx_.create(type, args);
  }

  // --- Actions ---------------------------------------------------------------
  const Token * strike(const Token * target) { return token("Strike", {{"target", target}}); }
  const Token * heal(const Token * target) { return token("Heal", {{"target", target}}); }
  const Token * check(const Token * condition, const Token * then_action)
  {
    return token("Check", {{"condition", condition}, {"then_action", then_action}});
  }

  // --- Conditions ------------------------------------------------------------
  const Token * coin() { return token("TrueOrFalseRandom"); }
  const Token * greater(const Token * l, const Token * r)
  {
    return token("GreaterThan", {{"left", l}, {"right", r}});
  }
  const Token * less(const Token * l, const Token * r)
  {
    return token("LessThan", {{"left", l}, {"right", r}});
  }
  const Token * eq(const Token * l, const Token * r)
  {
    return token("Eq", {{"left", l}, {"right", r}});
  }

  // --- Values ----------------------------------------------------------------
  const Token * number(int32_t v) { return ctx_.create_literal("Number", v); }
  const Token * acting() { return token("ActingCharacter"); }
  const Token * element() { return token(k_element_token); }
  const Token * enemy() { return token("Enemy"); }
  const Token * hero() { return token("Hero"); }
  const Token * hp_of(const Token * c) { return token("CharacterToHp", {{"character", c}}); }
  const Token * owner_of(const Token * hp)
  {
    return token("CharacterHpToCharacter", {{"character_hp", hp}});
  }
  const Token * team_of(const Token * c) { return token("CharacterTeam", {{"character", c}}); }

  // --- Collections -----------------------------------------------------------
  const Token * all_characters() { return token("AllCharacters"); }
  const Token * all_team_sides() { return token("AllTeamSides"); }
  const Token * members(const Token * side) { return token("TeamMembers", {{"team_side", side}}); }
  const Token * filter(const Token * array, const Token * condition)
  {
    return token("FilterList", {{"array", array}, {"condition", condition}});
  }
  const Token * map(const Token * array, const Token * transform)
  {
    return token("Map", {{"array", array}, {"transform", transform}});
  }
  const Token * pick(const Token * array) { return token("RandomPick", {{"array", array}}); }
  const Token * max(const Token * array) { return token("Max", {{"array", array}}); }
  const Token * min(const Token * array) { return token("Min", {{"array", array}}); }
  const Token * numeric_max(const Token * array)
  {
    return token("NumericMax", {{"array", array}});
  }
  const Token * numeric_min(const Token * array)
  {
    return token("NumericMin", {{"array", array}});
  }

private:
  TokenContext ctx_;
};

// ============================================================================
// Battle fixture
// ============================================================================

inline Character make_character(
  int32_t id, std::string name, int32_t hp, int32_t mp = 50, int32_t attack = 10)
{
  Character c;
  c.id = id;
  c.name = std::move(name);
  c.hp = hp;
  c.max_hp = hp > 100 ? hp : 100;
  c.mp = mp;
  c.max_mp = mp > 50 ? mp : 50;
  c.attack = attack;
  return c;
}

/**
 * Two players (Alice 100 HP, Bob 60 HP) against two enemies
 * (Goblin 30 HP, Orc 80 HP). Alice acts.
 */
inline BattleContext make_battle()
{
  BattleContext b;
  b.player_team.name = "Heroes";
  b.player_team.members = {make_character(1, "Alice", 100), make_character(2, "Bob", 60)};
  b.enemy_team.name = "Monsters";
  b.enemy_team.members = {make_character(3, "Goblin", 30), make_character(4, "Orc", 80)};
  b.acting = b.player_team.members[0];
  b.acting_side = TeamSide::Player;
  return b;
}

/**
 * Battle plus a seeded random source, ready to evaluate nodes against.
 */
struct EvalFixture
{
  BattleContext battle = make_battle();
  RandomSource rng{42};

  EvaluationContext context() { return EvaluationContext(battle, rng); }
};

}  // namespace rule_dsl::test_support
