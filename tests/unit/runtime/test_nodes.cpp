// tests/unit/runtime/test_nodes.cpp - Unit tests for evaluation nodes
//
// Nodes are assembled by hand here so each one can be exercised without
// going through the checker and the converters.
//

#include <gtest/gtest.h>

#include <functional>
#include <memory>
#include <utility>
#include <vector>

#include "rule_dsl/runtime/action.hpp"
#include "rule_dsl/runtime/nodes/action_nodes.hpp"
#include "rule_dsl/runtime/nodes/array_nodes.hpp"
#include "rule_dsl/runtime/nodes/condition_nodes.hpp"
#include "rule_dsl/runtime/nodes/value_nodes.hpp"
#include "rule_dsl/test_support/token_builders.hpp"

using namespace rule_dsl;
using test_support::EvalFixture;
using test_support::make_character;

namespace
{

/// Yields a fixed result and counts how often it was evaluated.
template <typename T>
class ProbeNode : public Node<T>
{
public:
  ProbeNode(std::function<NodeResult<T>()> body, int * count)
  : body_(std::move(body)), count_(count)
  {
  }

  NodeResult<T> evaluate(EvaluationContext &) const override
  {
    ++*count_;
    return body_();
  }

private:
  std::function<NodeResult<T>()> body_;
  int * count_;
};

template <typename T>
NodePtr<T> probe(T value, int * count)
{
  return std::make_unique<ProbeNode<T>>([value]() { return NodeResult<T>(value); }, count);
}

template <typename T>
NodePtr<T> failing(int * count)
{
  return std::make_unique<ProbeNode<T>>(
    []() { return NodeResult<T>(NodeError::evaluation("probe failed")); }, count);
}

NodePtr<int32_t> num(int32_t v) { return std::make_unique<NumberNode>(v); }

NodePtr<std::vector<Character>> characters() { return std::make_unique<AllCharactersNode>(); }

NodePtr<bool> hp_above(int32_t threshold)
{
  return std::make_unique<GreaterThanNode<CharacterHP, int32_t>>(
    std::make_unique<CharacterToHpNode>(std::make_unique<ElementNode<Character>>()),
    num(threshold));
}

struct NodeFixture : ::testing::Test
{
  EvalFixture eval;

  /// Replace every team with a single enemy team of the given HP values.
  void use_enemy_hp(const std::vector<int32_t> & hps)
  {
    eval.battle.player_team.members = {eval.battle.acting};
    eval.battle.enemy_team.members.clear();
    int32_t id = 10;
    for (int32_t hp : hps) {
      eval.battle.enemy_team.members.push_back(make_character(id++, "E", hp));
    }
  }
};

}  // namespace

// ============================================================================
// Actions
// ============================================================================

TEST_F(NodeFixture, StrikeTargetsEvaluatedCharacter)
{
  StrikeNode strike(std::make_unique<ActingCharacterNode>());
  auto ctx = eval.context();
  auto result = strike.evaluate(ctx);
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result.value()->kind(), ActionKind::Strike);
  EXPECT_EQ(result.value()->target_id(), 1);
}

TEST_F(NodeFixture, DeadActorBreaksBeforeTargetIsEvaluated)
{
  eval.battle.acting.hp = 0;
  int count = 0;
  StrikeNode strike(failing<Character>(&count));
  auto ctx = eval.context();
  auto result = strike.evaluate(ctx);
  ASSERT_FALSE(result.has_value());
  EXPECT_TRUE(result.error().is_break());
  EXPECT_EQ(count, 0);
}

TEST_F(NodeFixture, HealWithoutEnoughMpBreaks)
{
  eval.battle.acting.mp = 5;
  HealNode heal(std::make_unique<ActingCharacterNode>());
  auto ctx = eval.context();
  auto result = heal.evaluate(ctx);
  ASSERT_FALSE(result.has_value());
  EXPECT_TRUE(result.error().is_break());
}

TEST_F(NodeFixture, HealWithExactCostSucceeds)
{
  eval.battle.acting.mp = k_heal_mp_cost;
  HealNode heal(std::make_unique<ActingCharacterNode>());
  auto ctx = eval.context();
  auto result = heal.evaluate(ctx);
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result.value()->describe(), "Heal(target=1)");
}

TEST_F(NodeFixture, CheckShortCircuitsOnFalse)
{
  int cond_count = 0;
  int action_count = 0;
  CheckNode check(
    probe<bool>(false, &cond_count),
    std::make_unique<StrikeNode>(failing<Character>(&action_count)));

  auto ctx = eval.context();
  auto result = check.evaluate(ctx);
  ASSERT_FALSE(result.has_value());
  EXPECT_TRUE(result.error().is_break());
  EXPECT_EQ(cond_count, 1);
  EXPECT_EQ(action_count, 0);
}

TEST_F(NodeFixture, CheckPropagatesConditionError)
{
  int count = 0;
  CheckNode check(
    failing<bool>(&count),
    std::make_unique<StrikeNode>(std::make_unique<ActingCharacterNode>()));
  auto ctx = eval.context();
  auto result = check.evaluate(ctx);
  ASSERT_FALSE(result.has_value());
  EXPECT_FALSE(result.error().is_break());
  EXPECT_EQ(result.error().message(), "probe failed");
}

// ============================================================================
// Conditions
// ============================================================================

TEST_F(NodeFixture, DerivedStatComparison)
{
  eval.battle.acting.hp = 80;
  auto ctx = eval.context();

  GreaterThanNode<CharacterHP, int32_t> above_50(
    std::make_unique<CharacterToHpNode>(std::make_unique<ActingCharacterNode>()), num(50));
  GreaterThanNode<CharacterHP, int32_t> above_100(
    std::make_unique<CharacterToHpNode>(std::make_unique<ActingCharacterNode>()), num(100));

  EXPECT_TRUE(above_50.evaluate(ctx).value());
  EXPECT_FALSE(above_100.evaluate(ctx).value());
}

TEST_F(NodeFixture, ComparisonEvaluatesLeftFirstAndStopsOnError)
{
  int left = 0;
  int right = 0;
  LessThanNode<int32_t, int32_t> less(failing<int32_t>(&left), probe<int32_t>(1, &right));
  auto ctx = eval.context();
  EXPECT_FALSE(less.evaluate(ctx).has_value());
  EXPECT_EQ(left, 1);
  EXPECT_EQ(right, 0);
}

TEST_F(NodeFixture, CharacterEqualityIsByIdentity)
{
  Character renamed = eval.battle.acting;
  renamed.name = "Someone else";
  renamed.hp = 1;

  EqConditionNode<Character> eq(
    std::make_unique<ActingCharacterNode>(),
    std::make_unique<ConstantNode<Character>>(renamed));
  auto ctx = eval.context();
  EXPECT_TRUE(eq.evaluate(ctx).value());
}

TEST_F(NodeFixture, CoinFlipIsReproducible)
{
  TrueOrFalseRandomNode coin;
  RandomSource a(7);
  RandomSource b(7);
  EvaluationContext ctx_a(eval.battle, a);
  EvaluationContext ctx_b(eval.battle, b);
  for (int i = 0; i < 32; ++i) {
    EXPECT_EQ(coin.evaluate(ctx_a).value(), coin.evaluate(ctx_b).value());
  }
}

// ============================================================================
// Values
// ============================================================================

TEST_F(NodeFixture, HpRoundTripKeepsOwner)
{
  CharacterHpToCharacterNode owner(
    std::make_unique<CharacterToHpNode>(std::make_unique<ActingCharacterNode>()));
  auto ctx = eval.context();
  EXPECT_EQ(owner.evaluate(ctx).value().name, "Alice");
}

TEST_F(NodeFixture, CharacterTeamSearchesBothTeams)
{
  auto ctx = eval.context();
  CharacterTeamNode player(std::make_unique<ActingCharacterNode>());
  EXPECT_EQ(player.evaluate(ctx).value(), TeamSide::Player);

  CharacterTeamNode enemy(
    std::make_unique<ConstantNode<Character>>(eval.battle.enemy_team.members[1]));
  EXPECT_EQ(enemy.evaluate(ctx).value(), TeamSide::Enemy);

  CharacterTeamNode stranger(
    std::make_unique<ConstantNode<Character>>(make_character(99, "X", 1)));
  auto missing = stranger.evaluate(ctx);
  ASSERT_FALSE(missing.has_value());
  EXPECT_EQ(missing.error().message(), "Character with ID 99 not found in any team");
}

TEST_F(NodeFixture, ElementWithoutBindingFails)
{
  ElementNode<Character> element;
  auto ctx = eval.context();
  auto result = element.evaluate(ctx);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().message(), "No current element in context");
}

TEST_F(NodeFixture, ElementOfWrongTypeFails)
{
  ElementNode<int32_t> element;
  auto ctx = eval.context().with_element(TeamSide::Enemy);
  auto result = element.evaluate(ctx);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().message(), "Current element is not a i32");
}

// ============================================================================
// Collections
// ============================================================================

TEST_F(NodeFixture, FilterKeepsMatchingElementsInOrder)
{
  use_enemy_hp({30, 80, 50});
  FilterListNode<Character> filter(
    std::make_unique<TeamMembersNode>(std::make_unique<TeamSideNode>(TeamSide::Enemy)),
    hp_above(50));

  auto ctx = eval.context();
  auto kept = filter.evaluate(ctx);
  ASSERT_TRUE(kept.has_value());
  ASSERT_EQ(kept.value().size(), 1u);
  EXPECT_EQ(kept.value()[0].hp, 80);
}

TEST_F(NodeFixture, FilterLeavesCallerContextUntouched)
{
  FilterListNode<Character> filter(characters(), hp_above(0));
  auto ctx = eval.context();
  ASSERT_TRUE(filter.evaluate(ctx).has_value());
  EXPECT_FALSE(ctx.current_element().has_value());

  auto bound = ctx.with_element(int32_t{5});
  ASSERT_TRUE(filter.evaluate(bound).has_value());
  ASSERT_TRUE(bound.current_element().has_value());
  EXPECT_EQ(std::get<int32_t>(*bound.current_element()), 5);
}

TEST_F(NodeFixture, MapPreservesOrder)
{
  MapNode<Character, CharacterHP> map(
    characters(), std::make_unique<CharacterToHpNode>(std::make_unique<ElementNode<Character>>()));
  auto ctx = eval.context();
  auto hps = map.evaluate(ctx);
  ASSERT_TRUE(hps.has_value());
  std::vector<int32_t> values;
  for (const auto & hp : hps.value()) values.push_back(hp.hp_value);
  EXPECT_EQ(values, (std::vector<int32_t>{100, 60, 30, 80}));
}

TEST_F(NodeFixture, NestedCombinatorsRestoreOuterElement)
{
  // The outer element is a TeamSide; the inner filter rebinds it to each
  // Character.
  auto inner = std::make_unique<FilterListNode<Character>>(
    characters(),
    std::make_unique<EqConditionNode<TeamSide>>(
      std::make_unique<CharacterTeamNode>(std::make_unique<ElementNode<Character>>()),
      std::make_unique<TeamSideNode>(TeamSide::Enemy)));

  MapNode<TeamSide, Character> map(
    std::make_unique<AllTeamSidesNode>(),
    std::make_unique<MaxNode<Character>>(std::move(inner)));

  auto ctx = eval.context();
  auto result = map.evaluate(ctx);
  ASSERT_TRUE(result.has_value());
  ASSERT_EQ(result.value().size(), 2u);
  EXPECT_EQ(result.value()[0].name, "Orc");
  EXPECT_FALSE(ctx.current_element().has_value());
}

TEST_F(NodeFixture, ExtremaOnEmptyAndSingleton)
{
  use_enemy_hp({});
  auto ctx = eval.context();

  MaxNode<Character> empty_max(
    std::make_unique<TeamMembersNode>(std::make_unique<TeamSideNode>(TeamSide::Enemy)));
  auto empty = empty_max.evaluate(ctx);
  ASSERT_FALSE(empty.has_value());
  EXPECT_FALSE(empty.error().is_break());
  EXPECT_EQ(empty.error().message(), "Cannot find max of empty array");

  use_enemy_hp({42});
  auto ctx2 = eval.context();
  MinNode<Character> single_min(
    std::make_unique<TeamMembersNode>(std::make_unique<TeamSideNode>(TeamSide::Enemy)));
  auto single = single_min.evaluate(ctx2);
  ASSERT_TRUE(single.has_value());
  EXPECT_EQ(single.value().hp, 42);
}

TEST_F(NodeFixture, ExtremumTiesKeepFirstOccurrence)
{
  use_enemy_hp({50, 70, 70, 50});
  auto ctx = eval.context();
  MaxNode<Character> max(
    std::make_unique<TeamMembersNode>(std::make_unique<TeamSideNode>(TeamSide::Enemy)));
  MinNode<Character> min(
    std::make_unique<TeamMembersNode>(std::make_unique<TeamSideNode>(TeamSide::Enemy)));
  EXPECT_EQ(max.evaluate(ctx).value().id, 11);
  EXPECT_EQ(min.evaluate(ctx).value().id, 10);
}

TEST_F(NodeFixture, RandomPickIsReproducibleWithSeed)
{
  RandomPickNode<Character> pick(characters());

  std::vector<int32_t> first;
  std::vector<int32_t> second;
  for (auto * out : {&first, &second}) {
    RandomSource rng(1234);
    EvaluationContext ctx(eval.battle, rng);
    for (int i = 0; i < 20; ++i) {
      out->push_back(pick.evaluate(ctx).value().id);
    }
  }
  EXPECT_EQ(first, second);
}

TEST_F(NodeFixture, RandomPickFromEmptyFails)
{
  use_enemy_hp({});
  RandomPickNode<Character> pick(
    std::make_unique<TeamMembersNode>(std::make_unique<TeamSideNode>(TeamSide::Enemy)));
  auto ctx = eval.context();
  auto result = pick.evaluate(ctx);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().message(), "Cannot pick from empty array");
}
