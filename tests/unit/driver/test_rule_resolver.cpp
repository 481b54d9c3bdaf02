// tests/unit/driver/test_rule_resolver.cpp - Unit tests for per-turn rule resolution
//

#include <gtest/gtest.h>

#include <memory>
#include <utility>
#include <vector>

#include "rule_dsl/driver/compiler.hpp"
#include "rule_dsl/driver/rule_resolver.hpp"
#include "rule_dsl/test_support/token_builders.hpp"

using namespace rule_dsl;
using test_support::EvalFixture;
using test_support::RuleBuilder;

namespace
{

/// Counts evaluations, draws `draws` values from the random source, and
/// then yields a fixed result.
class CountingRule : public Node<ActionPtr>
{
public:
  enum class Outcome { Strike, Break, Fail };

  CountingRule(Outcome outcome, int * count, int draws = 0)
  : outcome_(outcome), count_(count), draws_(draws)
  {
  }

  NodeResult<ActionPtr> evaluate(EvaluationContext & ctx) const override
  {
    ++*count_;
    for (int i = 0; i < draws_; ++i) {
      ctx.rng()();
    }
    switch (outcome_) {
      case Outcome::Strike:
        return ActionPtr(std::make_unique<StrikeAction>(ctx.acting_character().id));
      case Outcome::Break:
        return NodeError::brk();
      case Outcome::Fail:
        break;
    }
    return NodeError::evaluation("rule failed");
  }

private:
  Outcome outcome_;
  int * count_;
  int draws_;
};

NodePtr<ActionPtr> rule(CountingRule::Outcome outcome, int * count, int draws = 0)
{
  return std::make_unique<CountingRule>(outcome, count, draws);
}

}  // namespace

TEST(RuleResolverTest, EmptyRuleListYieldsNoAction)
{
  EvalFixture eval;
  auto ctx = eval.context();
  const ResolveResult r = RuleResolver::resolve({}, ctx);
  EXPECT_TRUE(r.success());
  EXPECT_FALSE(r.has_action());
}

TEST(RuleResolverTest, FirstProducingRuleWins)
{
  EvalFixture eval;
  int counts[3] = {0, 0, 0};
  std::vector<NodePtr<ActionPtr>> rules;
  rules.push_back(rule(CountingRule::Outcome::Break, &counts[0]));
  rules.push_back(rule(CountingRule::Outcome::Strike, &counts[1]));
  rules.push_back(rule(CountingRule::Outcome::Strike, &counts[2]));

  auto ctx = eval.context();
  const ResolveResult r = RuleResolver::resolve(rules, ctx);
  ASSERT_TRUE(r.success());
  ASSERT_TRUE(r.has_action());
  EXPECT_EQ(r.action->target_id(), 1);
  EXPECT_EQ(counts[0], 1);
  EXPECT_EQ(counts[1], 1);
  EXPECT_EQ(counts[2], 0);
}

TEST(RuleResolverTest, BreakingRulesKeepTheirDrawsAndLaterRulesNeverRun)
{
  EvalFixture eval;
  RandomSource expected_rng = eval.rng;

  int counts[4] = {0, 0, 0, 0};
  std::vector<NodePtr<ActionPtr>> rules;
  rules.push_back(rule(CountingRule::Outcome::Break, &counts[0], 2));
  rules.push_back(rule(CountingRule::Outcome::Break, &counts[1], 3));
  rules.push_back(rule(CountingRule::Outcome::Strike, &counts[2]));
  rules.push_back(rule(CountingRule::Outcome::Strike, &counts[3], 1));

  auto ctx = eval.context();
  const ResolveResult r = RuleResolver::resolve(rules, ctx);
  ASSERT_TRUE(r.success());
  ASSERT_TRUE(r.has_action());
  EXPECT_EQ(r.action->kind(), ActionKind::Strike);
  EXPECT_EQ(r.action->target_id(), 1);

  EXPECT_EQ(counts[0], 1);
  EXPECT_EQ(counts[1], 1);
  EXPECT_EQ(counts[2], 1);
  EXPECT_EQ(counts[3], 0);

  // Exactly the five draws of the two breaking rules, each made once.
  expected_rng.discard(5);
  EXPECT_TRUE(eval.rng == expected_rng);
}

TEST(RuleResolverTest, AllBreakingYieldsNoAction)
{
  EvalFixture eval;
  int count = 0;
  std::vector<NodePtr<ActionPtr>> rules;
  rules.push_back(rule(CountingRule::Outcome::Break, &count));
  rules.push_back(rule(CountingRule::Outcome::Break, &count));

  auto ctx = eval.context();
  const ResolveResult r = RuleResolver::resolve(rules, ctx);
  EXPECT_TRUE(r.success());
  EXPECT_FALSE(r.has_action());
  EXPECT_EQ(count, 2);
}

TEST(RuleResolverTest, EvaluationErrorStopsResolution)
{
  EvalFixture eval;
  int counts[2] = {0, 0};
  std::vector<NodePtr<ActionPtr>> rules;
  rules.push_back(rule(CountingRule::Outcome::Fail, &counts[0]));
  rules.push_back(rule(CountingRule::Outcome::Strike, &counts[1]));

  auto ctx = eval.context();
  const ResolveResult r = RuleResolver::resolve(rules, ctx);
  EXPECT_FALSE(r.success());
  ASSERT_TRUE(r.error.has_value());
  EXPECT_EQ(r.error->message(), "rule failed");
  EXPECT_EQ(counts[1], 0);
}

TEST(CharacterRulesTest, ResolvesCompiledRules)
{
  RuleCompiler compiler;
  RuleBuilder b;
  EvalFixture eval;
  eval.battle.acting.mp = 0;

  // Heal breaks for lack of MP; the fallback strikes the weakest enemy.
  BatchCompileResult batch = compiler.compile_many({
    b.heal(b.acting()),
    b.strike(b.min(b.members(b.enemy()))),
  });
  ASSERT_TRUE(batch.success);

  const CharacterRules character(eval.battle.acting.id, std::move(batch.rules));
  EXPECT_EQ(character.character_id(), 1);
  EXPECT_EQ(character.size(), 2u);

  const ResolveResult r = character.resolve(eval.battle, eval.rng);
  ASSERT_TRUE(r.has_action());
  EXPECT_EQ(r.action->kind(), ActionKind::Strike);
  EXPECT_EQ(r.action->target_id(), 3);
}
