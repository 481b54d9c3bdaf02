// tests/unit/driver/test_compiler.cpp - End-to-end compile + evaluate tests
//

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "rule_dsl/driver/compiler.hpp"
#include "rule_dsl/runtime/action.hpp"
#include "rule_dsl/test_support/token_builders.hpp"

using namespace rule_dsl;
using test_support::EvalFixture;
using test_support::make_character;
using test_support::RuleBuilder;

namespace
{

struct CompilerFixture : ::testing::Test
{
  RuleCompiler compiler;
  RuleBuilder b;
  EvalFixture eval;

  NodePtr<ActionPtr> compile_ok(const Token * rule)
  {
    CompileResult r = compiler.compile(rule);
    EXPECT_TRUE(r.success) << (r.error ? r.error->message() : std::string());
    EXPECT_TRUE(r.diagnostics.empty());
    return std::move(r.node);
  }

  NodeResult<ActionPtr> run(const Node<ActionPtr> & node)
  {
    EvaluationContext ctx = eval.context();
    return node.evaluate(ctx);
  }
};

}  // namespace

TEST_F(CompilerFixture, DerivedStatThreshold)
{
  eval.battle.acting.hp = 80;

  auto above_50 = compile_ok(
    b.check(b.greater(b.hp_of(b.acting()), b.number(50)), b.strike(b.acting())));
  auto above_100 = compile_ok(
    b.check(b.greater(b.hp_of(b.acting()), b.number(100)), b.strike(b.acting())));
  ASSERT_NE(above_50, nullptr);
  ASSERT_NE(above_100, nullptr);

  EXPECT_TRUE(run(*above_50).has_value());
  auto r = run(*above_100);
  ASSERT_FALSE(r.has_value());
  EXPECT_TRUE(r.error().is_break());
}

TEST_F(CompilerFixture, FilterThenPickStrikesOnlyMatch)
{
  eval.battle.enemy_team.members = {
    make_character(10, "Slime", 30), make_character(11, "Troll", 80),
    make_character(12, "Wolf", 50)};

  auto rule = compile_ok(b.strike(b.pick(b.filter(
    b.members(b.enemy()), b.greater(b.hp_of(b.element()), b.number(50))))));
  ASSERT_NE(rule, nullptr);

  for (int i = 0; i < 5; ++i) {
    auto r = run(*rule);
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r.value()->target_id(), 11);
  }
}

TEST_F(CompilerFixture, MaxOfEmptyIsEvaluationError)
{
  auto rule = compile_ok(b.strike(
    b.max(b.filter(b.all_characters(), b.greater(b.hp_of(b.element()), b.number(1000))))));
  ASSERT_NE(rule, nullptr);

  auto r = run(*rule);
  ASSERT_FALSE(r.has_value());
  EXPECT_FALSE(r.error().is_break());
  EXPECT_EQ(r.error().describe(), "Evaluation error: Cannot find max of empty array");
}

TEST_F(CompilerFixture, MaxOfSingletonIsThatElement)
{
  auto rule = compile_ok(b.strike(
    b.max(b.filter(b.all_characters(), b.eq(b.element(), b.acting())))));
  ASSERT_NE(rule, nullptr);
  EXPECT_EQ(run(*rule).value()->target_id(), 1);
}

TEST_F(CompilerFixture, RandomPickIsSeedReproducible)
{
  auto rule = compile_ok(b.strike(b.pick(b.all_characters())));
  ASSERT_NE(rule, nullptr);

  auto targets = [&](uint32_t seed) {
    RandomSource rng(seed);
    EvaluationContext ctx(eval.battle, rng);
    std::vector<int32_t> out;
    for (int i = 0; i < 16; ++i) {
      out.push_back(rule->evaluate(ctx).value()->target_id());
    }
    return out;
  };

  EXPECT_EQ(targets(99), targets(99));
}

TEST_F(CompilerFixture, HealWithLowMpBreaks)
{
  eval.battle.acting.mp = 5;
  auto rule = compile_ok(b.heal(b.acting()));
  ASSERT_NE(rule, nullptr);
  auto r = run(*rule);
  ASSERT_FALSE(r.has_value());
  EXPECT_TRUE(r.error().is_break());
}

TEST_F(CompilerFixture, ElementOutsideListFailsToCompile)
{
  CompileResult r = compiler.compile(b.strike(b.element()));
  EXPECT_FALSE(r.success);
  EXPECT_EQ(r.node, nullptr);
  ASSERT_TRUE(r.error.has_value());
  EXPECT_EQ(r.error->kind(), CompileErrorKind::UnresolvedType);
  ASSERT_EQ(r.diagnostics.size(), 1u);
  EXPECT_EQ(r.diagnostics.all()[0].code, "E004");
  EXPECT_TRUE(r.diagnostics.has_errors());
}

TEST_F(CompilerFixture, CompiledRuleIsPureAcrossEvaluations)
{
  auto rule = compile_ok(b.check(
    b.less(b.hp_of(b.acting()), b.number(150)),
    b.heal(b.owner_of(b.numeric_min(b.map(b.members(b.hero()), b.hp_of(b.element())))))));
  ASSERT_NE(rule, nullptr);

  const BattleContext before = eval.battle;
  auto first = run(*rule);
  auto second = run(*rule);
  ASSERT_TRUE(first.has_value());
  ASSERT_TRUE(second.has_value());
  EXPECT_EQ(first.value()->describe(), second.value()->describe());
  EXPECT_EQ(first.value()->target_id(), 2);
  EXPECT_EQ(eval.battle.acting.mp, before.acting.mp);
  EXPECT_EQ(eval.battle.player_team.members[1].hp, before.player_team.members[1].hp);
}

TEST_F(CompilerFixture, CompileManyCollectsOneErrorPerRule)
{
  const std::vector<const Token *> rules{
    b.strike(b.number(1)),
    b.strike(b.acting()),
    b.heal(b.token("Nope")),
    b.heal(b.acting()),
  };

  BatchCompileResult batch = compiler.compile_many(rules);
  EXPECT_FALSE(batch.success);
  ASSERT_EQ(batch.errors.size(), 2u);
  EXPECT_EQ(batch.errors[0].kind(), CompileErrorKind::TypeMismatch);
  EXPECT_EQ(batch.errors[1].kind(), CompileErrorKind::UndefinedToken);
  EXPECT_EQ(batch.rules.size(), 2u);
  EXPECT_EQ(batch.diagnostics.size(), 2u);
}

TEST_F(CompilerFixture, CompileManyOfValidRulesSucceeds)
{
  BatchCompileResult batch = compiler.compile_many({b.strike(b.acting()), b.heal(b.acting())});
  EXPECT_TRUE(batch.success);
  EXPECT_TRUE(batch.errors.empty());
  EXPECT_EQ(batch.rules.size(), 2u);
}

TEST(TypedAstDumpTest, OneNodePerLine)
{
  RuleCompiler compiler;
  RuleBuilder b;
  CheckResult r = compiler.check(b.strike(b.acting()));
  ASSERT_TRUE(r.success());
  EXPECT_EQ(dump_typed_ast(*r.ast), "Strike : Action\n  target: ActingCharacter : Character\n");
}

TEST(TypedAstDumpTest, LiteralsAreShown)
{
  RuleCompiler compiler;
  RuleBuilder b;
  CheckResult r = compiler.check(b.check(b.less(b.number(1), b.number(2)), b.strike(b.acting())));
  ASSERT_TRUE(r.success());
  const std::string dump = dump_typed_ast(*r.ast);
  EXPECT_NE(dump.find("    left: Number(1) : i32\n"), std::string::npos);
  EXPECT_NE(dump.find("  condition: LessThan : bool\n"), std::string::npos);
}
