// tests/unit/codegen/test_converters.cpp - Unit tests for typed-AST code generation
//

#include <gtest/gtest.h>

#include <vector>

#include "rule_dsl/codegen/converter_registry.hpp"
#include "rule_dsl/driver/compiler.hpp"
#include "rule_dsl/runtime/action.hpp"
#include "rule_dsl/sema/types/type_checker.hpp"
#include "rule_dsl/test_support/token_builders.hpp"

using namespace rule_dsl;
using test_support::EvalFixture;
using test_support::RuleBuilder;

namespace
{

struct ConverterFixture : ::testing::Test
{
  RuleCompiler compiler;
  RuleBuilder b;
  EvalFixture eval;

  TypedAstPtr typed(const Token * root)
  {
    TypeChecker checker(compiler.types(), compiler.tokens(), compiler.traits());
    CheckResult r = checker.check(root);
    EXPECT_TRUE(r.success()) << r.error->message();
    return std::move(r.ast);
  }

  template <typename T>
  T evaluate(const Token * root)
  {
    TypedAstPtr ast = typed(root);
    ConvertResult<T> converted = compiler.converters().convert<T>(*ast);
    EXPECT_TRUE(converted.success()) << converted.error->message();
    EvaluationContext ctx = eval.context();
    auto result = converted.node->evaluate(ctx);
    EXPECT_TRUE(result.has_value()) << result.error().describe();
    return std::move(result).value();
  }
};

}  // namespace

TEST_F(ConverterFixture, BuiltinsAreRegistered) { EXPECT_GT(compiler.converters().size(), 30u); }

TEST_F(ConverterFixture, NumberAndTeamSideConstants)
{
  EXPECT_EQ(evaluate<int32_t>(b.number(-7)), -7);
  EXPECT_EQ(evaluate<TeamSide>(b.enemy()), TeamSide::Enemy);
  EXPECT_EQ(evaluate<TeamSide>(b.hero()), TeamSide::Player);
}

TEST_F(ConverterFixture, ComparisonAcrossRepresentations)
{
  // Alice acts with 100 HP.
  EXPECT_TRUE(evaluate<bool>(b.greater(b.hp_of(b.acting()), b.number(50))));
  EXPECT_FALSE(evaluate<bool>(b.greater(b.number(50), b.hp_of(b.acting()))));
  EXPECT_TRUE(evaluate<bool>(b.less(b.number(3), b.number(4))));
  EXPECT_FALSE(evaluate<bool>(b.less(b.hp_of(b.acting()), b.hp_of(b.acting()))));
}

TEST_F(ConverterFixture, EqOverEveryElementType)
{
  EXPECT_TRUE(evaluate<bool>(b.eq(b.number(2), b.number(2))));
  EXPECT_TRUE(evaluate<bool>(b.eq(b.acting(), b.acting())));
  EXPECT_TRUE(evaluate<bool>(b.eq(b.team_of(b.acting()), b.hero())));
  EXPECT_FALSE(evaluate<bool>(b.eq(b.team_of(b.acting()), b.enemy())));
  EXPECT_TRUE(evaluate<bool>(b.eq(b.hp_of(b.acting()), b.hp_of(b.acting()))));
}

TEST_F(ConverterFixture, CollectionsAndReductions)
{
  const auto everyone = evaluate<std::vector<Character>>(b.all_characters());
  ASSERT_EQ(everyone.size(), 4u);
  EXPECT_EQ(everyone[0].name, "Alice");
  EXPECT_EQ(everyone[3].name, "Orc");

  const auto monsters = evaluate<std::vector<Character>>(b.members(b.enemy()));
  ASSERT_EQ(monsters.size(), 2u);
  EXPECT_EQ(monsters[0].name, "Goblin");

  EXPECT_EQ(evaluate<std::vector<TeamSide>>(b.all_team_sides()).size(), 2u);

  const auto hps = evaluate<std::vector<CharacterHP>>(b.map(b.all_characters(), b.hp_of(b.element())));
  ASSERT_EQ(hps.size(), 4u);
  EXPECT_EQ(hps[1].hp_value, 60);
  EXPECT_EQ(hps[1].character.name, "Bob");

  EXPECT_EQ(evaluate<Character>(b.max(b.all_characters())).name, "Alice");
  EXPECT_EQ(evaluate<Character>(b.min(b.all_characters())).name, "Goblin");
  EXPECT_EQ(
    evaluate<CharacterHP>(b.numeric_min(b.map(b.members(b.enemy()), b.hp_of(b.element()))))
      .character.name,
    "Goblin");
}

TEST_F(ConverterFixture, MapToIntegersThroughNumericMax)
{
  // Map each side to a constant, then reduce.
  EXPECT_EQ(evaluate<int32_t>(b.numeric_max(b.map(b.all_team_sides(), b.number(9)))), 9);
}

TEST_F(ConverterFixture, ActionRoot)
{
  auto action = evaluate<ActionPtr>(b.strike(b.max(b.members(b.enemy()))));
  ASSERT_NE(action, nullptr);
  EXPECT_EQ(action->kind(), ActionKind::Strike);
  EXPECT_EQ(action->target_id(), 4);
  EXPECT_EQ(action->describe(), "Strike(target=4)");
}

TEST_F(ConverterFixture, RequestingWrongTypeIsChildTypeMismatch)
{
  TypedAstPtr ast = typed(b.acting());
  auto converted = compiler.converters().convert<int32_t>(*ast);
  ASSERT_FALSE(converted.success());
  EXPECT_EQ(converted.error->kind(), CompileErrorKind::ChildTypeMismatch);
  EXPECT_EQ(converted.error->expected(), "i32");
  EXPECT_EQ(converted.error->actual(), "Character");
}

TEST_F(ConverterFixture, EmptyRegistryHasNoConverter)
{
  ConverterRegistry empty(compiler.types());
  TypedAstPtr ast = typed(b.strike(b.acting()));
  auto converted = empty.convert<ActionPtr>(*ast);
  ASSERT_FALSE(converted.success());
  EXPECT_EQ(converted.error->kind(), CompileErrorKind::NoConverter);
  EXPECT_EQ(converted.error->subject(), "Strike");
}

TEST_F(ConverterFixture, MissingChildCarriesPath)
{
  TypedAstPtr ast = typed(b.strike(b.acting()));
  auto converted = compiler.converters().convert_child<Character>(*ast, "victim");
  ASSERT_FALSE(converted.success());
  EXPECT_EQ(converted.error->kind(), CompileErrorKind::MissingChild);
  EXPECT_EQ(converted.error->location(), "Strike.victim");
}

TEST_F(ConverterFixture, NestedFailureGetsFullPath)
{
  // Type-check a valid tree, then corrupt a leaf's type.
  TypedAstPtr ast = typed(b.strike(b.owner_of(b.hp_of(b.acting()))));
  TypedAst * leaf = ast->children[0].second->children[0].second.get();
  leaf->type = compiler.types().bool_type();

  auto converted = compiler.converters().convert<ActionPtr>(*ast);
  ASSERT_FALSE(converted.success());
  EXPECT_EQ(converted.error->kind(), CompileErrorKind::ChildTypeMismatch);
  EXPECT_EQ(
    converted.error->location(), "Strike.target -> CharacterHpToCharacter.character_hp");
}

TEST(NumericOperandKindTest, PrefersConcreteThenSibling)
{
  TypeContext types;
  RuleBuilder b;
  TypedAst concrete{b.number(1), types.i32_type(), {}};
  TypedAst hp{b.hp_of(b.acting()), types.character_hp_type(), {}};
  TypedAst abstract{b.number(2), types.numeric_type(), {}};

  EXPECT_EQ(numeric_operand_kind(&hp, &concrete), TypeKind::CharacterHP);
  EXPECT_EQ(numeric_operand_kind(&abstract, &hp), TypeKind::CharacterHP);
  EXPECT_EQ(numeric_operand_kind(&abstract, nullptr), TypeKind::I32);
}
