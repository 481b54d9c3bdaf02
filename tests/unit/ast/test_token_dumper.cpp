// tests/unit/ast/test_token_dumper.cpp - Token tree rendering tests
//

#include <gtest/gtest.h>

#include "rule_dsl/ast/token_dumper.hpp"
#include "rule_dsl/test_support/token_builders.hpp"

using namespace rule_dsl;
using test_support::RuleBuilder;

TEST(TokenDumperTest, Leaf)
{
  RuleBuilder b;
  EXPECT_EQ(dump_token(b.acting()), "ActingCharacter");
  EXPECT_EQ(dump_token(b.number(5)), "Number { value: 5 }");
}

TEST(TokenDumperTest, NullToken)
{
  EXPECT_EQ(dump_token(nullptr), "<null>");
  EXPECT_EQ(dump_token_head(nullptr), "<null>");
}

TEST(TokenDumperTest, NestedOperands)
{
  RuleBuilder b;
  const Token * rule = b.check(b.coin(), b.strike(b.acting()));

  EXPECT_EQ(
    dump_token(rule),
    "Check {\n"
    "  condition: TrueOrFalseRandom\n"
    "  then_action: Strike {\n"
    "    target: ActingCharacter\n"
    "  }\n"
    "}");
}

TEST(TokenDumperTest, HeadOmitsOperands)
{
  RuleBuilder b;
  EXPECT_EQ(dump_token_head(b.strike(b.acting())), "Strike");
  EXPECT_EQ(dump_token_head(b.number(-2)), "Number { value: -2 }");
}

TEST(TokenDumperTest, CycleIsCutOff)
{
  RuleBuilder b;
  Token * check = b.context().create(
    "Check", {{"condition", b.coin()}, {"then_action", nullptr}});
  check->mutable_args()[1].value = check;

  EXPECT_EQ(
    dump_token(check),
    "Check {\n"
    "  condition: TrueOrFalseRandom\n"
    "  then_action: <cycle: Check>\n"
    "}");
}
