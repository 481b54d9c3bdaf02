// tests/unit/ast/test_token_json.cpp - Rule set JSON loading tests
//

#include <gtest/gtest.h>

#include <string>

#include "rule_dsl/ast/token_context.hpp"
#include "rule_dsl/ast/token_json.hpp"

using namespace rule_dsl;
using nlohmann::json;

namespace
{

struct TokenJsonTest : ::testing::Test
{
  TokenContext ctx;
};

}  // namespace

TEST_F(TokenJsonTest, ParsesNestedRule)
{
  const auto r = parse_rule_set(
    R"({"rules": [{"tokens": [{"type": "Strike", "target": {"type": "ActingCharacter"}}]}]})",
    ctx);

  ASSERT_TRUE(r.success) << r.error;
  ASSERT_EQ(r.rules.size(), 1U);

  const Token * strike = r.rules[0];
  EXPECT_EQ(strike->type(), "Strike");
  ASSERT_EQ(strike->args().size(), 1U);
  ASSERT_NE(strike->arg("target"), nullptr);
  EXPECT_EQ(strike->arg("target")->type(), "ActingCharacter");
  EXPECT_FALSE(strike->literal().has_value());
}

TEST_F(TokenJsonTest, IntegerValueBecomesLiteral)
{
  const auto r = parse_rule_set(
    R"({"rules": [{"tokens": [{"type": "Check",
        "condition": {"type": "GreaterThan",
                      "left": {"type": "Number", "value": 50},
                      "right": {"type": "Number", "value": -3}},
        "then_action": {"type": "Heal", "target": {"type": "Hero"}}}]}]})",
    ctx);

  ASSERT_TRUE(r.success) << r.error;
  const Token * cond = r.rules[0]->arg("condition");
  ASSERT_NE(cond, nullptr);
  EXPECT_EQ(cond->arg("left")->literal(), 50);
  EXPECT_EQ(cond->arg("right")->literal(), -3);
  EXPECT_TRUE(cond->arg("left")->args().empty());
}

TEST_F(TokenJsonTest, KeepsRuleOrder)
{
  const auto r = parse_rule_set(
    R"({"rules": [
      {"tokens": [{"type": "Strike", "target": {"type": "Enemy"}}]},
      {"tokens": [{"type": "Heal", "target": {"type": "Hero"}}]}
    ]})",
    ctx);

  ASSERT_TRUE(r.success) << r.error;
  ASSERT_EQ(r.rules.size(), 2U);
  EXPECT_EQ(r.rules[0]->type(), "Strike");
  EXPECT_EQ(r.rules[1]->type(), "Heal");
}

TEST_F(TokenJsonTest, EmptyRuleListIsValid)
{
  const auto r = parse_rule_set(R"({"rules": []})", ctx);
  ASSERT_TRUE(r.success);
  EXPECT_TRUE(r.rules.empty());
}

TEST_F(TokenJsonTest, UnknownKindsAreLeftToTheChecker)
{
  const auto r =
    parse_rule_set(R"({"rules": [{"tokens": [{"type": "Fireball"}]}]})", ctx);
  ASSERT_TRUE(r.success);
  EXPECT_EQ(r.rules[0]->type(), "Fireball");
}

TEST_F(TokenJsonTest, MalformedJson)
{
  const auto r = parse_rule_set(R"({"rules": [)", ctx);
  EXPECT_FALSE(r.success);
  EXPECT_EQ(r.error.rfind("failed to parse JSON: ", 0), 0U) << r.error;
}

TEST_F(TokenJsonTest, MissingRulesList)
{
  const auto r = parse_rule_set(R"({"tokens": []})", ctx);
  EXPECT_FALSE(r.success);
  EXPECT_EQ(r.error, "rule set must be an object with a 'rules' list");
}

TEST_F(TokenJsonTest, ChainWithoutTokens)
{
  const auto r = parse_rule_set(R"({"rules": [{"type": "Strike"}]})", ctx);
  EXPECT_FALSE(r.success);
  EXPECT_EQ(r.error, "rules[0] must be an object with a 'tokens' list");
}

TEST_F(TokenJsonTest, EmptyTokenChain)
{
  const auto r = parse_rule_set(R"({"rules": [{"tokens": []}]})", ctx);
  EXPECT_FALSE(r.success);
  EXPECT_EQ(r.error, "rules[0]: empty token chain");
}

TEST_F(TokenJsonTest, MultipleRootTokens)
{
  const auto r = parse_rule_set(
    R"({"rules": [
      {"tokens": [{"type": "Hero"}]},
      {"tokens": [{"type": "Hero"}, {"type": "Enemy"}]}
    ]})",
    ctx);
  EXPECT_FALSE(r.success);
  EXPECT_EQ(r.error, "rules[1]: expected exactly one root token, found 2");
}

TEST_F(TokenJsonTest, TokenWithoutType)
{
  const auto r = parse_rule_set(
    R"({"rules": [{"tokens": [{"type": "Strike", "target": {"kind": "Hero"}}]}]})", ctx);
  EXPECT_FALSE(r.success);
  EXPECT_EQ(r.error, "rules[0]: token is missing a string 'type' field");
}

TEST_F(TokenJsonTest, OperandMustBeObject)
{
  const auto r = parse_rule_set(
    R"({"rules": [{"tokens": [{"type": "Strike", "target": "Hero"}]}]})", ctx);
  EXPECT_FALSE(r.success);
  EXPECT_EQ(r.error, "rules[0]: field 'target' of 'Strike' must be a token object");
}

TEST_F(TokenJsonTest, LiteralOutOfRange)
{
  const auto r = parse_rule_set(
    R"({"rules": [{"tokens": [{"type": "Number", "value": 4294967296}]}]})", ctx);
  EXPECT_FALSE(r.success);
  EXPECT_EQ(r.error, "rules[0]: field 'value' of 'Number' must be a 32-bit integer");
}

TEST_F(TokenJsonTest, TokenFromJsonRejectsNonObject)
{
  std::string error;
  EXPECT_EQ(token_from_json(json::array(), ctx, error), nullptr);
  EXPECT_EQ(error, "token must be a JSON object");
}

TEST_F(TokenJsonTest, TokenToJsonMirrorsInput)
{
  const json input = json::parse(
    R"({"type": "Strike", "target": {"type": "CharacterHpToCharacter",
        "character_hp": {"type": "Number", "value": 7}}})");

  std::string error;
  const Token * token = token_from_json(input, ctx, error);
  ASSERT_NE(token, nullptr) << error;
  EXPECT_EQ(token_to_json(token), input);
}

TEST_F(TokenJsonTest, LoadMissingFile)
{
  const auto r = load_rule_set("/nonexistent/rule_dsl/rules.json", ctx);
  EXPECT_FALSE(r.success);
  EXPECT_EQ(r.error, "rule file not found: /nonexistent/rule_dsl/rules.json");
}
