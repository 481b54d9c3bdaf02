// tests/unit/driver/test_error_reporter.cpp - Unit tests for compile error reports
//

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "rule_dsl/driver/compiler.hpp"
#include "rule_dsl/driver/error_reporter.hpp"
#include "rule_dsl/test_support/token_builders.hpp"

using namespace rule_dsl;
using test_support::RuleBuilder;

namespace
{

struct ReporterFixture : ::testing::Test
{
  RuleCompiler compiler;
  RuleBuilder b;
  ErrorReporter reporter{compiler.tokens()};

  CompileError error_for(const Token * rule)
  {
    CompileResult r = compiler.compile(rule);
    EXPECT_FALSE(r.success);
    return *r.error;
  }
};

bool has(const std::string & text, const std::string & needle)
{
  return text.find(needle) != std::string::npos;
}

}  // namespace

TEST_F(ReporterFixture, TypeMismatchReport)
{
  const std::string report = reporter.format_error(error_for(b.strike(b.number(5))));

  EXPECT_EQ(report.rfind("Compilation Error\n=================\n\n", 0), 0u);
  EXPECT_TRUE(
    has(report, "Error: Type mismatch in Strike.target: expected Character, but got i32\n"));
  EXPECT_TRUE(has(report, "\nLocation: Strike.target\n"));
  EXPECT_TRUE(has(report, "\nToken:\n  Number { value: 5 }\n"));
  EXPECT_TRUE(has(report, "The Strike.target expects a value of type 'Character'"));
}

TEST_F(ReporterFixture, UndefinedTokenListsKnownTokens)
{
  const CompileError err = error_for(b.strike(b.token("Fireball")));
  const std::string hint = reporter.suggestion(err);
  EXPECT_TRUE(has(hint, "The token 'Fireball' is not recognized."));
  EXPECT_TRUE(has(hint, "ActingCharacter"));
  EXPECT_TRUE(has(hint, "Strike"));
  EXPECT_TRUE(has(hint, "Element"));
}

TEST_F(ReporterFixture, RootErrorHasNoLocationBlock)
{
  const std::string report = reporter.format_error(error_for(b.acting()));
  EXPECT_FALSE(has(report, "Location:"));
  EXPECT_TRUE(has(report, "rule root"));
}

TEST_F(ReporterFixture, MultipleErrorsAreSeparated)
{
  const std::vector<CompileError> errs{
    error_for(b.strike(b.number(1))), error_for(b.heal(b.element()))};
  const std::string report = reporter.format_errors(errs);
  EXPECT_EQ(report.rfind("Found 2 compilation error(s):\n\n", 0), 0u);
  EXPECT_TRUE(has(report, "\n---\n\n"));
}

TEST_F(ReporterFixture, OneLineForm)
{
  EXPECT_EQ(
    reporter.format_error_oneline(error_for(b.heal(b.number(3)))),
    "Type mismatch in Heal.target: expected Character, but got i32 at Heal.target");
  EXPECT_EQ(
    reporter.format_error_oneline(error_for(b.acting())),
    "Type mismatch in rule root: expected Action, but got Character");
}

TEST_F(ReporterFixture, DiagnosticCarriesReporterSuggestion)
{
  const CompileError err = error_for(b.strike(b.token("Fireball")));
  const Diagnostic d = reporter.to_diagnostic(err);
  EXPECT_EQ(d.code, "E002");
  EXPECT_EQ(d.severity, Severity::Error);
  ASSERT_TRUE(d.help_message.has_value());
  EXPECT_TRUE(has(*d.help_message, "Available tokens"));
  EXPECT_EQ(d.primary_location(), "Strike.target");
  ASSERT_TRUE(d.snippet.has_value());
  EXPECT_EQ(*d.snippet, "Fireball");
}

TEST_F(ReporterFixture, TraitBoundSuggestionNamesAvailableTraits)
{
  const CompileError err =
    error_for(b.check(b.eq(b.hero(), b.max(b.all_team_sides())), b.strike(b.acting())));
  EXPECT_EQ(err.kind(), CompileErrorKind::TraitBoundError);
  const std::string hint = reporter.suggestion(err);
  EXPECT_TRUE(has(hint, "TeamSide implements:"));
  EXPECT_TRUE(has(hint, "Eq"));
}
