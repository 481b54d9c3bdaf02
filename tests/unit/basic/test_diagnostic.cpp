// tests/unit/basic/test_diagnostic.cpp - DiagnosticBag tests
//

#include <gtest/gtest.h>

#include "rule_dsl/basic/diagnostic.hpp"

using namespace rule_dsl;

TEST(DiagnosticBagTest, BuilderRegistersOnDestruction)
{
  DiagnosticBag bag;
  bag.report_error("Strike.target", "type mismatch", "expected Character")
    .with_code("E001")
    .with_help("use a Character token")
    .with_snippet("Number { value: 5 }");

  ASSERT_EQ(bag.size(), 1U);
  const Diagnostic & d = bag.all().front();
  EXPECT_EQ(d.severity, Severity::Error);
  EXPECT_EQ(d.code, "E001");
  EXPECT_EQ(d.message, "type mismatch");
  EXPECT_EQ(d.primary_location(), "Strike.target");
  ASSERT_NE(d.primary_label(), nullptr);
  EXPECT_EQ(d.primary_label()->message, "expected Character");
  EXPECT_EQ(d.help_message, "use a Character token");
  EXPECT_EQ(d.snippet, "Number { value: 5 }");
}

TEST(DiagnosticBagTest, SeverityQueries)
{
  DiagnosticBag bag;
  EXPECT_FALSE(bag.has_errors());

  bag.report_warning("", "unused rule");
  EXPECT_TRUE(bag.has_warnings());
  EXPECT_FALSE(bag.has_errors());

  bag.report_error("", "bad rule");
  EXPECT_TRUE(bag.has_errors());
  EXPECT_EQ(bag.errors().size(), 1U);
  EXPECT_EQ(bag.warnings().size(), 1U);
}

TEST(DiagnosticBagTest, MergeKeepsOrder)
{
  DiagnosticBag a;
  a.report_error("", "first");
  DiagnosticBag b;
  b.report_error("", "second");

  a.merge(std::move(b));
  ASSERT_EQ(a.size(), 2U);
  EXPECT_EQ(a.all()[0].message, "first");
  EXPECT_EQ(a.all()[1].message, "second");
}

TEST(DiagnosticTest, PrimaryLabelFallsBackToFirst)
{
  Diagnostic d;
  EXPECT_EQ(d.primary_label(), nullptr);
  EXPECT_EQ(d.primary_location(), "");

  d.labels.push_back(Label{"Eq.right", "note", LabelStyle::Secondary});
  ASSERT_NE(d.primary_label(), nullptr);
  EXPECT_EQ(d.primary_location(), "Eq.right");
}
