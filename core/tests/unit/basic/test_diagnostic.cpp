// tests/unit/basic/test_diagnostic.cpp - Unit tests for DiagnosticBag

#include <gtest/gtest.h>

#include "chartscan/basic/diagnostic.hpp"

using namespace chartscan;

TEST(BasicDiagnostic, BuilderRegistersOnDestruction)
{
  DiagnosticBag bag;
  {
    auto builder = bag.report_error(ErrorKind::ParseError, "bad placeholder");
    EXPECT_TRUE(bag.empty());
    builder.with_location("templates/a.yaml", 3).with_help("remove it");
  }
  ASSERT_EQ(bag.size(), 1U);

  const Diagnostic & d = *bag.begin();
  EXPECT_EQ(d.severity, Severity::Error);
  EXPECT_EQ(d.kind, ErrorKind::ParseError);
  EXPECT_EQ(d.message, "bad placeholder");
  ASSERT_TRUE(d.location.has_value());
  EXPECT_EQ(d.location->file, std::filesystem::path("templates/a.yaml"));
  EXPECT_EQ(d.location->line, 3U);
  EXPECT_TRUE(d.location->has_line());
  ASSERT_TRUE(d.help_message.has_value());
  EXPECT_EQ(*d.help_message, "remove it");
}

TEST(BasicDiagnostic, ErrorMessagesSkipWarningsAndKeepOrder)
{
  DiagnosticBag bag;
  bag.report_error(ErrorKind::ExternalToolError, "first");
  bag.report_warning(ErrorKind::ExternalToolError, "lint warning");
  bag.report_error(ErrorKind::UndefinedValue, "second");

  EXPECT_EQ(bag.errors().size(), 2U);
  EXPECT_EQ(bag.warnings().size(), 1U);

  const std::vector<std::string> expected{"first", "second"};
  EXPECT_EQ(bag.error_messages(), expected);
}

TEST(BasicDiagnostic, MergeAppends)
{
  DiagnosticBag a;
  a.report_error(ErrorKind::LoadError, "a");
  DiagnosticBag b;
  b.report_error(ErrorKind::WalkError, "b");

  a.merge(std::move(b));
  const std::vector<std::string> expected{"a", "b"};
  EXPECT_EQ(a.error_messages(), expected);
}

TEST(BasicDiagnostic, EmptyBagHasNoErrors)
{
  const DiagnosticBag bag;
  EXPECT_TRUE(bag.empty());
  EXPECT_TRUE(bag.errors().empty());
  EXPECT_TRUE(bag.error_messages().empty());
}

TEST(BasicDiagnostic, ErrorKindNames)
{
  EXPECT_STREQ(to_string(ErrorKind::ConfigError), "ConfigError");
  EXPECT_STREQ(to_string(ErrorKind::UndefinedValue), "UndefinedValue");
}
