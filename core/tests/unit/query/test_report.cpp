// tests/unit/query/test_report.cpp - Unit tests for message lists and reports
//

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "docschema/basic/diagnostic.hpp"
#include "docschema/query/report.hpp"

using namespace docschema;
using namespace docschema::query;

TEST(ReportTest, MessagesKeepEmissionOrder)
{
  DiagnosticBag diags;
  diags.report_error("a", "first");
  diags.report_warning("b", "second");
  diags.report_info("", "third");
  diags.report_error("c", "fourth");

  const std::vector<std::string> expected = {
    "first", "Warning: second", "Note: third", "fourth"};
  EXPECT_EQ(to_messages(diags), expected);
}

TEST(ReportTest, SyntaxReport)
{
  EXPECT_EQ(format_syntax_report({}), "Syntax is valid.");
  EXPECT_EQ(
    format_syntax_report({"one", "two"}), "Syntax validation errors found:\n- one\n- two");
}

TEST(ReportTest, SchemaReport)
{
  EXPECT_EQ(format_schema_report({}), "Query is valid against the schema.");
  EXPECT_EQ(
    format_schema_report({"bad"}), "Query validation errors found against the schema:\n- bad");
}
