// tests/unit/query/test_operators.cpp - Unit tests for the operator table and paths
//

#include <gtest/gtest.h>

#include <set>
#include <string>
#include <vector>

#include "docschema/query/operators.hpp"
#include "docschema/query/query_path.hpp"

using namespace docschema::query;

TEST(OperatorsTest, TableHasNoDuplicates)
{
  std::set<std::string_view> names;
  for (const auto & op : k_query_operators) {
    EXPECT_TRUE(names.insert(op.name).second) << op.name;
    EXPECT_TRUE(is_operator_key(op.name)) << op.name;
  }
}

TEST(OperatorsTest, Lookup)
{
  ASSERT_NE(find_operator("$elemMatch"), nullptr);
  EXPECT_EQ(find_operator("$elemMatch")->category, OperatorCategory::Array);
  EXPECT_EQ(find_operator("$bitsAnySet")->category, OperatorCategory::Bitwise);
  EXPECT_TRUE(is_known_operator("$comment"));
  EXPECT_FALSE(is_known_operator("$invalidOp"));
  EXPECT_FALSE(is_known_operator("eq"));
}

TEST(OperatorsTest, Families)
{
  EXPECT_TRUE(is_logical_list_operator("$nor"));
  EXPECT_FALSE(is_logical_list_operator("$not"));
  EXPECT_TRUE(is_value_comparison_operator("$lte"));
  EXPECT_FALSE(is_value_comparison_operator("$in"));
  EXPECT_TRUE(is_document_level_operator("$where"));
  EXPECT_FALSE(is_document_level_operator("$regex"));
}

TEST(OperatorsTest, OperatorKeyNeedsSigil)
{
  static_assert(is_operator_key("$x"));
  static_assert(!is_operator_key("x$"));
  static_assert(!is_operator_key(""));
}

TEST(QueryPathTest, JoinAndIndex)
{
  EXPECT_EQ(docschema::join_path("", "a"), "a");
  EXPECT_EQ(docschema::join_path("a", "$in"), "a.$in");
  EXPECT_EQ(index_path("a.$in", 2), "a.$in[2]");
}

TEST(QueryPathTest, SplitKeepsEmptySegments)
{
  EXPECT_EQ(split_field_path("a"), (std::vector<std::string>{"a"}));
  EXPECT_EQ(split_field_path("a.b.c"), (std::vector<std::string>{"a", "b", "c"}));
  EXPECT_EQ(split_field_path("a..b"), (std::vector<std::string>{"a", "", "b"}));
  EXPECT_EQ(split_field_path("a."), (std::vector<std::string>{"a", ""}));
}
