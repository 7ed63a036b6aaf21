// tests/unit/bson/test_type_tag.cpp - Unit tests for TypeTag names and codes
//

#include <gtest/gtest.h>

#include "docschema/bson/type_tag.hpp"

using namespace docschema;

TEST(TypeTagTest, NamesRoundTripThroughParse)
{
  for (const TypeTag tag :
       {TypeTag::String, TypeTag::ObjectId, TypeTag::EmptyArray, TypeTag::Date,
        TypeTag::JavaScript}) {
    const auto parsed = parse_type_name(type_name(tag));
    ASSERT_TRUE(parsed.has_value()) << type_name(tag);
    EXPECT_EQ(*parsed, tag);
  }
}

TEST(TypeTagTest, ParseRejectsUnknownNames)
{
  EXPECT_FALSE(parse_type_name("integer").has_value());
  EXPECT_FALSE(parse_type_name("").has_value());
  EXPECT_FALSE(parse_type_name("String").has_value());
}

TEST(TypeTagTest, BsonCodesResolve)
{
  EXPECT_EQ(type_from_bson_code(2), TypeTag::String);
  EXPECT_EQ(type_from_bson_code(16), TypeTag::Int);
  EXPECT_EQ(type_from_bson_code(18), TypeTag::Long);
  EXPECT_EQ(type_from_bson_code(9), TypeTag::Date);
  EXPECT_EQ(type_from_bson_code(-1), TypeTag::MinKey);
  EXPECT_EQ(type_from_bson_code(127), TypeTag::MaxKey);
  EXPECT_FALSE(type_from_bson_code(6).has_value());  // undefined
  EXPECT_FALSE(type_from_bson_code(42).has_value());
}

TEST(TypeTagTest, BsonAliasesResolve)
{
  EXPECT_EQ(type_from_bson_alias("string"), TypeTag::String);
  EXPECT_EQ(type_from_bson_alias("objectId"), TypeTag::ObjectId);
  EXPECT_EQ(type_from_bson_alias("dbPointer"), TypeTag::DbRef);
  EXPECT_EQ(type_from_bson_alias("javascriptWithScope"), TypeTag::JavaScript);
  EXPECT_FALSE(type_from_bson_alias("empty_array").has_value());
  EXPECT_FALSE(type_from_bson_alias("unknown").has_value());
}

TEST(TypeTagTest, NumericFamily)
{
  EXPECT_TRUE(is_numeric(TypeTag::Int));
  EXPECT_TRUE(is_numeric(TypeTag::Decimal));
  EXPECT_FALSE(is_numeric(TypeTag::Bool));
  EXPECT_TRUE(is_integral(TypeTag::Long));
  EXPECT_FALSE(is_integral(TypeTag::Double));

  EXPECT_TRUE(contains_numeric({TypeTag::String, TypeTag::Double}));
  EXPECT_FALSE(contains_numeric({TypeTag::String, TypeTag::Null}));
}

TEST(TypeTagTest, FormatTypeSet)
{
  EXPECT_EQ(format_type_set({}), "{}");
  EXPECT_EQ(format_type_set({TypeTag::String, TypeTag::Int}), "{string, int}");
}
