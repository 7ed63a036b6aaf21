// tests/unit/schema/test_schema_node.cpp - Unit tests for SchemaNode ownership
//

#include <gtest/gtest.h>

#include <utility>

#include "docschema/schema/schema_node.hpp"
#include "docschema/test_support/schema_helpers.hpp"

using namespace docschema;
using docschema::test_support::array_of;
using docschema::test_support::leaf;
using docschema::test_support::object_of;

TEST(SchemaNodeTest, FactoriesSetChildren)
{
  const auto obj = object_of({{"a", leaf({TypeTag::Int})}});
  ASSERT_NE(obj.object_schema(), nullptr);
  EXPECT_EQ(obj.element_schema(), nullptr);
  EXPECT_TRUE(obj.has_type(TypeTag::Object));
  EXPECT_EQ(obj.object_schema()->size(), 1U);

  const auto arr = array_of(leaf({TypeTag::String}));
  ASSERT_NE(arr.element_schema(), nullptr);
  EXPECT_EQ(arr.object_schema(), nullptr);
  EXPECT_TRUE(arr.element_schema()->has_type(TypeTag::String));

  const auto empty = SchemaNode::empty_array();
  ASSERT_NE(empty.element_schema(), nullptr);
  EXPECT_EQ(empty.element_schema()->types, TypeSet{TypeTag::EmptyArray});
}

TEST(SchemaNodeTest, ValidityFollowsTypes)
{
  EXPECT_FALSE(SchemaNode().is_valid());
  EXPECT_TRUE(SchemaNode::unknown().is_valid());
}

TEST(SchemaNodeTest, CopyIsDeep)
{
  auto original = object_of({{"inner", object_of({{"x", leaf({TypeTag::Bool})}})}});
  SchemaNode copy = original;
  EXPECT_EQ(copy, original);

  copy.set_object_schema({{"other", leaf({TypeTag::Null})}});
  EXPECT_NE(copy, original);
  ASSERT_NE(original.object_schema(), nullptr);
  EXPECT_EQ(original.object_schema()->count("inner"), 1U);
}

TEST(SchemaNodeTest, MoveTransfersChildren)
{
  auto source = array_of(leaf({TypeTag::Int}));
  SchemaNode target = std::move(source);
  ASSERT_NE(target.element_schema(), nullptr);
  EXPECT_TRUE(target.element_schema()->has_type(TypeTag::Int));
}

TEST(SchemaNodeTest, EqualityComparesStructure)
{
  EXPECT_EQ(array_of(leaf({TypeTag::Int})), array_of(leaf({TypeTag::Int})));
  EXPECT_NE(array_of(leaf({TypeTag::Int})), array_of(leaf({TypeTag::Long})));
  EXPECT_NE(leaf({TypeTag::Array}), array_of(leaf({TypeTag::Int})));
}

TEST(SchemaNodeTest, ClearersDropChildren)
{
  auto node = object_of({{"a", leaf({TypeTag::Int})}});
  node.clear_object_schema();
  EXPECT_EQ(node.object_schema(), nullptr);

  auto arr = array_of(leaf({TypeTag::Int}));
  arr.clear_element_schema();
  EXPECT_EQ(arr.element_schema(), nullptr);
}
