// tests/unit/schema/test_schema_inferencer.cpp - Unit tests for schema inference
//

#include <gtest/gtest.h>

#include <string>

#include "docschema/basic/diagnostic.hpp"
#include "docschema/basic/diagnostic_codes.hpp"
#include "docschema/schema/schema_inferencer.hpp"
#include "docschema/schema/schema_merger.hpp"
#include "docschema/test_support/schema_helpers.hpp"

using namespace docschema;
using docschema::test_support::array_of;
using docschema::test_support::has_code;
using docschema::test_support::leaf;
using docschema::test_support::object_of;

TEST(SchemaInferencerTest, Primitives)
{
  EXPECT_EQ(infer(Json(1)), leaf({TypeTag::Int}));
  EXPECT_EQ(infer(Json("x")), leaf({TypeTag::String}));
  EXPECT_EQ(infer(Json(nullptr)), leaf({TypeTag::Null}));
  EXPECT_EQ(infer(Json::parse(R"({"$oid": "abc"})")), leaf({TypeTag::ObjectId}));
}

TEST(SchemaInferencerTest, NestedDocument)
{
  const auto schema = infer(Json::parse(R"({"name": "a", "address": {"zip": 12345}})"));
  const auto expected = object_of(
    {{"name", leaf({TypeTag::String})},
     {"address", object_of({{"zip", leaf({TypeTag::Int})}})}});
  EXPECT_EQ(schema, expected);
}

TEST(SchemaInferencerTest, EmptyArrayCarriesPlaceholder)
{
  EXPECT_EQ(infer(Json::array()), SchemaNode::empty_array());
}

TEST(SchemaInferencerTest, ArrayElementsAreFolded)
{
  const auto schema = infer(Json::parse(R"([1, "two", {"k": true}, {"k": null, "j": 1.5}])"));
  ASSERT_NE(schema.element_schema(), nullptr);
  const auto & element = *schema.element_schema();
  EXPECT_EQ(element.types, (TypeSet{TypeTag::String, TypeTag::Int, TypeTag::Object}));
  ASSERT_NE(element.object_schema(), nullptr);
  EXPECT_EQ(element.object_schema()->at("k").types, (TypeSet{TypeTag::Bool, TypeTag::Null}));
  EXPECT_EQ(element.object_schema()->at("j"), leaf({TypeTag::Double}));
}

TEST(SchemaInferencerTest, NestedEmptyArraysMergeAway)
{
  const auto schema = infer(Json::parse(R"([[], [1]])"));
  const auto expected = array_of(array_of(leaf({TypeTag::Int})));
  EXPECT_EQ(schema, expected);
}

TEST(SchemaInferencerTest, MergeWithSelfIsStable)
{
  const Json value = Json::parse(R"({"a": [1, {"b": []}], "c": {"d": "x"}})");
  const auto schema = infer(value);
  EXPECT_EQ(merge(schema, schema), schema);
}

TEST(SchemaInferencerTest, DepthLimitRecordsUnknown)
{
  Json deep = 1;
  for (int i = 0; i < 5; ++i) {
    deep = Json{{"n", deep}};
  }

  DiagnosticBag diags;
  InferenceOptions options;
  options.max_depth = 2;
  const auto schema = infer(deep, options, &diags);

  // Levels 0..2 are traversed; the value at level 3 is past the limit.
  const SchemaNode * node = &schema;
  for (int i = 0; i < 3; ++i) {
    ASSERT_NE(node->object_schema(), nullptr);
    node = &node->object_schema()->at("n");
  }
  EXPECT_EQ(*node, SchemaNode::unknown());
  EXPECT_TRUE(has_code(diags, codes::k_inference_depth));
}
