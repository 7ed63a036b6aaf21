// tests/integration/test_toolkit.cpp - End-to-end tests over sample directories
//
// Infers schemas from sample files on disk and validates queries against the
// resulting snapshots, the way the CLI chains the two.
//

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "docschema/basic/diagnostic_codes.hpp"
#include "docschema/driver/toolkit.hpp"
#include "docschema/schema/schema_json.hpp"
#include "docschema/test_support/schema_helpers.hpp"

using namespace docschema;
using docschema::test_support::has_code;
using docschema::test_support::has_message_containing;
using docschema::test_support::make_temp_dir;
using docschema::test_support::write_file;

namespace fs = std::filesystem;

class ToolkitTest : public ::testing::Test
{
protected:
  void SetUp() override
  {
    dir_ = make_temp_dir("docschema_toolkit");
    write_file(
      dir_ / "users.json",
      R"([
        {"_id": {"$oid": "507f1f77bcf86cd799439011"}, "name": "Ann", "age": 31,
         "tags": [], "address": {"city": "Oslo"}},
        {"_id": {"$oid": "507f1f77bcf86cd799439012"}, "name": "Bob", "age": null,
         "tags": ["a", "b"], "address": {"city": "Rome", "zip": 12345}},
        "not a document"
      ])");
    write_file(
      dir_ / "orders.jsonl",
      "{\"sku\": \"A1\", \"qty\": 2, \"lines\": [{\"price\": 9.5}]}\n"
      "{\"sku\": \"B2\", \"qty\": {\"$numberLong\": \"5000000000\"}, \"lines\": []}\n");
    write_file(dir_ / "empty.json", "[]");
    write_file(dir_ / "README.txt", "ignored");
  }

  void TearDown() override
  {
    std::error_code ec;
    fs::remove_all(dir_, ec);
  }

  fs::path dir_;
};

TEST_F(ToolkitTest, InferCollectionFromFile)
{
  const Toolkit toolkit;
  const auto result = toolkit.infer_collection(dir_ / "users.json");

  ASSERT_TRUE(result.success);
  EXPECT_EQ(result.documents_analyzed, 2U);
  EXPECT_EQ(result.documents_skipped, 1U);
  EXPECT_TRUE(has_code(result.diagnostics, codes::k_document_not_object));

  const auto & schema = result.schema;
  EXPECT_EQ(schema.at("_id").types, TypeSet{TypeTag::ObjectId});
  EXPECT_EQ(schema.at("age").types, (TypeSet{TypeTag::Int, TypeTag::Null}));
  ASSERT_NE(schema.at("tags").element_schema(), nullptr);
  EXPECT_EQ(schema.at("tags").element_schema()->types, TypeSet{TypeTag::String});
  ASSERT_NE(schema.at("address").object_schema(), nullptr);
  EXPECT_EQ(schema.at("address").object_schema()->size(), 2U);
}

TEST_F(ToolkitTest, SampleSizeLimitsDocuments)
{
  ToolkitConfig config;
  config.inference.sample_size = 1;
  const Toolkit toolkit(config);

  const auto result = toolkit.infer_collection(dir_ / "users.json");
  EXPECT_EQ(result.documents_analyzed, 1U);
  ASSERT_NE(result.schema.at("tags").element_schema(), nullptr);
  EXPECT_EQ(result.schema.at("tags").element_schema()->types, TypeSet{TypeTag::EmptyArray});
}

TEST_F(ToolkitTest, InferDatabaseDirectory)
{
  const Toolkit toolkit;
  const auto result = toolkit.infer_database(dir_);

  ASSERT_TRUE(result.success);
  EXPECT_EQ(result.schema.size(), 2U);  // empty.json is omitted
  EXPECT_EQ(result.schema.count("empty"), 0U);
  EXPECT_TRUE(has_code(result.diagnostics, codes::k_empty_collection));

  const auto & orders = result.schema.at("orders");
  EXPECT_EQ(orders.at("qty").types, (TypeSet{TypeTag::Int, TypeTag::Long}));
  ASSERT_NE(orders.at("lines").element_schema(), nullptr);
  EXPECT_EQ(orders.at("lines").element_schema()->types, TypeSet{TypeTag::Object});
}

TEST_F(ToolkitTest, InferDatabaseTargetCollection)
{
  const Toolkit toolkit;
  const auto only = toolkit.infer_database(dir_, std::string("orders"));
  ASSERT_TRUE(only.success);
  EXPECT_EQ(only.schema.size(), 1U);
  EXPECT_EQ(only.schema.count("orders"), 1U);

  const auto missing = toolkit.infer_database(dir_, std::string("nope"));
  EXPECT_FALSE(missing.success);
  EXPECT_TRUE(has_code(missing.diagnostics, codes::k_collection_not_found));
}

TEST_F(ToolkitTest, BrokenSampleFailsDatabaseInference)
{
  write_file(dir_ / "broken.json", "[{");
  const Toolkit toolkit;
  const auto result = toolkit.infer_database(dir_);
  EXPECT_FALSE(result.success);
  EXPECT_TRUE(has_code(result.diagnostics, codes::k_load_failed));
  // Other collections are still inferred.
  EXPECT_EQ(result.schema.count("users"), 1U);
}

TEST_F(ToolkitTest, MissingDirectory)
{
  const Toolkit toolkit;
  EXPECT_FALSE(toolkit.infer_database(dir_ / "absent").success);
}

TEST_F(ToolkitTest, ValidateAgainstInferredSnapshot)
{
  const Toolkit toolkit;
  const auto inferred = toolkit.infer_database(dir_);
  ASSERT_TRUE(inferred.success);
  const Json snapshot = to_json(inferred.schema);

  const auto ok = toolkit.validate_against_schema(
    Json::parse(R"({"age": {"$gte": 18}, "address.city": "Oslo", "tags": {"$all": ["a"]}})"),
    snapshot, std::string("users"));
  EXPECT_TRUE(ok.valid);
  EXPECT_TRUE(ok.messages().empty());

  const auto bad = toolkit.validate_against_schema(
    Json::parse(R"({"age": "old", "address.country": "NO"})"), snapshot, std::string("users"));
  EXPECT_FALSE(bad.valid);
  EXPECT_EQ(bad.messages().size(), 2U);

  const auto unknown = toolkit.validate_against_schema(
    Json::parse(R"({"a": 1})"), snapshot, std::string("nope"));
  EXPECT_FALSE(unknown.valid);
  EXPECT_TRUE(has_code(unknown.diagnostics, codes::k_collection_not_found));
}

TEST_F(ToolkitTest, ValidateSyntaxUsesConfig)
{
  ToolkitConfig config;
  config.validation.max_depth = 1;
  const Toolkit toolkit(config);

  EXPECT_TRUE(toolkit.validate_syntax(Json::parse(R"({"a": 1})")).valid);
  const auto deep = toolkit.validate_syntax(Json::parse(R"({"$and": [{"$or": [{"a": 1}]}]})"));
  EXPECT_FALSE(deep.valid);
  EXPECT_TRUE(has_message_containing(deep.messages(), "maximum depth"));
}

TEST_F(ToolkitTest, SnapshotRoundTripsThroughDisk)
{
  const Toolkit toolkit;
  const auto inferred = toolkit.infer_collection(dir_ / "orders.jsonl");
  ASSERT_TRUE(inferred.success);

  const std::string text = to_json(inferred.schema).dump(2);
  write_file(dir_ / "orders.schema.json", text);
  std::ifstream in(dir_ / "orders.schema.json");
  const auto decoded = collection_schema_from_json(Json::parse(in));
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(*decoded, inferred.schema);
}
