// tests/unit/driver/test_sample_loader.cpp - Unit tests for reading sample files
//

#include <gtest/gtest.h>

#include <filesystem>
#include <string>

#include "docschema/driver/sample_loader.hpp"
#include "docschema/test_support/schema_helpers.hpp"

using namespace docschema;
using docschema::test_support::make_temp_dir;
using docschema::test_support::write_file;

namespace fs = std::filesystem;

class SampleLoaderTest : public ::testing::Test
{
protected:
  void SetUp() override { dir_ = make_temp_dir("docschema_samples"); }
  void TearDown() override
  {
    std::error_code ec;
    fs::remove_all(dir_, ec);
  }

  fs::path dir_;
};

TEST_F(SampleLoaderTest, JsonArrayIsTruncated)
{
  const auto path = dir_ / "users.json";
  write_file(path, R"([{"a": 1}, {"a": 2}, {"a": 3}])");

  const auto all = load_samples(path, 0);
  ASSERT_TRUE(all.success) << all.error;
  EXPECT_EQ(all.documents.size(), 3U);

  const auto two = load_samples(path, 2);
  ASSERT_TRUE(two.success);
  ASSERT_EQ(two.documents.size(), 2U);
  EXPECT_EQ(two.documents[1]["a"], 2);
}

TEST_F(SampleLoaderTest, SingleDocument)
{
  const auto path = dir_ / "one.json";
  write_file(path, R"({"a": 1})");
  const auto result = load_samples(path, 10);
  ASSERT_TRUE(result.success);
  EXPECT_EQ(result.documents.size(), 1U);
}

TEST_F(SampleLoaderTest, LineDelimited)
{
  const auto path = dir_ / "events.jsonl";
  write_file(path, "{\"a\": 1}\n\n{\"a\": 2}\r\n{\"a\": 3}\n");

  const auto result = load_samples(path, 2);
  ASSERT_TRUE(result.success) << result.error;
  EXPECT_EQ(result.documents.size(), 2U);
}

TEST_F(SampleLoaderTest, LineDelimitedErrorNamesLine)
{
  const auto path = dir_ / "bad.ndjson";
  write_file(path, "{\"a\": 1}\n{oops\n");

  const auto result = load_samples(path, 0);
  EXPECT_FALSE(result.success);
  EXPECT_NE(result.error.find(":2:"), std::string::npos);
}

TEST_F(SampleLoaderTest, RejectsScalarsAndBadJson)
{
  write_file(dir_ / "scalar.json", "42");
  EXPECT_FALSE(load_samples(dir_ / "scalar.json", 0).success);

  write_file(dir_ / "broken.json", "[{");
  EXPECT_FALSE(load_samples(dir_ / "broken.json", 0).success);

  EXPECT_FALSE(load_samples(dir_ / "absent.json", 0).success);
}

TEST_F(SampleLoaderTest, CollectionNames)
{
  EXPECT_EQ(collection_name("dir/users.json"), "users");
  EXPECT_EQ(collection_name("events.ndjson"), "events");
  EXPECT_FALSE(collection_name("notes.txt").has_value());
  EXPECT_TRUE(is_sample_file("x.jsonl"));
  EXPECT_FALSE(is_sample_file("x.yaml"));
}

TEST_F(SampleLoaderTest, LoadJsonFileKeepsAnyValue)
{
  write_file(dir_ / "query.json", R"([1, 2])");
  const auto result = load_json_file(dir_ / "query.json");
  ASSERT_TRUE(result.success);
  ASSERT_EQ(result.documents.size(), 1U);
  EXPECT_TRUE(result.documents[0].is_array());
}
