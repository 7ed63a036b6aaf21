// docschema/driver/sample_loader.cpp - Reading sampled documents from disk
//
#include "docschema/driver/sample_loader.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>
#include <utility>

namespace docschema
{

namespace
{

bool is_line_delimited(const std::filesystem::path & path)
{
  const auto ext = path.extension();
  return ext == ".jsonl" || ext == ".ndjson";
}

bool is_blank(const std::string & line)
{
  return line.find_first_not_of(" \t\r") == std::string::npos;
}

SampleLoadResult load_line_delimited(
  std::ifstream & in, const std::filesystem::path & path, size_t sample_size)
{
  std::vector<Json> documents;
  std::string line;
  size_t line_no = 0;
  while (std::getline(in, line)) {
    ++line_no;
    if (is_blank(line)) {
      continue;
    }
    if (sample_size != 0 && documents.size() >= sample_size) {
      break;
    }
    try {
      documents.push_back(Json::parse(line));
    } catch (const Json::exception & e) {
      return SampleLoadResult::fail(
        path.string() + ":" + std::to_string(line_no) + ": invalid JSON: " + e.what());
    }
  }
  return SampleLoadResult::ok(std::move(documents));
}

}  // namespace

SampleLoadResult load_json_file(const std::filesystem::path & path)
{
  std::ifstream in(path);
  if (!in) {
    return SampleLoadResult::fail("cannot open file: " + path.string());
  }

  std::stringstream buffer;
  buffer << in.rdbuf();

  std::vector<Json> documents;
  try {
    documents.push_back(Json::parse(buffer.str()));
  } catch (const Json::exception & e) {
    return SampleLoadResult::fail(path.string() + ": invalid JSON: " + e.what());
  }
  return SampleLoadResult::ok(std::move(documents));
}

SampleLoadResult load_samples(const std::filesystem::path & path, size_t sample_size)
{
  if (!std::filesystem::is_regular_file(path)) {
    return SampleLoadResult::fail("sample file not found: " + path.string());
  }

  if (is_line_delimited(path)) {
    std::ifstream in(path);
    if (!in) {
      return SampleLoadResult::fail("cannot open file: " + path.string());
    }
    return load_line_delimited(in, path, sample_size);
  }

  auto loaded = load_json_file(path);
  if (!loaded.success) {
    return loaded;
  }

  Json & root = loaded.documents.front();
  if (root.is_object()) {
    return loaded;
  }
  if (!root.is_array()) {
    return SampleLoadResult::fail(
      path.string() + ": expected an array of documents or a single document");
  }

  std::vector<Json> documents;
  const size_t count =
    sample_size == 0 ? root.size() : std::min(sample_size, static_cast<size_t>(root.size()));
  documents.reserve(count);
  for (size_t i = 0; i < count; ++i) {
    documents.push_back(std::move(root[i]));
  }
  return SampleLoadResult::ok(std::move(documents));
}

bool is_sample_file(const std::filesystem::path & path)
{
  return path.extension() == ".json" || is_line_delimited(path);
}

std::optional<std::string> collection_name(const std::filesystem::path & path)
{
  if (!is_sample_file(path) || path.stem().empty()) {
    return std::nullopt;
  }
  return path.stem().string();
}

}  // namespace docschema
