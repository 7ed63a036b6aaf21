// docschema/test_support/schema_helpers.hpp - helpers for unit/integration tests
//
// Compact builders for schema nodes and predicates over validator output.
//
#pragma once

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "docschema/basic/diagnostic.hpp"
#include "docschema/schema/schema_node.hpp"

namespace docschema::test_support
{

/// {types: {tags...}} without children
[[nodiscard]] inline SchemaNode leaf(std::initializer_list<TypeTag> tags)
{
  return SchemaNode(TypeSet(tags));
}

/// {types: {object}, schema: {fields...}}
[[nodiscard]] inline SchemaNode object_of(FieldSchemas fields)
{
  return SchemaNode::object(std::move(fields));
}

/// {types: {array}, element_schema: element}
[[nodiscard]] inline SchemaNode array_of(SchemaNode element)
{
  return SchemaNode::array(std::move(element));
}

[[nodiscard]] inline bool has_message_containing(
  const std::vector<std::string> & messages, std::string_view needle)
{
  return std::any_of(messages.begin(), messages.end(), [&](const std::string & m) {
    return m.find(needle) != std::string::npos;
  });
}

[[nodiscard]] inline bool has_code(const DiagnosticBag & diags, std::string_view code)
{
  return std::any_of(
    diags.begin(), diags.end(), [&](const Diagnostic & d) { return d.code == code; });
}

/// Fresh directory under the system temp dir (caller removes it)
[[nodiscard]] inline std::filesystem::path make_temp_dir(std::string_view prefix)
{
  const auto base = std::filesystem::temp_directory_path();
  const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  const auto dir = base / (std::string(prefix) + "_" + std::to_string(now));
  std::filesystem::create_directories(dir);
  return dir;
}

inline void write_file(const std::filesystem::path & path, const std::string & content)
{
  std::ofstream out(path);
  out << content;
}

}  // namespace docschema::test_support
