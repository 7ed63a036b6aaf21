// docschema/query/query_path.hpp - Dotted path helpers for diagnostics
#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "docschema/basic/diagnostic.hpp"  // join_path

namespace docschema::query
{

/// "a.$in" + 2 -> "a.$in[2]"
[[nodiscard]] inline std::string index_path(const std::string & path, size_t index)
{
  return path + "[" + std::to_string(index) + "]";
}

/// DBRef sub-fields, the only '$'-prefixed segments allowed inside a dotted field name
[[nodiscard]] inline bool is_dbref_field(const std::string & segment)
{
  return segment == "$ref" || segment == "$id" || segment == "$db";
}

/// Split a dotted field name; empty segments are preserved ("a..b" -> a, "", b)
[[nodiscard]] inline std::vector<std::string> split_field_path(const std::string & field)
{
  std::vector<std::string> parts;
  std::string::size_type start = 0;
  while (true) {
    const auto dot = field.find('.', start);
    if (dot == std::string::npos) {
      parts.push_back(field.substr(start));
      break;
    }
    parts.push_back(field.substr(start, dot - start));
    start = dot + 1;
  }
  return parts;
}

}  // namespace docschema::query
