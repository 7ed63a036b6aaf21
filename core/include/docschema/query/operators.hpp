// docschema/query/operators.hpp - Query filter operator table
//
// See: https://www.mongodb.com/docs/manual/reference/operator/query/
//
#pragma once

#include <array>
#include <string_view>

namespace docschema::query
{

enum class OperatorCategory {
  Comparison,
  Logical,
  Element,
  Evaluation,
  Geospatial,
  Array,
  Bitwise,
  Comment,
};

struct OperatorInfo
{
  std::string_view name;
  OperatorCategory category;
};

inline constexpr std::array<OperatorInfo, 41> k_query_operators = {{
  // Comparison
  {"$eq", OperatorCategory::Comparison},
  {"$gt", OperatorCategory::Comparison},
  {"$gte", OperatorCategory::Comparison},
  {"$in", OperatorCategory::Comparison},
  {"$lt", OperatorCategory::Comparison},
  {"$lte", OperatorCategory::Comparison},
  {"$ne", OperatorCategory::Comparison},
  {"$nin", OperatorCategory::Comparison},
  // Logical
  {"$and", OperatorCategory::Logical},
  {"$or", OperatorCategory::Logical},
  {"$not", OperatorCategory::Logical},
  {"$nor", OperatorCategory::Logical},
  // Element
  {"$exists", OperatorCategory::Element},
  {"$type", OperatorCategory::Element},
  // Evaluation
  {"$expr", OperatorCategory::Evaluation},
  {"$jsonSchema", OperatorCategory::Evaluation},
  {"$mod", OperatorCategory::Evaluation},
  {"$regex", OperatorCategory::Evaluation},
  {"$options", OperatorCategory::Evaluation},
  {"$text", OperatorCategory::Evaluation},
  {"$where", OperatorCategory::Evaluation},
  {"$search", OperatorCategory::Evaluation},
  // Geospatial
  {"$geoIntersects", OperatorCategory::Geospatial},
  {"$geoWithin", OperatorCategory::Geospatial},
  {"$near", OperatorCategory::Geospatial},
  {"$nearSphere", OperatorCategory::Geospatial},
  {"$box", OperatorCategory::Geospatial},
  {"$center", OperatorCategory::Geospatial},
  {"$centerSphere", OperatorCategory::Geospatial},
  {"$geometry", OperatorCategory::Geospatial},
  {"$maxDistance", OperatorCategory::Geospatial},
  {"$minDistance", OperatorCategory::Geospatial},
  {"$polygon", OperatorCategory::Geospatial},
  // Array
  {"$all", OperatorCategory::Array},
  {"$elemMatch", OperatorCategory::Array},
  {"$size", OperatorCategory::Array},
  // Bitwise
  {"$bitsAllClear", OperatorCategory::Bitwise},
  {"$bitsAllSet", OperatorCategory::Bitwise},
  {"$bitsAnyClear", OperatorCategory::Bitwise},
  {"$bitsAnySet", OperatorCategory::Bitwise},
  // Comments
  {"$comment", OperatorCategory::Comment},
}};

/// Keys starting with '$' select an operator rather than naming a field
[[nodiscard]] constexpr bool is_operator_key(std::string_view key) noexcept
{
  return !key.empty() && key.front() == '$';
}

/// Table entry for a known operator, nullptr otherwise
[[nodiscard]] const OperatorInfo * find_operator(std::string_view name) noexcept;

[[nodiscard]] bool is_known_operator(std::string_view name) noexcept;

/// $and, $or, $nor
[[nodiscard]] bool is_logical_list_operator(std::string_view name) noexcept;

/// $eq, $ne, $gt, $gte, $lt, $lte
[[nodiscard]] bool is_value_comparison_operator(std::string_view name) noexcept;

/// Operators that stand alone at document level: $expr, $where, $text, $comment, $jsonSchema
[[nodiscard]] bool is_document_level_operator(std::string_view name) noexcept;

}  // namespace docschema::query
