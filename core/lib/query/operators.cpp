// docschema/query/operators.cpp - Operator table lookups
//
#include "docschema/query/operators.hpp"

namespace docschema::query
{

const OperatorInfo * find_operator(std::string_view name) noexcept
{
  for (const auto & op : k_query_operators) {
    if (op.name == name) {
      return &op;
    }
  }
  return nullptr;
}

bool is_known_operator(std::string_view name) noexcept { return find_operator(name) != nullptr; }

bool is_logical_list_operator(std::string_view name) noexcept
{
  return name == "$and" || name == "$or" || name == "$nor";
}

bool is_value_comparison_operator(std::string_view name) noexcept
{
  return name == "$eq" || name == "$ne" || name == "$gt" || name == "$gte" || name == "$lt" ||
         name == "$lte";
}

bool is_document_level_operator(std::string_view name) noexcept
{
  return name == "$expr" || name == "$where" || name == "$text" || name == "$comment" ||
         name == "$jsonSchema";
}

}  // namespace docschema::query
