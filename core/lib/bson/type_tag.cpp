// docschema/bson/type_tag.cpp - TypeTag names and BSON type codes
//
#include "docschema/bson/type_tag.hpp"

#include <algorithm>
#include <array>
#include <utility>

namespace docschema
{

namespace
{

constexpr std::array<std::pair<TypeTag, std::string_view>, 20> k_type_names = {{
  {TypeTag::String, "string"},
  {TypeTag::Bool, "bool"},
  {TypeTag::Int, "int"},
  {TypeTag::Long, "long"},
  {TypeTag::Double, "double"},
  {TypeTag::Decimal, "decimal"},
  {TypeTag::Array, "array"},
  {TypeTag::Object, "object"},
  {TypeTag::ObjectId, "objectId"},
  {TypeTag::DbRef, "dbRef"},
  {TypeTag::Timestamp, "timestamp"},
  {TypeTag::Date, "date"},
  {TypeTag::Null, "null"},
  {TypeTag::MinKey, "minKey"},
  {TypeTag::MaxKey, "maxKey"},
  {TypeTag::BinData, "binData"},
  {TypeTag::JavaScript, "javascript"},
  {TypeTag::Regex, "regex"},
  {TypeTag::EmptyArray, "empty_array"},
  {TypeTag::Unknown, "unknown"},
}};

// https://www.mongodb.com/docs/manual/reference/bson-types/
constexpr std::array<std::pair<int64_t, TypeTag>, 17> k_bson_codes = {{
  {1, TypeTag::Double},
  {2, TypeTag::String},
  {3, TypeTag::Object},
  {4, TypeTag::Array},
  {5, TypeTag::BinData},
  {7, TypeTag::ObjectId},
  {8, TypeTag::Bool},
  {9, TypeTag::Date},
  {10, TypeTag::Null},
  {11, TypeTag::Regex},
  {12, TypeTag::DbRef},  // dbPointer (deprecated)
  {13, TypeTag::JavaScript},
  {16, TypeTag::Int},
  {17, TypeTag::Timestamp},
  {18, TypeTag::Long},
  {19, TypeTag::Decimal},
  {-1, TypeTag::MinKey},
}};

}  // namespace

bool contains_numeric(const TypeSet & types) noexcept
{
  return std::any_of(types.begin(), types.end(), [](TypeTag t) { return is_numeric(t); });
}

std::string_view type_name(TypeTag tag) noexcept
{
  for (const auto & [t, name] : k_type_names) {
    if (t == tag) {
      return name;
    }
  }
  return "unknown";
}

std::optional<TypeTag> parse_type_name(std::string_view name) noexcept
{
  for (const auto & [t, n] : k_type_names) {
    if (n == name) {
      return t;
    }
  }
  return std::nullopt;
}

std::optional<TypeTag> type_from_bson_code(int64_t code) noexcept
{
  if (code == 127) {
    return TypeTag::MaxKey;
  }
  for (const auto & [c, t] : k_bson_codes) {
    if (c == code) {
      return t;
    }
  }
  return std::nullopt;
}

std::optional<TypeTag> type_from_bson_alias(std::string_view alias) noexcept
{
  // $type aliases mostly match the tag names; these are the exceptions.
  if (alias == "dbPointer") return TypeTag::DbRef;
  if (alias == "javascriptWithScope") return TypeTag::JavaScript;
  if (alias == "empty_array" || alias == "unknown") return std::nullopt;
  return parse_type_name(alias);
}

std::string format_type_set(const TypeSet & types)
{
  std::string out = "{";
  bool first = true;
  for (const TypeTag t : types) {
    if (!first) {
      out += ", ";
    }
    out += type_name(t);
    first = false;
  }
  out += "}";
  return out;
}

}  // namespace docschema
