// docschema/bson/type_tag.hpp - Closed set of BSON value categories
//
// Every sampled value and every query value is classified into exactly one
// TypeTag. Schema nodes store sets of tags.
//
#pragma once

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <string_view>

namespace docschema
{

// ============================================================================
// TypeTag
// ============================================================================

/**
 * Value category of a document value.
 *
 * Declaration order is the canonical order used when a tag set is
 * serialized or printed.
 */
enum class TypeTag : uint8_t {
  String,
  Bool,
  Int,
  Long,
  Double,
  Decimal,
  Array,
  Object,
  ObjectId,
  DbRef,
  Timestamp,
  Date,
  Null,
  MinKey,
  MaxKey,
  BinData,
  JavaScript,
  Regex,

  /// Placeholder element type of an array observed only empty
  EmptyArray,

  /// Fallback for anything unrecognized
  Unknown,
};

/// Ordered, deduplicated set of tags.
using TypeSet = std::set<TypeTag>;

// ============================================================================
// Tag Queries
// ============================================================================

/// int, long, double and decimal
[[nodiscard]] constexpr bool is_numeric(TypeTag tag) noexcept
{
  return tag == TypeTag::Int || tag == TypeTag::Long || tag == TypeTag::Double ||
         tag == TypeTag::Decimal;
}

/// int and long
[[nodiscard]] constexpr bool is_integral(TypeTag tag) noexcept
{
  return tag == TypeTag::Int || tag == TypeTag::Long;
}

/// True if any tag in the set is numeric
[[nodiscard]] bool contains_numeric(const TypeSet & types) noexcept;

// ============================================================================
// Names
// ============================================================================

/// Canonical name ("string", "objectId", "empty_array", ...)
[[nodiscard]] std::string_view type_name(TypeTag tag) noexcept;

/// Inverse of type_name(); std::nullopt for unknown names
[[nodiscard]] std::optional<TypeTag> parse_type_name(std::string_view name) noexcept;

/// Resolve a numeric BSON type code as used by $type (e.g. 2 -> string, 16 -> int)
[[nodiscard]] std::optional<TypeTag> type_from_bson_code(int64_t code) noexcept;

/// Resolve a $type string alias ("string", "bool", "javascript", ...)
[[nodiscard]] std::optional<TypeTag> type_from_bson_alias(std::string_view alias) noexcept;

/// Render a set as "{int, string}"
[[nodiscard]] std::string format_type_set(const TypeSet & types);

}  // namespace docschema
