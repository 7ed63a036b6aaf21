// docschema/bson/classifier.hpp - Value -> TypeTag classification
//
// Values are nlohmann::json trees carrying MongoDB Extended JSON v2 wrappers
// for the BSON types plain JSON cannot express ({"$oid": ...},
// {"$numberLong": ...}, {"$date": ...}, ...).
//
#pragma once

#include <cstdint>
#include <optional>

#include "docschema/basic/json.hpp"
#include "docschema/bson/type_tag.hpp"

namespace docschema
{

/**
 * Classify a value. Total and deterministic; never throws.
 *
 * Precedence:
 *   string, bool, long/int, double/decimal, binData, array,
 *   wrapper types, object, null, unknown.
 *
 * Extended JSON wrappers are objects on the wire, so they are recognized
 * before the generic object test. Numeric wrappers are reported with their
 * numeric tag, binary wrappers as binData.
 */
[[nodiscard]] TypeTag classify(const Json & value) noexcept;

/**
 * If value is an Extended JSON wrapper (exact key set), return its tag.
 *
 * The legacy {"$regex": ..., "$options": ...} form is deliberately not
 * treated as a wrapper: in a filter it is the $regex operator block.
 */
[[nodiscard]] std::optional<TypeTag> wrapper_type(const Json & value) noexcept;

/// True for an Extended JSON wrapper (scalar value spelled as an object)
[[nodiscard]] inline bool is_wrapper(const Json & value) noexcept
{
  return wrapper_type(value).has_value();
}

/// Plain document: an object that is not an Extended JSON wrapper
[[nodiscard]] inline bool is_document(const Json & value) noexcept
{
  return value.is_object() && !is_wrapper(value);
}

/// string or regex wrapper
[[nodiscard]] bool is_regex_like(const Json & value) noexcept;

/// Classifies as int or long
[[nodiscard]] bool is_integer_like(const Json & value) noexcept;

/// Classifies as int, long, double or decimal
[[nodiscard]] bool is_numeric_like(const Json & value) noexcept;

/// Integer value of a JSON integer or a $numberInt / $numberLong wrapper
[[nodiscard]] std::optional<int64_t> integer_value(const Json & value) noexcept;

}  // namespace docschema
