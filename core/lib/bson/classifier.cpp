// docschema/bson/classifier.cpp - Value classification
//
#include "docschema/bson/classifier.hpp"

#include <charconv>
#include <cstdint>
#include <initializer_list>
#include <limits>
#include <string>
#include <system_error>

namespace docschema
{

namespace
{

[[nodiscard]] bool has_exactly(const Json & obj, std::initializer_list<const char *> keys) noexcept
{
  if (obj.size() != keys.size()) {
    return false;
  }
  for (const char * k : keys) {
    if (obj.find(k) == obj.end()) {
      return false;
    }
  }
  return true;
}

[[nodiscard]] bool is_dbref(const Json & obj) noexcept
{
  const auto ref = obj.find("$ref");
  if (ref == obj.end() || !ref->is_string() || obj.find("$id") == obj.end()) {
    return false;
  }
  const auto db = obj.find("$db");
  if (db != obj.end() && !db->is_string()) {
    return false;
  }
  return obj.size() == (db == obj.end() ? 2U : 3U);
}

[[nodiscard]] bool fits_int32(int64_t v) noexcept
{
  return v >= std::numeric_limits<int32_t>::min() && v <= std::numeric_limits<int32_t>::max();
}

}  // namespace

std::optional<TypeTag> wrapper_type(const Json & value) noexcept
{
  if (!value.is_object() || value.empty() || value.size() > 3) {
    return std::nullopt;
  }

  const auto first = value.begin();
  if (first.key().empty() || first.key().front() != '$') {
    return std::nullopt;
  }

  if (value.size() == 1) {
    const std::string & key = first.key();
    const Json & v = first.value();
    if (key == "$numberInt") return v.is_string() ? std::optional{TypeTag::Int} : std::nullopt;
    if (key == "$numberLong") return v.is_string() ? std::optional{TypeTag::Long} : std::nullopt;
    if (key == "$numberDouble") {
      return v.is_string() ? std::optional{TypeTag::Double} : std::nullopt;
    }
    if (key == "$numberDecimal") {
      return v.is_string() ? std::optional{TypeTag::Decimal} : std::nullopt;
    }
    if (key == "$binary") {
      return v.is_object() || v.is_string() ? std::optional{TypeTag::BinData} : std::nullopt;
    }
    if (key == "$uuid") return v.is_string() ? std::optional{TypeTag::BinData} : std::nullopt;
    if (key == "$oid") return v.is_string() ? std::optional{TypeTag::ObjectId} : std::nullopt;
    if (key == "$timestamp") {
      return v.is_object() && has_exactly(v, {"t", "i"}) ? std::optional{TypeTag::Timestamp}
                                                         : std::nullopt;
    }
    if (key == "$date") {
      return v.is_string() || v.is_number() || v.is_object() ? std::optional{TypeTag::Date}
                                                              : std::nullopt;
    }
    if (key == "$minKey") return std::optional{TypeTag::MinKey};
    if (key == "$maxKey") return std::optional{TypeTag::MaxKey};
    if (key == "$code") return v.is_string() ? std::optional{TypeTag::JavaScript} : std::nullopt;
    if (key == "$regularExpression") {
      return v.is_object() && v.contains("pattern") ? std::optional{TypeTag::Regex}
                                                    : std::nullopt;
    }
    return std::nullopt;
  }

  if (value.size() == 2 && has_exactly(value, {"$code", "$scope"})) {
    return value["$code"].is_string() ? std::optional{TypeTag::JavaScript} : std::nullopt;
  }

  if (is_dbref(value)) {
    return TypeTag::DbRef;
  }

  return std::nullopt;
}

TypeTag classify(const Json & value) noexcept
{
  switch (value.type()) {
    case Json::value_t::string:
      return TypeTag::String;
    case Json::value_t::boolean:
      return TypeTag::Bool;
    case Json::value_t::number_integer:
      return fits_int32(value.get<int64_t>()) ? TypeTag::Int : TypeTag::Long;
    case Json::value_t::number_unsigned:
      return value.get<uint64_t>() <= static_cast<uint64_t>(std::numeric_limits<int32_t>::max())
               ? TypeTag::Int
               : TypeTag::Long;
    case Json::value_t::number_float:
      return TypeTag::Double;
    case Json::value_t::binary:
      return TypeTag::BinData;
    case Json::value_t::array:
      return TypeTag::Array;
    case Json::value_t::object:
      if (const auto tag = wrapper_type(value)) {
        return *tag;
      }
      return TypeTag::Object;
    case Json::value_t::null:
      return TypeTag::Null;
    case Json::value_t::discarded:
    default:
      return TypeTag::Unknown;
  }
}

bool is_regex_like(const Json & value) noexcept
{
  return value.is_string() || wrapper_type(value) == TypeTag::Regex;
}

bool is_integer_like(const Json & value) noexcept { return is_integral(classify(value)); }

bool is_numeric_like(const Json & value) noexcept { return is_numeric(classify(value)); }

std::optional<int64_t> integer_value(const Json & value) noexcept
{
  if (value.is_number_integer()) {
    if (value.is_number_unsigned()) {
      const auto u = value.get<uint64_t>();
      if (u > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
        return std::nullopt;
      }
      return static_cast<int64_t>(u);
    }
    return value.get<int64_t>();
  }

  const auto tag = wrapper_type(value);
  if (!tag || !is_integral(*tag)) {
    return std::nullopt;
  }
  const auto & text = value.begin().value().get_ref<const std::string &>();
  int64_t result = 0;
  const auto * first = text.data();
  const auto * last = text.data() + text.size();
  const auto [ptr, ec] = std::from_chars(first, last, result);
  if (ec != std::errc() || ptr != last) {
    return std::nullopt;
  }
  return result;
}

}  // namespace docschema
