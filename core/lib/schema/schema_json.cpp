// docschema/schema/schema_json.cpp - Snapshot codec implementation
//
#include "docschema/schema/schema_json.hpp"

#include <string>
#include <utility>

#include "docschema/basic/diagnostic_codes.hpp"

namespace docschema
{

namespace
{

constexpr const char * k_types_key = "types";
constexpr const char * k_schema_key = "schema";
constexpr const char * k_element_key = "element_schema";

void warn(DiagnosticBag * diags, const std::string & path, std::string message, const char * code)
{
  if (diags) {
    diags->report_warning(path, std::move(message)).with_code(code);
  }
}

TypeSet decode_types(const Json & value, DiagnosticBag * diags, const std::string & path)
{
  TypeSet types;
  if (!value.is_array()) {
    warn(diags, path, "'types' of schema fragment at '" + path + "' is not a list.",
         codes::k_invalid_fragment);
    return types;
  }
  for (const auto & entry : value) {
    if (!entry.is_string()) {
      warn(
        diags, path,
        "Ignoring non-string type entry " + describe_fragment(entry) + " at '" + path + "'.",
        codes::k_invalid_fragment);
      continue;
    }
    const auto name = entry.get<std::string>();
    if (const auto tag = parse_type_name(name)) {
      types.insert(*tag);
    } else {
      warn(
        diags, path,
        "Unrecognized type name '" + name + "' at '" + path + "'; recorded as 'unknown'.",
        codes::k_unknown_type_name);
      types.insert(TypeTag::Unknown);
    }
  }
  return types;
}

std::optional<SchemaNode> decode_node(
  const Json & value, DiagnosticBag * diags, const std::string & path, size_t depth,
  size_t max_depth)
{
  if (!value.is_object()) {
    if (diags) {
      warn(
        diags, path,
        "Schema fragment at '" + path + "' is not an object: " + describe_fragment(value) + ".",
        codes::k_invalid_fragment);
    }
    return std::nullopt;
  }

  SchemaNode node;
  const auto types = value.find(k_types_key);
  if (types == value.end()) {
    warn(
      diags, path, "Schema fragment at '" + path + "' lacks 'types'.", codes::k_invalid_fragment);
  } else {
    node.types = decode_types(*types, diags, path);
  }

  const auto nested = value.find(k_schema_key);
  const auto element = value.find(k_element_key);
  if (depth >= max_depth && (nested != value.end() || element != value.end())) {
    warn(
      diags, path,
      "Schema nesting deeper than " + std::to_string(max_depth) + " levels at '" + path +
        "'; dropping the nested definitions.",
      codes::k_inference_depth);
    return node;
  }

  if (nested != value.end()) {
    if (nested->is_object()) {
      FieldSchemas fields;
      for (const auto & [key, child] : nested->items()) {
        if (auto decoded = decode_node(child, diags, join_path(path, key), depth + 1, max_depth)) {
          fields.emplace(key, std::move(*decoded));
        }
      }
      node.set_object_schema(std::move(fields));
    } else {
      warn(diags, path, "'schema' at '" + path + "' is not an object; ignoring it.",
           codes::k_invalid_fragment);
    }
  }

  if (element != value.end()) {
    if (auto decoded = decode_node(*element, diags, path + "[]", depth + 1, max_depth)) {
      node.set_element_schema(std::move(*decoded));
    }
  }

  return node;
}

}  // namespace

std::string describe_fragment(const Json & value)
{
  return value.dump(-1, ' ', false, Json::error_handler_t::replace);
}

// ============================================================================
// Encoding
// ============================================================================

Json to_json(const SchemaNode & node)
{
  Json types = Json::array();
  for (const TypeTag t : node.types) {
    types.push_back(std::string(type_name(t)));
  }

  Json out = Json::object();
  out[k_types_key] = std::move(types);
  if (const auto * fields = node.object_schema()) {
    out[k_schema_key] = to_json(*fields);
  }
  if (const auto * element = node.element_schema()) {
    out[k_element_key] = to_json(*element);
  }
  return out;
}

Json to_json(const CollectionSchema & schema)
{
  Json out = Json::object();
  for (const auto & [name, node] : schema) {
    out[name] = to_json(node);
  }
  return out;
}

Json to_json(const DatabaseSchema & schema)
{
  Json out = Json::object();
  for (const auto & [collection, fields] : schema) {
    out[collection] = to_json(fields);
  }
  return out;
}

// ============================================================================
// Decoding
// ============================================================================

std::optional<SchemaNode> schema_node_from_json(
  const Json & value, DiagnosticBag * diags, const std::string & path, size_t max_depth)
{
  return decode_node(value, diags, path, 0, max_depth);
}

std::optional<CollectionSchema> collection_schema_from_json(
  const Json & value, DiagnosticBag * diags, size_t max_depth)
{
  if (!value.is_object()) {
    warn(diags, "", "Collection schema must be an object.", codes::k_invalid_fragment);
    return std::nullopt;
  }
  CollectionSchema schema;
  for (const auto & [key, child] : value.items()) {
    if (auto decoded = decode_node(child, diags, key, 0, max_depth)) {
      schema.emplace(key, std::move(*decoded));
    }
  }
  return schema;
}

std::optional<DatabaseSchema> database_schema_from_json(
  const Json & value, DiagnosticBag * diags, size_t max_depth)
{
  if (!value.is_object()) {
    warn(diags, "", "Database schema must be an object.", codes::k_invalid_fragment);
    return std::nullopt;
  }
  DatabaseSchema schema;
  for (const auto & [collection, fields] : value.items()) {
    if (!fields.is_object()) {
      warn(
        diags, collection,
        "Schema of collection '" + collection + "' is not an object; skipping it.",
        codes::k_invalid_fragment);
      continue;
    }
    if (auto decoded = collection_schema_from_json(fields, diags, max_depth)) {
      schema.emplace(collection, std::move(*decoded));
    }
  }
  return schema;
}

}  // namespace docschema
