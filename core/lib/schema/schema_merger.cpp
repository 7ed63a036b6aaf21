// docschema/schema/schema_merger.cpp - Schema merge implementation
//
#include "docschema/schema/schema_merger.hpp"

#include <optional>
#include <utility>

#include "docschema/basic/diagnostic_codes.hpp"
#include "docschema/schema/schema_json.hpp"

namespace docschema
{

namespace
{

/// Resolve the case where at least one side carries no type information.
std::optional<SchemaNode> merge_degenerate(
  const SchemaNode & a, const SchemaNode & b, DiagnosticBag * diags, const std::string & path)
{
  if (a.is_valid() && b.is_valid()) {
    return std::nullopt;
  }
  if (!a.is_valid() && !b.is_valid()) {
    if (diags) {
      diags->report_error(path, "Cannot merge two schema fragments without types at '" + path +
                                  "'; recording 'unknown'.")
        .with_code(codes::k_merge_unrecoverable);
    }
    return SchemaNode::unknown();
  }
  if (diags) {
    diags->report_warning(path, "Ignoring schema fragment without types at '" + path +
                                  "' during merge; keeping the other side.")
      .with_code(codes::k_merge_anomaly);
  }
  return a.is_valid() ? a : b;
}

void drop_empty_array_placeholder(TypeSet & types)
{
  if (types.size() > 1) {
    types.erase(TypeTag::EmptyArray);
  }
}

}  // namespace

SchemaNode merge(
  const SchemaNode & a, const SchemaNode & b, DiagnosticBag * diags, const std::string & path)
{
  if (auto degenerate = merge_degenerate(a, b, diags, path)) {
    return std::move(*degenerate);
  }

  SchemaNode merged(a.types);
  merged.types.insert(b.types.begin(), b.types.end());
  drop_empty_array_placeholder(merged.types);

  const FieldSchemas * a_fields = a.object_schema();
  const FieldSchemas * b_fields = b.object_schema();
  if (a_fields && b_fields) {
    FieldSchemas fields = *a_fields;
    merge_into(fields, *b_fields, diags, path);
    merged.set_object_schema(std::move(fields));
  } else if (a_fields || b_fields) {
    merged.set_object_schema(a_fields ? *a_fields : *b_fields);
  }

  const SchemaNode * a_element = a.element_schema();
  const SchemaNode * b_element = b.element_schema();
  if (a_element && b_element) {
    merged.set_element_schema(merge(*a_element, *b_element, diags, path + "[]"));
  } else if (a_element || b_element) {
    merged.set_element_schema(a_element ? *a_element : *b_element);
  }

  return merged;
}

void merge_into(
  CollectionSchema & target, const CollectionSchema & incoming, DiagnosticBag * diags,
  const std::string & path)
{
  for (const auto & [key, node] : incoming) {
    auto it = target.find(key);
    if (it == target.end()) {
      target.emplace(key, node);
    } else {
      it->second = merge(it->second, node, diags, join_path(path, key));
    }
  }
}

SchemaNode merge_fragments(
  const Json & a, const Json & b, DiagnosticBag * diags, const std::string & path)
{
  auto a_node = schema_node_from_json(a, diags, path);
  auto b_node = schema_node_from_json(b, diags, path);

  if (a_node && b_node) {
    return merge(*a_node, *b_node, diags, path);
  }
  if (a_node || b_node) {
    return a_node ? std::move(*a_node) : std::move(*b_node);
  }

  if (diags) {
    diags->report_error(path, "Neither schema fragment at '" + (path.empty() ? "<root>" : path) +
                                "' is node-shaped; recording 'unknown'.")
      .with_code(codes::k_merge_unrecoverable);
  }
  return SchemaNode::unknown();
}

CollectionSchema merge_collection_schemas(
  const CollectionSchema & a, const CollectionSchema & b, DiagnosticBag * diags)
{
  CollectionSchema merged = a;
  merge_into(merged, b, diags);
  return merged;
}

}  // namespace docschema
