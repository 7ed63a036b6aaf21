// docschema/schema/schema_json.hpp - Snapshot codec for schema nodes
//
// JSON form:
//   {"types": ["int", "string"],
//    "schema": {"field": <node>, ...},     // object values
//    "element_schema": <node>}             // array values
//
// Decoding is tolerant: snapshots may come from storage or other tools, so
// malformed parts are dropped with a warning instead of failing the load.
//
#pragma once

#include <cstddef>
#include <optional>
#include <string>

#include "docschema/basic/diagnostic.hpp"
#include "docschema/basic/json.hpp"
#include "docschema/schema/schema_node.hpp"

namespace docschema
{

/// Default nesting limit when decoding snapshots (matches the inference default)
inline constexpr size_t k_max_snapshot_depth = 100;

[[nodiscard]] Json to_json(const SchemaNode & node);
[[nodiscard]] Json to_json(const CollectionSchema & schema);
[[nodiscard]] Json to_json(const DatabaseSchema & schema);

/**
 * Decode one node.
 *
 * @param value JSON fragment
 * @param diags Receives warnings for dropped parts (nullptr for silent mode)
 * @param path Location of the fragment, used in diagnostics
 * @param max_depth Nested "schema" / "element_schema" levels decoded below
 *        value; deeper parts are dropped with a warning
 * @return std::nullopt if value is not node-shaped (not an object). A node
 *         with a missing or empty "types" list is returned as-is (invalid).
 */
[[nodiscard]] std::optional<SchemaNode> schema_node_from_json(
  const Json & value, DiagnosticBag * diags = nullptr, const std::string & path = "",
  size_t max_depth = k_max_snapshot_depth);

/// Decode a collection schema; std::nullopt unless value is an object
[[nodiscard]] std::optional<CollectionSchema> collection_schema_from_json(
  const Json & value, DiagnosticBag * diags = nullptr, size_t max_depth = k_max_snapshot_depth);

/// Decode a database schema; std::nullopt unless value is an object
[[nodiscard]] std::optional<DatabaseSchema> database_schema_from_json(
  const Json & value, DiagnosticBag * diags = nullptr, size_t max_depth = k_max_snapshot_depth);

/// Compact one-line rendering of a fragment for messages; never throws on bad UTF-8
[[nodiscard]] std::string describe_fragment(const Json & value);

}  // namespace docschema
