// docschema/schema/schema_merger.hpp - Commutative schema merge
//
// merge() is commutative, associative and idempotent on valid nodes, so the
// order in which documents or array elements are folded never changes the
// result.
//
#pragma once

#include <string>

#include "docschema/basic/diagnostic.hpp"
#include "docschema/basic/json.hpp"
#include "docschema/schema/schema_node.hpp"

namespace docschema
{

/**
 * Merge two schema nodes.
 *
 * - types is the union of both sides
 * - object schemas merge key-wise; keys on one side pass through unchanged
 * - element schemas merge recursively
 * - empty_array is dropped from a type set as soon as another type joins it
 *
 * Total: a side without any type is treated as a partial fragment. Under a
 * shared key the valid side wins (with a warning); two typeless sides
 * produce {unknown} (with an error). Never throws.
 *
 * @param a First node
 * @param b Second node
 * @param diags Receives merge anomalies (nullptr for silent mode)
 * @param path Location used in diagnostics
 */
[[nodiscard]] SchemaNode merge(
  const SchemaNode & a, const SchemaNode & b, DiagnosticBag * diags = nullptr,
  const std::string & path = "");

/**
 * Merge two raw snapshot fragments.
 *
 * A fragment that is not node-shaped is ignored in favour of the other side;
 * if neither is, the result is {unknown} and an error diagnostic is recorded.
 */
[[nodiscard]] SchemaNode merge_fragments(
  const Json & a, const Json & b, DiagnosticBag * diags = nullptr, const std::string & path = "");

/// Key-wise merge of two collection-level schemas
[[nodiscard]] CollectionSchema merge_collection_schemas(
  const CollectionSchema & a, const CollectionSchema & b, DiagnosticBag * diags = nullptr);

/// Merge `incoming` into `target` in place; shared keys merge, new keys are inserted
void merge_into(CollectionSchema & target, const CollectionSchema & incoming,
                DiagnosticBag * diags = nullptr, const std::string & path = "");

}  // namespace docschema
