// docschema/schema/schema_inferencer.hpp - Value -> SchemaNode inference
#pragma once

#include <cstddef>

#include "docschema/basic/diagnostic.hpp"
#include "docschema/basic/json.hpp"
#include "docschema/schema/schema_node.hpp"

namespace docschema
{

struct InferenceOptions
{
  /// Nesting depth past which a subtree is recorded as {unknown}
  size_t max_depth = 100;
};

/**
 * Infer the schema of a single value.
 *
 * - primitives (anything but object/array) -> {types: {tag}}
 * - objects -> {types: {object}, schema: {key: infer(value)}}
 * - empty arrays -> {types: {array}, element_schema: {types: {empty_array}}}
 * - arrays -> {types: {array}, element_schema: merge of all element schemas}
 *
 * Never throws for any input value.
 */
[[nodiscard]] SchemaNode infer(
  const Json & value, const InferenceOptions & options = {}, DiagnosticBag * diags = nullptr);

}  // namespace docschema
