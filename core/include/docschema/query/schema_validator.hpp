// docschema/query/schema_validator.hpp - Query filter checks against a schema
//
// Resolves dotted field paths through nested object schemas and applies
// per-operator type rules to the resolved leaf node.
//
#pragma once

#include <string>
#include <vector>

#include "docschema/basic/diagnostic.hpp"
#include "docschema/basic/json.hpp"
#include "docschema/query/validation_options.hpp"
#include "docschema/schema/schema_node.hpp"

namespace docschema::query
{

/**
 * Schema-aware validator for query filter documents.
 *
 * Type compatibility rules (implicit equality, comparisons, $in/$nin and
 * $all elements):
 * - the value's tag is one of the allowed types, or
 * - the value is null and null is allowed, or
 * - the value is numeric and the allowed set contains any numeric type
 *   (only with ValidationOptions::coerce_numeric).
 *
 * Dotted paths resolve through nested object schemas only; they never
 * descend into array element schemas.
 */
class SchemaValidator
{
public:
  SchemaValidator(
    const CollectionSchema & schema, DiagnosticBag & diags, ValidationOptions options = {});

  /**
   * Validate a query filter document.
   *
   * @return true if no errors were reported (warnings allowed)
   */
  bool validate(const Json & query);

private:
  // Document level
  void validate_document(
    const Json & part, const FieldSchemas & scope, const std::string & path, size_t depth);
  void validate_logical(
    const std::string & op, const Json & value, const FieldSchemas & scope,
    const std::string & current_path, size_t depth);
  void validate_document_operator(
    const std::string & op, const Json & value, const std::string & current_path);
  void validate_negation_shallow(const Json & value, const std::string & current_path);

  [[nodiscard]] const SchemaNode * resolve_field(
    const std::string & key, const FieldSchemas & scope, const std::string & prefix,
    const std::string & current_path);

  // Field level
  void validate_field_value(
    const Json & value, const SchemaNode & leaf, const std::string & field_path, size_t depth);
  void validate_equality(
    const Json & value, const SchemaNode & leaf, const std::string & field_path);
  void validate_operator_block(
    const Json & block, const SchemaNode & leaf, const std::string & field_path, size_t depth);
  void validate_operator(
    const std::string & op, const Json & value, const SchemaNode & leaf,
    const std::string & field_path, const std::string & op_path, size_t depth);

  void validate_comparison(
    const std::string & op, const Json & value, const SchemaNode & leaf,
    const std::string & op_path);
  void validate_membership(
    const std::string & op, const Json & value, const SchemaNode & leaf,
    const std::string & op_path);
  void validate_type_operator(
    const Json & value, const SchemaNode & leaf, const std::string & op_path);
  void validate_all(
    const Json & value, const SchemaNode & leaf, const std::string & field_path,
    const std::string & op_path);
  void validate_elem_match(
    const Json & value, const SchemaNode & leaf, const std::string & field_path,
    const std::string & op_path, size_t depth);
  void validate_negation(
    const Json & value, const SchemaNode & leaf, const std::string & op_path, size_t depth);

  [[nodiscard]] bool is_compatible(TypeTag tag, const TypeSet & allowed) const;
  [[nodiscard]] bool requires_array(
    const std::string & op, const SchemaNode & leaf, const std::string & op_path);
  bool check_depth(const std::string & path, size_t depth);

  DiagnosticBuilder error(const std::string & path, std::string message, const char * code);

  const CollectionSchema & schema_;
  DiagnosticBag & diags_;
  ValidationOptions options_;
  size_t error_count_ = 0;
};

/// Validate and return the ordered messages (warnings prefixed "Warning: ")
[[nodiscard]] std::vector<std::string> validate_against_schema(
  const Json & query, const CollectionSchema & schema, const ValidationOptions & options = {});

/**
 * Validate against a schema snapshot in its JSON form.
 *
 * A snapshot that is not a document yields a single error and no query
 * traversal.
 */
[[nodiscard]] std::vector<std::string> validate_against_schema(
  const Json & query, const Json & schema_snapshot, const ValidationOptions & options = {});

}  // namespace docschema::query
