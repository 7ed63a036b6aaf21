// docschema/query/schema_validator.cpp - Query filter checks against a schema
//
#include "docschema/query/schema_validator.hpp"

#include <algorithm>
#include <optional>
#include <utility>

#include "docschema/basic/diagnostic_codes.hpp"
#include "docschema/bson/classifier.hpp"
#include "docschema/query/operators.hpp"
#include "docschema/query/query_path.hpp"
#include "docschema/query/report.hpp"
#include "docschema/schema/schema_json.hpp"

namespace docschema::query
{

namespace
{

std::string quoted_tag(const Json & value)
{
  return "'" + std::string(type_name(classify(value))) + "'";
}

std::string display_path(const std::string & path) { return path.empty() ? "<root>" : path; }

[[nodiscard]] bool has_operator_keys(const Json & value)
{
  if (!is_document(value)) {
    return false;
  }
  for (auto it = value.begin(); it != value.end(); ++it) {
    if (is_operator_key(it.key())) {
      return true;
    }
  }
  return false;
}

[[nodiscard]] bool has_field_keys(const Json & value)
{
  for (auto it = value.begin(); it != value.end(); ++it) {
    if (!is_operator_key(it.key())) {
      return true;
    }
  }
  return false;
}

/// Resolved $type argument: the tags it selects, or nullopt if unresolvable
struct TypeRequest
{
  std::string label;
  std::optional<TypeSet> tags;
};

TypeRequest resolve_type_request(const Json & spec)
{
  TypeRequest request;
  if (spec.is_string()) {
    const auto & alias = spec.get_ref<const std::string &>();
    request.label = alias;
    if (alias == "number") {
      request.tags = TypeSet{TypeTag::Int, TypeTag::Long, TypeTag::Double, TypeTag::Decimal};
    } else if (auto tag = type_from_bson_alias(alias)) {
      request.tags = TypeSet{*tag};
    }
    return request;
  }

  if (auto code = integer_value(spec)) {
    request.label = std::to_string(*code);
    if (auto tag = type_from_bson_code(*code)) {
      request.tags = TypeSet{*tag};
    }
  }
  return request;
}

}  // namespace

SchemaValidator::SchemaValidator(
  const CollectionSchema & schema, DiagnosticBag & diags, ValidationOptions options)
: schema_(schema), diags_(diags), options_(options)
{
}

bool SchemaValidator::validate(const Json & query)
{
  error_count_ = 0;
  if (!is_document(query)) {
    error("", "Query document must be a document.", codes::k_invalid_root);
    return false;
  }
  validate_document(query, schema_, "", 0);
  return error_count_ == 0;
}

DiagnosticBuilder SchemaValidator::error(
  const std::string & path, std::string message, const char * code)
{
  ++error_count_;
  auto builder = diags_.report_error(path, std::move(message));
  builder.with_code(code);
  return builder;
}

bool SchemaValidator::check_depth(const std::string & path, size_t depth)
{
  if (depth <= options_.max_depth) {
    return true;
  }
  error(
    path,
    "Query nesting exceeds the maximum depth of " + std::to_string(options_.max_depth) + " at '" +
      path + "'.",
    codes::k_validation_depth);
  return false;
}

bool SchemaValidator::is_compatible(TypeTag tag, const TypeSet & allowed) const
{
  if (allowed.count(tag) != 0) {
    return true;
  }
  // null only matches where null was observed; it gets no wider leniency.
  if (tag == TypeTag::Null) {
    return false;
  }
  return options_.coerce_numeric && is_numeric(tag) && contains_numeric(allowed);
}

// ============================================================================
// Document Level
// ============================================================================

void SchemaValidator::validate_document(
  const Json & part, const FieldSchemas & scope, const std::string & path, size_t depth)
{
  if (!check_depth(path, depth)) {
    return;
  }

  for (const auto & [key, value] : part.items()) {
    const std::string current_path = join_path(path, key);

    if (is_logical_list_operator(key)) {
      validate_logical(key, value, scope, current_path, depth);
      continue;
    }

    if (key == "$not") {
      validate_negation_shallow(value, current_path);
      continue;
    }

    if (is_operator_key(key)) {
      if (!is_known_operator(key)) {
        error(
          current_path, "Unknown operator '" + key + "' used at '" + current_path + "'.",
          codes::k_unknown_operator);
      } else if (is_document_level_operator(key)) {
        validate_document_operator(key, value, current_path);
      } else {
        error(
          current_path,
          "Operator '" + key + "' at '" + current_path +
            "' must be applied to a field, not used at document level.",
          codes::k_misplaced_operator);
      }
      continue;
    }

    const SchemaNode * leaf = resolve_field(key, scope, path, current_path);
    if (leaf == nullptr) {
      continue;
    }
    validate_field_value(value, *leaf, current_path, depth);
  }
}

void SchemaValidator::validate_logical(
  const std::string & op, const Json & value, const FieldSchemas & scope,
  const std::string & current_path, size_t depth)
{
  if (!value.is_array()) {
    error(
      current_path,
      "Invalid value for operator '" + op + "' at '" + current_path +
        "': Expected an array of query documents.",
      codes::k_invalid_operator_value);
    return;
  }
  if (value.empty()) {
    diags_
      .report_warning(
        current_path, "Operator '" + op + "' at '" + current_path + "' has an empty array.")
      .with_code(codes::k_empty_logical_array);
    return;
  }

  for (size_t i = 0; i < value.size(); ++i) {
    const std::string sub_path = index_path(current_path, i);
    if (!is_document(value[i])) {
      error(
        sub_path,
        "Invalid element in '" + op + "' array at '" + sub_path +
          "': Expected a query document, found " + quoted_tag(value[i]) + ".",
        codes::k_invalid_structure);
      continue;
    }
    // Each element is a complete filter over the same scope.
    validate_document(value[i], scope, sub_path, depth + 1);
  }
}

void SchemaValidator::validate_document_operator(
  const std::string & op, const Json & value, const std::string & current_path)
{
  auto invalid = [&](const std::string & expected) {
    error(
      current_path,
      "Invalid value for operator '" + op + "' at '" + current_path + "': Expected " + expected +
        ".",
      codes::k_invalid_operator_value);
  };

  if (op == "$where") {
    if (!value.is_string() && classify(value) != TypeTag::JavaScript) {
      invalid("a JavaScript string or code value");
    }
  } else if (op == "$text") {
    const auto search = is_document(value) ? value.find("$search") : value.end();
    if (!is_document(value) || search == value.end() || !search->is_string()) {
      invalid("a document with a string '$search' field");
    }
  } else if (op == "$jsonSchema") {
    if (!is_document(value)) {
      invalid("a JSON Schema document");
    }
  } else if (op == "$comment") {
    if (!value.is_string()) {
      invalid("a string");
    }
  }
  // $expr takes any aggregation expression; its semantics are not checked.
}

void SchemaValidator::validate_negation_shallow(
  const Json & value, const std::string & current_path)
{
  if (wrapper_type(value) == TypeTag::Regex) {
    return;
  }
  if (!is_document(value)) {
    error(
      current_path,
      "Invalid value for operator '$not' at '" + current_path +
        "': Expected an operator expression (document) or a regex pattern.",
      codes::k_invalid_operator_value);
    return;
  }

  if (has_field_keys(value)) {
    diags_
      .report_warning(
        current_path, "Value for '$not' at '" + current_path +
                        "' contains non-operator keys. Validation might be incomplete.")
      .with_code(codes::k_incomplete_validation);
  }
}

const SchemaNode * SchemaValidator::resolve_field(
  const std::string & key, const FieldSchemas & scope, const std::string & prefix,
  const std::string & current_path)
{
  const auto parts = split_field_path(key);
  const FieldSchemas * level = &scope;
  std::string traversed = prefix;
  const SchemaNode * node = nullptr;

  for (size_t i = 0; i < parts.size(); ++i) {
    const std::string & part = parts[i];
    const auto it = level->find(part);
    if (it == level->end()) {
      error(
        current_path,
        "Invalid query key '" + current_path + "': Field '" + part +
          "' not found in schema at '" + display_path(traversed) + "'.",
        codes::k_field_not_found);
      return nullptr;
    }
    node = &it->second;
    traversed = join_path(traversed, part);

    if (i + 1 == parts.size()) {
      break;
    }
    if (!node->has_type(TypeTag::Object)) {
      error(
        current_path,
        "Invalid query path '" + current_path + "': Field '" + part + "' at '" + traversed +
          "' is not defined as an 'object' in the schema, cannot traverse further.",
        codes::k_path_not_object);
      return nullptr;
    }
    if (node->object_schema() == nullptr) {
      error(
        current_path,
        "Schema definition error: Field '" + part + "' at '" + traversed +
          "' is an 'object' but lacks a 'schema' definition.",
        codes::k_schema_definition)
        .with_help("re-infer the schema snapshot from sample documents");
      return nullptr;
    }
    level = node->object_schema();
  }
  return node;
}

// ============================================================================
// Field Level
// ============================================================================

void SchemaValidator::validate_field_value(
  const Json & value, const SchemaNode & leaf, const std::string & field_path, size_t depth)
{
  if (has_operator_keys(value)) {
    validate_operator_block(value, leaf, field_path, depth + 1);
  } else {
    validate_equality(value, leaf, field_path);
  }
}

void SchemaValidator::validate_equality(
  const Json & value, const SchemaNode & leaf, const std::string & field_path)
{
  if (!leaf.is_valid()) {
    error(
      field_path,
      "Schema definition error at '" + field_path + "': Field lacks 'types' definition.",
      codes::k_schema_definition);
    return;
  }
  const TypeTag tag = classify(value);
  if (!is_compatible(tag, leaf.types)) {
    error(
      field_path,
      "Type mismatch for field '" + field_path + "': Query uses type '" +
        std::string(type_name(tag)) + "', but schema expects " + format_type_set(leaf.types) +
        ".",
      codes::k_type_mismatch);
  }
}

void SchemaValidator::validate_operator_block(
  const Json & block, const SchemaNode & leaf, const std::string & field_path, size_t depth)
{
  if (!check_depth(field_path, depth)) {
    return;
  }

  bool reported_mixed = false;
  for (const auto & [op, value] : block.items()) {
    const std::string op_path = join_path(field_path, op);

    if (!is_operator_key(op)) {
      if (!reported_mixed) {
        error(
          field_path,
          "Invalid query structure at '" + field_path +
            "': Cannot mix operators and field names at the same level within a field's value.",
          codes::k_mixed_operators);
        reported_mixed = true;
      }
      continue;
    }

    if (!is_known_operator(op)) {
      error(
        op_path, "Unknown operator '" + op + "' used at '" + op_path + "'.",
        codes::k_unknown_operator);
      continue;
    }

    validate_operator(op, value, leaf, field_path, op_path, depth);
  }
}

void SchemaValidator::validate_operator(
  const std::string & op, const Json & value, const SchemaNode & leaf,
  const std::string & field_path, const std::string & op_path, size_t depth)
{
  if (is_value_comparison_operator(op)) {
    validate_comparison(op, value, leaf, op_path);
  } else if (op == "$in" || op == "$nin") {
    validate_membership(op, value, leaf, op_path);
  } else if (op == "$exists") {
    if (!value.is_boolean()) {
      error(
        op_path,
        "Invalid value for operator '$exists' at '" + op_path + "': Expected boolean (true/false).",
        codes::k_invalid_operator_value);
    }
  } else if (op == "$type") {
    validate_type_operator(value, leaf, op_path);
  } else if (op == "$regex") {
    if (!leaf.has_type(TypeTag::String)) {
      diags_
        .report_warning(
          op_path, "Operator '$regex' at '" + op_path + "' is used on a field whose schema type " +
                     format_type_set(leaf.types) + " does not include 'string'.")
        .with_code(codes::k_operator_usage_warning);
    }
    if (!is_regex_like(value)) {
      error(
        op_path,
        "Invalid value for operator '$regex' at '" + op_path +
          "': Expected a string or regex pattern.",
        codes::k_invalid_operator_value);
    }
  } else if (op == "$options") {
    if (!value.is_string()) {
      error(
        op_path, "Invalid value for operator '$options' at '" + op_path + "': Expected a string.",
        codes::k_invalid_operator_value);
    }
  } else if (op == "$size") {
    // Both the field usage and the operand are reported.
    (void)requires_array(op, leaf, op_path);
    if (!is_integer_like(value)) {
      error(
        op_path, "Invalid value for operator '$size' at '" + op_path + "': Expected an integer.",
        codes::k_invalid_operator_value);
    }
  } else if (op == "$all") {
    validate_all(value, leaf, field_path, op_path);
  } else if (op == "$elemMatch") {
    validate_elem_match(value, leaf, field_path, op_path, depth);
  } else if (op == "$not") {
    validate_negation(value, leaf, op_path, depth);
  } else if (op == "$mod") {
    const bool valid = value.is_array() && value.size() == 2 &&
                       std::all_of(value.begin(), value.end(), is_numeric_like);
    if (!valid) {
      error(
        op_path,
        "Invalid value for operator '$mod' at '" + op_path +
          "': Expected an array of two numbers [divisor, remainder].",
        codes::k_invalid_operator_value);
    } else if (leaf.is_valid() && !contains_numeric(leaf.types)) {
      diags_
        .report_warning(
          op_path, "Operator '$mod' at '" + op_path + "' is used on a field whose schema type " +
                     format_type_set(leaf.types) + " is not numeric.")
        .with_code(codes::k_operator_usage_warning);
    }
  } else if (is_logical_list_operator(op) || is_document_level_operator(op)) {
    error(
      op_path,
      "Operator '" + op + "' at '" + op_path +
        "' cannot be applied to a field; use it at document level.",
      codes::k_misplaced_operator);
  }
  // Geospatial and bitwise operators carry no schema rule.
}

void SchemaValidator::validate_comparison(
  const std::string & op, const Json & value, const SchemaNode & leaf, const std::string & op_path)
{
  if (!leaf.is_valid()) {
    error(
      op_path, "Schema definition error at '" + op_path + "': Field lacks 'types' definition.",
      codes::k_schema_definition);
    return;
  }
  const TypeTag tag = classify(value);
  if (!is_compatible(tag, leaf.types)) {
    error(
      op_path,
      "Type mismatch for operator '" + op + "' at '" + op_path + "': Query uses type '" +
        std::string(type_name(tag)) + "', but schema expects " + format_type_set(leaf.types) +
        ".",
      codes::k_type_mismatch);
  }
}

void SchemaValidator::validate_membership(
  const std::string & op, const Json & value, const SchemaNode & leaf, const std::string & op_path)
{
  if (!value.is_array()) {
    error(
      op_path, "Invalid value for operator '" + op + "' at '" + op_path + "': Expected an array.",
      codes::k_invalid_operator_value);
    return;
  }
  if (!leaf.is_valid()) {
    error(
      op_path, "Schema definition error at '" + op_path + "': Field lacks 'types' definition.",
      codes::k_schema_definition);
    return;
  }

  for (size_t i = 0; i < value.size(); ++i) {
    const TypeTag tag = classify(value[i]);
    if (is_compatible(tag, leaf.types)) {
      continue;
    }
    const std::string item_path = index_path(op_path, i);
    error(
      item_path,
      "Type mismatch for item in '" + op + "' array at '" + item_path + "': Item type is '" +
        std::string(type_name(tag)) + "', but schema expects " + format_type_set(leaf.types) +
        ".",
      codes::k_type_mismatch);
  }
}

void SchemaValidator::validate_type_operator(
  const Json & value, const SchemaNode & leaf, const std::string & op_path)
{
  std::vector<Json> specs;
  if (value.is_array()) {
    specs.assign(value.begin(), value.end());
  } else {
    specs.push_back(value);
  }

  const bool valid_shape =
    !specs.empty() && std::all_of(specs.begin(), specs.end(), [](const Json & spec) {
      return spec.is_string() || is_integer_like(spec);
    });
  if (!valid_shape) {
    error(
      op_path,
      "Invalid value for operator '$type' at '" + op_path +
        "': Expected BSON type string (e.g., 'string') or number (e.g., 2), or an array of them.",
      codes::k_invalid_operator_value);
    return;
  }

  for (const auto & spec : specs) {
    const TypeRequest request = resolve_type_request(spec);
    if (!request.tags) {
      error(
        op_path, "Unknown BSON type '" + request.label + "' for operator '$type' at '" + op_path +
                   "'.",
        codes::k_invalid_operator_value)
        .with_help("use a BSON type alias such as 'string' or 'number', or its numeric code");
      continue;
    }
    if (!leaf.is_valid()) {
      continue;
    }
    const bool overlaps = std::any_of(
      request.tags->begin(), request.tags->end(), [&](TypeTag t) { return leaf.has_type(t); });
    if (!overlaps) {
      diags_
        .report_warning(
          op_path, "Operator '$type' at '" + op_path + "' checks for type '" + request.label +
                     "', which is not among the schema types " + format_type_set(leaf.types) +
                     ".")
        .with_code(codes::k_operator_usage_warning);
    }
  }
}

bool SchemaValidator::requires_array(
  const std::string & op, const SchemaNode & leaf, const std::string & op_path)
{
  if (leaf.has_type(TypeTag::Array)) {
    return true;
  }
  error(
    op_path,
    "Usage error for operator '" + op + "' at '" + op_path +
      "': Field type is not 'array' in schema (" + format_type_set(leaf.types) + ").",
    codes::k_operator_usage_error);
  return false;
}

void SchemaValidator::validate_all(
  const Json & value, const SchemaNode & leaf, const std::string & field_path,
  const std::string & op_path)
{
  if (!requires_array("$all", leaf, op_path)) {
    return;
  }
  if (!value.is_array()) {
    error(
      op_path, "Invalid value for operator '$all' at '" + op_path + "': Expected an array.",
      codes::k_invalid_operator_value);
    return;
  }

  const SchemaNode * element = leaf.element_schema();
  if (element == nullptr || !element->is_valid()) {
    error(
      field_path,
      "Schema definition error at '" + field_path +
        "': Array field lacks an 'element_schema' definition needed to validate '$all'.",
      codes::k_schema_definition);
    return;
  }

  for (size_t i = 0; i < value.size(); ++i) {
    const TypeTag tag = classify(value[i]);
    if (is_compatible(tag, element->types)) {
      continue;
    }
    const std::string item_path = index_path(op_path, i);
    error(
      item_path,
      "Type mismatch for item in '$all' array at '" + item_path + "': Item type is '" +
        std::string(type_name(tag)) + "', but array element schema expects " +
        format_type_set(element->types) + ".",
      codes::k_type_mismatch);
  }
}

void SchemaValidator::validate_elem_match(
  const Json & value, const SchemaNode & leaf, const std::string & field_path,
  const std::string & op_path, size_t depth)
{
  if (!requires_array("$elemMatch", leaf, op_path)) {
    return;
  }
  if (!is_document(value)) {
    error(
      op_path,
      "Invalid value for operator '$elemMatch' at '" + op_path +
        "': Expected a query document for element matching.",
      codes::k_invalid_operator_value);
    return;
  }

  const SchemaNode * element = leaf.element_schema();
  if (element == nullptr || !element->is_valid()) {
    error(
      field_path,
      "Schema definition error at '" + field_path +
        "': Array field lacks an 'element_schema' definition needed to validate '$elemMatch'.",
      codes::k_schema_definition);
    return;
  }

  if (element->has_type(TypeTag::Object)) {
    if (element->object_schema() == nullptr) {
      error(
        field_path,
        "Schema definition error at '" + field_path +
          "': Array element is 'object' but lacks 'schema' in 'element_schema'.",
        codes::k_schema_definition);
      return;
    }
    // The body is a full filter over the element document.
    validate_document(value, *element->object_schema(), op_path, depth + 1);
    return;
  }

  // Primitive elements: the body is an operator block over the element type.
  validate_field_value(value, *element, op_path, depth);
}

void SchemaValidator::validate_negation(
  const Json & value, const SchemaNode & leaf, const std::string & op_path, size_t depth)
{
  if (wrapper_type(value) == TypeTag::Regex) {
    if (!leaf.has_type(TypeTag::String)) {
      diags_
        .report_warning(
          op_path, "Operator '$not' at '" + op_path +
                     "' applies a regex to a field whose schema type " +
                     format_type_set(leaf.types) + " does not include 'string'.")
        .with_code(codes::k_operator_usage_warning);
    }
    return;
  }
  if (!has_operator_keys(value)) {
    error(
      op_path,
      "Invalid value for operator '$not' at '" + op_path +
        "': Expected an operator expression (document) or a regex pattern.",
      codes::k_invalid_operator_value);
    return;
  }
  validate_operator_block(value, leaf, op_path, depth + 1);
}

// ============================================================================
// Convenience Entry Points
// ============================================================================

std::vector<std::string> validate_against_schema(
  const Json & query, const CollectionSchema & schema, const ValidationOptions & options)
{
  DiagnosticBag diags;
  SchemaValidator validator(schema, diags, options);
  (void)validator.validate(query);
  return to_messages(diags);
}

std::vector<std::string> validate_against_schema(
  const Json & query, const Json & schema_snapshot, const ValidationOptions & options)
{
  DiagnosticBag diags;
  const auto schema = collection_schema_from_json(schema_snapshot, &diags, options.max_depth);
  if (!schema) {
    return {"Expected schema must be a document."};
  }
  SchemaValidator validator(*schema, diags, options);
  (void)validator.validate(query);
  return to_messages(diags);
}

}  // namespace docschema::query
