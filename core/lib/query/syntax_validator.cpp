// docschema/query/syntax_validator.cpp - Schema-free query filter checks
//
#include "docschema/query/syntax_validator.hpp"

#include <algorithm>

#include "docschema/basic/diagnostic_codes.hpp"
#include "docschema/bson/classifier.hpp"
#include "docschema/query/operators.hpp"
#include "docschema/query/query_path.hpp"
#include "docschema/query/report.hpp"

namespace docschema::query
{

namespace
{

[[nodiscard]] bool is_type_spec(const Json & value) noexcept
{
  return value.is_string() || is_integer_like(value);
}

}  // namespace

SyntaxValidator::SyntaxValidator(DiagnosticBag & diags, ValidationOptions options)
: diags_(diags), options_(options)
{
}

bool SyntaxValidator::validate(const Json & query)
{
  error_count_ = 0;
  if (!is_document(query)) {
    diags_.report_error("", "Query root must be a document.").with_code(codes::k_invalid_root);
    return false;
  }
  check_document(query, "", 0);
  return error_count_ == 0;
}

void SyntaxValidator::check_document(const Json & part, const std::string & path, size_t depth)
{
  if (!is_document(part)) {
    ++error_count_;
    diags_
      .report_error(
        path, "Invalid structure at '" + path + "': Expected a document, but found " +
                std::string(type_name(classify(part))) + ".")
      .with_code(codes::k_invalid_structure);
    return;
  }

  if (depth > options_.max_depth) {
    ++error_count_;
    diags_
      .report_error(
        path, "Query nesting exceeds the maximum depth of " + std::to_string(options_.max_depth) +
                " at '" + path + "'.")
      .with_code(codes::k_validation_depth);
    return;
  }

  for (const auto & [key, value] : part.items()) {
    const std::string current_path = join_path(path, key);
    if (is_operator_key(key)) {
      check_operator(key, value, current_path, depth);
    } else {
      check_field(key, value, path, current_path, depth);
    }
  }
}

void SyntaxValidator::check_operator(
  const std::string & key, const Json & value, const std::string & current_path, size_t depth)
{
  if (!is_known_operator(key)) {
    ++error_count_;
    diags_
      .report_error(
        current_path, "Unknown operator '" + key + "' used at '" + current_path + "'.")
      .with_code(codes::k_unknown_operator);
    return;
  }

  if (is_logical_list_operator(key)) {
    if (!value.is_array()) {
      report_invalid_value(key, current_path, "an array of query documents");
      return;
    }
    if (value.empty()) {
      diags_
        .report_warning(
          current_path, "Operator '" + key + "' at '" + current_path + "' has an empty array.")
        .with_code(codes::k_empty_logical_array);
      return;
    }
    for (size_t i = 0; i < value.size(); ++i) {
      check_document(value[i], index_path(current_path, i), depth + 1);
    }
    return;
  }

  if (key == "$not") {
    if (wrapper_type(value) == TypeTag::Regex) {
      return;
    }
    if (!is_document(value)) {
      report_invalid_value(
        key, current_path, "an operator expression block (document) or a regex pattern");
      return;
    }
    check_document(value, current_path, depth + 1);
    return;
  }

  if (key == "$in" || key == "$nin" || key == "$all") {
    if (!value.is_array()) {
      report_invalid_value(key, current_path, "an array");
    }
    return;
  }

  if (key == "$elemMatch") {
    if (!is_document(value)) {
      report_invalid_value(key, current_path, "a query document");
      return;
    }
    check_document(value, current_path, depth + 1);
    return;
  }

  if (key == "$exists") {
    if (!value.is_boolean()) {
      report_invalid_value(key, current_path, "a boolean (true/false)");
    }
    return;
  }

  if (key == "$type") {
    const bool valid =
      is_type_spec(value) ||
      (value.is_array() && !value.empty() &&
       std::all_of(value.begin(), value.end(), is_type_spec));
    if (!valid) {
      report_invalid_value(
        key, current_path, "a BSON type string, number, or an array of strings/numbers");
    }
    return;
  }

  if (key == "$size") {
    if (!is_integer_like(value)) {
      report_invalid_value(key, current_path, "an integer");
    }
    return;
  }

  if (key == "$regex") {
    if (!is_regex_like(value)) {
      report_invalid_value(key, current_path, "a string or regex pattern");
    }
    return;
  }

  if (key == "$mod") {
    const bool valid = value.is_array() && value.size() == 2 &&
                       std::all_of(value.begin(), value.end(), is_numeric_like);
    if (!valid) {
      report_invalid_value(key, current_path, "an array of two numbers [divisor, remainder]");
    }
    return;
  }

  // Comparison, geospatial, text, bitwise and comment operators carry no
  // structural constraint without a schema.
}

void SyntaxValidator::check_field(
  const std::string & key, const Json & value, const std::string & prefix,
  const std::string & current_path, size_t depth)
{
  if (!check_field_name(key, prefix, current_path)) {
    return;
  }

  // Scalars, arrays and Extended JSON wrappers are implicit equality matches.
  if (!is_document(value) || value.empty()) {
    return;
  }

  bool has_operators = false;
  bool has_fields = false;
  for (auto it = value.begin(); it != value.end(); ++it) {
    if (is_operator_key(it.key())) {
      has_operators = true;
    } else {
      has_fields = true;
    }
  }

  if (has_operators && has_fields) {
    ++error_count_;
    diags_
      .report_error(
        current_path, "Invalid query structure at '" + current_path +
                        "': Cannot mix operators and field names at the same level within a "
                        "field's value.")
      .with_code(codes::k_mixed_operators)
      .with_help("use a dotted field name or $elemMatch to match nested fields");
    return;
  }

  check_document(value, current_path, depth + 1);
}

bool SyntaxValidator::check_field_name(
  const std::string & key, const std::string & prefix, const std::string & current_path)
{
  if (key.empty()) {
    ++error_count_;
    diags_.report_error(prefix, "Empty field name found at '" + prefix + "'.")
      .with_code(codes::k_invalid_field_name);
    return false;
  }

  for (const auto & segment : split_field_path(key)) {
    if (segment.empty()) {
      ++error_count_;
      diags_
        .report_error(
          current_path,
          "Invalid field name '" + key + "' at '" + current_path + "': empty path segment.")
        .with_code(codes::k_invalid_field_name);
      return false;
    }
    if (is_operator_key(segment) && !is_dbref_field(segment)) {
      ++error_count_;
      diags_
        .report_error(
          current_path, "Invalid field name '" + key + "' starting with '$' at '" + current_path +
                          "' (segment '" + segment + "').")
        .with_code(codes::k_invalid_field_name);
      return false;
    }
  }
  return true;
}

void SyntaxValidator::report_invalid_value(
  const std::string & op, const std::string & current_path, const std::string & expected)
{
  ++error_count_;
  diags_
    .report_error(
      current_path, "Invalid value type for operator '" + op + "' at '" + current_path +
                      "': Expected " + expected + ".")
    .with_code(codes::k_invalid_operator_value);
}

std::vector<std::string> validate_syntax(const Json & query, const ValidationOptions & options)
{
  DiagnosticBag diags;
  SyntaxValidator validator(diags, options);
  (void)validator.validate(query);
  return to_messages(diags);
}

}  // namespace docschema::query
