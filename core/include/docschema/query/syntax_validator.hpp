// docschema/query/syntax_validator.hpp - Schema-free query filter checks
//
// Checks operator names, the structural shape of operator values and the
// separation of operator blocks from nested-document matches. Field names
// are not checked against any schema and value types only where an operator
// dictates them.
//
#pragma once

#include <string>
#include <vector>

#include "docschema/basic/diagnostic.hpp"
#include "docschema/basic/json.hpp"
#include "docschema/query/validation_options.hpp"

namespace docschema::query
{

/**
 * Structural validator for query filter documents.
 *
 * Every problem is reported; nothing stops at the first error and nothing
 * throws. A query root that is not a document short-circuits with a single
 * error.
 *
 * ## Usage
 * ```cpp
 * DiagnosticBag diags;
 * SyntaxValidator validator(diags);
 * bool ok = validator.validate(query);
 * ```
 */
class SyntaxValidator
{
public:
  explicit SyntaxValidator(DiagnosticBag & diags, ValidationOptions options = {});

  /**
   * Validate a query filter document.
   *
   * @return true if no errors were reported (warnings allowed)
   */
  bool validate(const Json & query);

private:
  void check_document(const Json & part, const std::string & path, size_t depth);
  void check_operator(
    const std::string & key, const Json & value, const std::string & current_path, size_t depth);
  void check_field(
    const std::string & key, const Json & value, const std::string & prefix,
    const std::string & current_path, size_t depth);
  bool check_field_name(
    const std::string & key, const std::string & prefix, const std::string & current_path);

  void report_invalid_value(
    const std::string & op, const std::string & current_path, const std::string & expected);

  DiagnosticBag & diags_;
  ValidationOptions options_;
  size_t error_count_ = 0;
};

/// Validate and return the ordered messages (warnings prefixed "Warning: ")
[[nodiscard]] std::vector<std::string> validate_syntax(
  const Json & query, const ValidationOptions & options = {});

}  // namespace docschema::query
