// docschema/driver/toolkit.hpp - Toolkit driver
//
// Single entry point for inference and validation over files on disk.
// Used by the CLI and can be embedded into other tools.
//
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <gsl/span>

#include "docschema/basic/diagnostic.hpp"
#include "docschema/basic/json.hpp"
#include "docschema/project/toolkit_config.hpp"
#include "docschema/schema/schema_node.hpp"

namespace docschema
{

// ============================================================================
// Results
// ============================================================================

struct CollectionInferenceResult
{
  /// Whether inference succeeded (no errors)
  bool success = false;

  DiagnosticBag diagnostics;

  /// Empty when the sample held no documents
  CollectionSchema schema;

  size_t documents_analyzed = 0;
  size_t documents_skipped = 0;
};

struct DatabaseInferenceResult
{
  bool success = false;

  DiagnosticBag diagnostics;

  /// Collections with an empty sample are omitted
  DatabaseSchema schema;
};

struct ValidationResult
{
  /// True when no errors were reported (warnings allowed)
  bool valid = false;

  DiagnosticBag diagnostics;

  /// Ordered messages, warnings prefixed with "Warning: "
  [[nodiscard]] std::vector<std::string> messages() const;
};

// ============================================================================
// Toolkit
// ============================================================================

/**
 * Facade over sampling, inference and validation.
 *
 * A database is a directory holding one sample file per collection
 * (see load_samples()); the file stem is the collection name.
 */
class Toolkit
{
public:
  explicit Toolkit(ToolkitConfig config = {});

  [[nodiscard]] const ToolkitConfig & config() const noexcept { return config_; }

  /// Infer a collection schema from already materialized documents
  [[nodiscard]] CollectionInferenceResult infer_collection(gsl::span<const Json> documents) const;

  /// Infer a collection schema from a sample file
  [[nodiscard]] CollectionInferenceResult infer_collection(
    const std::filesystem::path & sample_file) const;

  /**
   * Infer the schema of every collection in a directory.
   *
   * @param directory Directory holding the sample files
   * @param target_collection Restrict inference to this collection; it is
   *        an error if no sample file carries that name
   */
  [[nodiscard]] DatabaseInferenceResult infer_database(
    const std::filesystem::path & directory,
    const std::optional<std::string> & target_collection = std::nullopt) const;

  [[nodiscard]] ValidationResult validate_syntax(const Json & query) const;

  [[nodiscard]] ValidationResult validate_against_schema(
    const Json & query, const CollectionSchema & schema) const;

  /**
   * Validate against a schema snapshot in its JSON form.
   *
   * Accepts a collection schema or, with collection set, a database schema.
   */
  [[nodiscard]] ValidationResult validate_against_schema(
    const Json & query, const Json & schema_snapshot,
    const std::optional<std::string> & collection = std::nullopt) const;

private:
  ToolkitConfig config_;
};

}  // namespace docschema
