// docschema/driver/toolkit.cpp - Toolkit driver implementation
//
#include "docschema/driver/toolkit.hpp"

#include <map>
#include <system_error>
#include <utility>

#include "docschema/basic/diagnostic_codes.hpp"
#include "docschema/driver/sample_loader.hpp"
#include "docschema/query/report.hpp"
#include "docschema/query/schema_validator.hpp"
#include "docschema/query/syntax_validator.hpp"
#include "docschema/schema/schema_aggregator.hpp"
#include "docschema/schema/schema_json.hpp"

namespace docschema
{

namespace
{

/// Sample files of a directory keyed by collection name
std::map<std::string, std::filesystem::path> list_collections(
  const std::filesystem::path & directory, std::error_code & ec)
{
  std::map<std::string, std::filesystem::path> collections;
  for (std::filesystem::directory_iterator it(directory, ec), end; !ec && it != end;
       it.increment(ec)) {
    std::error_code entry_ec;
    if (!it->is_regular_file(entry_ec)) {
      continue;
    }
    if (auto name = collection_name(it->path())) {
      // First file wins when a.json and a.jsonl both exist.
      collections.emplace(std::move(*name), it->path());
    }
  }
  return collections;
}

}  // namespace

std::vector<std::string> ValidationResult::messages() const
{
  return query::to_messages(diagnostics);
}

Toolkit::Toolkit(ToolkitConfig config) : config_(std::move(config)) {}

CollectionInferenceResult Toolkit::infer_collection(gsl::span<const Json> documents) const
{
  CollectionInferenceResult result;

  SchemaAggregator aggregator(config_.inference.options, &result.diagnostics);
  for (const auto & doc : documents) {
    aggregator.add_document(doc);
  }
  result.documents_analyzed = aggregator.documents_analyzed();
  result.documents_skipped = aggregator.documents_skipped();
  result.schema = aggregator.take();
  result.success = !result.diagnostics.has_errors();
  return result;
}

CollectionInferenceResult Toolkit::infer_collection(
  const std::filesystem::path & sample_file) const
{
  const auto loaded = load_samples(sample_file, config_.inference.sample_size);
  if (!loaded.success) {
    CollectionInferenceResult result;
    result.diagnostics.report_error("", loaded.error).with_code(codes::k_load_failed);
    return result;
  }

  auto result = infer_collection(gsl::span<const Json>(loaded.documents));
  if (loaded.documents.empty()) {
    result.diagnostics
      .report_info("", "Collection sample '" + sample_file.string() + "' holds no documents.")
      .with_code(codes::k_empty_collection);
  }
  return result;
}

DatabaseInferenceResult Toolkit::infer_database(
  const std::filesystem::path & directory,
  const std::optional<std::string> & target_collection) const
{
  DatabaseInferenceResult result;

  std::error_code ec;
  if (!std::filesystem::is_directory(directory, ec)) {
    result.diagnostics.report_error("", "Database directory not found: " + directory.string())
      .with_code(codes::k_load_failed);
    return result;
  }

  auto collections = list_collections(directory, ec);
  if (ec) {
    result.diagnostics
      .report_error("", "Cannot list directory '" + directory.string() + "': " + ec.message())
      .with_code(codes::k_load_failed);
    return result;
  }

  if (target_collection) {
    const auto it = collections.find(*target_collection);
    if (it == collections.end()) {
      result.diagnostics
        .report_error(
          "", "Collection '" + *target_collection + "' not found in '" + directory.string() + "'.")
        .with_code(codes::k_collection_not_found);
      return result;
    }
    auto only = *it;
    collections.clear();
    collections.insert(std::move(only));
  } else if (collections.empty()) {
    result.diagnostics.report_info("", "Database contains no collections.")
      .with_code(codes::k_empty_collection);
  }

  for (const auto & [name, file] : collections) {
    auto inferred = infer_collection(file);
    result.diagnostics.merge_under(inferred.diagnostics, name);
    if (!inferred.schema.empty()) {
      result.schema.emplace(name, std::move(inferred.schema));
    }
  }

  result.success = !result.diagnostics.has_errors();
  return result;
}

ValidationResult Toolkit::validate_syntax(const Json & query) const
{
  ValidationResult result;
  query::SyntaxValidator validator(result.diagnostics, config_.validation);
  result.valid = validator.validate(query);
  return result;
}

ValidationResult Toolkit::validate_against_schema(
  const Json & query, const CollectionSchema & schema) const
{
  ValidationResult result;
  query::SchemaValidator validator(schema, result.diagnostics, config_.validation);
  result.valid = validator.validate(query);
  return result;
}

ValidationResult Toolkit::validate_against_schema(
  const Json & query, const Json & schema_snapshot,
  const std::optional<std::string> & collection) const
{
  ValidationResult result;

  const Json * collection_snapshot = &schema_snapshot;
  if (collection) {
    const auto it = schema_snapshot.find(*collection);
    if (it == schema_snapshot.end()) {
      result.diagnostics
        .report_error("", "Collection '" + *collection + "' not found in the schema snapshot.")
        .with_code(codes::k_collection_not_found);
      return result;
    }
    collection_snapshot = &*it;
  }

  const auto schema = collection_schema_from_json(
    *collection_snapshot, &result.diagnostics, config_.validation.max_depth);
  if (!schema) {
    result.diagnostics.report_error("", "Expected schema must be a document.")
      .with_code(codes::k_invalid_fragment);
    return result;
  }

  query::SchemaValidator validator(*schema, result.diagnostics, config_.validation);
  result.valid = validator.validate(query) && !result.diagnostics.has_errors();
  return result;
}

}  // namespace docschema
