// docschema/schema/schema_aggregator.hpp - Collection-level schema aggregation
//
// Folds the schemas of sampled documents into one collection schema. The
// aggregator performs no I/O: callers hand it documents already truncated
// to the sample size.
//
#pragma once

#include <cstddef>

#include <gsl/span>

#include "docschema/basic/diagnostic.hpp"
#include "docschema/basic/json.hpp"
#include "docschema/schema/schema_inferencer.hpp"
#include "docschema/schema/schema_node.hpp"

namespace docschema
{

/**
 * Incremental collection schema builder.
 *
 * A document that cannot be processed is skipped with a diagnostic; the
 * schema accumulated from the other documents is kept.
 *
 * ## Usage
 * ```cpp
 * DiagnosticBag diags;
 * SchemaAggregator aggregator({}, &diags);
 * for (const auto & doc : documents) aggregator.add_document(doc);
 * CollectionSchema schema = aggregator.snapshot();
 * ```
 */
class SchemaAggregator
{
public:
  explicit SchemaAggregator(InferenceOptions options = {}, DiagnosticBag * diags = nullptr);

  /// Infer one document and merge its fields into the running schema
  void add_document(const Json & document);

  /// Merge a previously produced collection schema into the running schema
  void add_schema(const CollectionSchema & schema);

  [[nodiscard]] const CollectionSchema & snapshot() const noexcept { return schema_; }

  /// Release the accumulated schema, leaving the aggregator empty
  [[nodiscard]] CollectionSchema take();

  [[nodiscard]] size_t documents_analyzed() const noexcept { return analyzed_; }
  [[nodiscard]] size_t documents_skipped() const noexcept { return skipped_; }

private:
  void skip(const Json & document, const std::string & reason, bool failed);

  InferenceOptions options_;
  DiagnosticBag * diags_;
  CollectionSchema schema_;
  size_t seen_ = 0;
  size_t analyzed_ = 0;
  size_t skipped_ = 0;
};

/**
 * One-shot aggregation over a bounded sequence of documents.
 *
 * An empty sequence yields an empty schema ("no sample available").
 */
[[nodiscard]] CollectionSchema aggregate(
  gsl::span<const Json> documents, const InferenceOptions & options = {},
  DiagnosticBag * diags = nullptr);

}  // namespace docschema
