// docschema/schema/schema_aggregator.cpp - Collection-level schema aggregation
//
#include "docschema/schema/schema_aggregator.hpp"

#include <exception>
#include <string>
#include <utility>

#include "docschema/basic/diagnostic_codes.hpp"
#include "docschema/bson/classifier.hpp"
#include "docschema/schema/schema_json.hpp"
#include "docschema/schema/schema_merger.hpp"

namespace docschema
{

namespace
{

constexpr size_t k_max_id_length = 64;

std::string describe_document(const Json & document, size_t index)
{
  std::string out = "document #" + std::to_string(index);
  if (!document.is_object()) {
    return out;
  }
  const auto id = document.find("_id");
  if (id == document.end()) {
    return out;
  }
  std::string id_text = describe_fragment(*id);
  if (id_text.size() > k_max_id_length) {
    id_text = id_text.substr(0, k_max_id_length) + "...";
  }
  return out + " (_id: " + id_text + ")";
}

}  // namespace

SchemaAggregator::SchemaAggregator(InferenceOptions options, DiagnosticBag * diags)
: options_(options), diags_(diags)
{
}

void SchemaAggregator::add_document(const Json & document)
{
  ++seen_;

  if (!is_document(document)) {
    skip(
      document,
      "expected an object, found '" + std::string(type_name(classify(document))) + "'", false);
    return;
  }

  try {
    const SchemaNode doc_schema = infer(document, options_, diags_);
    const FieldSchemas * fields = doc_schema.object_schema();
    if (fields == nullptr) {
      skip(document, "inference produced no field schema", false);
      return;
    }

    // Merge into a copy so a failure cannot leave a half-merged schema behind.
    CollectionSchema next = schema_;
    merge_into(next, *fields, diags_);
    schema_ = std::move(next);
    ++analyzed_;
  } catch (const std::exception & e) {
    skip(document, e.what(), true);
  }
}

void SchemaAggregator::skip(const Json & document, const std::string & reason, bool failed)
{
  ++skipped_;
  if (!diags_) {
    return;
  }
  const std::string what = describe_document(document, seen_ - 1);
  if (failed) {
    diags_
      ->report_warning(
        "", "Error processing schema for " + what + ": " + reason + ". Skipping it.")
      .with_code(codes::k_document_failed);
  } else {
    diags_->report_warning("", "Skipping " + what + ": " + reason + ".")
      .with_code(codes::k_document_not_object);
  }
}

void SchemaAggregator::add_schema(const CollectionSchema & schema)
{
  merge_into(schema_, schema, diags_);
}

CollectionSchema SchemaAggregator::take()
{
  CollectionSchema out = std::move(schema_);
  schema_.clear();
  return out;
}

CollectionSchema aggregate(
  gsl::span<const Json> documents, const InferenceOptions & options, DiagnosticBag * diags)
{
  SchemaAggregator aggregator(options, diags);
  for (const auto & document : documents) {
    aggregator.add_document(document);
  }
  return aggregator.take();
}

}  // namespace docschema
