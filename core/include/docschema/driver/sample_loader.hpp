// docschema/driver/sample_loader.hpp - Reading sampled documents from disk
//
// Sample files stand in for a live collection: one file per collection,
// named after it.
//
#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "docschema/basic/json.hpp"

namespace docschema
{

/**
 * Result of reading a JSON file or a sample of documents.
 */
struct SampleLoadResult
{
  /// Loaded documents (only valid if success == true)
  std::vector<Json> documents;

  bool success = false;

  /// Error message if loading failed
  std::string error;

  static SampleLoadResult ok(std::vector<Json> docs)
  {
    SampleLoadResult r;
    r.documents = std::move(docs);
    r.success = true;
    return r;
  }

  static SampleLoadResult fail(std::string msg)
  {
    SampleLoadResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

/**
 * Load up to sample_size documents.
 *
 * Supported layouts:
 * - ".json": an array of documents, or a single document
 * - ".jsonl" / ".ndjson": one document per line (blank lines ignored)
 *
 * @param path Sample file
 * @param sample_size Maximum number of documents (0 = all)
 */
[[nodiscard]] SampleLoadResult load_samples(const std::filesystem::path & path, size_t sample_size);

/**
 * Parse a whole file as one JSON value (queries, schema snapshots).
 *
 * On success documents holds exactly one value.
 */
[[nodiscard]] SampleLoadResult load_json_file(const std::filesystem::path & path);

/// True for files load_samples() understands
[[nodiscard]] bool is_sample_file(const std::filesystem::path & path);

/// Collection name for a sample file (its stem), std::nullopt otherwise
[[nodiscard]] std::optional<std::string> collection_name(const std::filesystem::path & path);

}  // namespace docschema
