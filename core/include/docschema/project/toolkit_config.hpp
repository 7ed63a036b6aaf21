// docschema/project/toolkit_config.hpp - Toolkit configuration (docschema.yaml)
//
// Parses and validates docschema.yaml configuration files.
//
#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

#include "docschema/query/validation_options.hpp"
#include "docschema/schema/schema_inferencer.hpp"

namespace docschema
{

// ============================================================================
// Configuration Structures
// ============================================================================

/**
 * Sampling and inference section.
 */
struct InferenceConfig
{
  /// Documents read per collection (0 = all)
  size_t sample_size = 100;

  InferenceOptions options;
};

/**
 * Output formatting section.
 */
struct OutputConfig
{
  /// JSON indentation for emitted schemas (-1 = single line)
  int indent = 2;
};

/**
 * Complete toolkit configuration (docschema.yaml).
 */
struct ToolkitConfig
{
  InferenceConfig inference;
  query::ValidationOptions validation;
  OutputConfig output;
};

// ============================================================================
// Configuration Loading Result
// ============================================================================

/**
 * Result of loading a configuration file.
 */
struct ConfigLoadResult
{
  /// Loaded configuration (only valid if success == true)
  ToolkitConfig config;

  bool success = false;

  /// Error message if loading failed
  std::string error;

  static ConfigLoadResult ok(ToolkitConfig cfg)
  {
    ConfigLoadResult r;
    r.config = std::move(cfg);
    r.success = true;
    return r;
  }

  static ConfigLoadResult fail(std::string msg)
  {
    ConfigLoadResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

// ============================================================================
// Configuration Loading API
// ============================================================================

/**
 * Load a configuration from a docschema.yaml file.
 *
 * Missing sections and keys keep their defaults. Unknown keys are ignored.
 *
 * @param config_path Path to docschema.yaml
 * @return ConfigLoadResult with the loaded config or error message
 */
[[nodiscard]] ConfigLoadResult load_toolkit_config(const std::filesystem::path & config_path);

/**
 * Find a configuration file by searching upward from a directory.
 *
 * @param start_dir Directory (or file) to start searching from
 * @return Path to docschema.yaml if found, std::nullopt otherwise
 */
[[nodiscard]] std::optional<std::filesystem::path> find_toolkit_config(
  const std::filesystem::path & start_dir);

inline constexpr const char * k_config_file_name = "docschema.yaml";

}  // namespace docschema
