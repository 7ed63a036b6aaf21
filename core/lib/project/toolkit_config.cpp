// docschema/project/toolkit_config.cpp - Toolkit configuration implementation
//
#include "docschema/project/toolkit_config.hpp"

#include <yaml-cpp/yaml.h>

#include <utility>

namespace docschema
{

namespace
{

/// Read a non-negative count; false (with error set) on a negative value
bool read_count(const YAML::Node & node, const char * name, size_t & out, std::string & error)
{
  if (!node[name]) {
    return true;
  }
  const auto value = node[name].as<long long>();
  if (value < 0) {
    error = std::string(name) + " must not be negative";
    return false;
  }
  out = static_cast<size_t>(value);
  return true;
}

}  // namespace

ConfigLoadResult load_toolkit_config(const std::filesystem::path & config_path)
{
  namespace fs = std::filesystem;

  if (!fs::exists(config_path)) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  YAML::Node root;
  try {
    root = YAML::LoadFile(config_path.string());
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }

  ToolkitConfig config;

  // An empty file is a valid, all-defaults configuration.
  if (root.IsNull()) {
    return ConfigLoadResult::ok(std::move(config));
  }
  if (!root.IsMap()) {
    return ConfigLoadResult::fail("configuration root must be a map");
  }

  std::string error;
  try {
    // Parse 'inference' section
    if (const auto inference = root["inference"]) {
      if (!inference.IsMap()) {
        return ConfigLoadResult::fail("inference must be a map");
      }
      if (
        !read_count(inference, "sample_size", config.inference.sample_size, error) ||
        !read_count(inference, "max_depth", config.inference.options.max_depth, error)) {
        return ConfigLoadResult::fail("invalid inference." + error);
      }
    }

    // Parse 'validation' section
    if (const auto validation = root["validation"]) {
      if (!validation.IsMap()) {
        return ConfigLoadResult::fail("validation must be a map");
      }
      if (!read_count(validation, "max_depth", config.validation.max_depth, error)) {
        return ConfigLoadResult::fail("invalid validation." + error);
      }
      if (validation["coerce_numeric"]) {
        config.validation.coerce_numeric = validation["coerce_numeric"].as<bool>();
      }
    }

    // Parse 'output' section
    if (const auto output = root["output"]) {
      if (!output.IsMap()) {
        return ConfigLoadResult::fail("output must be a map");
      }
      if (output["indent"]) {
        config.output.indent = output["indent"].as<int>();
        if (config.output.indent < -1) {
          return ConfigLoadResult::fail("output.indent must be -1 or greater");
        }
      }
    }
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("invalid configuration value: " + std::string(e.what()));
  }

  return ConfigLoadResult::ok(std::move(config));
}

std::optional<std::filesystem::path> find_toolkit_config(const std::filesystem::path & start_dir)
{
  namespace fs = std::filesystem;

  fs::path current = fs::absolute(start_dir);

  // If start_dir is a file, start from its parent
  if (fs::is_regular_file(current)) {
    current = current.parent_path();
  }

  while (true) {
    fs::path candidate = current / k_config_file_name;
    if (fs::exists(candidate)) {
      return candidate;
    }

    const fs::path parent = current.parent_path();
    if (parent == current) {
      // Reached filesystem root
      break;
    }
    current = parent;
  }

  return std::nullopt;
}

}  // namespace docschema
