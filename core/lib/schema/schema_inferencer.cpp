// docschema/schema/schema_inferencer.cpp - Recursive schema inference
//
#include "docschema/schema/schema_inferencer.hpp"

#include <optional>
#include <string>
#include <utility>

#include "docschema/basic/diagnostic_codes.hpp"
#include "docschema/bson/classifier.hpp"
#include "docschema/schema/schema_merger.hpp"

namespace docschema
{

namespace
{

class Inferencer
{
public:
  Inferencer(const InferenceOptions & options, DiagnosticBag * diags)
  : options_(options), diags_(diags)
  {
  }

  SchemaNode infer_value(const Json & value, const std::string & path, size_t depth)
  {
    if (depth > options_.max_depth) {
      if (diags_) {
        diags_
          ->report_warning(path, "Nesting deeper than " + std::to_string(options_.max_depth) +
                                   " levels at '" + path + "'; recording 'unknown'.")
          .with_code(codes::k_inference_depth);
      }
      return SchemaNode::unknown();
    }

    const TypeTag tag = classify(value);
    if (tag == TypeTag::Object) {
      return infer_object(value, path, depth);
    }
    if (tag == TypeTag::Array) {
      return infer_array(value, path, depth);
    }
    return SchemaNode::primitive(tag);
  }

private:
  SchemaNode infer_object(const Json & value, const std::string & path, size_t depth)
  {
    FieldSchemas fields;
    for (const auto & [key, child] : value.items()) {
      fields.emplace(key, infer_value(child, join_path(path, key), depth + 1));
    }
    return SchemaNode::object(std::move(fields));
  }

  SchemaNode infer_array(const Json & value, const std::string & path, size_t depth)
  {
    if (value.empty()) {
      return SchemaNode::empty_array();
    }

    std::optional<SchemaNode> element;
    size_t index = 0;
    for (const auto & item : value) {
      const std::string item_path = path + "[" + std::to_string(index++) + "]";
      SchemaNode item_schema = infer_value(item, item_path, depth + 1);
      if (element) {
        element = merge(*element, item_schema, diags_, path + "[]");
      } else {
        element = std::move(item_schema);
      }
    }
    return SchemaNode::array(std::move(*element));
  }

  const InferenceOptions & options_;
  DiagnosticBag * diags_;
};

}  // namespace

SchemaNode infer(const Json & value, const InferenceOptions & options, DiagnosticBag * diags)
{
  Inferencer inferencer(options, diags);
  return inferencer.infer_value(value, "", 0);
}

}  // namespace docschema
