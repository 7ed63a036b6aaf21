// docschema/schema/schema_node.hpp - Inferred structural description of a value position
//
// A SchemaNode owns its children outright: field schemas for object values and
// a single element schema for array values. Schemas mirror acyclic documents,
// so no back-references exist.
//
#pragma once

#include <map>
#include <memory>
#include <string>

#include "docschema/bson/type_tag.hpp"

namespace docschema
{

struct SchemaNode;

/// Field name -> schema of the values observed under that field
using FieldSchemas = std::map<std::string, SchemaNode>;

/**
 * Schema of one position in a document tree.
 *
 * Invariants for nodes produced by inference and merge:
 * - types is non-empty
 * - object_schema() is present iff Object is in types
 * - element_schema() is present iff Array is in types
 *
 * Nodes decoded from an external snapshot may violate these; the merger and
 * the validators tolerate such partial fragments.
 */
struct SchemaNode
{
  TypeSet types;

  SchemaNode();
  explicit SchemaNode(TypeSet types_in);
  ~SchemaNode();

  SchemaNode(const SchemaNode & other);
  SchemaNode & operator=(const SchemaNode & other);
  SchemaNode(SchemaNode && other) noexcept;
  SchemaNode & operator=(SchemaNode && other) noexcept;

  // ===========================================================================
  // Factories
  // ===========================================================================

  [[nodiscard]] static SchemaNode primitive(TypeTag tag);
  [[nodiscard]] static SchemaNode object(FieldSchemas fields);
  [[nodiscard]] static SchemaNode array(SchemaNode element);

  /// {types: {array}, element_schema: {types: {empty_array}}}
  [[nodiscard]] static SchemaNode empty_array();

  /// {types: {unknown}}, the placeholder for values that could not be described
  [[nodiscard]] static SchemaNode unknown();

  // ===========================================================================
  // Queries
  // ===========================================================================

  [[nodiscard]] bool has_type(TypeTag tag) const noexcept { return types.count(tag) != 0; }

  /// A node without any type carries no information
  [[nodiscard]] bool is_valid() const noexcept { return !types.empty(); }

  [[nodiscard]] const FieldSchemas * object_schema() const noexcept { return fields_.get(); }
  [[nodiscard]] const SchemaNode * element_schema() const noexcept { return element_.get(); }

  // ===========================================================================
  // Construction helpers (used while a node is being built)
  // ===========================================================================

  void set_object_schema(FieldSchemas fields);
  void set_element_schema(SchemaNode element);
  void clear_object_schema() noexcept;
  void clear_element_schema() noexcept;

  [[nodiscard]] bool operator==(const SchemaNode & other) const;
  [[nodiscard]] bool operator!=(const SchemaNode & other) const { return !(*this == other); }

private:
  std::unique_ptr<FieldSchemas> fields_;
  std::unique_ptr<SchemaNode> element_;
};

/// Collection-level schema: top-level field name -> node (the root is implicit)
using CollectionSchema = FieldSchemas;

/// Collection name -> collection schema
using DatabaseSchema = std::map<std::string, CollectionSchema>;

}  // namespace docschema
