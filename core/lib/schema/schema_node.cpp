// docschema/schema/schema_node.cpp - SchemaNode value semantics
//
#include "docschema/schema/schema_node.hpp"

#include <utility>

namespace docschema
{

SchemaNode::SchemaNode() = default;

SchemaNode::SchemaNode(TypeSet types_in) : types(std::move(types_in)) {}

SchemaNode::~SchemaNode() = default;

SchemaNode::SchemaNode(const SchemaNode & other)
: types(other.types),
  fields_(other.fields_ ? std::make_unique<FieldSchemas>(*other.fields_) : nullptr),
  element_(other.element_ ? std::make_unique<SchemaNode>(*other.element_) : nullptr)
{
}

SchemaNode & SchemaNode::operator=(const SchemaNode & other)
{
  if (this != &other) {
    SchemaNode copy(other);
    *this = std::move(copy);
  }
  return *this;
}

SchemaNode::SchemaNode(SchemaNode && other) noexcept
: types(std::move(other.types)),
  fields_(std::move(other.fields_)),
  element_(std::move(other.element_))
{
}

SchemaNode & SchemaNode::operator=(SchemaNode && other) noexcept
{
  types = std::move(other.types);
  fields_ = std::move(other.fields_);
  element_ = std::move(other.element_);
  return *this;
}

SchemaNode SchemaNode::primitive(TypeTag tag) { return SchemaNode(TypeSet{tag}); }

SchemaNode SchemaNode::object(FieldSchemas fields)
{
  SchemaNode node(TypeSet{TypeTag::Object});
  node.set_object_schema(std::move(fields));
  return node;
}

SchemaNode SchemaNode::array(SchemaNode element)
{
  SchemaNode node(TypeSet{TypeTag::Array});
  node.set_element_schema(std::move(element));
  return node;
}

SchemaNode SchemaNode::empty_array() { return array(primitive(TypeTag::EmptyArray)); }

SchemaNode SchemaNode::unknown() { return primitive(TypeTag::Unknown); }

void SchemaNode::set_object_schema(FieldSchemas fields)
{
  fields_ = std::make_unique<FieldSchemas>(std::move(fields));
}

void SchemaNode::set_element_schema(SchemaNode element)
{
  element_ = std::make_unique<SchemaNode>(std::move(element));
}

void SchemaNode::clear_object_schema() noexcept { fields_.reset(); }

void SchemaNode::clear_element_schema() noexcept { element_.reset(); }

bool SchemaNode::operator==(const SchemaNode & other) const
{
  if (types != other.types) {
    return false;
  }
  if (static_cast<bool>(fields_) != static_cast<bool>(other.fields_)) {
    return false;
  }
  if (fields_ && *fields_ != *other.fields_) {
    return false;
  }
  if (static_cast<bool>(element_) != static_cast<bool>(other.element_)) {
    return false;
  }
  return !element_ || *element_ == *other.element_;
}

}  // namespace docschema
