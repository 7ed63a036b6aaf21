// docschema/query/validation_options.hpp - Options shared by both validators
#pragma once

#include <cstddef>

namespace docschema::query
{

struct ValidationOptions
{
  /// Nesting depth past which a subtree is reported instead of traversed
  size_t max_depth = 100;

  /// Treat int, long, double and decimal as interchangeable when checking
  /// a query value against a schema that allows any numeric type
  bool coerce_numeric = true;
};

}  // namespace docschema::query
