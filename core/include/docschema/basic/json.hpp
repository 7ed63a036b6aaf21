// docschema/basic/json.hpp - JSON value alias shared by all modules
#pragma once

#include <nlohmann/json.hpp>

namespace docschema
{

/// Generic document tree: sampled documents, query filters and schema snapshots.
using Json = nlohmann::json;

}  // namespace docschema
