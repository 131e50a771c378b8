#pragma once

#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>

#include "grail/common/diagnostic.hpp"
#include "grail/ir/block.hpp"
#include "grail/ir/expression.hpp"
#include "grail/ir/location.hpp"
#include "grail/ir/query.hpp"
#include "grail/ir/query_metadata.hpp"

namespace grail::ir {

// JSON interchange for compiled queries.
//
// Document layout:
//   {
//     "blocks":   [ {"kind": "QueryRoot", "start_class": ["Animal"]}, ... ],
//     "metadata": {
//       "locations": [ {"location": {...}, "type": "Animal",
//                       "parent": {...}, "optional_depth": 0, ...}, ... ],
//       "revisits":  [ {"revisit": {...}, "origin": {...}}, ... ]
//     }
//   }
//
// The first entry of "locations" is the query root. A location is
// {"path": [...], "field": "name", "visit": 1}; a fold-scope location is
// {"base": <location>, "fold_path": [{"direction": "out", "edge": "E"}],
//  "field": "name"}. Blocks and expressions carry a "kind" tag named after
// their C++ type.

// Malformed documents yield a Diagnostic pointing at the offending value.
auto ParseQuery(const nlohmann::json& doc, const std::string& file = "<input>")
    -> Result<Query>;

// Reads and parses a query document. I/O and JSON syntax errors are host
// errors.
auto LoadQuery(const std::filesystem::path& path) -> Result<Query>;

auto ToJson(const Location& location) -> nlohmann::json;
auto ToJson(const FoldScopeLocation& location) -> nlohmann::json;
auto ToJson(const AnyLocation& location) -> nlohmann::json;
auto ToJson(const ExpressionPtr& expr) -> nlohmann::json;
auto ToJson(const Block& block) -> nlohmann::json;
auto ToJson(const BlockList& blocks) -> nlohmann::json;
auto ToJson(const QueryMetadataTable& metadata) -> nlohmann::json;
auto ToJson(const Query& query) -> nlohmann::json;

}  // namespace grail::ir
