#pragma once

#include "grail/ir/block.hpp"
#include "grail/ir/query_metadata.hpp"

namespace grail::ir {

// One compiled query as handed over by the front end.
struct Query {
  BlockList blocks;
  QueryMetadataTable metadata;
};

}  // namespace grail::ir
