#pragma once

#include "grail/ir/block.hpp"
#include "grail/ir/query_metadata.hpp"

namespace grail::lowering {

// Removes location revisits. The front end re-marks the vertex an optional
// branch started from under a fresh revisit location; backends without that
// notion bind the vertex once. Drops every MarkLocation of a revisit location
// and renames all remaining references (expressions, Backtrack, Fold) to the
// revisit's origin.
//
// Output length = input length - number of dropped MarkLocations.
auto EliminateLocationRevisits(
    const ir::BlockList& blocks, const ir::QueryMetadataTable& metadata)
    -> ir::BlockList;

}  // namespace grail::lowering
