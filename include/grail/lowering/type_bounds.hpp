#pragma once

#include "grail/ir/block.hpp"
#include "grail/ir/query_metadata.hpp"

namespace grail::lowering {

// Guarantees a CoerceType naming the destination's declared type directly
// after every Traverse, Fold and Recurse.
//
// Steps already narrowed by a CoerceType (possibly after some Filters) are
// left alone. Otherwise the CoerceType is inserted immediately after the step,
// ahead of any Filters, so those Filters see the narrowed type. The type comes
// from the metadata table entry of the step's MarkLocation.
//
// Throws InternalError{kMalformedIr} if a step reaches anything other than
// Filter, CoerceType or MarkLocation first, or the end of the sequence.
auto InsertExplicitTypeBounds(
    const ir::BlockList& blocks, const ir::QueryMetadataTable& metadata)
    -> ir::BlockList;

}  // namespace grail::lowering
