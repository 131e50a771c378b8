#pragma once

#include <cstddef>

#include "grail/ir/block.hpp"
#include "grail/ir/query_metadata.hpp"

namespace grail::lowering {

// Defers Filters inside @optional scopes to the global operations section.
//
// A filter on a vertex reached through an optional edge must drop the row only
// if the edge exists and the filter fails. Backends with native optional-match
// semantics drop the row on filter failure even when the edge is missing, so
// such filters are evaluated after the optional edges have been resolved:
// immediately after GlobalOperationsStart, in their original order.
//
// State: whether the scan is inside an optional scope, and the filters held
// back so far. Entering happens on an optional Traverse; on Backtrack(L) the
// flag is recomputed as optional_scopes_depth(L) > 0, which keeps the flag set
// when leaving an inner optional scope nested in an outer one.
class OptionalFilterHoister {
 public:
  explicit OptionalFilterHoister(const ir::QueryMetadataTable& metadata);

  // Feeds one block and returns the blocks to emit at this point, in order.
  auto Advance(const ir::Block& block) -> ir::BlockList;

  // Throws InternalError{kMalformedIr} if filters are still held back, i.e.
  // the sequence had no GlobalOperationsStart after them.
  void Finish() const;

  [[nodiscard]] auto InOptionalScope() const -> bool {
    return in_optional_scope_;
  }
  [[nodiscard]] auto HeldCount() const -> size_t {
    return held_.size();
  }

 private:
  const ir::QueryMetadataTable* metadata_;
  bool in_optional_scope_ = false;
  ir::BlockList held_;
};

// Must run after ResolveLocalFields: a moved filter still holding a LocalField
// would be bound to whichever location precedes its new position.
auto HoistOptionalScopeFilters(
    const ir::BlockList& blocks, const ir::QueryMetadataTable& metadata)
    -> ir::BlockList;

}  // namespace grail::lowering
