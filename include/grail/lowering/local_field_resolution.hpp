#pragma once

#include <cstddef>

#include "grail/ir/block.hpp"

namespace grail::lowering {

// Binds LocalField expressions to the location they are read at.
//
// Blocks are buffered until the next MarkLocation(L). At that point every
// LocalField(name) in the buffer becomes ContextField(L.name), or
// FoldedContextField(L.name) when L is a fold-scope location, and the buffer
// is released followed by the MarkLocation itself.
class LocalFieldBinder {
 public:
  // Feeds one block and returns the blocks released by it, in order. Empty
  // unless `block` is a MarkLocation.
  auto Advance(const ir::Block& block) -> ir::BlockList;

  // Releases blocks still waiting after the last MarkLocation, unrewritten.
  auto Finish() -> ir::BlockList;

  [[nodiscard]] auto PendingCount() const -> size_t {
    return pending_.size();
  }

 private:
  ir::BlockList pending_;
};

// Runs LocalFieldBinder over the whole sequence. The rewrite is 1:1; a change
// in block count throws InternalError{kInvariantViolation}.
auto ResolveLocalFields(const ir::BlockList& blocks) -> ir::BlockList;

}  // namespace grail::lowering
