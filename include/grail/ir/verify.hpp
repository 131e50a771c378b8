#pragma once

#include <string_view>

#include "grail/ir/block.hpp"
#include "grail/ir/expression.hpp"

namespace grail::ir {

// Verify the structural shape of a block sequence. Throws
// InternalError{kMalformedIr} on failure.
// label: descriptive name for error messages (e.g., "input", "after pass 2").
//
// Invariants checked:
// - The sequence starts with QueryRoot
// - Every Traverse/Fold/Recurse is followed, skipping only Filter and
//   CoerceType blocks, by a MarkLocation
// - A Fold is marked with a FoldScopeLocation
// - Exactly one GlobalOperationsStart exists
// - No traversal step, MarkLocation or Backtrack follows GlobalOperationsStart
// - ConstructResult, if present, follows GlobalOperationsStart
void VerifyBlocks(const BlockList& blocks, std::string_view label = "blocks");

// Throws InternalError{kInvariantViolation} if any LocalField is reachable
// from any block.
void VerifyNoLocalFields(
    const BlockList& blocks, std::string_view label = "blocks");

auto ContainsLocalField(const ExpressionPtr& expr) -> bool;
auto ContainsLocalField(const Block& block) -> bool;

}  // namespace grail::ir
