#include "grail/ir/verify.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include <fmt/core.h>

#include "grail/common/internal_error.hpp"
#include "grail/ir/dumper.hpp"

namespace grail::ir {

namespace {

[[noreturn]] void Fail(
    std::string_view label, const BlockList& blocks, const std::string& what) {
  common::ThrowInternalError(
      "IR verify",
      fmt::format("{}: {}. IR blocks: {}", label, what, FormatBlocks(blocks)));
}

// The traversal step at `step_index` must reach a MarkLocation, skipping only
// Filter and CoerceType blocks.
void VerifyStepIsMarked(
    const BlockList& blocks, size_t step_index, std::string_view label) {
  const Block& step = blocks[step_index];
  for (size_t i = step_index + 1; i < blocks.size(); ++i) {
    const Block& next = blocks[i];
    if (Is<Filter>(next) || Is<CoerceType>(next)) {
      continue;
    }
    const auto* mark = std::get_if<MarkLocation>(&next.data);
    if (mark == nullptr) {
      Fail(
          label, blocks,
          fmt::format(
              "block {} ({}) is followed by {} at {} before any MarkLocation",
              step_index, FormatBlock(step), BlockKindName(next), i));
    }
    if (Is<Fold>(step) && !IsFoldScope(mark->location)) {
      Fail(
          label, blocks,
          fmt::format(
              "block {} ({}) is marked with {}", step_index, FormatBlock(step),
              FormatLocation(mark->location)));
    }
    return;
  }
  Fail(
      label, blocks,
      fmt::format(
          "block {} ({}) is never followed by a MarkLocation", step_index,
          FormatBlock(step)));
}

}  // namespace

void VerifyBlocks(const BlockList& blocks, std::string_view label) {
  if (blocks.empty() || !Is<QueryRoot>(blocks.front())) {
    Fail(label, blocks, "sequence must start with QueryRoot");
  }

  std::optional<size_t> global_start;
  for (size_t i = 0; i < blocks.size(); ++i) {
    const Block& block = blocks[i];

    if (Is<GlobalOperationsStart>(block)) {
      if (global_start) {
        Fail(
            label, blocks,
            fmt::format(
                "second GlobalOperationsStart at {} (first at {})", i,
                *global_start));
      }
      global_start = i;
      continue;
    }

    if (global_start) {
      if (IsTraversalStep(block) || Is<MarkLocation>(block) ||
          Is<Backtrack>(block) || Is<QueryRoot>(block)) {
        Fail(
            label, blocks,
            fmt::format(
                "{} at {} appears after GlobalOperationsStart",
                BlockKindName(block), i));
      }
    } else if (Is<ConstructResult>(block)) {
      Fail(
          label, blocks,
          fmt::format(
              "ConstructResult at {} appears before GlobalOperationsStart", i));
    }

    if (i > 0 && Is<QueryRoot>(block)) {
      Fail(label, blocks, fmt::format("second QueryRoot at {}", i));
    }

    if (IsTraversalStep(block)) {
      VerifyStepIsMarked(blocks, i, label);
    }
  }

  if (!global_start) {
    Fail(label, blocks, "missing GlobalOperationsStart");
  }
}

auto ContainsLocalField(const ExpressionPtr& expr) -> bool {
  bool found = false;
  ForEachSubexpression(expr, [&](const Expression& node) {
    if (std::holds_alternative<LocalField>(node.data)) {
      found = true;
    }
  });
  return found;
}

auto ContainsLocalField(const Block& block) -> bool {
  for (const auto& expr : Expressions(block)) {
    if (ContainsLocalField(expr)) {
      return true;
    }
  }
  return false;
}

void VerifyNoLocalFields(const BlockList& blocks, std::string_view label) {
  for (size_t i = 0; i < blocks.size(); ++i) {
    if (ContainsLocalField(blocks[i])) {
      common::ThrowInvariantViolation(
          "IR verify",
          fmt::format(
              "{}: block {} ({}) still contains a LocalField. IR blocks: {}",
              label, i, FormatBlock(blocks[i]), FormatBlocks(blocks)));
    }
  }
}

}  // namespace grail::ir
