#include "grail/lowering/type_bounds.hpp"

#include <cstddef>
#include <optional>
#include <variant>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "grail/common/internal_error.hpp"
#include "grail/ir/dumper.hpp"

namespace grail::lowering {

namespace {

// What a traversal step runs into after skipping its Filters.
struct StepTarget {
  bool already_coerced = false;
  std::optional<ir::AnyLocation> marked_location;
};

auto FindStepTarget(const ir::BlockList& blocks, size_t step_index)
    -> StepTarget {
  for (size_t i = step_index + 1; i < blocks.size(); ++i) {
    const ir::Block& next = blocks[i];
    if (ir::Is<ir::CoerceType>(next)) {
      return StepTarget{.already_coerced = true, .marked_location = {}};
    }
    if (const auto* mark = std::get_if<ir::MarkLocation>(&next.data)) {
      return StepTarget{
          .already_coerced = false, .marked_location = mark->location};
    }
    if (!ir::Is<ir::Filter>(next)) {
      common::ThrowInternalError(
          "InsertExplicitTypeBounds",
          fmt::format(
              "expected only CoerceType and Filter blocks between {} and its "
              "MarkLocation, but found {} at index {}. IR blocks: {}",
              ir::FormatBlock(blocks[step_index]), ir::FormatBlock(next), i,
              ir::FormatBlocks(blocks)));
    }
  }
  common::ThrowInternalError(
      "InsertExplicitTypeBounds",
      fmt::format(
          "block {} at index {} has no MarkLocation or CoerceType after it. "
          "IR blocks: {}",
          ir::FormatBlock(blocks[step_index]), step_index,
          ir::FormatBlocks(blocks)));
}

}  // namespace

auto InsertExplicitTypeBounds(
    const ir::BlockList& blocks, const ir::QueryMetadataTable& metadata)
    -> ir::BlockList {
  ir::BlockList result;
  result.reserve(blocks.size());

  for (size_t i = 0; i < blocks.size(); ++i) {
    const ir::Block& block = blocks[i];
    result.push_back(block);

    if (!ir::IsTraversalStep(block)) {
      continue;
    }

    StepTarget target = FindStepTarget(blocks, i);
    if (target.already_coerced) {
      continue;
    }

    const ir::LocationInfo& info =
        metadata.GetLocationInfo(*target.marked_location);
    spdlog::debug(
        "type bounds: {} at {} narrowed to {}", ir::FormatBlock(block), i,
        info.type);
    result.push_back(ir::Block{ir::CoerceType{.target_class = {info.type}}});
  }

  return result;
}

}  // namespace grail::lowering
