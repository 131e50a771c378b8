#include "grail/lowering/optional_filter_hoisting.hpp"

#include <iterator>
#include <utility>
#include <variant>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "grail/common/internal_error.hpp"
#include "grail/common/overloaded.hpp"
#include "grail/ir/dumper.hpp"

namespace grail::lowering {

OptionalFilterHoister::OptionalFilterHoister(
    const ir::QueryMetadataTable& metadata)
    : metadata_(&metadata) {
}

auto OptionalFilterHoister::Advance(const ir::Block& block) -> ir::BlockList {
  return std::visit(
      Overloaded{
          [&](const ir::Filter&) -> ir::BlockList {
            if (!in_optional_scope_) {
              return {block};
            }
            spdlog::debug("optional filters: holding {}", ir::FormatBlock(block));
            held_.push_back(block);
            return {};
          },
          [&](const ir::Traverse& b) -> ir::BlockList {
            if (b.optional) {
              in_optional_scope_ = true;
            }
            return {block};
          },
          [&](const ir::Backtrack& b) -> ir::BlockList {
            const ir::LocationInfo& info = metadata_->GetLocationInfo(b.location);
            in_optional_scope_ = info.optional_scopes_depth > 0;
            return {block};
          },
          [&](const ir::GlobalOperationsStart&) -> ir::BlockList {
            ir::BlockList released;
            released.reserve(held_.size() + 1);
            released.push_back(block);
            released.insert(
                released.end(), std::make_move_iterator(held_.begin()),
                std::make_move_iterator(held_.end()));
            held_.clear();
            return released;
          },
          [&](const auto&) -> ir::BlockList { return {block}; },
      },
      block.data);
}

void OptionalFilterHoister::Finish() const {
  if (!held_.empty()) {
    common::ThrowInternalError(
        "HoistOptionalScopeFilters",
        fmt::format(
            "{} filter(s) inside optional scopes have no "
            "GlobalOperationsStart to move to, first: {}",
            held_.size(), ir::FormatBlock(held_.front())));
  }
}

auto HoistOptionalScopeFilters(
    const ir::BlockList& blocks, const ir::QueryMetadataTable& metadata)
    -> ir::BlockList {
  OptionalFilterHoister hoister(metadata);
  ir::BlockList result;
  result.reserve(blocks.size());

  for (const auto& block : blocks) {
    auto emitted = hoister.Advance(block);
    result.insert(
        result.end(), std::make_move_iterator(emitted.begin()),
        std::make_move_iterator(emitted.end()));
  }
  hoister.Finish();

  if (result.size() != blocks.size()) {
    common::ThrowInvariantViolation(
        "HoistOptionalScopeFilters",
        fmt::format(
            "the number of IR blocks unexpectedly changed, {} vs {}",
            blocks.size(), result.size()));
  }

  return result;
}

}  // namespace grail::lowering
