#include "grail/lowering/pipeline.hpp"

#include <cstddef>
#include <optional>
#include <string_view>

#include <spdlog/spdlog.h>

#include "grail/ir/verify.hpp"
#include "grail/lowering/local_field_resolution.hpp"
#include "grail/lowering/optional_filter_hoisting.hpp"
#include "grail/lowering/revisit_elimination.hpp"
#include "grail/lowering/type_bounds.hpp"

namespace grail::lowering {

auto PassName(PassId pass) -> std::string_view {
  switch (pass) {
    case PassId::kInsertTypeBounds:
      return "insert_type_bounds";
    case PassId::kEliminateRevisits:
      return "eliminate_revisits";
    case PassId::kResolveLocalFields:
      return "resolve_local_fields";
    case PassId::kHoistOptionalFilters:
      return "hoist_optional_filters";
  }
  return "unknown";
}

auto ParsePassName(std::string_view name) -> std::optional<PassId> {
  for (PassId pass : kPassOrder) {
    if (PassName(pass) == name) {
      return pass;
    }
  }
  return std::nullopt;
}

auto RunPass(
    PassId pass, const ir::BlockList& blocks,
    const ir::QueryMetadataTable& metadata) -> ir::BlockList {
  switch (pass) {
    case PassId::kInsertTypeBounds:
      return InsertExplicitTypeBounds(blocks, metadata);
    case PassId::kEliminateRevisits:
      return EliminateLocationRevisits(blocks, metadata);
    case PassId::kResolveLocalFields:
      return ResolveLocalFields(blocks);
    case PassId::kHoistOptionalFilters:
      return HoistOptionalScopeFilters(blocks, metadata);
  }
  return blocks;
}

auto LowerIr(
    const ir::BlockList& blocks, const ir::QueryMetadataTable& metadata,
    const LoweringOptions& options) -> ir::BlockList {
  if (options.verify) {
    ir::VerifyBlocks(blocks, "lowering input");
  }

  ir::BlockList current = blocks;
  for (PassId pass : kPassOrder) {
    size_t before = current.size();
    current = RunPass(pass, current, metadata);
    spdlog::debug(
        "lowering: {} ({} -> {} blocks)", PassName(pass), before,
        current.size());

    if (options.verify && pass == PassId::kResolveLocalFields) {
      ir::VerifyNoLocalFields(current, "after resolve_local_fields");
    }
    if (options.after_pass) {
      options.after_pass(pass, current);
    }
  }

  if (options.verify) {
    ir::VerifyBlocks(current, "lowering output");
  }
  return current;
}

}  // namespace grail::lowering
