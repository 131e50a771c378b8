#pragma once

#include <array>
#include <cstdint>
#include <functional>
#include <optional>
#include <string_view>

#include "grail/ir/block.hpp"
#include "grail/ir/query_metadata.hpp"

namespace grail::lowering {

enum class PassId : uint8_t {
  kInsertTypeBounds,
  kEliminateRevisits,
  kResolveLocalFields,
  kHoistOptionalFilters,
};

// Fixed pipeline order. Each pass relies on the ones before it: filters may
// only be moved once their fields name explicit locations, and those locations
// must already be free of revisits.
inline constexpr std::array<PassId, 4> kPassOrder = {
    PassId::kInsertTypeBounds,
    PassId::kEliminateRevisits,
    PassId::kResolveLocalFields,
    PassId::kHoistOptionalFilters,
};

// Stable names used by the CLI and grail.toml ("insert_type_bounds", ...).
auto PassName(PassId pass) -> std::string_view;
auto ParsePassName(std::string_view name) -> std::optional<PassId>;

// Runs a single pass.
auto RunPass(
    PassId pass, const ir::BlockList& blocks,
    const ir::QueryMetadataTable& metadata) -> ir::BlockList;

using PassObserver = std::function<void(PassId, const ir::BlockList&)>;

struct LoweringOptions {
  // Verify the input shape before lowering and the absence of LocalFields
  // after resolution. The passes' own checks always run.
  bool verify = false;

  // Called with the output of every pass.
  PassObserver after_pass;
};

// Lowers backend-agnostic IR into the form backend code generation expects.
// Faults thrown by a pass (InternalError) propagate unchanged.
auto LowerIr(
    const ir::BlockList& blocks, const ir::QueryMetadataTable& metadata,
    const LoweringOptions& options = {}) -> ir::BlockList;

}  // namespace grail::lowering
