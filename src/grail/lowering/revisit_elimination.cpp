#include "grail/lowering/revisit_elimination.hpp"

#include <cstddef>
#include <utility>
#include <variant>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "grail/common/internal_error.hpp"
#include "grail/common/overloaded.hpp"
#include "grail/ir/dumper.hpp"
#include "grail/lowering/expression_rewriter.hpp"
#include "grail/lowering/location_renaming.hpp"

namespace grail::lowering {

namespace {

// Renames the locations a block carries outside of its expressions.
auto TranslateBlockLocations(
    const ir::Block& block, const LocationTranslations& translations)
    -> ir::Block {
  return std::visit(
      Overloaded{
          [&](const ir::Backtrack& b) -> ir::Block {
            return ir::Block{ir::Backtrack{
                .location = TranslateLocation(b.location, translations),
                .optional = b.optional}};
          },
          [&](const ir::Fold& b) -> ir::Block {
            return ir::Block{ir::Fold{
                .fold_scope_location =
                    TranslateLocation(b.fold_scope_location, translations)}};
          },
          [&](const ir::MarkLocation& b) -> ir::Block {
            return ir::Block{ir::MarkLocation{
                .location = TranslateLocation(b.location, translations)}};
          },
          [&](const auto&) -> ir::Block { return block; },
      },
      block.data);
}

auto IsRevisitMark(
    const ir::Block& block, const LocationTranslations& translations) -> bool {
  const auto* mark = std::get_if<ir::MarkLocation>(&block.data);
  if (mark == nullptr) {
    return false;
  }
  const auto* location = std::get_if<ir::Location>(&mark->location);
  return location != nullptr && translations.contains(*location);
}

}  // namespace

auto EliminateLocationRevisits(
    const ir::BlockList& blocks, const ir::QueryMetadataTable& metadata)
    -> ir::BlockList {
  LocationTranslations translations = MakeRevisitLocationTranslations(metadata);
  ExpressionVisitor rewriter = MakeLocationRewriter(translations);

  ir::BlockList result;
  result.reserve(blocks.size());
  size_t dropped = 0;

  for (const auto& block : blocks) {
    if (IsRevisitMark(block, translations)) {
      spdlog::debug("revisits: dropping {}", ir::FormatBlock(block));
      ++dropped;
      continue;
    }
    ir::Block renamed = RewriteBlockExpressions(block, rewriter);
    result.push_back(TranslateBlockLocations(renamed, translations));
  }

  if (result.size() + dropped != blocks.size()) {
    common::ThrowInvariantViolation(
        "EliminateLocationRevisits",
        fmt::format(
            "expected {} blocks after dropping {} revisits, got {}",
            blocks.size() - dropped, dropped, result.size()));
  }

  return result;
}

}  // namespace grail::lowering
