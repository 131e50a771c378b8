#include "grail/lowering/local_field_resolution.hpp"

#include <iterator>
#include <utility>
#include <variant>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "grail/common/internal_error.hpp"
#include "grail/common/overloaded.hpp"
#include "grail/ir/dumper.hpp"
#include "grail/lowering/expression_rewriter.hpp"

namespace grail::lowering {

namespace {

auto BindLocalField(
    const ir::AnyLocation& location, const ir::ExpressionPtr& expr)
    -> ir::ExpressionPtr {
  const auto* local = std::get_if<ir::LocalField>(&expr->data);
  if (local == nullptr) {
    return expr;
  }
  return std::visit(
      Overloaded{
          [&](const ir::Location& loc) -> ir::ExpressionPtr {
            return ir::MakeExpression(
                ir::ContextField{
                    .location = loc.NavigateToField(local->field_name),
                    .field_type = local->field_type});
          },
          [&](const ir::FoldScopeLocation& loc) -> ir::ExpressionPtr {
            return ir::MakeExpression(
                ir::FoldedContextField{
                    .fold_scope_location =
                        loc.NavigateToField(local->field_name),
                    .field_type = local->field_type});
          },
      },
      location);
}

}  // namespace

auto LocalFieldBinder::Advance(const ir::Block& block) -> ir::BlockList {
  const auto* mark = std::get_if<ir::MarkLocation>(&block.data);
  if (mark == nullptr) {
    pending_.push_back(block);
    return {};
  }

  ir::BlockList released;
  released.reserve(pending_.size() + 1);
  for (const auto& waiting : pending_) {
    released.push_back(
        RewriteBlockExpressions(waiting, mark->location, BindLocalField));
  }
  released.push_back(block);
  pending_.clear();
  return released;
}

auto LocalFieldBinder::Finish() -> ir::BlockList {
  if (!pending_.empty()) {
    spdlog::debug(
        "local fields: {} block(s) after the last MarkLocation left unbound",
        pending_.size());
  }
  return std::exchange(pending_, {});
}

auto ResolveLocalFields(const ir::BlockList& blocks) -> ir::BlockList {
  LocalFieldBinder binder;
  ir::BlockList result;
  result.reserve(blocks.size());

  for (const auto& block : blocks) {
    auto released = binder.Advance(block);
    result.insert(
        result.end(), std::make_move_iterator(released.begin()),
        std::make_move_iterator(released.end()));
  }
  auto tail = binder.Finish();
  result.insert(
      result.end(), std::make_move_iterator(tail.begin()),
      std::make_move_iterator(tail.end()));

  if (result.size() != blocks.size()) {
    common::ThrowInvariantViolation(
        "ResolveLocalFields",
        fmt::format(
            "the number of IR blocks unexpectedly changed, {} vs {}: {} {}",
            blocks.size(), result.size(), ir::FormatBlocks(blocks),
            ir::FormatBlocks(result)));
  }

  return result;
}

}  // namespace grail::lowering
