#include "grail/ir/block.hpp"

#include <cstddef>
#include <variant>
#include <vector>

#include "grail/common/overloaded.hpp"

namespace grail::ir {

auto ConstructResult::operator==(const ConstructResult& other) const -> bool {
  if (fields.size() != other.fields.size()) {
    return false;
  }
  for (size_t i = 0; i < fields.size(); ++i) {
    if (fields[i].first != other.fields[i].first ||
        !ExpressionsEqual(fields[i].second, other.fields[i].second)) {
      return false;
    }
  }
  return true;
}

auto BlockKindName(const Block& block) -> const char* {
  return std::visit(
      Overloaded{
          [](const QueryRoot&) { return "QueryRoot"; },
          [](const CoerceType&) { return "CoerceType"; },
          [](const Filter&) { return "Filter"; },
          [](const MarkLocation&) { return "MarkLocation"; },
          [](const Traverse&) { return "Traverse"; },
          [](const Recurse&) { return "Recurse"; },
          [](const Fold&) { return "Fold"; },
          [](const Unfold&) { return "Unfold"; },
          [](const Backtrack&) { return "Backtrack"; },
          [](const EndOptional&) { return "EndOptional"; },
          [](const OutputSource&) { return "OutputSource"; },
          [](const GlobalOperationsStart&) { return "GlobalOperationsStart"; },
          [](const ConstructResult&) { return "ConstructResult"; },
      },
      block.data);
}

auto IsTraversalStep(const Block& block) -> bool {
  return Is<Traverse>(block) || Is<Fold>(block) || Is<Recurse>(block);
}

auto Expressions(const Block& block) -> std::vector<ExpressionPtr> {
  return std::visit(
      Overloaded{
          [](const Filter& b) -> std::vector<ExpressionPtr> {
            return {b.predicate};
          },
          [](const ConstructResult& b) {
            std::vector<ExpressionPtr> result;
            result.reserve(b.fields.size());
            for (const auto& [name, expr] : b.fields) {
              result.push_back(expr);
            }
            return result;
          },
          [](const auto&) -> std::vector<ExpressionPtr> { return {}; },
      },
      block.data);
}

}  // namespace grail::ir
