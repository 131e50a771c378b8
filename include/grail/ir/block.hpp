#pragma once

#include <set>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "grail/ir/expression.hpp"
#include "grail/ir/location.hpp"

namespace grail::ir {

// QueryRoot: start of the traversal, at vertices of the given type(s).
struct QueryRoot {
  std::set<std::string> start_class;

  auto operator==(const QueryRoot&) const -> bool = default;
};

// CoerceType: narrow the current vertex to one of the given types.
struct CoerceType {
  std::set<std::string> target_class;

  auto operator==(const CoerceType&) const -> bool = default;
};

// Filter: the current row survives only if `predicate` holds.
struct Filter {
  ExpressionPtr predicate;

  auto operator==(const Filter& other) const -> bool {
    return ExpressionsEqual(predicate, other.predicate);
  }
};

// MarkLocation: binds the vertex the traversal is currently at to `location`.
struct MarkLocation {
  AnyLocation location;

  auto operator==(const MarkLocation&) const -> bool = default;
};

// Traverse: follow an edge. With `optional`, a missing edge does not drop the
// row. `within_optional_scope` is set when an enclosing traversal is optional.
struct Traverse {
  EdgeDirection direction;
  std::string edge_name;
  bool optional = false;
  bool within_optional_scope = false;

  auto operator==(const Traverse&) const -> bool = default;
};

// Recurse: follow an edge repeatedly, 0..depth times.
struct Recurse {
  EdgeDirection direction;
  std::string edge_name;
  int depth = 1;
  bool within_optional_scope = false;

  auto operator==(const Recurse&) const -> bool = default;
};

// Fold: enter a @fold scope; results below it are aggregated into lists.
struct Fold {
  FoldScopeLocation fold_scope_location;

  auto operator==(const Fold&) const -> bool = default;
};

// Unfold: leave the innermost @fold scope.
struct Unfold {
  auto operator==(const Unfold&) const -> bool = default;
};

// Backtrack: return to a previously marked location.
struct Backtrack {
  Location location;
  bool optional = false;

  auto operator==(const Backtrack&) const -> bool = default;
};

// EndOptional: closes the innermost optional traversal.
struct EndOptional {
  auto operator==(const EndOptional&) const -> bool = default;
};

// OutputSource: marks the current vertex as the source of output rows.
struct OutputSource {
  auto operator==(const OutputSource&) const -> bool = default;
};

// GlobalOperationsStart: end of per-path traversal, start of query-wide
// post-processing. Exactly one per query.
struct GlobalOperationsStart {
  auto operator==(const GlobalOperationsStart&) const -> bool = default;
};

// ConstructResult: output column name -> expression, in output order.
struct ConstructResult {
  std::vector<std::pair<std::string, ExpressionPtr>> fields;

  auto operator==(const ConstructResult& other) const -> bool;
};

// Block data variant.
using BlockData = std::variant<
    QueryRoot, CoerceType, Filter, MarkLocation, Traverse, Recurse, Fold,
    Unfold, Backtrack, EndOptional, OutputSource, GlobalOperationsStart,
    ConstructResult>;

// One step of a compiled query.
struct Block {
  BlockData data;

  auto operator==(const Block&) const -> bool = default;
};

using BlockList = std::vector<Block>;

template <typename T>
auto Is(const Block& block) -> bool {
  return std::holds_alternative<T>(block.data);
}

// Display name of the held alternative ("Traverse", ...).
auto BlockKindName(const Block& block) -> const char*;

// True for the blocks that move the traversal to a new vertex and must be
// followed by a MarkLocation for it.
auto IsTraversalStep(const Block& block) -> bool;

// Expressions held directly by the block, in field order.
auto Expressions(const Block& block) -> std::vector<ExpressionPtr>;

}  // namespace grail::ir
