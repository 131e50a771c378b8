#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <variant>
#include <vector>

#include "grail/ir/location.hpp"

namespace grail::ir {

struct Expression;

// Expressions are immutable trees. Rewrites build new nodes only along the
// changed path and share every untouched subtree.
using ExpressionPtr = std::shared_ptr<const Expression>;

// Deep structural comparison (pointer identity is not required).
auto ExpressionsEqual(const ExpressionPtr& lhs, const ExpressionPtr& rhs)
    -> bool;

using LiteralValue = std::variant<
    std::monostate, bool, int64_t, std::string, std::vector<std::string>>;

struct Literal {
  LiteralValue value;

  auto operator==(const Literal&) const -> bool = default;
};

// Runtime parameter supplied when the query is executed ($name).
struct Variable {
  std::string name;
  std::string type;

  auto operator==(const Variable&) const -> bool = default;
};

// Property of whichever location is currently open. Only meaningful while the
// block that contains it has not been moved away from that location.
struct LocalField {
  std::string field_name;
  std::string field_type;

  auto operator==(const LocalField&) const -> bool = default;
};

// Property read at an explicit, field-qualified location.
struct ContextField {
  Location location;
  std::string field_type;

  auto operator==(const ContextField&) const -> bool = default;
};

// Property read at a fold-scope location; evaluates to a list.
struct FoldedContextField {
  FoldScopeLocation fold_scope_location;
  std::string field_type;

  auto operator==(const FoldedContextField&) const -> bool = default;
};

// True iff the vertex at `location` exists (it may not, under @optional).
struct ContextFieldExistence {
  Location location;

  auto operator==(const ContextFieldExistence&) const -> bool = default;
};

// Property emitted as a query output column.
struct OutputContextField {
  Location location;
  std::string field_type;

  auto operator==(const OutputContextField&) const -> bool = default;
};

enum class UnaryOp : uint8_t {
  kSize,
};

enum class BinaryOp : uint8_t {
  kEqual,
  kNotEqual,
  kGreaterOrEqual,
  kLessOrEqual,
  kGreater,
  kLess,
  kAnd,
  kOr,
  kContains,
  kNotContains,
  kIntersects,
  kHasSubstring,
  kStartsWith,
  kEndsWith,
  kInCollection,
  kNotInCollection,
};

auto ToString(UnaryOp op) -> const char*;
auto ToString(BinaryOp op) -> const char*;

struct UnaryTransformation {
  UnaryOp op;
  ExpressionPtr inner;

  auto operator==(const UnaryTransformation& other) const -> bool;
};

struct BinaryComposition {
  BinaryOp op;
  ExpressionPtr left;
  ExpressionPtr right;

  auto operator==(const BinaryComposition& other) const -> bool;
};

struct TernaryConditional {
  ExpressionPtr predicate;
  ExpressionPtr if_true;
  ExpressionPtr if_false;

  auto operator==(const TernaryConditional& other) const -> bool;
};

// Expression data variant.
using ExpressionData = std::variant<
    Literal, Variable, LocalField, ContextField, FoldedContextField,
    ContextFieldExistence, OutputContextField, UnaryTransformation,
    BinaryComposition, TernaryConditional>;

struct Expression {
  ExpressionData data;

  auto operator==(const Expression&) const -> bool = default;
};

template <typename T>
auto MakeExpression(T data) -> ExpressionPtr {
  return std::make_shared<const Expression>(Expression{.data = std::move(data)});
}

auto MakeLiteral(LiteralValue value) -> ExpressionPtr;
auto MakeTrue() -> ExpressionPtr;
auto MakeVariable(std::string name, std::string type) -> ExpressionPtr;
auto MakeLocalField(std::string field_name, std::string field_type)
    -> ExpressionPtr;
auto MakeBinary(BinaryOp op, ExpressionPtr left, ExpressionPtr right)
    -> ExpressionPtr;

// Direct children of an expression node, in evaluation order.
auto Children(const Expression& expr) -> std::vector<ExpressionPtr>;

// Calls `fn` on every node of the tree, parents before children.
template <typename Fn>
void ForEachSubexpression(const ExpressionPtr& expr, Fn&& fn) {
  if (expr == nullptr) {
    return;
  }
  fn(*expr);
  for (const auto& child : Children(*expr)) {
    ForEachSubexpression(child, fn);
  }
}

// Display name of the held alternative ("LocalField", ...).
auto ExpressionKindName(const Expression& expr) -> const char*;

}  // namespace grail::ir
