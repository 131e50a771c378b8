#include "grail/ir/expression.hpp"

#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "grail/common/overloaded.hpp"

namespace grail::ir {

auto ExpressionsEqual(const ExpressionPtr& lhs, const ExpressionPtr& rhs)
    -> bool {
  if (lhs == rhs) {
    return true;
  }
  if (lhs == nullptr || rhs == nullptr) {
    return false;
  }
  return *lhs == *rhs;
}

auto UnaryTransformation::operator==(const UnaryTransformation& other) const
    -> bool {
  return op == other.op && ExpressionsEqual(inner, other.inner);
}

auto BinaryComposition::operator==(const BinaryComposition& other) const
    -> bool {
  return op == other.op && ExpressionsEqual(left, other.left) &&
         ExpressionsEqual(right, other.right);
}

auto TernaryConditional::operator==(const TernaryConditional& other) const
    -> bool {
  return ExpressionsEqual(predicate, other.predicate) &&
         ExpressionsEqual(if_true, other.if_true) &&
         ExpressionsEqual(if_false, other.if_false);
}

auto ToString(UnaryOp op) -> const char* {
  switch (op) {
    case UnaryOp::kSize:
      return "size";
  }
  return "?";
}

auto ToString(BinaryOp op) -> const char* {
  switch (op) {
    case BinaryOp::kEqual:
      return "=";
    case BinaryOp::kNotEqual:
      return "!=";
    case BinaryOp::kGreaterOrEqual:
      return ">=";
    case BinaryOp::kLessOrEqual:
      return "<=";
    case BinaryOp::kGreater:
      return ">";
    case BinaryOp::kLess:
      return "<";
    case BinaryOp::kAnd:
      return "&&";
    case BinaryOp::kOr:
      return "||";
    case BinaryOp::kContains:
      return "contains";
    case BinaryOp::kNotContains:
      return "not_contains";
    case BinaryOp::kIntersects:
      return "intersects";
    case BinaryOp::kHasSubstring:
      return "has_substring";
    case BinaryOp::kStartsWith:
      return "starts_with";
    case BinaryOp::kEndsWith:
      return "ends_with";
    case BinaryOp::kInCollection:
      return "in_collection";
    case BinaryOp::kNotInCollection:
      return "not_in_collection";
  }
  return "?";
}

auto MakeLiteral(LiteralValue value) -> ExpressionPtr {
  return MakeExpression(Literal{.value = std::move(value)});
}

auto MakeTrue() -> ExpressionPtr {
  return MakeLiteral(true);
}

auto MakeVariable(std::string name, std::string type) -> ExpressionPtr {
  return MakeExpression(
      Variable{.name = std::move(name), .type = std::move(type)});
}

auto MakeLocalField(std::string field_name, std::string field_type)
    -> ExpressionPtr {
  return MakeExpression(
      LocalField{
          .field_name = std::move(field_name),
          .field_type = std::move(field_type)});
}

auto MakeBinary(BinaryOp op, ExpressionPtr left, ExpressionPtr right)
    -> ExpressionPtr {
  return MakeExpression(
      BinaryComposition{
          .op = op, .left = std::move(left), .right = std::move(right)});
}

auto Children(const Expression& expr) -> std::vector<ExpressionPtr> {
  return std::visit(
      Overloaded{
          [](const UnaryTransformation& e) -> std::vector<ExpressionPtr> {
            return {e.inner};
          },
          [](const BinaryComposition& e) -> std::vector<ExpressionPtr> {
            return {e.left, e.right};
          },
          [](const TernaryConditional& e) -> std::vector<ExpressionPtr> {
            return {e.predicate, e.if_true, e.if_false};
          },
          [](const auto&) -> std::vector<ExpressionPtr> { return {}; },
      },
      expr.data);
}

auto ExpressionKindName(const Expression& expr) -> const char* {
  return std::visit(
      Overloaded{
          [](const Literal&) { return "Literal"; },
          [](const Variable&) { return "Variable"; },
          [](const LocalField&) { return "LocalField"; },
          [](const ContextField&) { return "ContextField"; },
          [](const FoldedContextField&) { return "FoldedContextField"; },
          [](const ContextFieldExistence&) { return "ContextFieldExistence"; },
          [](const OutputContextField&) { return "OutputContextField"; },
          [](const UnaryTransformation&) { return "UnaryTransformation"; },
          [](const BinaryComposition&) { return "BinaryComposition"; },
          [](const TernaryConditional&) { return "TernaryConditional"; },
      },
      expr.data);
}

}  // namespace grail::ir
