#include "grail/lowering/expression_rewriter.hpp"

#include <utility>
#include <variant>

#include "grail/common/internal_error.hpp"
#include "grail/common/overloaded.hpp"
#include "grail/ir/dumper.hpp"

namespace grail::lowering {

namespace {

// Rebuilds `expr` with rewritten children, reusing `expr` itself when no
// child changed.
auto RewriteChildren(
    const ir::ExpressionPtr& expr, const ExpressionVisitor& visitor)
    -> ir::ExpressionPtr {
  return std::visit(
      Overloaded{
          [&](const ir::UnaryTransformation& e) -> ir::ExpressionPtr {
            auto inner = RewriteExpression(e.inner, visitor);
            if (inner == e.inner) {
              return expr;
            }
            return ir::MakeExpression(
                ir::UnaryTransformation{.op = e.op, .inner = std::move(inner)});
          },
          [&](const ir::BinaryComposition& e) -> ir::ExpressionPtr {
            auto left = RewriteExpression(e.left, visitor);
            auto right = RewriteExpression(e.right, visitor);
            if (left == e.left && right == e.right) {
              return expr;
            }
            return ir::MakeBinary(e.op, std::move(left), std::move(right));
          },
          [&](const ir::TernaryConditional& e) -> ir::ExpressionPtr {
            auto predicate = RewriteExpression(e.predicate, visitor);
            auto if_true = RewriteExpression(e.if_true, visitor);
            auto if_false = RewriteExpression(e.if_false, visitor);
            if (predicate == e.predicate && if_true == e.if_true &&
                if_false == e.if_false) {
              return expr;
            }
            return ir::MakeExpression(
                ir::TernaryConditional{
                    .predicate = std::move(predicate),
                    .if_true = std::move(if_true),
                    .if_false = std::move(if_false)});
          },
          [&](const auto&) -> ir::ExpressionPtr { return expr; },
      },
      expr->data);
}

}  // namespace

auto RewriteExpression(
    const ir::ExpressionPtr& expr, const ExpressionVisitor& visitor)
    -> ir::ExpressionPtr {
  if (expr == nullptr) {
    common::ThrowInternalError("RewriteExpression", "null expression");
  }
  ir::ExpressionPtr rebuilt = RewriteChildren(expr, visitor);
  ir::ExpressionPtr result = visitor(rebuilt);
  if (result == nullptr) {
    common::ThrowInternalError(
        "RewriteExpression",
        "visitor returned null for " + ir::FormatExpression(rebuilt));
  }
  return result;
}

auto RewriteBlockExpressions(
    const ir::Block& block, const ExpressionVisitor& visitor) -> ir::Block {
  return std::visit(
      Overloaded{
          [&](const ir::Filter& b) -> ir::Block {
            return ir::Block{
                ir::Filter{.predicate = RewriteExpression(b.predicate, visitor)}};
          },
          [&](const ir::ConstructResult& b) -> ir::Block {
            ir::ConstructResult result;
            result.fields.reserve(b.fields.size());
            for (const auto& [name, expr] : b.fields) {
              result.fields.emplace_back(name, RewriteExpression(expr, visitor));
            }
            return ir::Block{std::move(result)};
          },
          [&](const auto&) -> ir::Block { return block; },
      },
      block.data);
}

auto RewriteBlockExpressions(
    const ir::Block& block, const ir::AnyLocation& location,
    const LocatedExpressionVisitor& visitor) -> ir::Block {
  return RewriteBlockExpressions(
      block, [&](const ir::ExpressionPtr& expr) -> ir::ExpressionPtr {
        return visitor(location, expr);
      });
}

}  // namespace grail::lowering
