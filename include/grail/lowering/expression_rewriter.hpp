#pragma once

#include <functional>

#include "grail/ir/block.hpp"
#include "grail/ir/expression.hpp"
#include "grail/ir/location.hpp"

namespace grail::lowering {

// Rewrites a single node whose children have already been rewritten. Must
// handle every expression alternative; returning the argument unchanged is
// the identity rewrite. Must not return null.
using ExpressionVisitor =
    std::function<ir::ExpressionPtr(const ir::ExpressionPtr&)>;

// Same, with the location the rewrite is performed on behalf of.
using LocatedExpressionVisitor = std::function<ir::ExpressionPtr(
    const ir::AnyLocation&, const ir::ExpressionPtr&)>;

// Post-order rewrite: children first, then the node itself. Nodes whose
// children did not change are passed to `visitor` as the original pointer, so
// an identity visitor returns the input tree by reference.
auto RewriteExpression(
    const ir::ExpressionPtr& expr, const ExpressionVisitor& visitor)
    -> ir::ExpressionPtr;

// Applies RewriteExpression to every expression held by `block`. Blocks
// holding no expressions are returned as equal copies.
auto RewriteBlockExpressions(
    const ir::Block& block, const ExpressionVisitor& visitor) -> ir::Block;

// Binds `location` as the first argument of `visitor` and rewrites.
auto RewriteBlockExpressions(
    const ir::Block& block, const ir::AnyLocation& location,
    const LocatedExpressionVisitor& visitor) -> ir::Block;

}  // namespace grail::lowering
