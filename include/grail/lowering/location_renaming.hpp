#pragma once

#include <map>

#include "grail/ir/location.hpp"
#include "grail/ir/query_metadata.hpp"
#include "grail/lowering/expression_rewriter.hpp"

namespace grail::lowering {

// Vertex location -> the vertex location it should be renamed to.
using LocationTranslations = std::map<ir::Location, ir::Location>;

// Maps every revisit location in the table to the location first visited at
// the same vertex. Chains (revisit of a revisit) map straight to the origin.
auto MakeRevisitLocationTranslations(const ir::QueryMetadataTable& metadata)
    -> LocationTranslations;

// Field-qualified locations are translated at their vertex and keep their
// field; fold-scope locations translate their base.
auto TranslateLocation(
    const ir::Location& location, const LocationTranslations& translations)
    -> ir::Location;
auto TranslateLocation(
    const ir::FoldScopeLocation& location,
    const LocationTranslations& translations) -> ir::FoldScopeLocation;
auto TranslateLocation(
    const ir::AnyLocation& location, const LocationTranslations& translations)
    -> ir::AnyLocation;

// Visitor that renames the location of every location-bearing expression.
// The returned visitor owns a copy of `translations`.
auto MakeLocationRewriter(LocationTranslations translations)
    -> ExpressionVisitor;

}  // namespace grail::lowering
