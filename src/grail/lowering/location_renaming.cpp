#include "grail/lowering/location_renaming.hpp"

#include <memory>
#include <utility>
#include <variant>

#include <fmt/core.h>

#include "grail/common/internal_error.hpp"
#include "grail/common/overloaded.hpp"
#include "grail/ir/dumper.hpp"

namespace grail::lowering {

auto MakeRevisitLocationTranslations(const ir::QueryMetadataTable& metadata)
    -> LocationTranslations {
  LocationTranslations translations;
  for (const auto& [revisit, origin] : metadata.RevisitOrigins()) {
    if (metadata.RevisitOrigins().contains(origin)) {
      common::ThrowInternalError(
          "MakeRevisitLocationTranslations",
          fmt::format(
              "origin {} of revisit {} is itself a revisit",
              ir::FormatLocation(origin), ir::FormatLocation(revisit)));
    }
    translations.emplace(revisit, origin);
  }
  return translations;
}

auto TranslateLocation(
    const ir::Location& location, const LocationTranslations& translations)
    -> ir::Location {
  auto it = translations.find(location.AtVertex());
  if (it == translations.end()) {
    return location;
  }
  if (location.Field()) {
    return it->second.NavigateToField(*location.Field());
  }
  return it->second;
}

auto TranslateLocation(
    const ir::FoldScopeLocation& location,
    const LocationTranslations& translations) -> ir::FoldScopeLocation {
  auto it = translations.find(location.BaseLocation());
  if (it == translations.end()) {
    return location;
  }
  return location.WithBaseLocation(it->second);
}

auto TranslateLocation(
    const ir::AnyLocation& location, const LocationTranslations& translations)
    -> ir::AnyLocation {
  return std::visit(
      [&](const auto& loc) -> ir::AnyLocation {
        return TranslateLocation(loc, translations);
      },
      location);
}

auto MakeLocationRewriter(LocationTranslations translations)
    -> ExpressionVisitor {
  auto shared =
      std::make_shared<const LocationTranslations>(std::move(translations));
  return [shared](const ir::ExpressionPtr& expr) -> ir::ExpressionPtr {
    const LocationTranslations& map = *shared;
    return std::visit(
        Overloaded{
            [&](const ir::ContextField& e) -> ir::ExpressionPtr {
              auto renamed = TranslateLocation(e.location, map);
              if (renamed == e.location) {
                return expr;
              }
              return ir::MakeExpression(
                  ir::ContextField{
                      .location = std::move(renamed),
                      .field_type = e.field_type});
            },
            [&](const ir::FoldedContextField& e) -> ir::ExpressionPtr {
              auto renamed = TranslateLocation(e.fold_scope_location, map);
              if (renamed == e.fold_scope_location) {
                return expr;
              }
              return ir::MakeExpression(
                  ir::FoldedContextField{
                      .fold_scope_location = std::move(renamed),
                      .field_type = e.field_type});
            },
            [&](const ir::ContextFieldExistence& e) -> ir::ExpressionPtr {
              auto renamed = TranslateLocation(e.location, map);
              if (renamed == e.location) {
                return expr;
              }
              return ir::MakeExpression(
                  ir::ContextFieldExistence{.location = std::move(renamed)});
            },
            [&](const ir::OutputContextField& e) -> ir::ExpressionPtr {
              auto renamed = TranslateLocation(e.location, map);
              if (renamed == e.location) {
                return expr;
              }
              return ir::MakeExpression(
                  ir::OutputContextField{
                      .location = std::move(renamed),
                      .field_type = e.field_type});
            },
            [&](const ir::Literal&) { return expr; },
            [&](const ir::Variable&) { return expr; },
            [&](const ir::LocalField&) { return expr; },
            [&](const ir::UnaryTransformation&) { return expr; },
            [&](const ir::BinaryComposition&) { return expr; },
            [&](const ir::TernaryConditional&) { return expr; },
        },
        expr->data);
  };
}

}  // namespace grail::lowering
