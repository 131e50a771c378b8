#include "grail/ir/location.hpp"

#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include <fmt/core.h>

#include "grail/common/internal_error.hpp"
#include "grail/ir/dumper.hpp"

namespace grail::ir {

auto ToString(EdgeDirection direction) -> const char* {
  switch (direction) {
    case EdgeDirection::kIn:
      return "in";
    case EdgeDirection::kOut:
      return "out";
  }
  return "?";
}

Location::Location(
    std::vector<std::string> query_path, std::optional<std::string> field,
    int visit_counter)
    : query_path_(std::move(query_path)),
      field_(std::move(field)),
      visit_counter_(visit_counter) {
  if (query_path_.empty()) {
    common::ThrowInternalError("Location", "query path must not be empty");
  }
  if (visit_counter_ < 1) {
    common::ThrowInternalError(
        "Location",
        fmt::format("visit counter must be positive, got {}", visit_counter_));
  }
}

auto Location::NavigateToField(const std::string& field) const -> Location {
  if (IsField()) {
    common::ThrowInternalError(
        "Location::NavigateToField",
        fmt::format(
            "cannot navigate to field '{}' from field location {}", field,
            FormatLocation(*this)));
  }
  return Location(query_path_, field, visit_counter_);
}

auto Location::NavigateToSubpath(const std::string& edge) const -> Location {
  if (IsField()) {
    common::ThrowInternalError(
        "Location::NavigateToSubpath",
        fmt::format(
            "cannot navigate to subpath '{}' from field location {}", edge,
            FormatLocation(*this)));
  }
  auto path = query_path_;
  path.push_back(edge);
  return Location(std::move(path));
}

auto Location::Revisit() const -> Location {
  if (IsField()) {
    common::ThrowInternalError(
        "Location::Revisit", fmt::format(
                                 "cannot revisit field location {}",
                                 FormatLocation(*this)));
  }
  return Location(query_path_, std::nullopt, visit_counter_ + 1);
}

auto Location::AtVertex() const -> Location {
  if (!IsField()) {
    return *this;
  }
  return Location(query_path_, std::nullopt, visit_counter_);
}

auto Location::NavigateToFold(
    EdgeDirection direction, const std::string& edge) const
    -> FoldScopeLocation {
  if (IsField()) {
    common::ThrowInternalError(
        "Location::NavigateToFold",
        fmt::format(
            "cannot fold edge '{}' from field location {}", edge,
            FormatLocation(*this)));
  }
  return FoldScopeLocation(
      *this, {FoldPathStep{.direction = direction, .edge_name = edge}});
}

FoldScopeLocation::FoldScopeLocation(
    Location base_location, std::vector<FoldPathStep> fold_path,
    std::optional<std::string> field)
    : base_location_(std::move(base_location)),
      fold_path_(std::move(fold_path)),
      field_(std::move(field)) {
  if (base_location_.IsField()) {
    common::ThrowInternalError(
        "FoldScopeLocation",
        fmt::format(
            "fold base must be a vertex location, got {}",
            FormatLocation(base_location_)));
  }
  if (fold_path_.empty()) {
    common::ThrowInternalError(
        "FoldScopeLocation", "fold path must not be empty");
  }
}

auto FoldScopeLocation::NavigateToField(const std::string& field) const
    -> FoldScopeLocation {
  if (IsField()) {
    common::ThrowInternalError(
        "FoldScopeLocation::NavigateToField",
        fmt::format(
            "cannot navigate to field '{}' from field location {}", field,
            FormatLocation(*this)));
  }
  return FoldScopeLocation(base_location_, fold_path_, field);
}

auto FoldScopeLocation::NavigateToSubpath(
    EdgeDirection direction, const std::string& edge) const
    -> FoldScopeLocation {
  if (IsField()) {
    common::ThrowInternalError(
        "FoldScopeLocation::NavigateToSubpath",
        fmt::format(
            "cannot navigate to subpath '{}' from field location {}", edge,
            FormatLocation(*this)));
  }
  auto path = fold_path_;
  path.push_back(FoldPathStep{.direction = direction, .edge_name = edge});
  return FoldScopeLocation(base_location_, std::move(path));
}

auto FoldScopeLocation::AtVertex() const -> FoldScopeLocation {
  if (!IsField()) {
    return *this;
  }
  return FoldScopeLocation(base_location_, fold_path_);
}

auto FoldScopeLocation::WithBaseLocation(Location base) const
    -> FoldScopeLocation {
  return FoldScopeLocation(std::move(base), fold_path_, field_);
}

auto NavigateToField(const AnyLocation& location, const std::string& field)
    -> AnyLocation {
  return std::visit(
      [&](const auto& loc) -> AnyLocation {
        return loc.NavigateToField(field);
      },
      location);
}

auto AtVertex(const AnyLocation& location) -> AnyLocation {
  return std::visit(
      [](const auto& loc) -> AnyLocation { return loc.AtVertex(); }, location);
}

}  // namespace grail::ir
