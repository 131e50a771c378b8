#include "grail/ir/query_metadata.hpp"

#include <string>
#include <utility>
#include <variant>

#include <fmt/core.h>

#include "grail/common/internal_error.hpp"
#include "grail/ir/dumper.hpp"

namespace grail::ir {

namespace {

auto IsFieldLocation(const AnyLocation& location) -> bool {
  return std::visit([](const auto& loc) { return loc.IsField(); }, location);
}

}  // namespace

QueryMetadataTable::QueryMetadataTable(
    Location root_location, LocationInfo root_info)
    : root_location_(std::move(root_location)) {
  if (root_info.parent_location.has_value()) {
    common::ThrowInternalError(
        "QueryMetadataTable", fmt::format(
                                  "root location {} must not have a parent",
                                  FormatLocation(root_location_)));
  }
  RegisterLocation(root_location_, std::move(root_info));
}

void QueryMetadataTable::RegisterLocation(
    const AnyLocation& location, LocationInfo info) {
  if (IsFieldLocation(location)) {
    common::ThrowInternalError(
        "QueryMetadataTable::RegisterLocation",
        fmt::format(
            "cannot register field location {}", FormatLocation(location)));
  }
  if (locations_.contains(location)) {
    common::ThrowInternalError(
        "QueryMetadataTable::RegisterLocation",
        fmt::format(
            "location {} registered twice", FormatLocation(location)));
  }
  if (info.parent_location.has_value() &&
      !locations_.contains(*info.parent_location)) {
    common::ThrowInternalError(
        "QueryMetadataTable::RegisterLocation",
        fmt::format(
            "parent {} of location {} is not registered",
            FormatLocation(*info.parent_location), FormatLocation(location)));
  }
  locations_.emplace(location, std::move(info));
  registration_order_.push_back(location);
}

void QueryMetadataTable::RecordCoercionAtLocation(
    const AnyLocation& location, const std::string& coerced_to_type) {
  auto it = locations_.find(location);
  if (it == locations_.end()) {
    common::ThrowInternalError(
        "QueryMetadataTable::RecordCoercionAtLocation",
        fmt::format("unknown location {}", FormatLocation(location)));
  }
  LocationInfo& info = it->second;
  if (info.coerced_from_type.has_value()) {
    common::ThrowInternalError(
        "QueryMetadataTable::RecordCoercionAtLocation",
        fmt::format(
            "location {} was already coerced from {}", FormatLocation(location),
            *info.coerced_from_type));
  }
  info.coerced_from_type = info.type;
  info.type = coerced_to_type;
}

auto QueryMetadataTable::RevisitLocation(const Location& location)
    -> Location {
  Location revisit = location.Revisit();
  RegisterLocation(revisit, GetLocationInfo(location));
  revisit_origins_.emplace(revisit, GetRevisitOrigin(location));
  return revisit;
}

void QueryMetadataTable::RecordRevisit(
    const Location& revisit, const Location& origin) {
  if (!HasLocation(revisit) || !HasLocation(origin)) {
    common::ThrowInternalError(
        "QueryMetadataTable::RecordRevisit",
        fmt::format(
            "revisit {} -> {} names an unregistered location",
            FormatLocation(revisit), FormatLocation(origin)));
  }
  if (revisit.QueryPath() != origin.QueryPath() || revisit == origin) {
    common::ThrowInternalError(
        "QueryMetadataTable::RecordRevisit",
        fmt::format(
            "{} is not a revisit of {}", FormatLocation(revisit),
            FormatLocation(origin)));
  }
  Location root_origin = GetRevisitOrigin(origin);
  if (root_origin == revisit) {
    common::ThrowInternalError(
        "QueryMetadataTable::RecordRevisit",
        fmt::format(
            "revisit {} -> {} forms a cycle", FormatLocation(revisit),
            FormatLocation(origin)));
  }
  auto [it, inserted] = revisit_origins_.emplace(revisit, root_origin);
  if (!inserted && it->second != root_origin) {
    common::ThrowInternalError(
        "QueryMetadataTable::RecordRevisit",
        fmt::format(
            "revisit {} already has origin {}", FormatLocation(revisit),
            FormatLocation(it->second)));
  }
  // Earlier revisits recorded against `revisit` now resolve further back.
  for (auto& [key, value] : revisit_origins_) {
    if (value == revisit) {
      value = root_origin;
    }
  }
}

auto QueryMetadataTable::HasLocation(const AnyLocation& location) const
    -> bool {
  return locations_.contains(location);
}

auto QueryMetadataTable::GetLocationInfo(const AnyLocation& location) const
    -> const LocationInfo& {
  auto it = locations_.find(location);
  if (it == locations_.end()) {
    common::ThrowInternalError(
        "QueryMetadataTable::GetLocationInfo",
        fmt::format(
            "location {} is not registered in the metadata table",
            FormatLocation(location)));
  }
  return it->second;
}

auto QueryMetadataTable::GetRevisitOrigin(const Location& location) const
    -> Location {
  auto it = revisit_origins_.find(location);
  if (it == revisit_origins_.end()) {
    return location;
  }
  return it->second;
}

}  // namespace grail::ir
