#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "grail/ir/location.hpp"

namespace grail::ir {

// Facts the front end computed about one vertex location.
struct LocationInfo {
  std::optional<AnyLocation> parent_location;
  std::string type;  // Declared type name at this location
  std::optional<std::string> coerced_from_type;
  int optional_scopes_depth = 0;
  int recursive_scopes_depth = 0;
  bool is_within_fold = false;

  auto operator==(const LocationInfo&) const -> bool = default;
};

// Per-query table of location facts, built by the front end and consumed
// read-only by lowering. Only vertex locations are registered; field-qualified
// locations are looked up through their vertex.
class QueryMetadataTable {
 public:
  QueryMetadataTable(Location root_location, LocationInfo root_info);

  [[nodiscard]] auto RootLocation() const -> const Location& {
    return root_location_;
  }

  // Throws InternalError if `location` is already registered or names a
  // field.
  void RegisterLocation(const AnyLocation& location, LocationInfo info);

  // Records that the vertex at `location` was narrowed to `coerced_to_type`.
  void RecordCoercionAtLocation(
      const AnyLocation& location, const std::string& coerced_to_type);

  // Mints and registers the revisit of `location`, returning it. The revisit
  // shares the location's info; its origin is the origin of `location`.
  auto RevisitLocation(const Location& location) -> Location;

  // Registers an externally minted revisit (used when loading serialized
  // tables). `revisit` must already be registered.
  void RecordRevisit(const Location& revisit, const Location& origin);

  [[nodiscard]] auto HasLocation(const AnyLocation& location) const -> bool;

  // Throws InternalError{kMalformedIr} if the location is not registered.
  [[nodiscard]] auto GetLocationInfo(const AnyLocation& location) const
      -> const LocationInfo&;

  // The location first visited at the same vertex, or `location` itself if
  // it is not a revisit.
  [[nodiscard]] auto GetRevisitOrigin(const Location& location) const
      -> Location;

  // revisit -> origin for every revisit location, chains already collapsed.
  [[nodiscard]] auto RevisitOrigins() const
      -> const std::map<Location, Location>& {
    return revisit_origins_;
  }

  // Registration order.
  [[nodiscard]] auto RegisteredLocations() const
      -> const std::vector<AnyLocation>& {
    return registration_order_;
  }

 private:
  Location root_location_;
  std::map<AnyLocation, LocationInfo> locations_;
  std::vector<AnyLocation> registration_order_;
  std::map<Location, Location> revisit_origins_;
};

}  // namespace grail::ir
