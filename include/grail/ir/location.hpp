#pragma once

#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace grail::ir {

enum class EdgeDirection : uint8_t {
  kIn,
  kOut,
};

auto ToString(EdgeDirection direction) -> const char*;

class FoldScopeLocation;

// Compile-time identifier for a position reached by the traversal.
//
// A Location names a vertex (query_path from the root, plus a visit counter
// that distinguishes revisits of the same vertex), or a property read at that
// vertex when field() is set. Locations are immutable; every navigation
// returns a new value.
class Location {
 public:
  explicit Location(
      std::vector<std::string> query_path,
      std::optional<std::string> field = std::nullopt, int visit_counter = 1);

  [[nodiscard]] auto QueryPath() const -> const std::vector<std::string>& {
    return query_path_;
  }
  [[nodiscard]] auto Field() const -> const std::optional<std::string>& {
    return field_;
  }
  [[nodiscard]] auto VisitCounter() const -> int {
    return visit_counter_;
  }
  [[nodiscard]] auto IsField() const -> bool {
    return field_.has_value();
  }

  // Field-qualified location for reading `field` at this vertex.
  // Throws InternalError if this location already names a field.
  [[nodiscard]] auto NavigateToField(const std::string& field) const
      -> Location;

  // Location of the vertex reached by following `edge` from here.
  [[nodiscard]] auto NavigateToSubpath(const std::string& edge) const
      -> Location;

  // Same vertex, reached again after an optional branch completes.
  [[nodiscard]] auto Revisit() const -> Location;

  // Drops the field qualifier, if any.
  [[nodiscard]] auto AtVertex() const -> Location;

  [[nodiscard]] auto NavigateToFold(
      EdgeDirection direction, const std::string& edge) const
      -> FoldScopeLocation;

  auto operator==(const Location&) const -> bool = default;
  auto operator<=>(const Location&) const = default;

 private:
  std::vector<std::string> query_path_;
  std::optional<std::string> field_;
  int visit_counter_;
};

struct FoldPathStep {
  EdgeDirection direction;
  std::string edge_name;

  auto operator==(const FoldPathStep&) const -> bool = default;
  auto operator<=>(const FoldPathStep&) const = default;
};

// A location inside a @fold scope. Reads at such a location produce a list of
// values (one per folded vertex) rather than a scalar.
class FoldScopeLocation {
 public:
  FoldScopeLocation(
      Location base_location, std::vector<FoldPathStep> fold_path,
      std::optional<std::string> field = std::nullopt);

  [[nodiscard]] auto BaseLocation() const -> const Location& {
    return base_location_;
  }
  [[nodiscard]] auto FoldPath() const -> const std::vector<FoldPathStep>& {
    return fold_path_;
  }
  [[nodiscard]] auto Field() const -> const std::optional<std::string>& {
    return field_;
  }
  [[nodiscard]] auto IsField() const -> bool {
    return field_.has_value();
  }

  [[nodiscard]] auto NavigateToField(const std::string& field) const
      -> FoldScopeLocation;
  [[nodiscard]] auto NavigateToSubpath(
      EdgeDirection direction, const std::string& edge) const
      -> FoldScopeLocation;
  [[nodiscard]] auto AtVertex() const -> FoldScopeLocation;

  // Same fold path rooted at a different base vertex.
  [[nodiscard]] auto WithBaseLocation(Location base) const
      -> FoldScopeLocation;

  auto operator==(const FoldScopeLocation&) const -> bool = default;
  auto operator<=>(const FoldScopeLocation&) const = default;

 private:
  Location base_location_;
  std::vector<FoldPathStep> fold_path_;
  std::optional<std::string> field_;
};

using AnyLocation = std::variant<Location, FoldScopeLocation>;

inline auto IsFoldScope(const AnyLocation& location) -> bool {
  return std::holds_alternative<FoldScopeLocation>(location);
}

// NavigateToField on whichever kind of location is held.
auto NavigateToField(const AnyLocation& location, const std::string& field)
    -> AnyLocation;

auto AtVertex(const AnyLocation& location) -> AnyLocation;

}  // namespace grail::ir
