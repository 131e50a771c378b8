#include "grail/ir/json.hpp"

#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <fstream>
#include <limits>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include <fmt/core.h>

#include "grail/common/internal_error.hpp"
#include "grail/common/overloaded.hpp"

namespace grail::ir {

namespace {

using nlohmann::json;

// Thrown while walking a document; converted to a Diagnostic at the API
// boundary.
struct DocumentError {
  std::string pointer;
  std::string message;
};

auto Child(const std::string& pointer, std::string_view key) -> std::string {
  return fmt::format("{}/{}", pointer, key);
}

auto Child(const std::string& pointer, size_t index) -> std::string {
  return fmt::format("{}/{}", pointer, index);
}

// Typed accessors over one JSON document, tracking the JSON pointer of every
// value so errors can name it.
class DocumentReader {
 public:
  auto ReadObject(const json& value, const std::string& pointer)
      -> const json& {
    if (!value.is_object()) {
      throw DocumentError{pointer, "expected an object"};
    }
    return value;
  }

  auto Field(const json& object, const std::string& pointer, const char* key)
      -> const json& {
    ReadObject(object, pointer);
    auto it = object.find(key);
    if (it == object.end()) {
      throw DocumentError{
          pointer, fmt::format("missing required field '{}'", key)};
    }
    return *it;
  }

  auto String(const json& object, const std::string& pointer, const char* key)
      -> std::string {
    const json& value = Field(object, pointer, key);
    if (!value.is_string()) {
      throw DocumentError{Child(pointer, key), "expected a string"};
    }
    return value.get<std::string>();
  }

  auto OptionalString(
      const json& object, const std::string& pointer, const char* key)
      -> std::optional<std::string> {
    if (!object.contains(key) || object.at(key).is_null()) {
      return std::nullopt;
    }
    return String(object, pointer, key);
  }

  auto Bool(
      const json& object, const std::string& pointer, const char* key,
      bool fallback) -> bool {
    if (!object.contains(key)) {
      return fallback;
    }
    const json& value = object.at(key);
    if (!value.is_boolean()) {
      throw DocumentError{Child(pointer, key), "expected a boolean"};
    }
    return value.get<bool>();
  }

  auto Int(
      const json& object, const std::string& pointer, const char* key,
      int fallback) -> int {
    if (!object.contains(key)) {
      return fallback;
    }
    const json& value = object.at(key);
    if (!value.is_number_integer()) {
      throw DocumentError{Child(pointer, key), "expected an integer"};
    }
    bool in_range =
        value.is_number_unsigned()
            ? value.get<uint64_t>() <=
                  static_cast<uint64_t>(std::numeric_limits<int>::max())
            : value.get<int64_t>() >= std::numeric_limits<int>::min() &&
                  value.get<int64_t>() <= std::numeric_limits<int>::max();
    if (!in_range) {
      throw DocumentError{Child(pointer, key), "integer out of range"};
    }
    return static_cast<int>(value.get<int64_t>());
  }

  auto StringList(
      const json& object, const std::string& pointer, const char* key)
      -> std::vector<std::string> {
    const json& value = Field(object, pointer, key);
    std::string list_pointer = Child(pointer, key);
    if (!value.is_array()) {
      throw DocumentError{list_pointer, "expected an array of strings"};
    }
    std::vector<std::string> result;
    for (size_t i = 0; i < value.size(); ++i) {
      if (!value[i].is_string()) {
        throw DocumentError{Child(list_pointer, i), "expected a string"};
      }
      result.push_back(value[i].get<std::string>());
    }
    return result;
  }

  auto StringSet(
      const json& object, const std::string& pointer, const char* key)
      -> std::set<std::string> {
    auto list = StringList(object, pointer, key);
    return {list.begin(), list.end()};
  }

  auto Direction(const json& object, const std::string& pointer)
      -> EdgeDirection {
    std::string text = String(object, pointer, "direction");
    if (text == "in") {
      return EdgeDirection::kIn;
    }
    if (text == "out") {
      return EdgeDirection::kOut;
    }
    throw DocumentError{
        Child(pointer, "direction"),
        fmt::format("unknown edge direction '{}'", text)};
  }

  auto ReadVertexLocation(const json& value, const std::string& pointer)
      -> Location {
    ReadObject(value, pointer);
    auto path = StringList(value, pointer, "path");
    if (path.empty()) {
      throw DocumentError{Child(pointer, "path"), "path must not be empty"};
    }
    int visit = Int(value, pointer, "visit", 1);
    if (visit < 1) {
      throw DocumentError{Child(pointer, "visit"), "visit must be positive"};
    }
    return Location(
        std::move(path), OptionalString(value, pointer, "field"), visit);
  }

  auto ReadFoldLocation(const json& value, const std::string& pointer)
      -> FoldScopeLocation {
    ReadObject(value, pointer);
    std::string base_pointer = Child(pointer, "base");
    Location base =
        ReadVertexLocation(Field(value, pointer, "base"), base_pointer);
    if (base.IsField()) {
      throw DocumentError{base_pointer, "fold base must not name a field"};
    }
    const json& steps = Field(value, pointer, "fold_path");
    std::string steps_pointer = Child(pointer, "fold_path");
    if (!steps.is_array() || steps.empty()) {
      throw DocumentError{steps_pointer, "expected a non-empty array"};
    }
    std::vector<FoldPathStep> fold_path;
    for (size_t i = 0; i < steps.size(); ++i) {
      std::string step_pointer = Child(steps_pointer, i);
      fold_path.push_back(
          FoldPathStep{
              .direction = Direction(steps[i], step_pointer),
              .edge_name = String(steps[i], step_pointer, "edge")});
    }
    return FoldScopeLocation(
        std::move(base), std::move(fold_path),
        OptionalString(value, pointer, "field"));
  }

  auto ReadLocation(const json& value, const std::string& pointer)
      -> AnyLocation {
    ReadObject(value, pointer);
    if (value.contains("fold_path")) {
      return ReadFoldLocation(value, pointer);
    }
    return ReadVertexLocation(value, pointer);
  }

  auto ReadLiteral(const json& value, const std::string& pointer)
      -> LiteralValue {
    if (value.is_null()) {
      return std::monostate{};
    }
    if (value.is_boolean()) {
      return value.get<bool>();
    }
    if (value.is_number_unsigned() &&
        value.get<uint64_t>() >
            static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
      throw DocumentError{pointer, "integer literal out of range"};
    }
    if (value.is_number_integer()) {
      return value.get<int64_t>();
    }
    if (value.is_string()) {
      return value.get<std::string>();
    }
    if (value.is_array()) {
      std::vector<std::string> list;
      for (size_t i = 0; i < value.size(); ++i) {
        if (!value[i].is_string()) {
          throw DocumentError{Child(pointer, i), "expected a string"};
        }
        list.push_back(value[i].get<std::string>());
      }
      return list;
    }
    throw DocumentError{pointer, "unsupported literal value"};
  }

  auto ReadUnaryOp(const json& object, const std::string& pointer) -> UnaryOp {
    std::string text = String(object, pointer, "op");
    if (text == ToString(UnaryOp::kSize)) {
      return UnaryOp::kSize;
    }
    throw DocumentError{
        Child(pointer, "op"), fmt::format("unknown unary operator '{}'", text)};
  }

  auto ReadBinaryOp(const json& object, const std::string& pointer)
      -> BinaryOp {
    std::string text = String(object, pointer, "op");
    for (auto raw = static_cast<uint8_t>(BinaryOp::kEqual);
         raw <= static_cast<uint8_t>(BinaryOp::kNotInCollection); ++raw) {
      auto op = static_cast<BinaryOp>(raw);
      if (text == ToString(op)) {
        return op;
      }
    }
    throw DocumentError{
        Child(pointer, "op"),
        fmt::format("unknown binary operator '{}'", text)};
  }

  auto ReadFieldLocation(
      const json& object, const std::string& pointer, const char* key)
      -> Location {
    std::string location_pointer = Child(pointer, key);
    Location location =
        ReadVertexLocation(Field(object, pointer, key), location_pointer);
    if (!location.IsField()) {
      throw DocumentError{location_pointer, "expected a field location"};
    }
    return location;
  }

  auto ReadExpression(const json& value, const std::string& pointer)
      -> ExpressionPtr {
    std::string kind = String(value, pointer, "kind");
    auto sub = [&](const char* key) {
      return ReadExpression(Field(value, pointer, key), Child(pointer, key));
    };

    if (kind == "Literal") {
      return MakeLiteral(
          ReadLiteral(Field(value, pointer, "value"), Child(pointer, "value")));
    }
    if (kind == "Variable") {
      return MakeVariable(
          String(value, pointer, "name"), String(value, pointer, "type"));
    }
    if (kind == "LocalField") {
      return MakeLocalField(
          String(value, pointer, "field"), String(value, pointer, "type"));
    }
    if (kind == "ContextField") {
      return MakeExpression(
          ContextField{
              .location = ReadFieldLocation(value, pointer, "location"),
              .field_type = String(value, pointer, "type")});
    }
    if (kind == "FoldedContextField") {
      std::string location_pointer = Child(pointer, "location");
      FoldScopeLocation location = ReadFoldLocation(
          Field(value, pointer, "location"), location_pointer);
      if (!location.IsField()) {
        throw DocumentError{location_pointer, "expected a field location"};
      }
      return MakeExpression(
          FoldedContextField{
              .fold_scope_location = std::move(location),
              .field_type = String(value, pointer, "type")});
    }
    if (kind == "ContextFieldExistence") {
      std::string location_pointer = Child(pointer, "location");
      Location location = ReadVertexLocation(
          Field(value, pointer, "location"), location_pointer);
      if (location.IsField()) {
        throw DocumentError{location_pointer, "expected a vertex location"};
      }
      return MakeExpression(ContextFieldExistence{.location = location});
    }
    if (kind == "OutputContextField") {
      return MakeExpression(
          OutputContextField{
              .location = ReadFieldLocation(value, pointer, "location"),
              .field_type = String(value, pointer, "type")});
    }
    if (kind == "UnaryTransformation") {
      return MakeExpression(
          UnaryTransformation{
              .op = ReadUnaryOp(value, pointer), .inner = sub("inner")});
    }
    if (kind == "BinaryComposition") {
      return MakeBinary(ReadBinaryOp(value, pointer), sub("left"), sub("right"));
    }
    if (kind == "TernaryConditional") {
      return MakeExpression(
          TernaryConditional{
              .predicate = sub("predicate"),
              .if_true = sub("if_true"),
              .if_false = sub("if_false")});
    }
    throw DocumentError{
        Child(pointer, "kind"),
        fmt::format("unknown expression kind '{}'", kind)};
  }

  auto ReadBlock(const json& value, const std::string& pointer) -> Block {
    std::string kind = String(value, pointer, "kind");

    if (kind == "QueryRoot") {
      return Block{
          QueryRoot{.start_class = StringSet(value, pointer, "start_class")}};
    }
    if (kind == "CoerceType") {
      return Block{
          CoerceType{.target_class = StringSet(value, pointer, "target_class")}};
    }
    if (kind == "Filter") {
      return Block{Filter{
          .predicate = ReadExpression(
              Field(value, pointer, "predicate"),
              Child(pointer, "predicate"))}};
    }
    if (kind == "MarkLocation") {
      return Block{MarkLocation{
          .location = ReadLocation(
              Field(value, pointer, "location"), Child(pointer, "location"))}};
    }
    if (kind == "Traverse") {
      return Block{Traverse{
          .direction = Direction(value, pointer),
          .edge_name = String(value, pointer, "edge"),
          .optional = Bool(value, pointer, "optional", false),
          .within_optional_scope =
              Bool(value, pointer, "within_optional_scope", false)}};
    }
    if (kind == "Recurse") {
      int depth = Int(value, pointer, "depth", 1);
      if (depth < 1) {
        throw DocumentError{Child(pointer, "depth"), "depth must be positive"};
      }
      return Block{Recurse{
          .direction = Direction(value, pointer),
          .edge_name = String(value, pointer, "edge"),
          .depth = depth,
          .within_optional_scope =
              Bool(value, pointer, "within_optional_scope", false)}};
    }
    if (kind == "Fold") {
      return Block{Fold{
          .fold_scope_location = ReadFoldLocation(
              Field(value, pointer, "location"), Child(pointer, "location"))}};
    }
    if (kind == "Unfold") {
      return Block{Unfold{}};
    }
    if (kind == "Backtrack") {
      return Block{Backtrack{
          .location = ReadVertexLocation(
              Field(value, pointer, "location"), Child(pointer, "location")),
          .optional = Bool(value, pointer, "optional", false)}};
    }
    if (kind == "EndOptional") {
      return Block{EndOptional{}};
    }
    if (kind == "OutputSource") {
      return Block{OutputSource{}};
    }
    if (kind == "GlobalOperationsStart") {
      return Block{GlobalOperationsStart{}};
    }
    if (kind == "ConstructResult") {
      const json& fields = Field(value, pointer, "fields");
      std::string fields_pointer = Child(pointer, "fields");
      if (!fields.is_array()) {
        throw DocumentError{fields_pointer, "expected an array"};
      }
      ConstructResult result;
      for (size_t i = 0; i < fields.size(); ++i) {
        std::string field_pointer = Child(fields_pointer, i);
        result.fields.emplace_back(
            String(fields[i], field_pointer, "name"),
            ReadExpression(
                Field(fields[i], field_pointer, "expr"),
                Child(field_pointer, "expr")));
      }
      return Block{std::move(result)};
    }
    throw DocumentError{
        Child(pointer, "kind"), fmt::format("unknown block kind '{}'", kind)};
  }

  auto ReadLocationInfo(const json& value, const std::string& pointer)
      -> LocationInfo {
    LocationInfo info;
    if (value.contains("parent") && !value.at("parent").is_null()) {
      info.parent_location =
          ReadLocation(value.at("parent"), Child(pointer, "parent"));
    }
    info.type = String(value, pointer, "type");
    info.coerced_from_type = OptionalString(value, pointer, "coerced_from");
    info.optional_scopes_depth = Int(value, pointer, "optional_depth", 0);
    info.recursive_scopes_depth = Int(value, pointer, "recursive_depth", 0);
    info.is_within_fold = Bool(value, pointer, "in_fold", false);
    return info;
  }

  auto ReadMetadata(const json& value, const std::string& pointer)
      -> QueryMetadataTable {
    const json& locations = Field(value, pointer, "locations");
    std::string locations_pointer = Child(pointer, "locations");
    if (!locations.is_array() || locations.empty()) {
      throw DocumentError{locations_pointer, "expected a non-empty array"};
    }

    std::string root_pointer = Child(locations_pointer, 0);
    AnyLocation root = ReadLocation(
        Field(locations[0], root_pointer, "location"),
        Child(root_pointer, "location"));
    const auto* root_vertex = std::get_if<Location>(&root);
    if (root_vertex == nullptr) {
      throw DocumentError{
          root_pointer, "root must be a vertex location, not a fold scope"};
    }
    QueryMetadataTable table(
        *root_vertex, ReadLocationInfo(locations[0], root_pointer));

    for (size_t i = 1; i < locations.size(); ++i) {
      std::string entry_pointer = Child(locations_pointer, i);
      AnyLocation location = ReadLocation(
          Field(locations[i], entry_pointer, "location"),
          Child(entry_pointer, "location"));
      table.RegisterLocation(
          location, ReadLocationInfo(locations[i], entry_pointer));
    }

    if (value.contains("revisits")) {
      const json& revisits = value.at("revisits");
      std::string revisits_pointer = Child(pointer, "revisits");
      if (!revisits.is_array()) {
        throw DocumentError{revisits_pointer, "expected an array"};
      }
      for (size_t i = 0; i < revisits.size(); ++i) {
        std::string entry_pointer = Child(revisits_pointer, i);
        table.RecordRevisit(
            ReadVertexLocation(
                Field(revisits[i], entry_pointer, "revisit"),
                Child(entry_pointer, "revisit")),
            ReadVertexLocation(
                Field(revisits[i], entry_pointer, "origin"),
                Child(entry_pointer, "origin")));
      }
    }
    return table;
  }
};

auto OptionalToJson(const std::optional<std::string>& value) -> json {
  if (!value) {
    return nullptr;
  }
  return *value;
}

auto LiteralToJson(const LiteralValue& value) -> json {
  return std::visit(
      Overloaded{
          [](std::monostate) -> json { return nullptr; },
          [](bool b) -> json { return b; },
          [](int64_t i) -> json { return i; },
          [](const std::string& s) -> json { return s; },
          [](const std::vector<std::string>& list) -> json { return list; },
      },
      value);
}

}  // namespace

auto ParseQuery(const nlohmann::json& doc, const std::string& file)
    -> Result<Query> {
  DocumentReader reader;
  try {
    reader.ReadObject(doc, "");
    QueryMetadataTable metadata =
        reader.ReadMetadata(reader.Field(doc, "", "metadata"), "/metadata");

    const json& blocks_json = reader.Field(doc, "", "blocks");
    if (!blocks_json.is_array()) {
      throw DocumentError{"/blocks", "expected an array"};
    }
    BlockList blocks;
    blocks.reserve(blocks_json.size());
    for (size_t i = 0; i < blocks_json.size(); ++i) {
      blocks.push_back(reader.ReadBlock(blocks_json[i], Child("/blocks", i)));
    }
    return Query{.blocks = std::move(blocks), .metadata = std::move(metadata)};
  } catch (const DocumentError& e) {
    return std::unexpected(
        Diagnostic::Error(
            DocumentSpan{
                .file = file, .pointer = e.pointer.empty() ? "/" : e.pointer},
            e.message));
  } catch (const common::InternalError& e) {
    // The metadata section names locations inconsistently (duplicates,
    // unknown parents). That is a defect of the document, not of lowering.
    return std::unexpected(
        Diagnostic::Error(
            DocumentSpan{.file = file, .pointer = "/metadata"}, e.Detail()));
  }
}

auto LoadQuery(const std::filesystem::path& path) -> Result<Query> {
  std::ifstream in(path);
  if (!in) {
    return std::unexpected(
        Diagnostic::HostError(
            fmt::format("cannot open query file '{}'", path.string())));
  }
  json doc;
  try {
    doc = json::parse(in);
  } catch (const json::parse_error& e) {
    return std::unexpected(
        Diagnostic::HostError(
            fmt::format("failed to parse {}: {}", path.string(), e.what())));
  }
  return ParseQuery(doc, path.string());
}

auto ToJson(const Location& location) -> nlohmann::json {
  json result = {
      {"path", location.QueryPath()},
      {"visit", location.VisitCounter()},
  };
  if (location.Field()) {
    result["field"] = *location.Field();
  }
  return result;
}

auto ToJson(const FoldScopeLocation& location) -> nlohmann::json {
  json steps = json::array();
  for (const auto& step : location.FoldPath()) {
    steps.push_back(
        {{"direction", ToString(step.direction)}, {"edge", step.edge_name}});
  }
  json result = {
      {"base", ToJson(location.BaseLocation())},
      {"fold_path", std::move(steps)},
  };
  if (location.Field()) {
    result["field"] = *location.Field();
  }
  return result;
}

auto ToJson(const AnyLocation& location) -> nlohmann::json {
  return std::visit(
      [](const auto& loc) -> json { return ToJson(loc); }, location);
}

auto ToJson(const ExpressionPtr& expr) -> nlohmann::json {
  if (expr == nullptr) {
    return nullptr;
  }
  return std::visit(
      Overloaded{
          [](const Literal& e) -> json {
            return {{"kind", "Literal"}, {"value", LiteralToJson(e.value)}};
          },
          [](const Variable& e) -> json {
            return {{"kind", "Variable"}, {"name", e.name}, {"type", e.type}};
          },
          [](const LocalField& e) -> json {
            return {
                {"kind", "LocalField"},
                {"field", e.field_name},
                {"type", e.field_type}};
          },
          [](const ContextField& e) -> json {
            return {
                {"kind", "ContextField"},
                {"location", ToJson(e.location)},
                {"type", e.field_type}};
          },
          [](const FoldedContextField& e) -> json {
            return {
                {"kind", "FoldedContextField"},
                {"location", ToJson(e.fold_scope_location)},
                {"type", e.field_type}};
          },
          [](const ContextFieldExistence& e) -> json {
            return {
                {"kind", "ContextFieldExistence"},
                {"location", ToJson(e.location)}};
          },
          [](const OutputContextField& e) -> json {
            return {
                {"kind", "OutputContextField"},
                {"location", ToJson(e.location)},
                {"type", e.field_type}};
          },
          [](const UnaryTransformation& e) -> json {
            return {
                {"kind", "UnaryTransformation"},
                {"op", ToString(e.op)},
                {"inner", ToJson(e.inner)}};
          },
          [](const BinaryComposition& e) -> json {
            return {
                {"kind", "BinaryComposition"},
                {"op", ToString(e.op)},
                {"left", ToJson(e.left)},
                {"right", ToJson(e.right)}};
          },
          [](const TernaryConditional& e) -> json {
            return {
                {"kind", "TernaryConditional"},
                {"predicate", ToJson(e.predicate)},
                {"if_true", ToJson(e.if_true)},
                {"if_false", ToJson(e.if_false)}};
          },
      },
      expr->data);
}

auto ToJson(const Block& block) -> nlohmann::json {
  json result = std::visit(
      Overloaded{
          [](const QueryRoot& b) -> json {
            return {{"start_class", b.start_class}};
          },
          [](const CoerceType& b) -> json {
            return {{"target_class", b.target_class}};
          },
          [](const Filter& b) -> json {
            return {{"predicate", ToJson(b.predicate)}};
          },
          [](const MarkLocation& b) -> json {
            return {{"location", ToJson(b.location)}};
          },
          [](const Traverse& b) -> json {
            return {
                {"direction", ToString(b.direction)},
                {"edge", b.edge_name},
                {"optional", b.optional},
                {"within_optional_scope", b.within_optional_scope}};
          },
          [](const Recurse& b) -> json {
            return {
                {"direction", ToString(b.direction)},
                {"edge", b.edge_name},
                {"depth", b.depth},
                {"within_optional_scope", b.within_optional_scope}};
          },
          [](const Fold& b) -> json {
            return {{"location", ToJson(b.fold_scope_location)}};
          },
          [](const Backtrack& b) -> json {
            return {
                {"location", ToJson(b.location)}, {"optional", b.optional}};
          },
          [](const ConstructResult& b) -> json {
            json fields = json::array();
            for (const auto& [name, expr] : b.fields) {
              fields.push_back({{"name", name}, {"expr", ToJson(expr)}});
            }
            return {{"fields", std::move(fields)}};
          },
          [](const Unfold&) -> json { return json::object(); },
          [](const EndOptional&) -> json { return json::object(); },
          [](const OutputSource&) -> json { return json::object(); },
          [](const GlobalOperationsStart&) -> json { return json::object(); },
      },
      block.data);
  result["kind"] = BlockKindName(block);
  return result;
}

auto ToJson(const BlockList& blocks) -> nlohmann::json {
  json result = json::array();
  for (const auto& block : blocks) {
    result.push_back(ToJson(block));
  }
  return result;
}

auto ToJson(const QueryMetadataTable& metadata) -> nlohmann::json {
  json locations = json::array();
  for (const auto& location : metadata.RegisteredLocations()) {
    const LocationInfo& info = metadata.GetLocationInfo(location);
    json entry = {
        {"location", ToJson(location)},
        {"type", info.type},
        {"coerced_from", OptionalToJson(info.coerced_from_type)},
        {"optional_depth", info.optional_scopes_depth},
        {"recursive_depth", info.recursive_scopes_depth},
        {"in_fold", info.is_within_fold},
    };
    entry["parent"] = info.parent_location ? ToJson(*info.parent_location)
                                           : json(nullptr);
    locations.push_back(std::move(entry));
  }

  json revisits = json::array();
  for (const auto& [revisit, origin] : metadata.RevisitOrigins()) {
    revisits.push_back({{"revisit", ToJson(revisit)}, {"origin", ToJson(origin)}});
  }
  return {{"locations", std::move(locations)}, {"revisits", std::move(revisits)}};
}

auto ToJson(const Query& query) -> nlohmann::json {
  return {{"blocks", ToJson(query.blocks)}, {"metadata", ToJson(query.metadata)}};
}

}  // namespace grail::ir
