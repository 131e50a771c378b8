#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <variant>

#include <nlohmann/json.hpp>

#include "grail/ir/dumper.hpp"
#include "grail/ir/json.hpp"
#include "tests/common/ir_builder.hpp"

namespace grail::test {
namespace {

using nlohmann::json;

// Animal -[optional]-> out_Animal_ParentOf, a revisit of Animal, and a fold.
constexpr const char* kQueryDocument = R"({
  "blocks": [
    {"kind": "QueryRoot", "start_class": ["Animal"]},
    {"kind": "MarkLocation", "location": {"path": ["Animal"]}},
    {"kind": "Traverse", "direction": "out", "edge": "Animal_ParentOf",
     "optional": true},
    {"kind": "Filter", "predicate": {
      "kind": "BinaryComposition", "op": "=",
      "left": {"kind": "LocalField", "field": "name", "type": "String"},
      "right": {"kind": "Variable", "name": "wanted", "type": "String"}}},
    {"kind": "MarkLocation",
     "location": {"path": ["Animal", "out_Animal_ParentOf"]}},
    {"kind": "Backtrack", "location": {"path": ["Animal"]}, "optional": true},
    {"kind": "MarkLocation", "location": {"path": ["Animal"], "visit": 2}},
    {"kind": "Fold", "location": {
      "base": {"path": ["Animal"]},
      "fold_path": [{"direction": "in", "edge": "Animal_ParentOf"}]}},
    {"kind": "MarkLocation", "location": {
      "base": {"path": ["Animal"]},
      "fold_path": [{"direction": "in", "edge": "Animal_ParentOf"}]}},
    {"kind": "Unfold"},
    {"kind": "GlobalOperationsStart"},
    {"kind": "ConstructResult", "fields": [
      {"name": "name", "expr": {"kind": "OutputContextField",
        "location": {"path": ["Animal"], "visit": 2, "field": "name"},
        "type": "String"}},
      {"name": "children", "expr": {"kind": "FoldedContextField",
        "location": {"base": {"path": ["Animal"]},
                     "fold_path": [{"direction": "in",
                                    "edge": "Animal_ParentOf"}],
                     "field": "name"},
        "type": "[String]"}}]}
  ],
  "metadata": {
    "locations": [
      {"location": {"path": ["Animal"]}, "type": "Animal"},
      {"location": {"path": ["Animal", "out_Animal_ParentOf"]},
       "type": "Animal", "parent": {"path": ["Animal"]}, "optional_depth": 1},
      {"location": {"path": ["Animal"], "visit": 2}, "type": "Animal"},
      {"location": {"base": {"path": ["Animal"]},
                    "fold_path": [{"direction": "in",
                                   "edge": "Animal_ParentOf"}]},
       "type": "Animal", "parent": {"path": ["Animal"]}, "in_fold": true}
    ],
    "revisits": [
      {"revisit": {"path": ["Animal"], "visit": 2},
       "origin": {"path": ["Animal"]}}
    ]
  }
})";

class JsonTest : public ::testing::Test {
 protected:
  static auto Parse(const json& doc) -> Result<ir::Query> {
    return ir::ParseQuery(doc, "query.json");
  }

  // Expects parsing to fail with an error at `pointer`.
  static void ExpectErrorAt(const json& doc, const std::string& pointer) {
    auto query = Parse(doc);
    ASSERT_FALSE(query.has_value());
    EXPECT_EQ(query.error().primary.kind, DiagKind::kError);
    const auto* span = std::get_if<DocumentSpan>(&query.error().primary.span);
    ASSERT_NE(span, nullptr);
    EXPECT_EQ(span->file, "query.json");
    EXPECT_EQ(span->pointer, pointer) << query.error().primary.message;
  }
};

TEST_F(JsonTest, ParsesRepresentativeQuery) {
  auto query = Parse(json::parse(kQueryDocument));
  ASSERT_TRUE(query.has_value()) << query.error().primary.message;

  ASSERT_EQ(query->blocks.size(), 12U);
  EXPECT_EQ(
      ir::FormatBlock(query->blocks[2]),
      "Traverse(out, Animal_ParentOf, optional)");
  EXPECT_EQ(
      ir::FormatBlock(query->blocks[3]), "Filter((local(name) = $wanted))");
  EXPECT_EQ(
      ir::FormatBlock(query->blocks[7]),
      "Fold(Animal@1/fold(in_Animal_ParentOf))");
  EXPECT_EQ(
      ir::FormatBlock(query->blocks[11]),
      "ConstructResult(name: out(Animal@2.name), "
      "children: folded(Animal@1/fold(in_Animal_ParentOf).name))");

  const ir::QueryMetadataTable& metadata = query->metadata;
  EXPECT_EQ(metadata.RootLocation(), Loc({"Animal"}));
  EXPECT_EQ(metadata.RegisteredLocations().size(), 4U);
  EXPECT_EQ(
      metadata.GetLocationInfo(Loc({"Animal", "out_Animal_ParentOf"}))
          .optional_scopes_depth,
      1);
  EXPECT_EQ(metadata.GetRevisitOrigin(Loc({"Animal"}, 2)), Loc({"Animal"}));
}

TEST_F(JsonTest, SerializedQueryParsesBackToSameIr) {
  auto query = Parse(json::parse(kQueryDocument));
  ASSERT_TRUE(query.has_value()) << query.error().primary.message;

  auto again = Parse(ir::ToJson(*query));
  ASSERT_TRUE(again.has_value()) << again.error().primary.message;
  EXPECT_EQ(again->blocks, query->blocks);
  EXPECT_EQ(
      again->metadata.RegisteredLocations(),
      query->metadata.RegisteredLocations());
  EXPECT_EQ(again->metadata.RevisitOrigins(), query->metadata.RevisitOrigins());
}

TEST_F(JsonTest, BlockSerializationUsesKindTags) {
  json block = ir::ToJson(Back(Loc({"Animal"}), true));
  EXPECT_EQ(block["kind"], "Backtrack");
  EXPECT_EQ(block["optional"], true);
  EXPECT_EQ(block["location"]["path"], json::array({"Animal"}));
  EXPECT_EQ(block["location"]["visit"], 1);
}

TEST_F(JsonTest, MissingFieldIsReportedAtItsObject) {
  json doc = json::parse(kQueryDocument);
  doc["blocks"][2].erase("edge");
  ExpectErrorAt(doc, "/blocks/2");
}

TEST_F(JsonTest, UnknownKindsAndOperatorsAreReported) {
  json doc = json::parse(kQueryDocument);
  doc["blocks"][9]["kind"] = "Teleport";
  ExpectErrorAt(doc, "/blocks/9/kind");

  doc = json::parse(kQueryDocument);
  doc["blocks"][3]["predicate"]["op"] = "~=";
  ExpectErrorAt(doc, "/blocks/3/predicate/op");
}

TEST_F(JsonTest, InvalidLocationsAreReported) {
  json doc = json::parse(kQueryDocument);
  doc["blocks"][1]["location"]["path"] = json::array();
  ExpectErrorAt(doc, "/blocks/1/location/path");

  doc = json::parse(kQueryDocument);
  doc["blocks"][5]["location"]["visit"] = 0;
  ExpectErrorAt(doc, "/blocks/5/location/visit");
}

TEST_F(JsonTest, InconsistentMetadataIsReported) {
  json doc = json::parse(kQueryDocument);
  json duplicate = json::object();
  duplicate["location"]["path"] = json::array({"Animal"});
  duplicate["type"] = "Animal";
  doc["metadata"]["locations"].push_back(duplicate);
  ExpectErrorAt(doc, "/metadata");

  doc = json::parse(kQueryDocument);
  doc["metadata"]["locations"] = json::array();
  ExpectErrorAt(doc, "/metadata/locations");
}

TEST_F(JsonTest, CyclicRevisitIsReportedAtMetadata) {
  json doc = json::parse(kQueryDocument);
  json reversed = json::object();
  reversed["revisit"]["path"] = json::array({"Animal"});
  reversed["origin"]["path"] = json::array({"Animal"});
  reversed["origin"]["visit"] = 2;
  doc["metadata"]["revisits"].push_back(reversed);
  ExpectErrorAt(doc, "/metadata");
}

TEST_F(JsonTest, OutOfRangeIntegersAreReported) {
  json doc = json::parse(kQueryDocument);
  doc["metadata"]["locations"][1]["optional_depth"] = 4294967296LL;
  ExpectErrorAt(doc, "/metadata/locations/1/optional_depth");

  doc = json::parse(kQueryDocument);
  doc["blocks"][6]["location"]["visit"] = -5000000000LL;
  ExpectErrorAt(doc, "/blocks/6/location/visit");

  doc = json::parse(kQueryDocument);
  doc["blocks"][3]["predicate"]["right"] = {
      {"kind", "Literal"}, {"value", 18446744073709551615ULL}};
  ExpectErrorAt(doc, "/blocks/3/predicate/right/value");
}

TEST_F(JsonTest, NonObjectDocumentIsReportedAtRoot) {
  ExpectErrorAt(json::array({1, 2}), "/");
}

TEST_F(JsonTest, LoadQueryReportsHostErrors) {
  auto missing = ir::LoadQuery("/nonexistent/grail/query.json");
  ASSERT_FALSE(missing.has_value());
  EXPECT_EQ(missing.error().primary.kind, DiagKind::kHostError);

  auto path = std::filesystem::temp_directory_path() / "grail_json_test.json";
  {
    std::ofstream out(path);
    out << "{ \"blocks\": [";
  }
  auto broken = ir::LoadQuery(path);
  std::filesystem::remove(path);
  ASSERT_FALSE(broken.has_value());
  EXPECT_EQ(broken.error().primary.kind, DiagKind::kHostError);
  EXPECT_NE(
      broken.error().primary.message.find("failed to parse"),
      std::string::npos);
}

}  // namespace
}  // namespace grail::test
