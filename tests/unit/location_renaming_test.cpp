#include <gtest/gtest.h>

#include "grail/common/internal_error.hpp"
#include "grail/ir/dumper.hpp"
#include "grail/lowering/expression_rewriter.hpp"
#include "grail/lowering/location_renaming.hpp"
#include "tests/common/ir_builder.hpp"

namespace grail::test {
namespace {

using lowering::LocationTranslations;
using lowering::TranslateLocation;

class LocationRenamingTest : public ::testing::Test {
 protected:
  ir::Location animal_ = Loc({"Animal"});
  ir::Location revisit_ = animal_.Revisit();
  LocationTranslations translations_ = {{revisit_, animal_}};
};

TEST_F(LocationRenamingTest, TranslationsComeFromRevisitOrigins) {
  ir::QueryMetadataTable table = RootTable(animal_, "Animal");
  ir::Location second = table.RevisitLocation(animal_);
  ir::Location third = table.RevisitLocation(second);

  LocationTranslations translations =
      lowering::MakeRevisitLocationTranslations(table);
  ASSERT_EQ(translations.size(), 2U);
  EXPECT_EQ(translations.at(second), animal_);
  EXPECT_EQ(translations.at(third), animal_);
}

TEST_F(LocationRenamingTest, EmptyTableHasNoTranslations) {
  EXPECT_TRUE(lowering::MakeRevisitLocationTranslations(
                  RootTable(animal_, "Animal"))
                  .empty());
}

TEST_F(LocationRenamingTest, VertexAndFieldLocationsTranslate) {
  EXPECT_EQ(TranslateLocation(revisit_, translations_), animal_);
  EXPECT_EQ(
      TranslateLocation(revisit_.NavigateToField("name"), translations_),
      animal_.NavigateToField("name"));

  ir::Location other = animal_.NavigateToSubpath("out_Animal_ParentOf");
  EXPECT_EQ(TranslateLocation(other, translations_), other);
}

TEST_F(LocationRenamingTest, FoldScopeLocationsTranslateTheirBase) {
  ir::FoldScopeLocation folded =
      revisit_.NavigateToFold(ir::EdgeDirection::kOut, "Animal_ParentOf")
          .NavigateToField("name");
  ir::FoldScopeLocation renamed = TranslateLocation(folded, translations_);
  EXPECT_EQ(renamed.BaseLocation(), animal_);
  EXPECT_EQ(renamed.FoldPath(), folded.FoldPath());
  EXPECT_EQ(renamed.Field(), folded.Field());
}

TEST_F(LocationRenamingTest, RewriterRenamesEveryLocationBearingExpression) {
  auto existence =
      ir::MakeExpression(ir::ContextFieldExistence{.location = revisit_});
  auto folded = ir::MakeExpression(
      ir::FoldedContextField{
          .fold_scope_location =
              revisit_.NavigateToFold(ir::EdgeDirection::kIn, "Animal_ParentOf")
                  .NavigateToField("name"),
          .field_type = "[String]"});
  auto expr = ir::MakeExpression(
      ir::TernaryConditional{
          .predicate = existence,
          .if_true = ir::MakeBinary(
              ir::BinaryOp::kContains, folded, Ctx(revisit_, "name")),
          .if_false = OutputOf(revisit_, "uuid")});

  auto renamed = lowering::RewriteExpression(
      expr, lowering::MakeLocationRewriter(translations_));
  EXPECT_EQ(
      ir::FormatExpression(renamed),
      "(exists(Animal@1) ? (folded(Animal@1/fold(in_Animal_ParentOf).name) "
      "contains ctx(Animal@1.name)) : out(Animal@1.uuid))");
}

TEST_F(LocationRenamingTest, RewriterKeepsUnaffectedNodes) {
  auto expr = EqualsVar(Ctx(animal_, "name"), "wanted");
  auto renamed = lowering::RewriteExpression(
      expr, lowering::MakeLocationRewriter(translations_));
  EXPECT_EQ(renamed, expr);
}

TEST_F(LocationRenamingTest, RewriterOwnsItsTranslations) {
  lowering::ExpressionVisitor rewriter;
  {
    LocationTranslations scoped = {{revisit_, animal_}};
    rewriter = lowering::MakeLocationRewriter(scoped);
  }
  auto renamed = lowering::RewriteExpression(Ctx(revisit_, "name"), rewriter);
  EXPECT_EQ(ir::FormatExpression(renamed), "ctx(Animal@1.name)");
}

}  // namespace
}  // namespace grail::test
