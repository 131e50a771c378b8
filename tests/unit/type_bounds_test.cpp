#include <gtest/gtest.h>

#include <cstddef>
#include <string>

#include "grail/common/internal_error.hpp"
#include "grail/ir/dumper.hpp"
#include "grail/lowering/type_bounds.hpp"
#include "tests/common/ir_builder.hpp"

namespace grail::test {
namespace {

using common::FaultKind;
using common::InternalError;
using lowering::InsertExplicitTypeBounds;

class TypeBoundsTest : public ::testing::Test {
 protected:
  TypeBoundsTest() {
    table_.RegisterLocation(parent_, Info(animal_, "Animal"));
    table_.RegisterLocation(species_, Info(parent_, "Species"));
    table_.RegisterLocation(fold_, Info(animal_, "Animal", 0, true));
  }

  ir::Location animal_ = Loc({"Animal"});
  ir::Location parent_ = animal_.NavigateToSubpath("out_Animal_ParentOf");
  ir::Location species_ = parent_.NavigateToSubpath("out_Animal_OfSpecies");
  ir::FoldScopeLocation fold_ =
      animal_.NavigateToFold(ir::EdgeDirection::kIn, "Animal_ParentOf");
  ir::QueryMetadataTable table_ = RootTable(animal_, "Animal");
};

TEST_F(TypeBoundsTest, InsertsCoercionAfterEachStep) {
  ir::BlockList blocks = {
      Root("Animal"),          Mark(animal_),  Out("Animal_ParentOf"),
      Mark(parent_),           Out("Animal_OfSpecies"), Mark(species_),
      Back(parent_),           Back(animal_),  GlobalStart(),
  };
  ir::BlockList result = InsertExplicitTypeBounds(blocks, table_);
  EXPECT_EQ(
      result,
      (ir::BlockList{
          Root("Animal"), Mark(animal_), Out("Animal_ParentOf"),
          Coerce("Animal"), Mark(parent_), Out("Animal_OfSpecies"),
          Coerce("Species"), Mark(species_), Back(parent_), Back(animal_),
          GlobalStart()}));
}

TEST_F(TypeBoundsTest, CoercionGoesBeforeSkippedFilters) {
  auto filter = FilterOn(EqualsVar(Local("name"), "wanted"));
  ir::BlockList blocks = {
      Root("Animal"), Mark(animal_), Out("Animal_ParentOf"),
      filter,         Mark(parent_), Back(animal_),
      GlobalStart(),
  };
  ir::BlockList result = InsertExplicitTypeBounds(blocks, table_);
  ASSERT_EQ(result.size(), blocks.size() + 1);
  EXPECT_EQ(result[3], Coerce("Animal"));
  EXPECT_EQ(result[4], filter);
  EXPECT_EQ(result[5], Mark(parent_));
}

TEST_F(TypeBoundsTest, ExistingCoercionIsKept) {
  ir::BlockList blocks = {
      Root("Animal"),
      Mark(animal_),
      Out("Animal_ParentOf"),
      FilterOn(EqualsVar(Local("name"), "wanted")),
      Coerce("Dog"),
      Mark(parent_),
      Back(animal_),
      GlobalStart(),
  };
  EXPECT_EQ(InsertExplicitTypeBounds(blocks, table_), blocks);
}

TEST_F(TypeBoundsTest, FoldAndRecurseAreSteps) {
  ir::BlockList blocks = {
      Root("Animal"), Mark(animal_), Recurse("Animal_ParentOf", 2),
      Mark(parent_),  Back(animal_), FoldAt(fold_),
      Mark(fold_),    Unfold(),      GlobalStart(),
  };
  ir::BlockList result = InsertExplicitTypeBounds(blocks, table_);
  ASSERT_EQ(result.size(), blocks.size() + 2);
  EXPECT_EQ(result[3], Coerce("Animal"));
  EXPECT_EQ(result[7], Coerce("Animal"));
  EXPECT_EQ(result[8], Mark(fold_));
}

TEST_F(TypeBoundsTest, IsIdempotent) {
  ir::BlockList blocks = {
      Root("Animal"), Mark(animal_), Out("Animal_ParentOf"),
      FilterOn(EqualsVar(Local("name"), "wanted")), Mark(parent_),
      FoldAt(fold_), Mark(fold_), Unfold(), Back(animal_), GlobalStart(),
  };
  ir::BlockList once = InsertExplicitTypeBounds(blocks, table_);
  EXPECT_EQ(InsertExplicitTypeBounds(once, table_), once);
}

TEST_F(TypeBoundsTest, GrowsByOneBlockPerUncoercedStep) {
  ir::BlockList blocks = {
      Root("Animal"), Mark(animal_),   Out("Animal_ParentOf"),
      Coerce("Dog"),  Mark(parent_),   Out("Animal_OfSpecies"),
      Mark(species_), Back(animal_),   GlobalStart(),
  };
  size_t uncoerced_steps = 1;
  EXPECT_EQ(
      InsertExplicitTypeBounds(blocks, table_).size(),
      blocks.size() + uncoerced_steps);
}

TEST_F(TypeBoundsTest, StepWithoutMarkIsMalformed) {
  ir::BlockList blocks = {
      Root("Animal"), Mark(animal_), Out("Animal_ParentOf"), Back(animal_),
      GlobalStart(),
  };
  try {
    (void)InsertExplicitTypeBounds(blocks, table_);
    FAIL() << "expected InternalError";
  } catch (const InternalError& e) {
    EXPECT_EQ(e.Kind(), FaultKind::kMalformedIr);
    EXPECT_NE(e.Detail().find("Backtrack(Animal@1)"), std::string::npos);
  }
}

TEST_F(TypeBoundsTest, StepAtEndOfInputIsMalformed) {
  ir::BlockList blocks = {
      Root("Animal"), Mark(animal_), Out("Animal_ParentOf"),
      FilterOn(EqualsVar(Local("name"), "wanted")),
  };
  EXPECT_THROW((void)InsertExplicitTypeBounds(blocks, table_), InternalError);
}

TEST_F(TypeBoundsTest, UnregisteredTargetIsMalformed) {
  ir::Location unknown = animal_.NavigateToSubpath("out_Animal_FedAt");
  ir::BlockList blocks = {
      Root("Animal"), Mark(animal_), Out("Animal_FedAt"), Mark(unknown),
      Back(animal_), GlobalStart(),
  };
  EXPECT_THROW((void)InsertExplicitTypeBounds(blocks, table_), InternalError);
}

}  // namespace
}  // namespace grail::test
