#include <gtest/gtest.h>

#include <cstddef>
#include <string>
#include <vector>

#include "grail/common/internal_error.hpp"
#include "grail/ir/dumper.hpp"
#include "grail/ir/verify.hpp"
#include "grail/lowering/local_field_resolution.hpp"
#include "grail/lowering/optional_filter_hoisting.hpp"
#include "grail/lowering/pipeline.hpp"
#include "tests/common/ir_builder.hpp"

namespace grail::test {
namespace {

using common::FaultKind;
using common::InternalError;
using lowering::LowerIr;
using lowering::PassId;

auto IndexOf(const ir::BlockList& blocks, const ir::Block& needle) -> size_t {
  for (size_t i = 0; i < blocks.size(); ++i) {
    if (blocks[i] == needle) {
      return i;
    }
  }
  return blocks.size();
}

class PipelineTest : public ::testing::Test {
 protected:
  PipelineTest() {
    table_.RegisterLocation(b_, Info(a_, "Animal", 1));
  }

  // A (depth 0) -[optional]-> B (depth 1) with a local-field filter on B.
  auto SingleOptionalScope() const -> ir::BlockList {
    return {
        Root("Animal"),
        Mark(a_),
        Out("Animal_ParentOf", true),
        FilterOn(EqualsVar(Local("x"), "wanted")),
        Mark(b_),
        Back(a_, true),
        GlobalStart(),
    };
  }

  ir::Location a_ = Loc({"Animal"});
  ir::Location b_ = a_.NavigateToSubpath("out_Animal_ParentOf");
  ir::QueryMetadataTable table_ = RootTable(a_, "Animal");
};

TEST_F(PipelineTest, PassNamesRoundTrip) {
  std::vector<std::string> names;
  for (PassId pass : lowering::kPassOrder) {
    names.emplace_back(lowering::PassName(pass));
    EXPECT_EQ(lowering::ParsePassName(lowering::PassName(pass)), pass);
  }
  EXPECT_EQ(
      names, (std::vector<std::string>{
                 "insert_type_bounds", "eliminate_revisits",
                 "resolve_local_fields", "hoist_optional_filters"}));
  EXPECT_FALSE(lowering::ParsePassName("fold_constants").has_value());
}

TEST_F(PipelineTest, SingleOptionalScopeWithLocalFieldFilter) {
  ir::BlockList result = LowerIr(SingleOptionalScope(), table_);

  ir::Block bound_filter = FilterOn(EqualsVar(Ctx(b_, "x"), "wanted"));
  EXPECT_EQ(
      result,
      (ir::BlockList{
          Root("Animal"),
          Mark(a_),
          Out("Animal_ParentOf", true),
          Coerce("Animal"),
          Mark(b_),
          Back(a_, true),
          GlobalStart(),
          bound_filter,
      }));

  size_t traverse = IndexOf(result, Out("Animal_ParentOf", true));
  size_t backtrack = IndexOf(result, Back(a_, true));
  for (size_t i = traverse; i < backtrack; ++i) {
    EXPECT_FALSE(ir::Is<ir::Filter>(result[i])) << ir::FormatBlock(result[i]);
  }
  EXPECT_EQ(IndexOf(result, bound_filter), IndexOf(result, GlobalStart()) + 1);
}

TEST_F(PipelineTest, FilterAfterTheOptionalMarkStaysUnbound) {
  // The filter follows B's MarkLocation, so no later mark binds it. The tail
  // is released unrewritten and the verifier reports the surviving field.
  ir::BlockList blocks = {
      Root("Animal"),
      Mark(a_),
      Out("Animal_ParentOf", true),
      Mark(b_),
      FilterOn(EqualsVar(Local("x"), "wanted")),
      Back(a_, true),
      GlobalStart(),
  };
  ir::BlockList result = LowerIr(blocks, table_);
  EXPECT_TRUE(ir::ContainsLocalField(result.back()));

  try {
    (void)LowerIr(blocks, table_, {.verify = true, .after_pass = {}});
    FAIL() << "expected InternalError";
  } catch (const InternalError& e) {
    EXPECT_EQ(e.Kind(), FaultKind::kInvariantViolation);
  }
}

TEST_F(PipelineTest, NestedOptionalScopesHoistBothFiltersInOrder) {
  ir::Location c = b_.NavigateToSubpath("out_Animal_ParentOf");
  table_.RegisterLocation(c, Info(b_, "Animal", 2));

  ir::BlockList blocks = {
      Root("Animal"),
      Mark(a_),
      Out("Animal_ParentOf", true),
      FilterOn(EqualsVar(Local("name"), "outer")),
      Mark(b_),
      Out("Animal_ParentOf", true, true),
      FilterOn(EqualsVar(Local("name"), "inner")),
      Mark(c),
      Back(b_, true),
      Back(a_, true),
      GlobalStart(),
  };
  ir::BlockList result = LowerIr(blocks, table_, {.verify = true, .after_pass = {}});

  size_t global = IndexOf(result, GlobalStart());
  ASSERT_EQ(result.size(), global + 3);
  EXPECT_EQ(result[global + 1], FilterOn(EqualsVar(Ctx(b_, "name"), "outer")));
  EXPECT_EQ(result[global + 2], FilterOn(EqualsVar(Ctx(c, "name"), "inner")));
}

TEST_F(PipelineTest, RevisitsAreRemovedFromTheOutput) {
  ir::Location revisit = table_.RevisitLocation(a_);
  ir::BlockList blocks = {
      Root("Animal"),
      Mark(a_),
      Out("Animal_ParentOf", true),
      FilterOn(EqualsVar(Local("name"), "wanted")),
      Mark(b_),
      Back(a_, true),
      Mark(revisit),
      GlobalStart(),
      Construct(
          {{"name", OutputOf(revisit, "name")},
           {"has_parent", ir::MakeExpression(
                              ir::ContextFieldExistence{.location = b_})}}),
  };
  ir::BlockList result =
      LowerIr(blocks, table_, {.verify = true, .after_pass = {}});

  std::string text = ir::FormatBlocks(result);
  EXPECT_EQ(text.find("Animal@2"), std::string::npos) << text;
  EXPECT_EQ(result.size(), blocks.size());  // one CoerceType in, one mark out
  EXPECT_EQ(
      ir::FormatBlock(result.back()),
      "ConstructResult(name: out(Animal@1.name), "
      "has_parent: exists(Animal.out_Animal_ParentOf@1))");
}

TEST_F(PipelineTest, ObserverSeesEveryPassInOrder) {
  std::vector<PassId> seen;
  std::vector<size_t> sizes;
  lowering::LoweringOptions options{
      .verify = false,
      .after_pass =
          [&](PassId pass, const ir::BlockList& blocks) {
            seen.push_back(pass);
            sizes.push_back(blocks.size());
          },
  };
  (void)LowerIr(SingleOptionalScope(), table_, options);

  EXPECT_EQ(
      seen, (std::vector<PassId>{
                PassId::kInsertTypeBounds, PassId::kEliminateRevisits,
                PassId::kResolveLocalFields, PassId::kHoistOptionalFilters}));
  EXPECT_EQ(sizes, (std::vector<size_t>{8, 8, 8, 8}));
}

TEST_F(PipelineTest, RunPassMatchesPipelineStep) {
  ir::BlockList input = SingleOptionalScope();
  ir::BlockList step = lowering::RunPass(PassId::kInsertTypeBounds, input, table_);
  EXPECT_EQ(step.size(), input.size() + 1);
  EXPECT_EQ(step[3], Coerce("Animal"));
}

TEST_F(PipelineTest, HoistingBeforeResolutionBindsTheWrongLocation) {
  ir::BlockList typed =
      lowering::RunPass(PassId::kInsertTypeBounds, SingleOptionalScope(), table_);

  // Documented order: the filter reads B.x.
  ir::BlockList resolved = lowering::ResolveLocalFields(typed);
  ir::BlockList correct = lowering::HoistOptionalScopeFilters(resolved, table_);
  EXPECT_EQ(correct.back(), FilterOn(EqualsVar(Ctx(b_, "x"), "wanted")));

  // Swapped order: the moved filter no longer precedes B's MarkLocation, so
  // nothing binds it and it keeps an unresolved local reference.
  ir::BlockList hoisted = lowering::HoistOptionalScopeFilters(typed, table_);
  ir::BlockList swapped = lowering::ResolveLocalFields(hoisted);
  EXPECT_TRUE(ir::ContainsLocalField(swapped.back()));
  EXPECT_NE(swapped.back(), correct.back());
}

TEST_F(PipelineTest, VerifyRejectsMalformedInput) {
  ir::BlockList blocks = {Mark(a_), GlobalStart()};
  try {
    (void)LowerIr(blocks, table_, {.verify = true, .after_pass = {}});
    FAIL() << "expected InternalError";
  } catch (const InternalError& e) {
    EXPECT_EQ(e.Kind(), FaultKind::kMalformedIr);
  }
}

TEST_F(PipelineTest, FaultsPropagateFromPasses) {
  ir::BlockList blocks = {
      Root("Animal"), Mark(a_), Out("Animal_ParentOf", true), Back(a_, true),
      GlobalStart(),
  };
  EXPECT_THROW((void)LowerIr(blocks, table_), InternalError);
}

}  // namespace
}  // namespace grail::test
