#pragma once

#include <ostream>
#include <string>

#include "grail/ir/block.hpp"
#include "grail/ir/expression.hpp"
#include "grail/ir/location.hpp"
#include "grail/ir/query_metadata.hpp"

namespace grail::ir {

// Text forms:
//   Location:          Animal.out_Animal_ParentOf@1.name
//   FoldScopeLocation: Animal@1/fold(out_Animal_ParentOf).name
auto FormatLocation(const Location& location) -> std::string;
auto FormatLocation(const FoldScopeLocation& location) -> std::string;
auto FormatLocation(const AnyLocation& location) -> std::string;

auto FormatExpression(const Expression& expr) -> std::string;
auto FormatExpression(const ExpressionPtr& expr) -> std::string;
auto FormatBlock(const Block& block) -> std::string;

// Compact single-line form of a whole sequence, for fault messages.
auto FormatBlocks(const BlockList& blocks) -> std::string;

class Dumper {
 public:
  explicit Dumper(std::ostream* out);

  // One block per line, prefixed with its index. Traversal depth is shown
  // by indentation.
  void Dump(const BlockList& blocks);
  void Dump(const QueryMetadataTable& metadata);

 private:
  void PrintIndent();

  std::ostream* out_;
  int indent_ = 0;
};

}  // namespace grail::ir
