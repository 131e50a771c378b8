#include "grail/ir/dumper.hpp"

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <set>
#include <string>
#include <variant>
#include <vector>

#include <fmt/core.h>
#include <fmt/format.h>
#include <fmt/ranges.h>

#include "grail/common/overloaded.hpp"

namespace grail::ir {

namespace {

auto FormatTypeSet(const std::set<std::string>& types) -> std::string {
  return fmt::format("{{{}}}", fmt::join(types, ", "));
}

auto FormatLiteral(const LiteralValue& value) -> std::string {
  return std::visit(
      Overloaded{
          [](std::monostate) -> std::string { return "null"; },
          [](bool b) -> std::string { return b ? "true" : "false"; },
          [](int64_t i) -> std::string { return fmt::format("{}", i); },
          [](const std::string& s) -> std::string {
            return fmt::format("\"{}\"", s);
          },
          [](const std::vector<std::string>& list) -> std::string {
            std::vector<std::string> quoted;
            quoted.reserve(list.size());
            for (const auto& s : list) {
              quoted.push_back(fmt::format("\"{}\"", s));
            }
            return fmt::format("[{}]", fmt::join(quoted, ", "));
          },
      },
      value);
}

}  // namespace

auto FormatLocation(const Location& location) -> std::string {
  std::string result = fmt::format(
      "{}@{}", fmt::join(location.QueryPath(), "."), location.VisitCounter());
  if (location.Field()) {
    result += fmt::format(".{}", *location.Field());
  }
  return result;
}

auto FormatLocation(const FoldScopeLocation& location) -> std::string {
  std::string result = FormatLocation(location.BaseLocation());
  for (const auto& step : location.FoldPath()) {
    result += fmt::format(
        "/fold({}_{})", ToString(step.direction), step.edge_name);
  }
  if (location.Field()) {
    result += fmt::format(".{}", *location.Field());
  }
  return result;
}

auto FormatLocation(const AnyLocation& location) -> std::string {
  return std::visit(
      [](const auto& loc) { return FormatLocation(loc); }, location);
}

auto FormatExpression(const ExpressionPtr& expr) -> std::string {
  if (expr == nullptr) {
    return "<null>";
  }
  return FormatExpression(*expr);
}

auto FormatExpression(const Expression& expr) -> std::string {
  return std::visit(
      Overloaded{
          [](const Literal& e) { return FormatLiteral(e.value); },
          [](const Variable& e) { return fmt::format("${}", e.name); },
          [](const LocalField& e) {
            return fmt::format("local({})", e.field_name);
          },
          [](const ContextField& e) {
            return fmt::format("ctx({})", FormatLocation(e.location));
          },
          [](const FoldedContextField& e) {
            return fmt::format(
                "folded({})", FormatLocation(e.fold_scope_location));
          },
          [](const ContextFieldExistence& e) {
            return fmt::format("exists({})", FormatLocation(e.location));
          },
          [](const OutputContextField& e) {
            return fmt::format("out({})", FormatLocation(e.location));
          },
          [](const UnaryTransformation& e) {
            return fmt::format(
                "{}({})", ToString(e.op), FormatExpression(e.inner));
          },
          [](const BinaryComposition& e) {
            return fmt::format(
                "({} {} {})", FormatExpression(e.left), ToString(e.op),
                FormatExpression(e.right));
          },
          [](const TernaryConditional& e) {
            return fmt::format(
                "({} ? {} : {})", FormatExpression(e.predicate),
                FormatExpression(e.if_true), FormatExpression(e.if_false));
          },
      },
      expr.data);
}

auto FormatBlock(const Block& block) -> std::string {
  return std::visit(
      Overloaded{
          [](const QueryRoot& b) {
            return fmt::format("QueryRoot({})", FormatTypeSet(b.start_class));
          },
          [](const CoerceType& b) {
            return fmt::format(
                "CoerceType({})", FormatTypeSet(b.target_class));
          },
          [](const Filter& b) {
            return fmt::format("Filter({})", FormatExpression(b.predicate));
          },
          [](const MarkLocation& b) {
            return fmt::format("MarkLocation({})", FormatLocation(b.location));
          },
          [](const Traverse& b) {
            return fmt::format(
                "Traverse({}, {}{}{})", ToString(b.direction), b.edge_name,
                b.optional ? ", optional" : "",
                b.within_optional_scope ? ", within_optional" : "");
          },
          [](const Recurse& b) {
            return fmt::format(
                "Recurse({}, {}, depth={}{})", ToString(b.direction),
                b.edge_name, b.depth,
                b.within_optional_scope ? ", within_optional" : "");
          },
          [](const Fold& b) {
            return fmt::format(
                "Fold({})", FormatLocation(b.fold_scope_location));
          },
          [](const Unfold&) -> std::string { return "Unfold()"; },
          [](const Backtrack& b) {
            return fmt::format(
                "Backtrack({}{})", FormatLocation(b.location),
                b.optional ? ", optional" : "");
          },
          [](const EndOptional&) -> std::string { return "EndOptional()"; },
          [](const OutputSource&) -> std::string { return "OutputSource()"; },
          [](const GlobalOperationsStart&) -> std::string {
            return "GlobalOperationsStart()";
          },
          [](const ConstructResult& b) {
            std::vector<std::string> fields;
            fields.reserve(b.fields.size());
            for (const auto& [name, expr] : b.fields) {
              fields.push_back(
                  fmt::format("{}: {}", name, FormatExpression(expr)));
            }
            return fmt::format("ConstructResult({})", fmt::join(fields, ", "));
          },
      },
      block.data);
}

auto FormatBlocks(const BlockList& blocks) -> std::string {
  std::vector<std::string> parts;
  parts.reserve(blocks.size());
  for (const auto& block : blocks) {
    parts.push_back(FormatBlock(block));
  }
  return fmt::format("[{}]", fmt::join(parts, ", "));
}

Dumper::Dumper(std::ostream* out) : out_(out) {
}

void Dumper::PrintIndent() {
  for (int i = 0; i < indent_; ++i) {
    *out_ << "  ";
  }
}

void Dumper::Dump(const BlockList& blocks) {
  indent_ = 0;
  for (size_t i = 0; i < blocks.size(); ++i) {
    const Block& block = blocks[i];
    if (Is<Unfold>(block) || Is<GlobalOperationsStart>(block)) {
      indent_ = Is<Unfold>(block) && indent_ > 0 ? indent_ - 1 : 0;
    }
    *out_ << fmt::format("{:>4}: ", i);
    PrintIndent();
    *out_ << FormatBlock(block) << "\n";
    if (IsTraversalStep(block)) {
      ++indent_;
    } else if (Is<Backtrack>(block) && indent_ > 0) {
      --indent_;
    }
  }
}

void Dumper::Dump(const QueryMetadataTable& metadata) {
  for (const auto& location : metadata.RegisteredLocations()) {
    const LocationInfo& info = metadata.GetLocationInfo(location);
    *out_ << fmt::format(
        "{}: type={} optional_depth={} recursive_depth={}{}{}\n",
        FormatLocation(location), info.type, info.optional_scopes_depth,
        info.recursive_scopes_depth, info.is_within_fold ? " in_fold" : "",
        info.coerced_from_type
            ? fmt::format(" coerced_from={}", *info.coerced_from_type)
            : "");
  }
  for (const auto& [revisit, origin] : metadata.RevisitOrigins()) {
    *out_ << fmt::format(
        "revisit {} -> {}\n", FormatLocation(revisit), FormatLocation(origin));
  }
}

}  // namespace grail::ir
