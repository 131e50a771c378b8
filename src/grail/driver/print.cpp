#include "print.hpp"

#include <string>
#include <variant>

#include <fmt/color.h>
#include <fmt/core.h>

#include "grail/common/diagnostic.hpp"
#include "grail/common/internal_error.hpp"
#include "grail/common/overloaded.hpp"

namespace grail::driver {

namespace {

constexpr auto kToolColor = fmt::terminal_color::white;
constexpr auto kToolStyle = fmt::fg(kToolColor) | fmt::emphasis::bold;

auto DiagKindToString(DiagKind kind) -> const char* {
  switch (kind) {
    case DiagKind::kError:
      return "error:";
    case DiagKind::kHostError:
      return "error:";
    case DiagKind::kNote:
      return "note:";
  }
  return "error:";
}

auto DiagKindToStyle(DiagKind kind) -> fmt::text_style {
  switch (kind) {
    case DiagKind::kError:
    case DiagKind::kHostError:
      return fmt::fg(fmt::terminal_color::bright_red) | fmt::emphasis::bold;
    case DiagKind::kNote:
      return fmt::fg(fmt::terminal_color::bright_cyan) | fmt::emphasis::bold;
  }
  return fmt::fg(fmt::terminal_color::bright_red) | fmt::emphasis::bold;
}

// Print a single DiagItem, prefixed with its document position when known
void PrintDiagItem(const DiagItem& item, bool is_primary) {
  const char* kind_str = DiagKindToString(item.kind);
  fmt::text_style kind_style = DiagKindToStyle(item.kind);

  std::string location = std::visit(
      Overloaded{
          [](const DocumentSpan& span) -> std::string {
            return fmt::format("{}:{}", span.file, span.pointer);
          },
          [](UnknownSpan) -> std::string { return "grail"; },
      },
      item.span);

  fmt::print(
      stderr, "{}: {} {}\n", fmt::styled(location, kToolStyle),
      fmt::styled(kind_str, kind_style),
      fmt::styled(
          item.message, is_primary ? fmt::emphasis::bold : fmt::text_style{}));
}

}  // namespace

void PrintError(const std::string& message) {
  fmt::print(
      stderr, "{}: {} {}\n", fmt::styled("grail", kToolStyle),
      fmt::styled(
          "error:",
          fmt::fg(fmt::terminal_color::bright_red) | fmt::emphasis::bold),
      fmt::styled(message, fmt::emphasis::bold));
}

void PrintDiagnostic(const Diagnostic& diag) {
  PrintDiagItem(diag.primary, true);
  for (const auto& note : diag.notes) {
    PrintDiagItem(note, false);
  }
}

void PrintInternalError(const common::InternalError& error) {
  fmt::print(
      stderr, "{}: {} {}\n", fmt::styled("grail", kToolStyle),
      fmt::styled(
          fmt::format("internal error ({}):", common::ToString(error.Kind())),
          fmt::fg(fmt::terminal_color::bright_red) | fmt::emphasis::bold),
      fmt::styled(
          fmt::format("{}: {}", error.Context(), error.Detail()),
          fmt::emphasis::bold));
}

}  // namespace grail::driver
