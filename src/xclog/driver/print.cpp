#include "print.hpp"

#include <cstdio>
#include <string>
#include <variant>

#include <fmt/color.h>
#include <fmt/core.h>

#include "xclog/common/diagnostic/diagnostic.hpp"
#include "xclog/common/overloaded.hpp"

namespace xclog::driver {

namespace {

constexpr auto kToolColor = fmt::terminal_color::white;
constexpr auto kToolStyle = fmt::fg(kToolColor) | fmt::emphasis::bold;

auto DiagKindToString(DiagKind kind) -> const char* {
  switch (kind) {
    case DiagKind::kHostError:
      return "error:";
    case DiagKind::kWarning:
      return "warning:";
    case DiagKind::kNote:
      return "note:";
  }
  return "error:";
}

auto DiagKindToStyle(DiagKind kind) -> fmt::text_style {
  switch (kind) {
    case DiagKind::kHostError:
      return fmt::fg(fmt::terminal_color::bright_red) | fmt::emphasis::bold;
    case DiagKind::kWarning:
      return fmt::fg(fmt::terminal_color::bright_magenta) | fmt::emphasis::bold;
    case DiagKind::kNote:
      return fmt::fg(fmt::terminal_color::bright_cyan) | fmt::emphasis::bold;
  }
  return fmt::fg(fmt::terminal_color::bright_red) | fmt::emphasis::bold;
}

auto FormatLocation(const FileLocation& loc) -> std::string {
  if (loc.line && loc.column) {
    return fmt::format("{}:{}:{}", loc.path, *loc.line, *loc.column);
  }
  if (loc.line) {
    return fmt::format("{}:{}", loc.path, *loc.line);
  }
  return loc.path;
}

void PrintDiagItem(const DiagItem& item, bool is_primary) {
  const char* kind_str = DiagKindToString(item.kind);
  fmt::text_style kind_style = DiagKindToStyle(item.kind);

  std::string location;
  std::visit(
      Overloaded{
          [&](const FileLocation& loc) { location = FormatLocation(loc); },
          [&](UnknownSpan) {
            // No location available
          },
      },
      item.span);

  fmt::text_style message_style = is_primary ? fmt::emphasis::bold : fmt::text_style{};
  if (!location.empty()) {
    fmt::print(
        stderr, "{}: {} {}\n", fmt::styled(location, fmt::emphasis::bold),
        fmt::styled(kind_str, kind_style),
        fmt::styled(item.message, message_style));
  } else {
    fmt::print(
        stderr, "{}: {} {}\n", fmt::styled("xclog", kToolStyle),
        fmt::styled(kind_str, kind_style),
        fmt::styled(item.message, message_style));
  }
}

}  // namespace

void PrintError(const std::string& message) {
  fmt::print(
      stderr, "{}: {} {}\n", fmt::styled("xclog", kToolStyle),
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

}  // namespace xclog::driver
