#include "print.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include <fmt/color.h>
#include <fmt/core.h>
#include <unistd.h>

#include "strata/common/diagnostic/diagnostic.hpp"
#include "strata/common/diagnostic/diagnostic_set.hpp"
#include "strata/common/source_manager.hpp"
#include "strata/common/source_span.hpp"

namespace strata::driver {

namespace {

constexpr auto kToolColor = fmt::terminal_color::white;
constexpr auto kToolStyle = fmt::fg(kToolColor) | fmt::emphasis::bold;

auto DiagKindToString(DiagKind kind) -> std::string_view {
  switch (kind) {
    case DiagKind::kError:
    case DiagKind::kHostError:
      return "error";
    case DiagKind::kWarning:
      return "warning";
    case DiagKind::kNote:
      return "note";
  }
  return "error";
}

auto DiagKindToStyle(DiagKind kind) -> fmt::text_style {
  switch (kind) {
    case DiagKind::kError:
    case DiagKind::kHostError:
      return fmt::fg(fmt::terminal_color::bright_red) | fmt::emphasis::bold;
    case DiagKind::kWarning:
      return fmt::fg(fmt::terminal_color::bright_magenta) | fmt::emphasis::bold;
    case DiagKind::kNote:
      return fmt::fg(fmt::terminal_color::bright_cyan) | fmt::emphasis::bold;
  }
  return fmt::fg(fmt::terminal_color::bright_red) | fmt::emphasis::bold;
}

// Escape sequences only for terminals; NO_COLOR disables them.
auto UseColor(FILE* sink) -> bool {
  return std::getenv("NO_COLOR") == nullptr && isatty(fileno(sink)) != 0;
}

class Printer {
 public:
  Printer(FILE* sink, const SourceManager* source_manager)
      : sink_(sink), source_manager_(source_manager), color_(UseColor(sink)) {
  }

  auto Style(fmt::text_style style) const -> fmt::text_style {
    return color_ ? style : fmt::text_style{};
  }

  // Print a single DiagItem with optional source context
  void PrintItem(const DiagItem& item, bool is_primary) const {
    std::string kind(DiagKindToString(item.kind));
    if (!item.code.empty()) {
      kind += "[" + item.code + "]";
    }
    kind += ":";
    fmt::text_style kind_style = Style(DiagKindToStyle(item.kind));
    fmt::text_style message_style =
        is_primary ? Style(fmt::emphasis::bold) : fmt::text_style{};

    std::optional<SourceSpan> span;
    std::string location;
    if (const auto* located = std::get_if<SourceSpan>(&item.span)) {
      span = *located;
      if (source_manager_ != nullptr) {
        location = FormatSourceLocation(*located, *source_manager_);
      }
    }

    if (!location.empty()) {
      fmt::print(
          sink_, "{}: {} {}\n", fmt::styled(location, Style(fmt::emphasis::bold)),
          fmt::styled(kind, kind_style), fmt::styled(item.message, message_style));
    } else {
      fmt::print(
          sink_, "{}: {} {}\n", fmt::styled("strata", Style(kToolStyle)),
          fmt::styled(kind, kind_style), fmt::styled(item.message, message_style));
    }

    // Source line and caret marker, only for primary messages with a span
    if (is_primary && span && source_manager_ != nullptr && span->file_id &&
        span->line != 0) {
      PrintSourceLine(*span);
    }
  }

 private:
  void PrintSourceLine(const SourceSpan& span) const {
    std::string_view source_line =
        source_manager_->GetLine(span.file_id, span.line);
    if (source_line.empty()) {
      return;
    }

    std::string line_num_str = std::to_string(span.line);
    size_t field_width = std::max(line_num_str.size(), size_t{4});
    std::string num_field(field_width - line_num_str.size(), ' ');
    num_field += line_num_str;
    std::string blank_field(field_width, ' ');

    const auto gutter_style = Style(fmt::fg(fmt::terminal_color::white));
    fmt::print(
        sink_, " {} {}\n", fmt::styled(num_field + " |", gutter_style),
        source_line);

    uint32_t col = span.column > 0 ? span.column - 1 : 0;
    col = std::min<uint32_t>(col, static_cast<uint32_t>(source_line.size()));
    const auto marker_style = Style(fmt::fg(fmt::terminal_color::green));
    fmt::print(
        sink_, " {} {}{}\n", fmt::styled(blank_field + " |", gutter_style),
        std::string(col, ' '), fmt::styled("^", marker_style));
  }

  FILE* sink_;
  const SourceManager* source_manager_;
  bool color_;
};

}  // namespace

void PrintError(const std::string& message) {
  Printer printer(stderr, nullptr);
  fmt::print(
      stderr, "{}: {} {}\n", fmt::styled("strata", printer.Style(kToolStyle)),
      fmt::styled(
          "error:",
          printer.Style(
              fmt::fg(fmt::terminal_color::bright_red) | fmt::emphasis::bold)),
      fmt::styled(message, printer.Style(fmt::emphasis::bold)));
}

void PrintWarning(const std::string& message) {
  Printer printer(stderr, nullptr);
  fmt::print(
      stderr, "{}: {} {}\n", fmt::styled("strata", printer.Style(kToolStyle)),
      fmt::styled(
          "warning:",
          printer.Style(
              fmt::fg(fmt::terminal_color::bright_yellow) |
              fmt::emphasis::bold)),
      fmt::styled(message, printer.Style(fmt::emphasis::bold)));
}

void PrintDiagnostic(const Diagnostic& diag) {
  Printer printer(stderr, nullptr);
  printer.PrintItem(diag.primary, true);
  for (const auto& note : diag.notes) {
    printer.PrintItem(note, false);
  }
}

void PrintDiagnostics(
    const DiagnosticSet& diagnostics, const SourceManager* source_manager,
    FILE* sink) {
  Printer printer(sink, source_manager);
  for (const auto& diag : diagnostics.GetDiagnostics()) {
    printer.PrintItem(diag.primary, true);
    for (const auto& note : diag.notes) {
      printer.PrintItem(note, false);
    }
  }

  size_t error_count = diagnostics.ErrorCount();
  size_t warning_count = diagnostics.WarningCount();
  if (warning_count > 0 || error_count > 0) {
    std::string summary;
    if (warning_count > 0) {
      summary += fmt::format(
          "{} warning{}", warning_count, warning_count == 1 ? "" : "s");
    }
    if (warning_count > 0 && error_count > 0) {
      summary += " and ";
    }
    if (error_count > 0) {
      summary +=
          fmt::format("{} error{}", error_count, error_count == 1 ? "" : "s");
    }
    fmt::print(sink, "{} generated.\n", summary);
  }
}

}  // namespace strata::driver
