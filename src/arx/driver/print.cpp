#include "print.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <fmt/color.h>
#include <fmt/core.h>

#include "arx/common/diagnostic.hpp"
#include "arx/common/overloaded.hpp"
#include "arx/common/source_span.hpp"

namespace arx::driver {

namespace {

constexpr auto kToolColor = fmt::terminal_color::white;
constexpr auto kToolStyle = fmt::fg(kToolColor) | fmt::emphasis::bold;

auto DiagKindToString(DiagKind kind) -> const char* {
  switch (kind) {
    case DiagKind::kError:
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

void PrintDiagItem(
    const DiagItem& item, const std::string& file, bool is_primary) {
  std::string location;
  std::visit(
      Overloaded{
          [&](const SourceSpan& span) {
            if (!file.empty()) {
              location = FormatSourceLocation(span, file);
            }
          },
          [&](UnknownSpan) {},
      },
      item.span);

  // Categories are shown in brackets after the message, like compiler flags
  std::string message = item.message;
  if (item.category) {
    message += fmt::format(" [{}]", ToString(*item.category));
  }

  auto message_style = is_primary ? fmt::emphasis::bold : fmt::text_style{};
  if (!location.empty()) {
    fmt::print(
        stderr, "{}: {} {}\n", fmt::styled(location, fmt::emphasis::bold),
        fmt::styled(DiagKindToString(item.kind), DiagKindToStyle(item.kind)),
        fmt::styled(message, message_style));
  } else {
    fmt::print(
        stderr, "{}: {} {}\n", fmt::styled("arx", kToolStyle),
        fmt::styled(DiagKindToString(item.kind), DiagKindToStyle(item.kind)),
        fmt::styled(message, message_style));
  }
}

}  // namespace

void PrintError(const std::string& message) {
  fmt::print(
      stderr, "{}: {} {}\n", fmt::styled("arx", kToolStyle),
      fmt::styled(
          "error:",
          fmt::fg(fmt::terminal_color::bright_red) | fmt::emphasis::bold),
      fmt::styled(message, fmt::emphasis::bold));
}

void PrintWarning(const std::string& message) {
  fmt::print(
      stderr, "{}: {} {}\n", fmt::styled("arx", kToolStyle),
      fmt::styled(
          "warning:",
          fmt::fg(fmt::terminal_color::bright_yellow) | fmt::emphasis::bold),
      fmt::styled(message, fmt::emphasis::bold));
}

void PrintDiagnostic(const Diagnostic& diag, const std::string& file) {
  PrintDiagItem(diag.primary, file, true);
  for (const auto& note : diag.notes) {
    PrintDiagItem(note, file, false);
  }
}

void PrintDiagnostics(
    const std::vector<Diagnostic>& diags, const std::string& file) {
  uint32_t error_count = 0;
  uint32_t warning_count = 0;

  for (const auto& diag : diags) {
    switch (diag.primary.kind) {
      case DiagKind::kError:
      case DiagKind::kHostError:
        ++error_count;
        break;
      case DiagKind::kWarning:
        ++warning_count;
        break;
      case DiagKind::kNote:
        break;
    }
    PrintDiagnostic(diag, file);
  }

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
    fmt::print(stderr, "{} generated.\n", summary);
  }
}

}  // namespace arx::driver
