#pragma once

#include <cstdint>
#include <exception>
#include <expected>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "arx/common/source_span.hpp"

namespace arx {

enum class DiagKind : uint8_t {
  kError,      // Invalid program: lowering cannot continue
  kHostError,  // I/O, malformed external input, toolchain problems
  kWarning,    // Non-fatal
  kNote,       // Auxiliary message
};

// What went wrong, independent of where it was detected.
enum class ErrorCategory : uint8_t {
  kUnresolvedReference,  // Variable, function or extern name not found
  kOverloadMismatch,     // No extern overload matches the argument tags
  kTypeMismatch,         // Assignment, declaration, return or operand types
  kStructural,           // Unterminated block, break/continue outside loop
  kUnsupported,          // Operator or construct the backend cannot lower
  kDescriptor,           // Malformed or missing extern descriptor
  kEnvironment,          // Required external tool not found
  kProcessFailure,       // External tool exited non-zero
  kInput,                // Malformed AST file or project configuration
};

auto ToString(ErrorCategory category) -> const char*;

struct UnknownSpan {
  auto operator==(const UnknownSpan&) const -> bool = default;
};

using DiagSpan = std::variant<SourceSpan, UnknownSpan>;

struct DiagItem {
  DiagKind kind;
  DiagSpan span;
  std::string message;
  std::optional<ErrorCategory> category;  // Set for kError and kHostError

  auto operator==(const DiagItem&) const -> bool = default;
};

struct Diagnostic {
  DiagItem primary;
  std::vector<DiagItem> notes;

  auto operator==(const Diagnostic&) const -> bool = default;

  [[nodiscard]] auto Category() const -> std::optional<ErrorCategory> {
    return primary.category;
  }
  [[nodiscard]] auto Message() const -> const std::string& {
    return primary.message;
  }

  // Factory: error in the program being compiled
  static auto Error(SourceSpan span, ErrorCategory cat, std::string msg)
      -> Diagnostic {
    return Diagnostic{
        .primary =
            {.kind = DiagKind::kError,
             .span = span,
             .message = std::move(msg),
             .category = cat},
        .notes = {},
    };
  }

  // Factory: host error without source location
  static auto HostError(ErrorCategory cat, std::string msg) -> Diagnostic {
    return Diagnostic{
        .primary =
            {.kind = DiagKind::kHostError,
             .span = UnknownSpan{},
             .message = std::move(msg),
             .category = cat},
        .notes = {},
    };
  }

  // Factory: host error with source location (e.g. a bad AST node)
  static auto HostError(SourceSpan span, ErrorCategory cat, std::string msg)
      -> Diagnostic {
    return Diagnostic{
        .primary =
            {.kind = DiagKind::kHostError,
             .span = span,
             .message = std::move(msg),
             .category = cat},
        .notes = {},
    };
  }

  static auto Warning(std::string msg) -> Diagnostic {
    return Diagnostic{
        .primary =
            {.kind = DiagKind::kWarning,
             .span = UnknownSpan{},
             .message = std::move(msg),
             .category = std::nullopt},
        .notes = {},
    };
  }

  static auto Warning(SourceSpan span, std::string msg) -> Diagnostic {
    return Diagnostic{
        .primary =
            {.kind = DiagKind::kWarning,
             .span = span,
             .message = std::move(msg),
             .category = std::nullopt},
        .notes = {},
    };
  }

  auto WithNote(SourceSpan span, std::string msg) && -> Diagnostic {
    notes.push_back(
        DiagItem{
            .kind = DiagKind::kNote,
            .span = span,
            .message = std::move(msg),
            .category = std::nullopt,
        });
    return std::move(*this);
  }

  auto WithNote(std::string msg) && -> Diagnostic {
    notes.push_back(
        DiagItem{
            .kind = DiagKind::kNote,
            .span = UnknownSpan{},
            .message = std::move(msg),
            .category = std::nullopt,
        });
    return std::move(*this);
  }
};

template <typename T>
using Result = std::expected<T, Diagnostic>;

class DiagnosticException : public std::exception {
 public:
  explicit DiagnosticException(Diagnostic diag) : diag_(std::move(diag)) {
  }

  [[nodiscard]] auto GetDiagnostic() const -> const Diagnostic& {
    return diag_;
  }
  [[nodiscard]] auto what() const noexcept -> const char* override {
    return diag_.primary.message.c_str();
  }

 private:
  Diagnostic diag_;
};

}  // namespace arx
