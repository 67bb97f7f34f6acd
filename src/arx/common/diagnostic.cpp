#include "arx/common/diagnostic.hpp"

#include <string>

#include <fmt/core.h>

#include "arx/common/source_span.hpp"

namespace arx {

auto ToString(ErrorCategory category) -> const char* {
  switch (category) {
    case ErrorCategory::kUnresolvedReference:
      return "unresolved reference";
    case ErrorCategory::kOverloadMismatch:
      return "overload mismatch";
    case ErrorCategory::kTypeMismatch:
      return "type mismatch";
    case ErrorCategory::kStructural:
      return "structural error";
    case ErrorCategory::kUnsupported:
      return "unsupported";
    case ErrorCategory::kDescriptor:
      return "descriptor error";
    case ErrorCategory::kEnvironment:
      return "environment error";
    case ErrorCategory::kProcessFailure:
      return "process failure";
    case ErrorCategory::kInput:
      return "input error";
  }
  return "error";
}

auto FormatSourceLocation(const SourceSpan& span, const std::string& file)
    -> std::string {
  if (!span.IsKnown()) {
    return file;
  }
  if (span.column == 0) {
    return fmt::format("{}:{}", file, span.line);
  }
  return fmt::format("{}:{}:{}", file, span.line, span.column);
}

}  // namespace arx
