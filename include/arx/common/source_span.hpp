#pragma once

#include <cstdint>
#include <string>

namespace arx {

// Position of an AST node inside its interchange file. Lines and columns are
// 1-based; a zero line means the position is unknown.
struct SourceSpan {
  uint32_t line = 0;
  uint32_t column = 0;

  [[nodiscard]] auto IsKnown() const -> bool {
    return line != 0;
  }

  auto operator==(const SourceSpan&) const -> bool = default;
};

// Format a SourceSpan as "file:line:col". Falls back to the bare file name
// when the span is unknown.
auto FormatSourceLocation(const SourceSpan& span, const std::string& file)
    -> std::string;

}  // namespace arx
