#pragma once

#include <cstdint>
#include <utility>

namespace arx::ast {

struct ExpressionId {
  uint32_t value = 0;

  auto operator==(const ExpressionId&) const -> bool = default;
  auto operator<=>(const ExpressionId&) const = default;
  explicit operator bool() const {
    return value != UINT32_MAX;
  }

  template <typename H>
  friend auto AbslHashValue(H h, ExpressionId id) -> H {
    return H::combine(std::move(h), id.value);
  }
};

constexpr ExpressionId kInvalidExpressionId{UINT32_MAX};

struct StatementId {
  uint32_t value = 0;

  auto operator==(const StatementId&) const -> bool = default;
  auto operator<=>(const StatementId&) const = default;
  explicit operator bool() const {
    return value != UINT32_MAX;
  }

  template <typename H>
  friend auto AbslHashValue(H h, StatementId id) -> H {
    return H::combine(std::move(h), id.value);
  }
};

constexpr StatementId kInvalidStatementId{UINT32_MAX};

struct Expression;
struct Statement;
struct Function;
struct Program;
class Arena;
struct Type;

}  // namespace arx::ast
