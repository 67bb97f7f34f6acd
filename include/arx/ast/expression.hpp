#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

#include "arx/ast/fwd.hpp"
#include "arx/common/source_span.hpp"

namespace arx::ast {

struct IntLiteral {
  int64_t value;

  auto operator==(const IntLiteral&) const -> bool = default;
};

struct FloatLiteral {
  double value;

  auto operator==(const FloatLiteral&) const -> bool = default;
};

struct BoolLiteral {
  bool value;

  auto operator==(const BoolLiteral&) const -> bool = default;
};

struct StringLiteral {
  std::string value;

  auto operator==(const StringLiteral&) const -> bool = default;
};

struct VariableRef {
  std::string name;

  auto operator==(const VariableRef&) const -> bool = default;
};

// The operator keeps its source spelling; the lowering decides which ones it
// can translate for the operand types it sees.
struct BinaryOp {
  std::string op;
  ExpressionId lhs;
  ExpressionId rhs;

  auto operator==(const BinaryOp&) const -> bool = default;
};

// Call of a program function or of an implicitly declared C function.
struct Call {
  std::string callee;
  std::vector<ExpressionId> arguments;

  auto operator==(const Call&) const -> bool = default;
};

// `module.function(args)`: resolved through the extern overload table.
struct MethodCall {
  std::string object;
  std::string method;
  std::vector<ExpressionId> arguments;

  auto operator==(const MethodCall&) const -> bool = default;
};

struct ListLiteral {
  std::vector<ExpressionId> elements;

  auto operator==(const ListLiteral&) const -> bool = default;
};

using ExpressionData = std::variant<
    IntLiteral, FloatLiteral, BoolLiteral, StringLiteral, VariableRef,
    BinaryOp, Call, MethodCall, ListLiteral>;

struct Expression {
  SourceSpan span;
  ExpressionData data;

  auto operator==(const Expression&) const -> bool = default;
};

}  // namespace arx::ast
