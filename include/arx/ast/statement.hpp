#pragma once

#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "arx/ast/fwd.hpp"
#include "arx/ast/type.hpp"
#include "arx/common/source_span.hpp"

namespace arx::ast {

struct ExpressionStatement {
  ExpressionId expression;

  auto operator==(const ExpressionStatement&) const -> bool = default;
};

struct ReturnStatement {
  ExpressionId value;

  auto operator==(const ReturnStatement&) const -> bool = default;
};

struct ReturnVoidStatement {
  auto operator==(const ReturnVoidStatement&) const -> bool = default;
};

struct DeclareStatement {
  Type type;
  std::string name;
  ExpressionId value;

  auto operator==(const DeclareStatement&) const -> bool = default;
};

struct AssignStatement {
  std::string name;
  ExpressionId value;

  auto operator==(const AssignStatement&) const -> bool = default;
};

// One arm of an if/else-if/else chain. Only the last arm may omit the
// condition.
struct IfBranch {
  std::optional<ExpressionId> condition;
  std::vector<StatementId> body;

  auto operator==(const IfBranch&) const -> bool = default;
};

struct IfChainStatement {
  std::vector<IfBranch> branches;

  auto operator==(const IfChainStatement&) const -> bool = default;
};

struct ForInStatement {
  Type element_type;
  std::string variable;
  ExpressionId iterable;
  std::vector<StatementId> body;

  auto operator==(const ForInStatement&) const -> bool = default;
};

struct WhileStatement {
  ExpressionId condition;
  std::vector<StatementId> body;

  auto operator==(const WhileStatement&) const -> bool = default;
};

struct BreakStatement {
  auto operator==(const BreakStatement&) const -> bool = default;
};

struct ContinueStatement {
  auto operator==(const ContinueStatement&) const -> bool = default;
};

// `list[T] name = init`. A list literal initializer is heap-allocated with
// element type T; any other initializer is bound as-is.
struct DeclareListStatement {
  Type element_type;
  std::string name;
  ExpressionId value;

  auto operator==(const DeclareListStatement&) const -> bool = default;
};

using StatementData = std::variant<
    ExpressionStatement, ReturnStatement, ReturnVoidStatement,
    DeclareStatement, AssignStatement, IfChainStatement, ForInStatement,
    WhileStatement, BreakStatement, ContinueStatement, DeclareListStatement>;

struct Statement {
  SourceSpan span;
  StatementData data;

  auto operator==(const Statement&) const -> bool = default;
};

}  // namespace arx::ast
