#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "arx/ast/expression.hpp"
#include "arx/ast/program.hpp"
#include "arx/ast/statement.hpp"

namespace arx::ast {

class Arena final {
 public:
  Arena() = default;
  ~Arena() = default;

  Arena(const Arena&) = delete;
  auto operator=(const Arena&) -> Arena& = delete;

  Arena(Arena&&) = default;
  auto operator=(Arena&&) -> Arena& = default;

  auto AddExpression(Expression expr) -> ExpressionId {
    ExpressionId id{static_cast<uint32_t>(expressions_.size())};
    expressions_.push_back(std::move(expr));
    return id;
  }

  auto AddStatement(Statement stmt) -> StatementId {
    StatementId id{static_cast<uint32_t>(statements_.size())};
    statements_.push_back(std::move(stmt));
    return id;
  }

  [[nodiscard]] auto operator[](ExpressionId id) const -> const Expression& {
    return expressions_.at(id.value);
  }

  [[nodiscard]] auto operator[](StatementId id) const -> const Statement& {
    return statements_.at(id.value);
  }

  [[nodiscard]] auto ExpressionCount() const -> size_t {
    return expressions_.size();
  }
  [[nodiscard]] auto StatementCount() const -> size_t {
    return statements_.size();
  }

 private:
  std::vector<Expression> expressions_;
  std::vector<Statement> statements_;
};

// A loaded AST: the arena owning every node plus the program that refers
// into it.
struct CompilationUnit {
  std::string source_path;
  Arena arena;
  Program program;
};

}  // namespace arx::ast
