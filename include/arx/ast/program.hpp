#pragma once

#include <string>
#include <vector>

#include "arx/ast/fwd.hpp"
#include "arx/ast/type.hpp"
#include "arx/common/source_span.hpp"

namespace arx::ast {

struct Parameter {
  Type type;
  std::string name;
};

struct Function {
  std::string name;
  std::vector<Parameter> parameters;
  Type return_type;
  std::vector<StatementId> body;
  SourceSpan span;
};

struct Program {
  // Extern modules requested by the program, in addition to `core`.
  std::vector<std::string> uses;
  std::vector<Function> functions;
};

}  // namespace arx::ast
