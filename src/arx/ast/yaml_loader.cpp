#include "arx/ast/yaml_loader.hpp"

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <initializer_list>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include <fmt/core.h>
// NOLINTNEXTLINE(misc-include-cleaner): yaml.h is the public API
#include <yaml-cpp/yaml.h>

#include "arx/ast/arena.hpp"
#include "arx/ast/expression.hpp"
#include "arx/ast/statement.hpp"
#include "arx/ast/type.hpp"
#include "arx/common/diagnostic.hpp"

namespace arx::ast {

namespace {

auto SpanOf(const YAML::Node& node) -> SourceSpan {
  auto mark = node.Mark();
  if (mark.line < 0) {
    return SourceSpan{};
  }
  return SourceSpan{
      .line = static_cast<uint32_t>(mark.line + 1),
      .column = static_cast<uint32_t>(mark.column + 1)};
}

[[noreturn]] void ThrowMalformed(const YAML::Node& node, std::string msg) {
  throw DiagnosticException(
      Diagnostic::HostError(
          SpanOf(node), ErrorCategory::kInput, std::move(msg)));
}

void ValidateKeys(
    const YAML::Node& node, std::initializer_list<std::string_view> allowed,
    std::string_view context) {
  for (const auto& pair : node) {
    auto key = pair.first.as<std::string>();
    if (std::ranges::find(allowed, key) == allowed.end()) {
      ThrowMalformed(
          pair.first, fmt::format("unknown field '{}' in {}", key, context));
    }
  }
}

auto RequireField(
    const YAML::Node& node, const char* key, std::string_view context)
    -> YAML::Node {
  auto field = node[key];
  if (!field) {
    ThrowMalformed(
        node, fmt::format("missing field '{}' in {}", key, context));
  }
  return field;
}

template <typename T>
auto ScalarAs(const YAML::Node& node, std::string_view what) -> T {
  if (!node.IsScalar()) {
    ThrowMalformed(node, fmt::format("expected a scalar {}", what));
  }
  try {
    return node.as<T>();
  } catch (const YAML::BadConversion&) {
    ThrowMalformed(
        node, fmt::format("'{}' is not a valid {}", node.Scalar(), what));
  }
}

auto ParseTypeNode(const YAML::Node& node) -> Type {
  auto spelling = ScalarAs<std::string>(node, "type name");
  auto type = ParseType(spelling);
  if (!type) {
    ThrowMalformed(node, fmt::format("unknown type '{}'", spelling));
  }
  return *std::move(type);
}

// Single-key map `{key: payload}`; returns the key and its payload node.
auto SplitTagged(const YAML::Node& node, std::string_view what)
    -> std::pair<std::string, YAML::Node> {
  if (!node.IsMap() || node.size() != 1) {
    ThrowMalformed(
        node, fmt::format("{} must be a map with exactly one key", what));
  }
  auto entry = *node.begin();
  return {entry.first.as<std::string>(), entry.second};
}

class AstLoader {
 public:
  explicit AstLoader(Arena& arena) : arena_(arena) {
  }

  auto LoadProgram(const YAML::Node& root) -> Program {
    if (!root.IsMap()) {
      ThrowMalformed(root, "AST document must be a map");
    }
    ValidateKeys(root, {"uses", "functions"}, "document root");

    Program program;
    if (auto uses = root["uses"]) {
      if (!uses.IsSequence()) {
        ThrowMalformed(uses, "'uses' must be a list of module names");
      }
      for (const auto& module : uses) {
        program.uses.push_back(ScalarAs<std::string>(module, "module name"));
      }
    }

    auto functions = RequireField(root, "functions", "document root");
    if (!functions.IsSequence()) {
      ThrowMalformed(functions, "'functions' must be a list");
    }
    for (const auto& node : functions) {
      program.functions.push_back(LoadFunction(node));
    }
    return program;
  }

 private:
  auto LoadFunction(const YAML::Node& node) -> Function {
    if (!node.IsMap()) {
      ThrowMalformed(node, "function must be a map");
    }
    ValidateKeys(node, {"name", "return", "params", "body"}, "function");

    Function function{
        .name = ScalarAs<std::string>(
            RequireField(node, "name", "function"), "function name"),
        .parameters = {},
        .return_type = Type::Void(),
        .body = {},
        .span = SpanOf(node),
    };
    if (auto ret = node["return"]) {
      function.return_type = ParseTypeNode(ret);
    }
    if (auto params = node["params"]) {
      if (!params.IsSequence()) {
        ThrowMalformed(params, "'params' must be a list");
      }
      for (const auto& param : params) {
        ValidateKeys(param, {"type", "name"}, "parameter");
        function.parameters.push_back(
            Parameter{
                .type = ParseTypeNode(RequireField(param, "type", "parameter")),
                .name = ScalarAs<std::string>(
                    RequireField(param, "name", "parameter"),
                    "parameter name"),
            });
      }
    }
    function.body = LoadBody(RequireField(node, "body", "function"));
    return function;
  }

  auto LoadBody(const YAML::Node& node) -> std::vector<StatementId> {
    if (node.IsNull()) {
      return {};
    }
    if (!node.IsSequence()) {
      ThrowMalformed(node, "statement body must be a list");
    }
    std::vector<StatementId> body;
    body.reserve(node.size());
    for (const auto& stmt : node) {
      body.push_back(LoadStatement(stmt));
    }
    return body;
  }

  auto LoadStatement(const YAML::Node& node) -> StatementId {
    auto span = SpanOf(node);

    // `- break`, `- continue` and `- return` written as bare scalars
    if (node.IsScalar()) {
      const auto& word = node.Scalar();
      if (word == "return") {
        return Add(span, ReturnVoidStatement{});
      }
      if (word == "break") {
        return Add(span, BreakStatement{});
      }
      if (word == "continue") {
        return Add(span, ContinueStatement{});
      }
      ThrowMalformed(node, fmt::format("unknown statement '{}'", word));
    }

    auto [key, payload] = SplitTagged(node, "statement");
    if (key == "expr") {
      return Add(
          span, ExpressionStatement{.expression = LoadExpression(payload)});
    }
    if (key == "return") {
      if (payload.IsNull()) {
        return Add(span, ReturnVoidStatement{});
      }
      return Add(span, ReturnStatement{.value = LoadExpression(payload)});
    }
    if (key == "declare") {
      ValidateKeys(payload, {"type", "name", "value"}, "declare");
      return Add(
          span,
          DeclareStatement{
              .type = ParseTypeNode(RequireField(payload, "type", "declare")),
              .name = ScalarAs<std::string>(
                  RequireField(payload, "name", "declare"), "variable name"),
              .value =
                  LoadExpression(RequireField(payload, "value", "declare")),
          });
    }
    if (key == "assign") {
      ValidateKeys(payload, {"name", "value"}, "assign");
      return Add(
          span, AssignStatement{
                    .name = ScalarAs<std::string>(
                        RequireField(payload, "name", "assign"),
                        "variable name"),
                    .value = LoadExpression(
                        RequireField(payload, "value", "assign")),
                });
    }
    if (key == "if") {
      return Add(span, LoadIfChain(payload));
    }
    if (key == "for") {
      ValidateKeys(payload, {"type", "var", "in", "body"}, "for");
      auto iterable = LoadExpression(RequireField(payload, "in", "for"));
      return Add(
          span,
          ForInStatement{
              .element_type =
                  ParseTypeNode(RequireField(payload, "type", "for")),
              .variable = ScalarAs<std::string>(
                  RequireField(payload, "var", "for"), "loop variable"),
              .iterable = iterable,
              .body = LoadBody(RequireField(payload, "body", "for")),
          });
    }
    if (key == "while") {
      ValidateKeys(payload, {"cond", "body"}, "while");
      auto condition = LoadExpression(RequireField(payload, "cond", "while"));
      return Add(
          span, WhileStatement{
                    .condition = condition,
                    .body = LoadBody(RequireField(payload, "body", "while")),
                });
    }
    if (key == "break") {
      return Add(span, BreakStatement{});
    }
    if (key == "continue") {
      return Add(span, ContinueStatement{});
    }
    if (key == "declare_list") {
      ValidateKeys(payload, {"type", "name", "value"}, "declare_list");
      return Add(
          span,
          DeclareListStatement{
              .element_type =
                  ParseTypeNode(RequireField(payload, "type", "declare_list")),
              .name = ScalarAs<std::string>(
                  RequireField(payload, "name", "declare_list"),
                  "variable name"),
              .value = LoadExpression(
                  RequireField(payload, "value", "declare_list")),
          });
    }
    ThrowMalformed(node, fmt::format("unknown statement kind '{}'", key));
  }

  auto LoadIfChain(const YAML::Node& node) -> IfChainStatement {
    if (!node.IsSequence() || node.size() == 0) {
      ThrowMalformed(node, "'if' must be a non-empty list of branches");
    }
    IfChainStatement chain;
    for (std::size_t i = 0; i < node.size(); ++i) {
      const auto& branch = node[i];
      ValidateKeys(branch, {"cond", "body"}, "if branch");
      IfBranch arm;
      if (auto cond = branch["cond"]) {
        arm.condition = LoadExpression(cond);
      } else if (i + 1 != node.size()) {
        ThrowMalformed(
            branch, "only the last branch of an if chain may omit 'cond'");
      }
      arm.body = LoadBody(RequireField(branch, "body", "if branch"));
      chain.branches.push_back(std::move(arm));
    }
    return chain;
  }

  auto LoadArguments(const YAML::Node& node) -> std::vector<ExpressionId> {
    std::vector<ExpressionId> arguments;
    if (!node || node.IsNull()) {
      return arguments;
    }
    if (!node.IsSequence()) {
      ThrowMalformed(node, "'args' must be a list");
    }
    for (const auto& arg : node) {
      arguments.push_back(LoadExpression(arg));
    }
    return arguments;
  }

  auto LoadExpression(const YAML::Node& node) -> ExpressionId {
    auto span = SpanOf(node);
    auto [key, payload] = SplitTagged(node, "expression");

    if (key == "int") {
      auto value = ScalarAs<int64_t>(payload, "int");
      if (value < std::numeric_limits<int32_t>::min() ||
          value > std::numeric_limits<int32_t>::max()) {
        ThrowMalformed(
            payload,
            fmt::format("integer literal {} is out of range for 'int'", value));
      }
      return Add(span, IntLiteral{.value = value});
    }
    if (key == "float") {
      return Add(
          span, FloatLiteral{.value = ScalarAs<double>(payload, "float")});
    }
    if (key == "bool") {
      return Add(span, BoolLiteral{.value = ScalarAs<bool>(payload, "bool")});
    }
    if (key == "str") {
      return Add(
          span,
          StringLiteral{.value = ScalarAs<std::string>(payload, "string")});
    }
    if (key == "var") {
      return Add(
          span,
          VariableRef{.name = ScalarAs<std::string>(payload, "variable name")});
    }
    if (key == "binop") {
      ValidateKeys(payload, {"op", "lhs", "rhs"}, "binop");
      auto lhs = LoadExpression(RequireField(payload, "lhs", "binop"));
      auto rhs = LoadExpression(RequireField(payload, "rhs", "binop"));
      return Add(
          span, BinaryOp{
                    .op = ScalarAs<std::string>(
                        RequireField(payload, "op", "binop"), "operator"),
                    .lhs = lhs,
                    .rhs = rhs,
                });
    }
    if (key == "call") {
      ValidateKeys(payload, {"name", "args"}, "call");
      return Add(
          span, Call{
                    .callee = ScalarAs<std::string>(
                        RequireField(payload, "name", "call"), "callee"),
                    .arguments = LoadArguments(payload["args"]),
                });
    }
    if (key == "method") {
      ValidateKeys(payload, {"object", "name", "args"}, "method");
      return Add(
          span, MethodCall{
                    .object = ScalarAs<std::string>(
                        RequireField(payload, "object", "method"), "module"),
                    .method = ScalarAs<std::string>(
                        RequireField(payload, "name", "method"), "method"),
                    .arguments = LoadArguments(payload["args"]),
                });
    }
    if (key == "list") {
      ListLiteral literal;
      if (!payload.IsNull()) {
        if (!payload.IsSequence()) {
          ThrowMalformed(payload, "'list' must be a list of expressions");
        }
        for (const auto& element : payload) {
          literal.elements.push_back(LoadExpression(element));
        }
      }
      return Add(span, std::move(literal));
    }
    ThrowMalformed(node, fmt::format("unknown expression kind '{}'", key));
  }

  auto Add(SourceSpan span, ExpressionData data) -> ExpressionId {
    return arena_.AddExpression(
        Expression{.span = span, .data = std::move(data)});
  }

  auto Add(SourceSpan span, StatementData data) -> StatementId {
    return arena_.AddStatement(
        Statement{.span = span, .data = std::move(data)});
  }

  Arena& arena_;
};

auto LoadFromNode(const YAML::Node& root, std::string source_path)
    -> CompilationUnit {
  CompilationUnit unit{
      .source_path = std::move(source_path), .arena = {}, .program = {}};
  AstLoader loader(unit.arena);
  unit.program = loader.LoadProgram(root);
  return unit;
}

auto FromYamlException(const YAML::Exception& e) -> Diagnostic {
  SourceSpan span{};
  if (e.mark.line >= 0) {
    span = SourceSpan{
        .line = static_cast<uint32_t>(e.mark.line + 1),
        .column = static_cast<uint32_t>(e.mark.column + 1)};
  }
  return Diagnostic::HostError(span, ErrorCategory::kInput, e.msg);
}

}  // namespace

auto LoadCompilationUnitFromString(
    std::string_view text, std::string source_path)
    -> Result<CompilationUnit> {
  try {
    auto root = YAML::Load(std::string(text));
    return LoadFromNode(root, std::move(source_path));
  } catch (const DiagnosticException& e) {
    return std::unexpected(e.GetDiagnostic());
  } catch (const YAML::Exception& e) {
    return std::unexpected(FromYamlException(e));
  }
}

auto LoadCompilationUnitFromFile(const std::filesystem::path& path)
    -> Result<CompilationUnit> {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return std::unexpected(
        Diagnostic::HostError(
            ErrorCategory::kInput,
            fmt::format("cannot open AST file '{}'", path.string())));
  }
  try {
    auto root = YAML::LoadFile(path.string());
    return LoadFromNode(root, path.string());
  } catch (const DiagnosticException& e) {
    return std::unexpected(e.GetDiagnostic());
  } catch (const YAML::Exception& e) {
    return std::unexpected(FromYamlException(e));
  }
}

}  // namespace arx::ast
