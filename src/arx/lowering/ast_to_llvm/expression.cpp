#include "arx/lowering/ast_to_llvm/expression.hpp"

#include <algorithm>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <fmt/core.h>

#include "arx/ast/expression.hpp"
#include "arx/ast/type.hpp"
#include "arx/common/diagnostic.hpp"
#include "arx/common/overloaded.hpp"
#include "arx/extern_link/type_tag.hpp"
#include "arx/lowering/ast_to_llvm/context.hpp"
#include "arx/lowering/ast_to_llvm/list_model.hpp"
#include "llvm/IR/Constants.h"
#include "llvm/IR/DerivedTypes.h"
#include "llvm/IR/InstrTypes.h"

namespace arx::lowering::ast_to_llvm {

namespace {

struct OperatorInfo {
  llvm::Instruction::BinaryOps int_op;
  llvm::Instruction::BinaryOps float_op;
};

auto LookupArithmetic(std::string_view op) -> std::optional<OperatorInfo> {
  if (op == "+") {
    return OperatorInfo{llvm::Instruction::Add, llvm::Instruction::FAdd};
  }
  if (op == "-") {
    return OperatorInfo{llvm::Instruction::Sub, llvm::Instruction::FSub};
  }
  if (op == "*") {
    return OperatorInfo{llvm::Instruction::Mul, llvm::Instruction::FMul};
  }
  if (op == "/") {
    return OperatorInfo{llvm::Instruction::SDiv, llvm::Instruction::FDiv};
  }
  if (op == "%") {
    return OperatorInfo{llvm::Instruction::SRem, llvm::Instruction::FRem};
  }
  return std::nullopt;
}

struct ComparisonInfo {
  llvm::CmpInst::Predicate int_pred;
  llvm::CmpInst::Predicate float_pred;
};

auto LookupComparison(std::string_view op) -> std::optional<ComparisonInfo> {
  if (op == "==") {
    return ComparisonInfo{llvm::CmpInst::ICMP_EQ, llvm::CmpInst::FCMP_OEQ};
  }
  if (op == "!=") {
    return ComparisonInfo{llvm::CmpInst::ICMP_NE, llvm::CmpInst::FCMP_ONE};
  }
  if (op == "<") {
    return ComparisonInfo{llvm::CmpInst::ICMP_SLT, llvm::CmpInst::FCMP_OLT};
  }
  if (op == "<=") {
    return ComparisonInfo{llvm::CmpInst::ICMP_SLE, llvm::CmpInst::FCMP_OLE};
  }
  if (op == ">") {
    return ComparisonInfo{llvm::CmpInst::ICMP_SGT, llvm::CmpInst::FCMP_OGT};
  }
  if (op == ">=") {
    return ComparisonInfo{llvm::CmpInst::ICMP_SGE, llvm::CmpInst::FCMP_OGE};
  }
  return std::nullopt;
}

// Void calls cannot carry a value name.
auto CallName(llvm::FunctionType* type, const std::string& name)
    -> std::string {
  return type->getReturnType()->isVoidTy() ? std::string() : name;
}

[[noreturn]] void ThrowUnimplementedOperator(
    SourceSpan span, const std::string& op, const ast::Type& type) {
  ThrowLoweringError(
      span, ErrorCategory::kUnsupported,
      fmt::format(
          "unimplemented operator '{}' for operands of type '{}'", op,
          type.ToString()));
}

auto LowerBinaryOp(
    Context& ctx, FunctionContext& fctx, const ast::BinaryOp& binop,
    SourceSpan span) -> TypedValue {
  auto& builder = ctx.GetBuilder();
  TypedValue lhs = LowerExpression(ctx, fctx, binop.lhs);
  TypedValue rhs = LowerExpression(ctx, fctx, binop.rhs);

  if (lhs.type != rhs.type) {
    ThrowLoweringError(
        span, ErrorCategory::kTypeMismatch,
        fmt::format(
            "operands of '{}' have different types: '{}' and '{}'", binop.op,
            lhs.type.ToString(), rhs.type.ToString()));
  }
  const ast::Type& type = lhs.type;

  if (type.kind == ast::TypeKind::kString) {
    if (binop.op == "==") {
      return TypedValue{
          .value = builder.CreateCall(
              ctx.GetCoreStringEqual(), {lhs.value, rhs.value}, "streq"),
          .type = ast::Type::Bool()};
    }
    if (binop.op == "+") {
      return TypedValue{
          .value = builder.CreateCall(
              ctx.GetCoreStringConcat(), {lhs.value, rhs.value}, "strcat"),
          .type = ast::Type::String()};
    }
  }

  if (auto arith = LookupArithmetic(binop.op)) {
    if (type.kind == ast::TypeKind::kInt) {
      return TypedValue{
          .value = builder.CreateBinOp(arith->int_op, lhs.value, rhs.value),
          .type = type};
    }
    if (type.kind == ast::TypeKind::kFloat) {
      return TypedValue{
          .value = builder.CreateBinOp(arith->float_op, lhs.value, rhs.value),
          .type = type};
    }
    ThrowUnimplementedOperator(span, binop.op, type);
  }

  if (auto cmp = LookupComparison(binop.op)) {
    if (type.kind == ast::TypeKind::kFloat) {
      return TypedValue{
          .value = builder.CreateFCmp(cmp->float_pred, lhs.value, rhs.value),
          .type = ast::Type::Bool()};
    }
    if (type.IsVoid()) {
      ThrowUnimplementedOperator(span, binop.op, type);
    }
    // int, bool and pointer-shaped operands compare as signed integers
    return TypedValue{
        .value = builder.CreateICmp(cmp->int_pred, lhs.value, rhs.value),
        .type = ast::Type::Bool()};
  }

  ThrowUnimplementedOperator(span, binop.op, type);
}

auto LowerArguments(
    Context& ctx, FunctionContext& fctx,
    const std::vector<ast::ExpressionId>& arguments)
    -> std::vector<TypedValue> {
  std::vector<TypedValue> values;
  values.reserve(arguments.size());
  for (ast::ExpressionId arg : arguments) {
    values.push_back(LowerExpression(ctx, fctx, arg));
  }
  return values;
}

auto ValuesOf(const std::vector<TypedValue>& args)
    -> std::vector<llvm::Value*> {
  std::vector<llvm::Value*> values;
  values.reserve(args.size());
  for (const auto& arg : args) {
    values.push_back(arg.value);
  }
  return values;
}

auto FormatArgumentTypes(const std::vector<TypedValue>& args) -> std::string {
  std::string out;
  for (const auto& arg : args) {
    if (!out.empty()) {
      out += ", ";
    }
    out += arg.type.ToString();
  }
  return out;
}

auto LowerProgramCall(
    Context& ctx, const ProgramFunction& callee,
    const std::vector<TypedValue>& args, SourceSpan span) -> TypedValue {
  const auto& params = callee.decl->parameters;
  if (params.size() != args.size()) {
    ThrowLoweringError(
        span, ErrorCategory::kTypeMismatch,
        fmt::format(
            "'{}' expects {} argument(s), got {}", callee.decl->name,
            params.size(), args.size()));
  }
  for (std::size_t i = 0; i < params.size(); ++i) {
    if (params[i].type != args[i].type) {
      ThrowLoweringError(
          span, ErrorCategory::kTypeMismatch,
          fmt::format(
              "argument {} of '{}' has type '{}', expected '{}'", i + 1,
              callee.decl->name, args[i].type.ToString(),
              params[i].type.ToString()));
    }
  }
  auto* fn_type = callee.function->getFunctionType();
  auto* call = ctx.GetBuilder().CreateCall(
      callee.function, ValuesOf(args), CallName(fn_type, "call"));
  return TypedValue{.value = call, .type = callee.decl->return_type};
}

// A bare call to a name that is not a program function refers to a C
// function. The first call site fixes its signature as `i32 name(args)`.
auto LowerForeignCall(
    Context& ctx, const ast::Call& call, const std::vector<TypedValue>& args,
    SourceSpan span) -> TypedValue {
  std::vector<llvm::Type*> param_types;
  param_types.reserve(args.size());
  for (const auto& arg : args) {
    param_types.push_back(ctx.GetLlvmType(arg.type));
  }

  llvm::Function* fn = ctx.FindDeclaration(call.callee);
  if (fn == nullptr) {
    auto* fn_type = llvm::FunctionType::get(
        llvm::Type::getInt32Ty(ctx.GetLlvmContext()), param_types, false);
    fn = ctx.DeclareExternal(call.callee, fn_type, span);
  } else {
    auto* existing = fn->getFunctionType();
    bool matches = existing->getNumParams() == param_types.size();
    for (std::size_t i = 0; matches && i < param_types.size(); ++i) {
      matches = existing->getParamType(static_cast<unsigned>(i)) ==
                param_types[i];
    }
    if (!matches) {
      ThrowLoweringError(
          span, ErrorCategory::kTypeMismatch,
          fmt::format(
              "call to '{}' with arguments ({}) does not match its earlier "
              "declaration",
              call.callee, FormatArgumentTypes(args)));
    }
  }

  auto return_type = ctx.GetSourceType(fn->getReturnType());
  if (!return_type) {
    ThrowLoweringError(
        span, ErrorCategory::kUnsupported,
        fmt::format(
            "'{}' returns a type with no source equivalent", call.callee));
  }
  auto* result = ctx.GetBuilder().CreateCall(
      fn, ValuesOf(args), CallName(fn->getFunctionType(), "call"));
  return TypedValue{.value = result, .type = *return_type};
}

auto LowerCall(
    Context& ctx, FunctionContext& fctx, const ast::Call& call,
    SourceSpan span) -> TypedValue {
  auto args = LowerArguments(ctx, fctx, call.arguments);
  if (const auto* callee = ctx.FindProgramFunction(call.callee)) {
    return LowerProgramCall(ctx, *callee, args, span);
  }
  return LowerForeignCall(ctx, call, args, span);
}

auto LowerMethodCall(
    Context& ctx, FunctionContext& fctx, const ast::MethodCall& call,
    SourceSpan span) -> TypedValue {
  auto qualified = fmt::format("{}.{}", call.object, call.method);
  const auto* overloads = ctx.GetExterns().Find(qualified);
  if (overloads == nullptr) {
    ThrowLoweringError(
        span, ErrorCategory::kUnresolvedReference,
        fmt::format("extern function '{}' not found", qualified));
  }

  auto args = LowerArguments(ctx, fctx, call.arguments);
  extern_link::ArgumentTags tags;
  tags.reserve(args.size());
  for (const auto& arg : args) {
    tags.push_back(extern_link::TagOf(arg.type));
  }

  auto it = overloads->find(tags);
  if (it == overloads->end()) {
    auto diag = Diagnostic::Error(
        span, ErrorCategory::kOverloadMismatch,
        fmt::format(
            "no matching overload for '{}({})'", qualified,
            extern_link::FormatTags(tags)));
    std::vector<std::string> candidates;
    for (const auto& [candidate_tags, target] : *overloads) {
      candidates.push_back(
          fmt::format(
              "candidate: {}({}) -> {}", qualified,
              extern_link::FormatTags(candidate_tags), target.symbol));
    }
    std::ranges::sort(candidates);
    for (auto& note : candidates) {
      diag = std::move(diag).WithNote(std::move(note));
    }
    throw DiagnosticException(std::move(diag));
  }

  const auto& target = it->second;
  ast::Type return_type = extern_link::TypeFromTag(target.return_tag);
  std::vector<llvm::Type*> param_types;
  param_types.reserve(args.size());
  for (const auto& arg : args) {
    param_types.push_back(ctx.GetLlvmType(arg.type));
  }
  auto* fn_type = llvm::FunctionType::get(
      ctx.GetLlvmType(return_type), param_types, false);
  llvm::Function* fn = ctx.DeclareExternal(target.symbol, fn_type, span);
  auto* result = ctx.GetBuilder().CreateCall(
      fn, ValuesOf(args), CallName(fn_type, "ext"));
  return TypedValue{.value = result, .type = return_type};
}

}  // namespace

auto LowerExpression(
    Context& ctx, FunctionContext& fctx, ast::ExpressionId expr_id)
    -> TypedValue {
  const ast::Expression& expr = ctx.GetArena()[expr_id];
  auto& builder = ctx.GetBuilder();
  auto& llvm_ctx = ctx.GetLlvmContext();

  return std::visit(
      Overloaded{
          [&](const ast::IntLiteral& lit) -> TypedValue {
            return TypedValue{
                .value = llvm::ConstantInt::getSigned(
                    llvm::Type::getInt32Ty(llvm_ctx), lit.value),
                .type = ast::Type::Int()};
          },
          [&](const ast::FloatLiteral& lit) -> TypedValue {
            return TypedValue{
                .value = llvm::ConstantFP::get(
                    llvm::Type::getDoubleTy(llvm_ctx), lit.value),
                .type = ast::Type::Float()};
          },
          [&](const ast::BoolLiteral& lit) -> TypedValue {
            return TypedValue{
                .value = builder.getInt1(lit.value),
                .type = ast::Type::Bool()};
          },
          [&](const ast::StringLiteral& lit) -> TypedValue {
            return TypedValue{
                .value = ctx.CreateStringConstant(lit.value),
                .type = ast::Type::String()};
          },
          [&](const ast::VariableRef& var) -> TypedValue {
            const VariableBinding* binding = fctx.Lookup(var.name);
            if (binding == nullptr) {
              ThrowLoweringError(
                  expr.span, ErrorCategory::kUnresolvedReference,
                  fmt::format("undefined variable '{}'", var.name));
            }
            return TypedValue{
                .value = builder.CreateLoad(
                    ctx.GetLlvmType(binding->type), binding->storage,
                    var.name),
                .type = binding->type};
          },
          [&](const ast::BinaryOp& binop) -> TypedValue {
            return LowerBinaryOp(ctx, fctx, binop, expr.span);
          },
          [&](const ast::Call& call) -> TypedValue {
            return LowerCall(ctx, fctx, call, expr.span);
          },
          [&](const ast::MethodCall& call) -> TypedValue {
            return LowerMethodCall(ctx, fctx, call, expr.span);
          },
          [&](const ast::ListLiteral& list) -> TypedValue {
            return LowerListLiteral(ctx, fctx, std::nullopt, list, expr.span);
          },
      },
      expr.data);
}

}  // namespace arx::lowering::ast_to_llvm
