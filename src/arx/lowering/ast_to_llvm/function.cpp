#include "arx/lowering/ast_to_llvm/function.hpp"

#include <vector>

#include <fmt/core.h>

#include "arx/ast/program.hpp"
#include "arx/common/diagnostic.hpp"
#include "arx/common/internal_error.hpp"
#include "arx/lowering/ast_to_llvm/context.hpp"
#include "arx/lowering/ast_to_llvm/statement.hpp"
#include "arx/lowering/ast_to_llvm/verify.hpp"
#include "llvm/IR/BasicBlock.h"
#include "llvm/IR/DerivedTypes.h"

namespace arx::lowering::ast_to_llvm {

auto DeclareFunction(Context& ctx, const ast::Function& decl)
    -> llvm::Function* {
  if (ctx.FindProgramFunction(decl.name) != nullptr ||
      ctx.GetModule().getFunction(decl.name) != nullptr) {
    ThrowLoweringError(
        decl.span, ErrorCategory::kStructural,
        fmt::format("function '{}' is defined more than once", decl.name));
  }

  std::vector<llvm::Type*> param_types;
  param_types.reserve(decl.parameters.size());
  for (const auto& param : decl.parameters) {
    if (param.type.IsVoid()) {
      ThrowLoweringError(
          decl.span, ErrorCategory::kTypeMismatch,
          fmt::format(
              "parameter '{}' of '{}' cannot be void", param.name, decl.name));
    }
    param_types.push_back(ctx.GetLlvmType(param.type));
  }

  auto* fn_type = llvm::FunctionType::get(
      ctx.GetLlvmType(decl.return_type), param_types, false);
  auto* fn = llvm::Function::Create(
      fn_type, llvm::Function::ExternalLinkage, decl.name, &ctx.GetModule());
  for (unsigned i = 0; i < fn->arg_size(); ++i) {
    fn->getArg(i)->setName(decl.parameters[i].name);
  }

  ctx.RegisterProgramFunction(
      decl.name, ProgramFunction{.function = fn, .decl = &decl});
  return fn;
}

void LowerFunctionBody(Context& ctx, const ast::Function& decl) {
  const ProgramFunction* registered = ctx.FindProgramFunction(decl.name);
  if (registered == nullptr || registered->decl != &decl) {
    common::ThrowInternalError(
        "LowerFunctionBody",
        fmt::format("function '{}' was not declared", decl.name));
  }
  llvm::Function& fn = *registered->function;
  auto& builder = ctx.GetBuilder();

  llvm::BasicBlock* entry =
      llvm::BasicBlock::Create(ctx.GetLlvmContext(), "entry", &fn);
  builder.SetInsertPoint(entry);

  FunctionContext fctx(ctx, fn, decl);
  for (unsigned i = 0; i < fn.arg_size(); ++i) {
    const auto& param = decl.parameters[i];
    llvm::AllocaInst* slot =
        fctx.CreateSlot(ctx.GetLlvmType(param.type), param.name + ".addr");
    builder.CreateStore(fn.getArg(i), slot);
    fctx.Bind(param.name, VariableBinding{.storage = slot, .type = param.type});
  }

  LowerStatements(ctx, fctx, decl.body);
  llvm::BasicBlock* current = builder.GetInsertBlock();
  builder.ClearInsertionPoint();
  FinalizeFunction(fctx, current);
}

}  // namespace arx::lowering::ast_to_llvm
