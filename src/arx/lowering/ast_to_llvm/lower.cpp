#include "arx/lowering/ast_to_llvm/lower.hpp"

#include <string>
#include <utility>

#include <fmt/core.h>

#include "arx/ast/program.hpp"
#include "arx/ast/type.hpp"
#include "arx/common/diagnostic.hpp"
#include "arx/common/internal_error.hpp"
#include "arx/lowering/ast_to_llvm/context.hpp"
#include "arx/lowering/ast_to_llvm/function.hpp"
#include "llvm/IR/BasicBlock.h"
#include "llvm/IR/DerivedTypes.h"
#include "llvm/IR/Verifier.h"
#include "llvm/Support/Host.h"
#include "llvm/Support/raw_ostream.h"

namespace arx::lowering::ast_to_llvm {

namespace {

// i32 main() { return _exec(); }
void EmitEntryWrapper(Context& ctx) {
  const ProgramFunction* entry = ctx.FindProgramFunction(kProgramEntryName);
  if (entry == nullptr || ctx.FindProgramFunction("main") != nullptr) {
    return;
  }
  const ast::Function& decl = *entry->decl;
  if (!decl.parameters.empty() || decl.return_type != ast::Type::Int()) {
    ThrowLoweringError(
        decl.span, ErrorCategory::kTypeMismatch,
        fmt::format(
            "entry function '{}' must take no parameters and return int",
            kProgramEntryName));
  }

  auto& llvm_ctx = ctx.GetLlvmContext();
  auto* fn_type =
      llvm::FunctionType::get(llvm::Type::getInt32Ty(llvm_ctx), false);
  auto* main_fn = llvm::Function::Create(
      fn_type, llvm::Function::ExternalLinkage, "main", &ctx.GetModule());
  auto& builder = ctx.GetBuilder();
  builder.SetInsertPoint(llvm::BasicBlock::Create(llvm_ctx, "entry", main_fn));
  builder.CreateRet(builder.CreateCall(entry->function, {}, "status"));
  builder.ClearInsertionPoint();

  if (llvm::verifyFunction(*main_fn, &llvm::errs())) {
    common::ThrowInternalError("EmitEntryWrapper", "invalid main wrapper");
  }
}

}  // namespace

auto LowerAstToLlvm(const LoweringInput& input) -> Result<LoweringResult> {
  if (input.unit == nullptr || input.externs == nullptr) {
    common::ThrowInternalError(
        "LowerAstToLlvm", "compilation unit and extern table are required");
  }

  try {
    Context ctx(*input.unit, *input.externs, input.module_name);
    ctx.GetModule().setSourceFileName(input.unit->source_path);
    ctx.GetModule().setTargetTriple(
        input.target_triple.empty() ? llvm::sys::getDefaultTargetTriple()
                                    : input.target_triple);

    const auto& functions = input.unit->program.functions;
    for (const auto& decl : functions) {
      DeclareFunction(ctx, decl);
    }
    for (const auto& decl : functions) {
      LowerFunctionBody(ctx, decl);
    }
    EmitEntryWrapper(ctx);

    auto [context, module] = ctx.TakeOwnership();
    return LoweringResult{
        .context = std::move(context), .module = std::move(module)};
  } catch (const DiagnosticException& e) {
    return std::unexpected(e.GetDiagnostic());
  }
}

auto DumpLlvmIr(const LoweringResult& result) -> std::string {
  std::string ir;
  llvm::raw_string_ostream os(ir);
  result.module->print(os, nullptr);
  return os.str();
}

}  // namespace arx::lowering::ast_to_llvm
