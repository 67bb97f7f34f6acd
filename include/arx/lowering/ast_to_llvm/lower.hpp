#pragma once

#include <memory>
#include <string>

#include "arx/ast/arena.hpp"
#include "arx/common/diagnostic.hpp"
#include "arx/extern_link/resolver.hpp"
#include "llvm/IR/LLVMContext.h"
#include "llvm/IR/Module.h"

namespace arx::lowering::ast_to_llvm {

// Function a C `main` wrapper is generated for when the program defines no
// `main` of its own.
inline constexpr const char* kProgramEntryName = "_exec";

struct LoweringInput {
  const ast::CompilationUnit* unit = nullptr;
  const extern_link::OverloadTable* externs = nullptr;
  std::string module_name = "arx";
  std::string target_triple;  // Empty: host default
};

struct LoweringResult {
  std::unique_ptr<llvm::LLVMContext> context;
  std::unique_ptr<llvm::Module> module;
};

// Lower a whole compilation unit into one module. The first error aborts the
// unit and is returned as the diagnostic.
auto LowerAstToLlvm(const LoweringInput& input) -> Result<LoweringResult>;

auto DumpLlvmIr(const LoweringResult& result) -> std::string;

}  // namespace arx::lowering::ast_to_llvm
