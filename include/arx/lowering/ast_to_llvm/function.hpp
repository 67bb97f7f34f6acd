#pragma once

#include "arx/ast/program.hpp"
#include "arx/lowering/ast_to_llvm/context.hpp"
#include "llvm/IR/Function.h"

namespace arx::lowering::ast_to_llvm {

// Create the IR function for `decl` and register it for calls. Run for every
// function before any body is lowered.
auto DeclareFunction(Context& ctx, const ast::Function& decl)
    -> llvm::Function*;

// Lower the body of a declared function and run the verification sweep.
void LowerFunctionBody(Context& ctx, const ast::Function& decl);

}  // namespace arx::lowering::ast_to_llvm
