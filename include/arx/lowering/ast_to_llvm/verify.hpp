#pragma once

#include <cstddef>

#include "arx/lowering/ast_to_llvm/context.hpp"
#include "llvm/IR/BasicBlock.h"
#include "llvm/IR/Function.h"

namespace arx::lowering::ast_to_llvm {

// Erase every block not reachable from the entry block. Returns how many
// were removed.
auto RemoveUnreachableBlocks(llvm::Function& function) -> std::size_t;

// Whole-function sweep after the body is lowered. `current` is the block the
// builder ended in. Unreachable blocks are dropped; a reachable block without
// a terminator is a structural error ("falls off the end" when it is
// `current`). An IR verifier failure is an internal error.
void FinalizeFunction(FunctionContext& fctx, llvm::BasicBlock* current);

}  // namespace arx::lowering::ast_to_llvm
