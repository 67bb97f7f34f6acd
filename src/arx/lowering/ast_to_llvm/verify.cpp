#include "arx/lowering/ast_to_llvm/verify.hpp"

#include <cstddef>
#include <string>
#include <vector>

#include <fmt/core.h>

#include "absl/container/flat_hash_set.h"
#include "arx/common/diagnostic.hpp"
#include "arx/common/internal_error.hpp"
#include "arx/lowering/ast_to_llvm/context.hpp"
#include "llvm/IR/CFG.h"
#include "llvm/IR/Verifier.h"
#include "llvm/Support/raw_ostream.h"

namespace arx::lowering::ast_to_llvm {

namespace {

auto CollectReachable(llvm::Function& function)
    -> absl::flat_hash_set<const llvm::BasicBlock*> {
  absl::flat_hash_set<const llvm::BasicBlock*> reachable;
  if (function.empty()) {
    return reachable;
  }
  std::vector<llvm::BasicBlock*> worklist{&function.getEntryBlock()};
  reachable.insert(&function.getEntryBlock());
  while (!worklist.empty()) {
    llvm::BasicBlock* block = worklist.back();
    worklist.pop_back();
    if (block->getTerminator() == nullptr) {
      continue;
    }
    for (llvm::BasicBlock* succ : llvm::successors(block)) {
      if (reachable.insert(succ).second) {
        worklist.push_back(succ);
      }
    }
  }
  return reachable;
}

auto EraseBlocksExcept(
    llvm::Function& function,
    const absl::flat_hash_set<const llvm::BasicBlock*>& keep) -> std::size_t {
  std::vector<llvm::BasicBlock*> dead;
  for (llvm::BasicBlock& block : function) {
    if (!keep.contains(&block)) {
      dead.push_back(&block);
    }
  }
  // Drop all edges first so dead blocks that branch to each other can go.
  for (llvm::BasicBlock* block : dead) {
    block->dropAllReferences();
  }
  for (llvm::BasicBlock* block : dead) {
    block->eraseFromParent();
  }
  return dead.size();
}

}  // namespace

auto RemoveUnreachableBlocks(llvm::Function& function) -> std::size_t {
  return EraseBlocksExcept(function, CollectReachable(function));
}

void FinalizeFunction(FunctionContext& fctx, llvm::BasicBlock* current) {
  llvm::Function& function = fctx.GetFunction();
  const ast::Function& decl = fctx.GetDecl();
  auto reachable = CollectReachable(function);

  if (current != nullptr && reachable.contains(current) &&
      current->getTerminator() == nullptr) {
    ThrowLoweringError(
        decl.span, ErrorCategory::kStructural,
        fmt::format(
            "function '{}' falls off the end without returning", decl.name));
  }
  for (llvm::BasicBlock& block : function) {
    if (reachable.contains(&block) && block.getTerminator() == nullptr) {
      ThrowLoweringError(
          decl.span, ErrorCategory::kStructural,
          fmt::format(
              "block '{}' in function '{}' has no terminator",
              block.getName().str(), decl.name));
    }
  }

  EraseBlocksExcept(function, reachable);

  std::string errors;
  llvm::raw_string_ostream os(errors);
  if (llvm::verifyFunction(function, &os)) {
    common::ThrowInternalError(
        "FinalizeFunction",
        fmt::format(
            "IR verification failed for '{}': {}", decl.name, os.str()));
  }
}

}  // namespace arx::lowering::ast_to_llvm
