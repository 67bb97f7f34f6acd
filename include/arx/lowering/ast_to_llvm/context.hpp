#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "arx/ast/arena.hpp"
#include "arx/ast/type.hpp"
#include "arx/common/diagnostic.hpp"
#include "arx/extern_link/resolver.hpp"
#include "llvm/IR/IRBuilder.h"
#include "llvm/IR/LLVMContext.h"
#include "llvm/IR/Module.h"

namespace arx::lowering::ast_to_llvm {

// Result of lowering one expression: the IR value and its source type.
struct TypedValue {
  llvm::Value* value;
  ast::Type type;
};

// Identifier binding: stack slot in the entry block plus static type.
struct VariableBinding {
  llvm::AllocaInst* storage;
  ast::Type type;
};

struct ProgramFunction {
  llvm::Function* function;
  const ast::Function* decl;
};

// Abort lowering of the compilation unit with a user-facing error.
[[noreturn]] void ThrowLoweringError(
    SourceSpan span, ErrorCategory category, std::string message);

// Module-wide state for AST -> LLVM lowering
class Context {
 public:
  Context(
      const ast::CompilationUnit& unit,
      const extern_link::OverloadTable& externs,
      const std::string& module_name);

  [[nodiscard]] auto GetLlvmContext() -> llvm::LLVMContext& {
    return *llvm_context_;
  }
  [[nodiscard]] auto GetModule() -> llvm::Module& {
    return *llvm_module_;
  }
  [[nodiscard]] auto GetBuilder() -> llvm::IRBuilder<>& {
    return builder_;
  }
  [[nodiscard]] auto GetArena() const -> const ast::Arena& {
    return unit_.arena;
  }
  [[nodiscard]] auto GetExterns() const -> const extern_link::OverloadTable& {
    return externs_;
  }

  // %List = type { i8*, i32, i32, i64, i1 }
  [[nodiscard]] auto GetListType() -> llvm::StructType*;
  [[nodiscard]] auto GetListPointerType() -> llvm::PointerType*;
  [[nodiscard]] auto GetBytePointerType() -> llvm::PointerType*;

  // IR type of a source type. void maps to the IR void type.
  [[nodiscard]] auto GetLlvmType(const ast::Type& type) -> llvm::Type*;

  // Source type of an IR type produced by GetLlvmType; nullopt for types
  // with no source counterpart (e.g. i64).
  [[nodiscard]] auto GetSourceType(llvm::Type* type)
      -> std::optional<ast::Type>;

  // Runtime entry points
  [[nodiscard]] auto GetCoreListLen() -> llvm::Function*;
  [[nodiscard]] auto GetCoreListGet() -> llvm::Function*;
  [[nodiscard]] auto GetCoreListCreate() -> llvm::Function*;
  [[nodiscard]] auto GetCoreStringEqual() -> llvm::Function*;
  [[nodiscard]] auto GetCoreStringConcat() -> llvm::Function*;
  [[nodiscard]] auto GetMalloc() -> llvm::Function*;

  // Declare an external symbol once per module. A later request for the same
  // symbol with a different signature is a type error reported at `span`.
  auto DeclareExternal(
      const std::string& symbol, llvm::FunctionType* type, SourceSpan span)
      -> llvm::Function*;

  // nullptr when the module has no declaration for the symbol yet.
  [[nodiscard]] auto FindDeclaration(const std::string& symbol) const
      -> llvm::Function*;

  void RegisterProgramFunction(
      const std::string& name, ProgramFunction function);
  [[nodiscard]] auto FindProgramFunction(const std::string& name) const
      -> const ProgramFunction*;

  // Private constant global `str.N` holding the NUL-terminated bytes;
  // returns an i8* to its first byte.
  auto CreateStringConstant(std::string_view text) -> llvm::Constant*;

  auto TakeOwnership() -> std::pair<
      std::unique_ptr<llvm::LLVMContext>, std::unique_ptr<llvm::Module>>;

 private:
  const ast::CompilationUnit& unit_;
  const extern_link::OverloadTable& externs_;

  std::unique_ptr<llvm::LLVMContext> llvm_context_;
  std::unique_ptr<llvm::Module> llvm_module_;
  llvm::IRBuilder<> builder_;

  llvm::StructType* list_type_ = nullptr;

  // Declarations keyed by symbol name
  absl::flat_hash_map<std::string, llvm::Function*> declarations_;
  absl::flat_hash_map<std::string, ProgramFunction> program_functions_;

  uint32_t string_counter_ = 0;
};

// Per-function lowering state: flat variable scope, loop target stacks and
// block label counters.
class FunctionContext {
 public:
  FunctionContext(
      Context& ctx, llvm::Function& function, const ast::Function& decl);

  [[nodiscard]] auto GetFunction() -> llvm::Function& {
    return function_;
  }
  [[nodiscard]] auto GetDecl() const -> const ast::Function& {
    return decl_;
  }
  [[nodiscard]] auto ReturnType() const -> const ast::Type& {
    return decl_.return_type;
  }

  // Stack slot in the entry block, grouped with the other allocas.
  auto CreateSlot(llvm::Type* type, const std::string& name)
      -> llvm::AllocaInst*;

  // Introduce or overwrite a binding.
  void Bind(const std::string& name, VariableBinding binding);
  [[nodiscard]] auto Lookup(const std::string& name) const
      -> const VariableBinding*;

  void PushLoop(
      llvm::BasicBlock* continue_target, llvm::BasicBlock* break_target);
  void PopLoop();
  // nullptr outside of any loop
  [[nodiscard]] auto ContinueTarget() const -> llvm::BasicBlock*;
  [[nodiscard]] auto BreakTarget() const -> llvm::BasicBlock*;

  auto NextIfLabel() -> std::string;
  auto NextLoopLabel(std::string_view kind) -> std::string;

  auto CreateBlock(const std::string& name) -> llvm::BasicBlock*;

 private:
  Context& ctx_;
  llvm::Function& function_;
  const ast::Function& decl_;
  std::unique_ptr<llvm::IRBuilder<>> alloca_builder_;

  absl::flat_hash_map<std::string, VariableBinding> variables_;
  std::vector<llvm::BasicBlock*> continue_targets_;
  std::vector<llvm::BasicBlock*> break_targets_;

  uint32_t if_counter_ = 0;
  uint32_t loop_counter_ = 0;
};

// RAII guard pairing PushLoop/PopLoop around a loop body.
class LoopScope {
 public:
  LoopScope(
      FunctionContext& fctx, llvm::BasicBlock* continue_target,
      llvm::BasicBlock* break_target);
  ~LoopScope();

  LoopScope(const LoopScope&) = delete;
  auto operator=(const LoopScope&) -> LoopScope& = delete;
  LoopScope(LoopScope&&) = delete;
  auto operator=(LoopScope&&) -> LoopScope& = delete;

 private:
  FunctionContext& fctx_;
};

}  // namespace arx::lowering::ast_to_llvm
