#include "arx/lowering/ast_to_llvm/context.hpp"

#include <array>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/core.h>

#include "arx/ast/type.hpp"
#include "arx/common/diagnostic.hpp"
#include "arx/common/internal_error.hpp"
#include "arx/lowering/ast_to_llvm/list_model.hpp"
#include "llvm/IR/Attributes.h"
#include "llvm/IR/Constants.h"
#include "llvm/IR/DerivedTypes.h"
#include "llvm/IR/GlobalVariable.h"
#include "llvm/IR/Instructions.h"
#include "llvm/Support/raw_ostream.h"

namespace arx::lowering::ast_to_llvm {

namespace {

auto PrintType(llvm::Type* type) -> std::string {
  std::string text;
  llvm::raw_string_ostream os(text);
  type->print(os);
  return os.str();
}

// C `bool` arguments and results travel zero-extended.
void MarkBoolExtension(llvm::Function& fn) {
  llvm::FunctionType* type = fn.getFunctionType();
  if (type->getReturnType()->isIntegerTy(1)) {
    fn.addRetAttr(llvm::Attribute::ZExt);
  }
  for (unsigned i = 0; i < type->getNumParams(); ++i) {
    if (type->getParamType(i)->isIntegerTy(1)) {
      fn.addParamAttr(i, llvm::Attribute::ZExt);
    }
  }
}

}  // namespace

void ThrowLoweringError(
    SourceSpan span, ErrorCategory category, std::string message) {
  throw DiagnosticException(
      Diagnostic::Error(span, category, std::move(message)));
}

Context::Context(
    const ast::CompilationUnit& unit,
    const extern_link::OverloadTable& externs, const std::string& module_name)
    : unit_(unit),
      externs_(externs),
      llvm_context_(std::make_unique<llvm::LLVMContext>()),
      llvm_module_(std::make_unique<llvm::Module>(module_name, *llvm_context_)),
      builder_(*llvm_context_) {
  // The record type exists before any list value is produced.
  list_type_ = CreateListRecordType(*llvm_context_);
}

auto Context::GetListType() -> llvm::StructType* {
  return list_type_;
}

auto Context::GetListPointerType() -> llvm::PointerType* {
  return llvm::PointerType::getUnqual(list_type_);
}

auto Context::GetBytePointerType() -> llvm::PointerType* {
  return llvm::Type::getInt8PtrTy(*llvm_context_);
}

auto Context::GetLlvmType(const ast::Type& type) -> llvm::Type* {
  switch (type.kind) {
    case ast::TypeKind::kVoid:
      return llvm::Type::getVoidTy(*llvm_context_);
    case ast::TypeKind::kInt:
      return llvm::Type::getInt32Ty(*llvm_context_);
    case ast::TypeKind::kFloat:
      return llvm::Type::getDoubleTy(*llvm_context_);
    case ast::TypeKind::kBool:
      return llvm::Type::getInt1Ty(*llvm_context_);
    case ast::TypeKind::kString:
      return GetBytePointerType();
    case ast::TypeKind::kIntPointer:
      return llvm::Type::getInt32PtrTy(*llvm_context_);
    case ast::TypeKind::kList:
      return GetListPointerType();
  }
  common::ThrowInternalError("Context::GetLlvmType", "unknown type kind");
}

auto Context::GetSourceType(llvm::Type* type) -> std::optional<ast::Type> {
  if (type->isVoidTy()) {
    return ast::Type::Void();
  }
  if (type->isIntegerTy(32)) {
    return ast::Type::Int();
  }
  if (type->isIntegerTy(1)) {
    return ast::Type::Bool();
  }
  if (type->isDoubleTy()) {
    return ast::Type::Float();
  }
  if (type == GetBytePointerType()) {
    return ast::Type::String();
  }
  if (type == llvm::Type::getInt32PtrTy(*llvm_context_)) {
    return ast::Type::IntPointer();
  }
  if (type == GetListPointerType()) {
    return ast::Type::UntypedList();
  }
  return std::nullopt;
}

auto Context::GetCoreListLen() -> llvm::Function* {
  // i32 core_list_len(%List*)
  auto* fn_type = llvm::FunctionType::get(
      llvm::Type::getInt32Ty(*llvm_context_), {GetListPointerType()}, false);
  return DeclareExternal("core_list_len", fn_type, SourceSpan{});
}

auto Context::GetCoreListGet() -> llvm::Function* {
  // i8* core_list_get(%List*, i32 index)
  auto* fn_type = llvm::FunctionType::get(
      GetBytePointerType(),
      {GetListPointerType(), llvm::Type::getInt32Ty(*llvm_context_)}, false);
  return DeclareExternal("core_list_get", fn_type, SourceSpan{});
}

auto Context::GetCoreListCreate() -> llvm::Function* {
  // %List* core_list_create(i8* data, i32 length, i32 element_size,
  //                         i1 is_pointer)
  auto* i32_ty = llvm::Type::getInt32Ty(*llvm_context_);
  auto* fn_type = llvm::FunctionType::get(
      GetListPointerType(),
      {GetBytePointerType(), i32_ty, i32_ty,
       llvm::Type::getInt1Ty(*llvm_context_)},
      false);
  return DeclareExternal("core_list_create", fn_type, SourceSpan{});
}

auto Context::GetCoreStringEqual() -> llvm::Function* {
  // i1 core_string_equal(i8*, i8*)
  auto* fn_type = llvm::FunctionType::get(
      llvm::Type::getInt1Ty(*llvm_context_),
      {GetBytePointerType(), GetBytePointerType()}, false);
  return DeclareExternal("core_string_equal", fn_type, SourceSpan{});
}

auto Context::GetCoreStringConcat() -> llvm::Function* {
  // i8* core_string_concat(i8*, i8*)
  auto* fn_type = llvm::FunctionType::get(
      GetBytePointerType(), {GetBytePointerType(), GetBytePointerType()},
      false);
  return DeclareExternal("core_string_concat", fn_type, SourceSpan{});
}

auto Context::GetMalloc() -> llvm::Function* {
  // i8* malloc(i64)
  auto* fn_type = llvm::FunctionType::get(
      GetBytePointerType(), {llvm::Type::getInt64Ty(*llvm_context_)}, false);
  return DeclareExternal("malloc", fn_type, SourceSpan{});
}

auto Context::DeclareExternal(
    const std::string& symbol, llvm::FunctionType* type, SourceSpan span)
    -> llvm::Function* {
  llvm::Function* fn = FindDeclaration(symbol);
  if (fn == nullptr) {
    fn = llvm::Function::Create(
        type, llvm::Function::ExternalLinkage, symbol, llvm_module_.get());
    MarkBoolExtension(*fn);
    declarations_.emplace(symbol, fn);
    return fn;
  }
  if (fn->getFunctionType() != type) {
    ThrowLoweringError(
        span, ErrorCategory::kTypeMismatch,
        fmt::format(
            "'{}' is already declared as '{}', cannot redeclare as '{}'",
            symbol, PrintType(fn->getFunctionType()), PrintType(type)));
  }
  return fn;
}

auto Context::FindDeclaration(const std::string& symbol) const
    -> llvm::Function* {
  auto it = declarations_.find(symbol);
  if (it != declarations_.end()) {
    return it->second;
  }
  return nullptr;
}

void Context::RegisterProgramFunction(
    const std::string& name, ProgramFunction function) {
  program_functions_.insert_or_assign(name, function);
  declarations_.insert_or_assign(name, function.function);
}

auto Context::FindProgramFunction(const std::string& name) const
    -> const ProgramFunction* {
  auto it = program_functions_.find(name);
  if (it == program_functions_.end()) {
    return nullptr;
  }
  return &it->second;
}

auto Context::CreateStringConstant(std::string_view text) -> llvm::Constant* {
  auto* data = llvm::ConstantDataArray::getString(
      *llvm_context_, llvm::StringRef(text.data(), text.size()), true);
  auto* global = new llvm::GlobalVariable(
      *llvm_module_, data->getType(), true, llvm::GlobalValue::PrivateLinkage,
      data, fmt::format("str.{}", string_counter_++));
  global->setUnnamedAddr(llvm::GlobalValue::UnnamedAddr::Global);
  global->setAlignment(llvm::Align(1));

  auto* zero =
      llvm::ConstantInt::get(llvm::Type::getInt32Ty(*llvm_context_), 0);
  std::array<llvm::Constant*, 2> indices{zero, zero};
  return llvm::ConstantExpr::getInBoundsGetElementPtr(
      data->getType(), global, indices);
}

auto Context::TakeOwnership() -> std::pair<
    std::unique_ptr<llvm::LLVMContext>, std::unique_ptr<llvm::Module>> {
  return {std::move(llvm_context_), std::move(llvm_module_)};
}

FunctionContext::FunctionContext(
    Context& ctx, llvm::Function& function, const ast::Function& decl)
    : ctx_(ctx), function_(function), decl_(decl) {
  if (function_.empty()) {
    common::ThrowInternalError(
        "FunctionContext", "entry block must exist before lowering");
  }
  llvm::BasicBlock& entry = function_.getEntryBlock();
  alloca_builder_ = std::make_unique<llvm::IRBuilder<>>(&entry, entry.begin());
}

auto FunctionContext::CreateSlot(llvm::Type* type, const std::string& name)
    -> llvm::AllocaInst* {
  // Insert after the existing allocas, before any other instruction.
  llvm::BasicBlock& entry = function_.getEntryBlock();
  llvm::BasicBlock::iterator insert_point = entry.begin();
  while (insert_point != entry.end() &&
         llvm::isa<llvm::AllocaInst>(&*insert_point)) {
    ++insert_point;
  }
  alloca_builder_->SetInsertPoint(&entry, insert_point);
  return alloca_builder_->CreateAlloca(type, nullptr, name);
}

void FunctionContext::Bind(const std::string& name, VariableBinding binding) {
  variables_.insert_or_assign(name, std::move(binding));
}

auto FunctionContext::Lookup(const std::string& name) const
    -> const VariableBinding* {
  auto it = variables_.find(name);
  if (it == variables_.end()) {
    return nullptr;
  }
  return &it->second;
}

void FunctionContext::PushLoop(
    llvm::BasicBlock* continue_target, llvm::BasicBlock* break_target) {
  continue_targets_.push_back(continue_target);
  break_targets_.push_back(break_target);
}

void FunctionContext::PopLoop() {
  if (continue_targets_.empty() || break_targets_.empty()) {
    common::ThrowInternalError("FunctionContext::PopLoop", "no loop to pop");
  }
  continue_targets_.pop_back();
  break_targets_.pop_back();
}

auto FunctionContext::ContinueTarget() const -> llvm::BasicBlock* {
  return continue_targets_.empty() ? nullptr : continue_targets_.back();
}

auto FunctionContext::BreakTarget() const -> llvm::BasicBlock* {
  return break_targets_.empty() ? nullptr : break_targets_.back();
}

auto FunctionContext::NextIfLabel() -> std::string {
  return fmt::format("if{}", if_counter_++);
}

auto FunctionContext::NextLoopLabel(std::string_view kind) -> std::string {
  return fmt::format("{}{}", kind, loop_counter_++);
}

auto FunctionContext::CreateBlock(const std::string& name)
    -> llvm::BasicBlock* {
  return llvm::BasicBlock::Create(ctx_.GetLlvmContext(), name, &function_);
}

LoopScope::LoopScope(
    FunctionContext& fctx, llvm::BasicBlock* continue_target,
    llvm::BasicBlock* break_target)
    : fctx_(fctx) {
  fctx_.PushLoop(continue_target, break_target);
}

LoopScope::~LoopScope() {
  fctx_.PopLoop();
}

}  // namespace arx::lowering::ast_to_llvm
