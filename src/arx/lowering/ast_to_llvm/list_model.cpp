#include "arx/lowering/ast_to_llvm/list_model.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <fmt/core.h>

#include "arx/ast/type.hpp"
#include "arx/common/diagnostic.hpp"
#include "arx/common/internal_error.hpp"
#include "arx/lowering/ast_to_llvm/context.hpp"
#include "arx/lowering/ast_to_llvm/expression.hpp"
#include "llvm/IR/Constants.h"
#include "llvm/IR/DerivedTypes.h"

namespace arx::lowering::ast_to_llvm {

auto CreateListRecordType(llvm::LLVMContext& ctx) -> llvm::StructType* {
  return llvm::StructType::create(
      ctx,
      {
          llvm::Type::getInt8PtrTy(ctx),
          llvm::Type::getInt32Ty(ctx),
          llvm::Type::getInt32Ty(ctx),
          llvm::Type::getInt64Ty(ctx),
          llvm::Type::getInt1Ty(ctx),
      },
      "List");
}

auto AbiSizeOf(llvm::Type* type) -> uint64_t {
  if (type->isPointerTy()) {
    return kPointerByteSize;
  }
  if (type->isIntegerTy()) {
    return (type->getIntegerBitWidth() + 7) / 8;
  }
  if (type->isDoubleTy()) {
    return 8;
  }
  if (type->isFloatTy()) {
    return 4;
  }
  if (auto* struct_type = llvm::dyn_cast<llvm::StructType>(type)) {
    uint64_t total = 0;
    for (llvm::Type* field : struct_type->elements()) {
      total += AbiSizeOf(field);
    }
    return total;
  }
  if (auto* array_type = llvm::dyn_cast<llvm::ArrayType>(type)) {
    return array_type->getNumElements() *
           AbiSizeOf(array_type->getElementType());
  }
  common::ThrowInternalError(
      "AbiSizeOf", "type has no defined element size in the list model");
}

auto LowerListLiteral(
    Context& ctx, FunctionContext& fctx,
    const std::optional<ast::Type>& element_type_hint,
    const ast::ListLiteral& literal, SourceSpan span) -> TypedValue {
  auto& builder = ctx.GetBuilder();
  auto& llvm_ctx = ctx.GetLlvmContext();
  auto* i32_ty = llvm::Type::getInt32Ty(llvm_ctx);
  auto* i64_ty = llvm::Type::getInt64Ty(llvm_ctx);

  // Elements are lowered before the allocation, in source order.
  std::vector<TypedValue> elements;
  elements.reserve(literal.elements.size());
  for (ast::ExpressionId element_id : literal.elements) {
    elements.push_back(LowerExpression(ctx, fctx, element_id));
  }

  if (!element_type_hint && elements.empty()) {
    ThrowLoweringError(
        span, ErrorCategory::kTypeMismatch,
        "cannot infer the element type of an empty list literal");
  }
  const ast::Type element_type =
      element_type_hint ? *element_type_hint : elements.front().type;
  if (element_type.IsVoid()) {
    ThrowLoweringError(
        span, ErrorCategory::kTypeMismatch, "list elements cannot be void");
  }

  std::vector<llvm::Value*> values;
  values.reserve(elements.size());
  for (std::size_t i = 0; i < elements.size(); ++i) {
    const TypedValue& element = elements[i];
    if (element.type == element_type) {
      values.push_back(element.value);
      continue;
    }
    // A pointer to the element type is stored by value.
    if (element.type.kind == ast::TypeKind::kIntPointer &&
        element_type.kind == ast::TypeKind::kInt) {
      values.push_back(builder.CreateLoad(i32_ty, element.value, "deref"));
      continue;
    }
    ThrowLoweringError(
        ctx.GetArena()[literal.elements[i]].span, ErrorCategory::kTypeMismatch,
        fmt::format(
            "list element of type '{}' in a list of '{}'",
            element.type.ToString(), element_type.ToString()));
  }

  llvm::Type* element_llvm_type = ctx.GetLlvmType(element_type);
  uint64_t element_size = AbiSizeOf(element_llvm_type);
  auto count = static_cast<uint64_t>(values.size());

  llvm::Value* data = builder.CreateCall(
      ctx.GetMalloc(), {llvm::ConstantInt::get(i64_ty, count * element_size)},
      "list.data");

  for (uint64_t i = 0; i < count; ++i) {
    llvm::Value* byte_ptr = builder.CreateInBoundsGEP(
        builder.getInt8Ty(), data,
        llvm::ConstantInt::get(i64_ty, i * element_size), "list.slot");
    llvm::Value* typed_ptr = builder.CreateBitCast(
        byte_ptr, llvm::PointerType::getUnqual(element_llvm_type));
    builder.CreateStore(values[i], typed_ptr);
  }

  llvm::Value* list = builder.CreateCall(
      ctx.GetCoreListCreate(),
      {data, llvm::ConstantInt::get(i32_ty, count),
       llvm::ConstantInt::get(i32_ty, element_size),
       builder.getInt1(element_type.IsPointerShaped())},
      "list");
  return TypedValue{.value = list, .type = ast::Type::List(element_type)};
}

auto LoadListElement(
    Context& ctx, llvm::Value* list, llvm::Value* index,
    const ast::Type& element_type) -> llvm::Value* {
  auto& builder = ctx.GetBuilder();
  llvm::Type* element_llvm_type = ctx.GetLlvmType(element_type);

  llvm::Value* raw =
      builder.CreateCall(ctx.GetCoreListGet(), {list, index}, "elem.raw");

  // The runtime hands back the stored pointer itself for pointer elements
  // and the slot address for scalars.
  if (element_type.IsPointerShaped()) {
    return builder.CreatePointerCast(raw, element_llvm_type, "elem");
  }
  llvm::Value* typed_ptr = builder.CreateBitCast(
      raw, llvm::PointerType::getUnqual(element_llvm_type), "elem.ptr");
  return builder.CreateLoad(element_llvm_type, typed_ptr, "elem");
}

}  // namespace arx::lowering::ast_to_llvm
