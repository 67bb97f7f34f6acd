#pragma once

#include <cstdint>
#include <optional>

#include "arx/ast/expression.hpp"
#include "arx/ast/type.hpp"
#include "arx/common/source_span.hpp"
#include "arx/lowering/ast_to_llvm/context.hpp"
#include "llvm/IR/DerivedTypes.h"
#include "llvm/IR/LLVMContext.h"
#include "llvm/IR/Value.h"

namespace arx::lowering::ast_to_llvm {

// Field layout of the list record shared with the runtime library.
inline constexpr unsigned kListDataField = 0;         // i8* element storage
inline constexpr unsigned kListLengthField = 1;       // i32 element count
inline constexpr unsigned kListElementSizeField = 2;  // i32 bytes per element
inline constexpr unsigned kListReservedField = 3;     // i64
inline constexpr unsigned kListIsPointerField = 4;    // i1 pointer elements

// Pointer width assumed by the size accounting, independent of the host.
inline constexpr uint64_t kPointerByteSize = 8;

// Create the identified struct `%List` in `ctx`.
auto CreateListRecordType(llvm::LLVMContext& ctx) -> llvm::StructType*;

// Byte size used for list element storage: i1 -> 1, i32 -> 4, double -> 8,
// pointers -> kPointerByteSize, structs -> sum of fields (no padding),
// arrays -> count * element.
auto AbiSizeOf(llvm::Type* type) -> uint64_t;

// Heap-allocate the literal's elements, store each at i * size(T), and wrap
// the buffer with core_list_create. Yields a list[T] value. Without an
// element type, T is the type of the first element.
auto LowerListLiteral(
    Context& ctx, FunctionContext& fctx,
    const std::optional<ast::Type>& element_type,
    const ast::ListLiteral& literal, SourceSpan span) -> TypedValue;

// Element `index` of `list` as a value of `element_type`.
auto LoadListElement(
    Context& ctx, llvm::Value* list, llvm::Value* index,
    const ast::Type& element_type) -> llvm::Value*;

}  // namespace arx::lowering::ast_to_llvm
