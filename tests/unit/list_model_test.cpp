#include <gtest/gtest.h>

#include <llvm/IR/DerivedTypes.h>
#include <llvm/IR/LLVMContext.h>
#include <llvm/IR/Type.h>

#include "arx/common/internal_error.hpp"
#include "arx/lowering/ast_to_llvm/list_model.hpp"

namespace arx::lowering::ast_to_llvm {
namespace {

class AbiSizeTest : public ::testing::Test {
 protected:
  llvm::LLVMContext ctx_;
};

TEST_F(AbiSizeTest, ScalarWidths) {
  EXPECT_EQ(AbiSizeOf(llvm::Type::getInt1Ty(ctx_)), 1U);
  EXPECT_EQ(AbiSizeOf(llvm::Type::getInt8Ty(ctx_)), 1U);
  EXPECT_EQ(AbiSizeOf(llvm::Type::getInt32Ty(ctx_)), 4U);
  EXPECT_EQ(AbiSizeOf(llvm::Type::getInt64Ty(ctx_)), 8U);
  EXPECT_EQ(AbiSizeOf(llvm::Type::getDoubleTy(ctx_)), 8U);
  EXPECT_EQ(AbiSizeOf(llvm::Type::getFloatTy(ctx_)), 4U);
}

TEST_F(AbiSizeTest, PointersUseFixedWidth) {
  EXPECT_EQ(AbiSizeOf(llvm::Type::getInt8PtrTy(ctx_)), kPointerByteSize);
  EXPECT_EQ(AbiSizeOf(llvm::Type::getInt32PtrTy(ctx_)), kPointerByteSize);
  auto* list = CreateListRecordType(ctx_);
  EXPECT_EQ(AbiSizeOf(llvm::PointerType::getUnqual(list)), kPointerByteSize);
}

TEST_F(AbiSizeTest, AggregatesSumWithoutPadding) {
  // { i8*, i32, i32, i64, i1 } -> 8 + 4 + 4 + 8 + 1
  EXPECT_EQ(AbiSizeOf(CreateListRecordType(ctx_)), 25U);

  auto* array = llvm::ArrayType::get(llvm::Type::getInt32Ty(ctx_), 5);
  EXPECT_EQ(AbiSizeOf(array), 20U);

  auto* nested = llvm::ArrayType::get(
      llvm::StructType::get(
          ctx_, {llvm::Type::getInt1Ty(ctx_), llvm::Type::getDoubleTy(ctx_)}),
      3);
  EXPECT_EQ(AbiSizeOf(nested), 27U);
}

TEST_F(AbiSizeTest, ListRecordLayout) {
  auto* list = CreateListRecordType(ctx_);
  EXPECT_EQ(list->getName(), "List");
  ASSERT_EQ(list->getNumElements(), 5U);
  EXPECT_TRUE(list->getElementType(kListDataField)->isPointerTy());
  EXPECT_TRUE(list->getElementType(kListLengthField)->isIntegerTy(32));
  EXPECT_TRUE(list->getElementType(kListElementSizeField)->isIntegerTy(32));
  EXPECT_TRUE(list->getElementType(kListReservedField)->isIntegerTy(64));
  EXPECT_TRUE(list->getElementType(kListIsPointerField)->isIntegerTy(1));
}

TEST_F(AbiSizeTest, UnsizedTypeIsInternalError) {
  EXPECT_THROW(
      (void)AbiSizeOf(llvm::Type::getVoidTy(ctx_)), common::InternalError);
}

}  // namespace
}  // namespace arx::lowering::ast_to_llvm
