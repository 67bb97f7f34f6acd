#include "arx/lowering/ast_to_llvm/statement.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <fmt/core.h>

#include "arx/ast/expression.hpp"
#include "arx/ast/statement.hpp"
#include "arx/ast/type.hpp"
#include "arx/common/diagnostic.hpp"
#include "arx/common/overloaded.hpp"
#include "arx/lowering/ast_to_llvm/context.hpp"
#include "arx/lowering/ast_to_llvm/expression.hpp"
#include "arx/lowering/ast_to_llvm/list_model.hpp"
#include "llvm/IR/BasicBlock.h"
#include "llvm/IR/Constants.h"

namespace arx::lowering::ast_to_llvm {

namespace {

auto IsTerminated(llvm::IRBuilder<>& builder) -> bool {
  return builder.GetInsertBlock()->getTerminator() != nullptr;
}

void BranchIfOpen(llvm::IRBuilder<>& builder, llvm::BasicBlock* target) {
  if (!IsTerminated(builder)) {
    builder.CreateBr(target);
  }
}

// Blocks are created ahead of the code that fills them; moving each one to
// the end of the function when it is entered keeps the IR in source order.
void EnterBlock(llvm::IRBuilder<>& builder, llvm::BasicBlock* block) {
  llvm::BasicBlock* last = &block->getParent()->back();
  if (last != block) {
    block->moveAfter(last);
  }
  builder.SetInsertPoint(block);
}

void RequireBool(const TypedValue& cond, SourceSpan span, const char* what) {
  if (cond.type.kind != ast::TypeKind::kBool) {
    ThrowLoweringError(
        span, ErrorCategory::kTypeMismatch,
        fmt::format(
            "{} condition must be 'bool', got '{}'", what,
            cond.type.ToString()));
  }
}

// Value for a declaration: list literals take their element type from the
// declared list type, so `list[int] xs = []` is well-formed.
auto LowerInitializer(
    Context& ctx, FunctionContext& fctx, const ast::Type& declared,
    ast::ExpressionId value_id) -> TypedValue {
  const ast::Expression& value = ctx.GetArena()[value_id];
  if (const auto* literal = std::get_if<ast::ListLiteral>(&value.data)) {
    if (declared.IsList() && declared.HasElement()) {
      return LowerListLiteral(
          ctx, fctx, *declared.element, *literal, value.span);
    }
  }
  return LowerExpression(ctx, fctx, value_id);
}

void BindNewSlot(
    Context& ctx, FunctionContext& fctx, const std::string& name,
    const TypedValue& value) {
  llvm::AllocaInst* slot =
      fctx.CreateSlot(ctx.GetLlvmType(value.type), name);
  ctx.GetBuilder().CreateStore(value.value, slot);
  fctx.Bind(name, VariableBinding{.storage = slot, .type = value.type});
}

void LowerReturn(
    Context& ctx, FunctionContext& fctx, const ast::ReturnStatement& ret,
    SourceSpan span) {
  TypedValue value = LowerExpression(ctx, fctx, ret.value);
  const ast::Type& expected = fctx.ReturnType();
  if (expected.IsVoid()) {
    ThrowLoweringError(
        span, ErrorCategory::kTypeMismatch,
        fmt::format(
            "'{}' returns void but a '{}' value is returned",
            fctx.GetDecl().name, value.type.ToString()));
  }
  if (value.type != expected) {
    ThrowLoweringError(
        span, ErrorCategory::kTypeMismatch,
        fmt::format(
            "'{}' returns '{}' but a '{}' value is returned",
            fctx.GetDecl().name, expected.ToString(), value.type.ToString()));
  }
  ctx.GetBuilder().CreateRet(value.value);
}

void LowerReturnVoid(Context& ctx, FunctionContext& fctx, SourceSpan span) {
  if (!fctx.ReturnType().IsVoid()) {
    ThrowLoweringError(
        span, ErrorCategory::kTypeMismatch,
        fmt::format(
            "void return in '{}', which returns '{}'", fctx.GetDecl().name,
            fctx.ReturnType().ToString()));
  }
  ctx.GetBuilder().CreateRetVoid();
}

void LowerDeclare(
    Context& ctx, FunctionContext& fctx, const ast::DeclareStatement& decl,
    SourceSpan span) {
  if (decl.type.IsVoid()) {
    ThrowLoweringError(
        span, ErrorCategory::kTypeMismatch,
        fmt::format(
            "unsupported local type 'void' for variable '{}'", decl.name));
  }
  TypedValue value = LowerInitializer(ctx, fctx, decl.type, decl.value);
  if (value.type != decl.type) {
    ThrowLoweringError(
        span, ErrorCategory::kTypeMismatch,
        fmt::format(
            "cannot initialize '{}' of type '{}' with a '{}' value", decl.name,
            decl.type.ToString(), value.type.ToString()));
  }
  // The declared type is the more precise one for untyped list values.
  value.type = decl.type;
  BindNewSlot(ctx, fctx, decl.name, value);
}

void LowerAssign(
    Context& ctx, FunctionContext& fctx, const ast::AssignStatement& assign,
    SourceSpan span) {
  const VariableBinding* binding = fctx.Lookup(assign.name);
  if (binding == nullptr) {
    ThrowLoweringError(
        span, ErrorCategory::kUnresolvedReference,
        fmt::format("assignment to undefined variable '{}'", assign.name));
  }
  // Copy: lowering the value cannot rebind, but keep the slot stable anyway.
  VariableBinding target = *binding;
  TypedValue value = LowerInitializer(ctx, fctx, target.type, assign.value);
  if (value.type != target.type) {
    ThrowLoweringError(
        span, ErrorCategory::kTypeMismatch,
        fmt::format(
            "cannot assign a '{}' value to '{}' of type '{}'",
            value.type.ToString(), assign.name, target.type.ToString()));
  }
  ctx.GetBuilder().CreateStore(value.value, target.storage);
}

void LowerIfChain(
    Context& ctx, FunctionContext& fctx, const ast::IfChainStatement& chain,
    SourceSpan span) {
  auto& builder = ctx.GetBuilder();
  const auto& arena = ctx.GetArena();
  const std::string label = fctx.NextIfLabel();
  const std::size_t count = chain.branches.size();

  llvm::BasicBlock* end_block = fctx.CreateBlock(label + ".end");

  for (std::size_t i = 0; i < count; ++i) {
    const ast::IfBranch& branch = chain.branches[i];
    const bool is_last = i + 1 == count;
    if (!branch.condition && !is_last) {
      ThrowLoweringError(
          span, ErrorCategory::kStructural,
          "only the last branch of an if chain may omit its condition");
    }

    llvm::BasicBlock* then_block =
        fctx.CreateBlock(fmt::format("{}.then{}", label, i));
    // A condition-less branch always runs; no fallthrough edge is needed.
    llvm::BasicBlock* next_block = nullptr;
    if (branch.condition) {
      next_block =
          is_last ? end_block
                  : fctx.CreateBlock(fmt::format("{}.next{}", label, i));
      TypedValue cond = LowerExpression(ctx, fctx, *branch.condition);
      RequireBool(cond, arena[*branch.condition].span, "if");
      builder.CreateCondBr(cond.value, then_block, next_block);
    } else {
      builder.CreateBr(then_block);
    }

    EnterBlock(builder, then_block);
    LowerStatements(ctx, fctx, branch.body);
    BranchIfOpen(builder, end_block);

    if (next_block != nullptr && next_block != end_block) {
      EnterBlock(builder, next_block);
    }
  }

  // When every branch terminated and the last one had no condition, the end
  // block has no predecessors; the verification sweep removes it.
  EnterBlock(builder, end_block);
}

void LowerForIn(
    Context& ctx, FunctionContext& fctx, const ast::ForInStatement& loop,
    SourceSpan span) {
  auto& builder = ctx.GetBuilder();
  auto* i32_ty = llvm::Type::getInt32Ty(ctx.GetLlvmContext());

  TypedValue iterable = LowerExpression(ctx, fctx, loop.iterable);
  if (!iterable.type.IsList()) {
    ThrowLoweringError(
        span, ErrorCategory::kTypeMismatch,
        fmt::format(
            "for-in requires a list, got '{}'", iterable.type.ToString()));
  }
  if (loop.element_type.IsVoid()) {
    ThrowLoweringError(
        span, ErrorCategory::kTypeMismatch,
        fmt::format(
            "unsupported local type 'void' for loop variable '{}'",
            loop.variable));
  }
  if (iterable.type.HasElement() &&
      *iterable.type.element != loop.element_type) {
    ThrowLoweringError(
        span, ErrorCategory::kTypeMismatch,
        fmt::format(
            "loop variable '{}' is '{}' but the list holds '{}'",
            loop.variable, loop.element_type.ToString(),
            iterable.type.element->ToString()));
  }

  const std::string label = fctx.NextLoopLabel("for");
  llvm::AllocaInst* index_slot =
      fctx.CreateSlot(i32_ty, fmt::format("{}.index", loop.variable));
  builder.CreateStore(llvm::ConstantInt::get(i32_ty, 0), index_slot);

  llvm::BasicBlock* cond_block = fctx.CreateBlock(label + ".cond");
  llvm::BasicBlock* body_block = fctx.CreateBlock(label + ".body");
  llvm::BasicBlock* continue_block = fctx.CreateBlock(label + ".continue");
  llvm::BasicBlock* end_block = fctx.CreateBlock(label + ".end");

  builder.CreateBr(cond_block);

  EnterBlock(builder, cond_block);
  llvm::Value* index = builder.CreateLoad(i32_ty, index_slot, "index");
  llvm::Value* length =
      builder.CreateCall(ctx.GetCoreListLen(), {iterable.value}, "len");
  builder.CreateCondBr(
      builder.CreateICmpSLT(index, length, "in.range"), body_block,
      end_block);

  EnterBlock(builder, body_block);
  llvm::Value* element =
      LoadListElement(ctx, iterable.value, index, loop.element_type);
  BindNewSlot(
      ctx, fctx, loop.variable,
      TypedValue{.value = element, .type = loop.element_type});
  {
    LoopScope scope(fctx, continue_block, end_block);
    LowerStatements(ctx, fctx, loop.body);
  }
  BranchIfOpen(builder, continue_block);

  EnterBlock(builder, continue_block);
  llvm::Value* current = builder.CreateLoad(i32_ty, index_slot, "index");
  builder.CreateStore(
      builder.CreateAdd(current, llvm::ConstantInt::get(i32_ty, 1), "next"),
      index_slot);
  builder.CreateBr(cond_block);

  EnterBlock(builder, end_block);
}

void LowerWhile(
    Context& ctx, FunctionContext& fctx, const ast::WhileStatement& loop) {
  auto& builder = ctx.GetBuilder();
  const std::string label = fctx.NextLoopLabel("while");

  llvm::BasicBlock* cond_block = fctx.CreateBlock(label + ".cond");
  llvm::BasicBlock* body_block = fctx.CreateBlock(label + ".body");
  llvm::BasicBlock* continue_block = fctx.CreateBlock(label + ".continue");
  llvm::BasicBlock* end_block = fctx.CreateBlock(label + ".end");

  builder.CreateBr(cond_block);

  EnterBlock(builder, cond_block);
  TypedValue cond = LowerExpression(ctx, fctx, loop.condition);
  RequireBool(cond, ctx.GetArena()[loop.condition].span, "while");
  builder.CreateCondBr(cond.value, body_block, end_block);

  EnterBlock(builder, body_block);
  {
    LoopScope scope(fctx, continue_block, end_block);
    LowerStatements(ctx, fctx, loop.body);
  }
  BranchIfOpen(builder, continue_block);

  EnterBlock(builder, continue_block);
  builder.CreateBr(cond_block);

  EnterBlock(builder, end_block);
}

void LowerDeclareList(
    Context& ctx, FunctionContext& fctx,
    const ast::DeclareListStatement& decl) {
  const ast::Expression& value = ctx.GetArena()[decl.value];
  TypedValue list = [&] {
    if (const auto* literal = std::get_if<ast::ListLiteral>(&value.data)) {
      return LowerListLiteral(
          ctx, fctx, decl.element_type, *literal, value.span);
    }
    // Bound with whatever type the initializer reports.
    return LowerExpression(ctx, fctx, decl.value);
  }();
  BindNewSlot(ctx, fctx, decl.name, list);
}

}  // namespace

void LowerStatement(
    Context& ctx, FunctionContext& fctx, ast::StatementId stmt_id) {
  auto& builder = ctx.GetBuilder();
  const ast::Statement& stmt = ctx.GetArena()[stmt_id];

  // Code after return/break/continue goes into a fresh block that has no
  // predecessors; the verification sweep drops it.
  if (IsTerminated(builder)) {
    builder.SetInsertPoint(fctx.CreateBlock("dead"));
  }

  std::visit(
      Overloaded{
          [&](const ast::ExpressionStatement& s) {
            (void)LowerExpression(ctx, fctx, s.expression);
          },
          [&](const ast::ReturnStatement& s) {
            LowerReturn(ctx, fctx, s, stmt.span);
          },
          [&](const ast::ReturnVoidStatement&) {
            LowerReturnVoid(ctx, fctx, stmt.span);
          },
          [&](const ast::DeclareStatement& s) {
            LowerDeclare(ctx, fctx, s, stmt.span);
          },
          [&](const ast::AssignStatement& s) {
            LowerAssign(ctx, fctx, s, stmt.span);
          },
          [&](const ast::IfChainStatement& s) {
            LowerIfChain(ctx, fctx, s, stmt.span);
          },
          [&](const ast::ForInStatement& s) {
            LowerForIn(ctx, fctx, s, stmt.span);
          },
          [&](const ast::WhileStatement& s) { LowerWhile(ctx, fctx, s); },
          [&](const ast::BreakStatement&) {
            llvm::BasicBlock* target = fctx.BreakTarget();
            if (target == nullptr) {
              ThrowLoweringError(
                  stmt.span, ErrorCategory::kStructural,
                  "'break' outside of a loop");
            }
            builder.CreateBr(target);
          },
          [&](const ast::ContinueStatement&) {
            llvm::BasicBlock* target = fctx.ContinueTarget();
            if (target == nullptr) {
              ThrowLoweringError(
                  stmt.span, ErrorCategory::kStructural,
                  "'continue' outside of a loop");
            }
            builder.CreateBr(target);
          },
          [&](const ast::DeclareListStatement& s) {
            LowerDeclareList(ctx, fctx, s);
          },
      },
      stmt.data);
}

void LowerStatements(
    Context& ctx, FunctionContext& fctx,
    const std::vector<ast::StatementId>& body) {
  for (ast::StatementId stmt_id : body) {
    LowerStatement(ctx, fctx, stmt_id);
  }
}

}  // namespace arx::lowering::ast_to_llvm
