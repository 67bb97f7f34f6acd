#pragma once

#include "arx/ast/fwd.hpp"
#include "arx/lowering/ast_to_llvm/context.hpp"

namespace arx::lowering::ast_to_llvm {

// Lower one expression at the builder's insertion point.
auto LowerExpression(
    Context& ctx, FunctionContext& fctx, ast::ExpressionId expr_id)
    -> TypedValue;

}  // namespace arx::lowering::ast_to_llvm
