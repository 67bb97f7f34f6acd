#pragma once

#include <vector>

#include "arx/ast/fwd.hpp"
#include "arx/lowering/ast_to_llvm/context.hpp"

namespace arx::lowering::ast_to_llvm {

void LowerStatement(
    Context& ctx, FunctionContext& fctx, ast::StatementId stmt_id);

void LowerStatements(
    Context& ctx, FunctionContext& fctx,
    const std::vector<ast::StatementId>& body);

}  // namespace arx::lowering::ast_to_llvm
