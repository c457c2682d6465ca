/**
 * @file
 * @brief AST declarations.
 */
#pragma once

#include <memory>
#include "ast/Expr.h"
#include "ast/HasParams.h"
#include "ast/Param.h"

namespace pyscope::ast {

struct LambdaExpr final : Expr, HasParams<Param> {
  std::unique_ptr<Expr> body;
  LambdaExpr() : Expr(NodeKind::LambdaExpr) {}
};

} // namespace pyscope::ast
