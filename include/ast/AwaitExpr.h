/**
 * @file
 * @brief AST declarations.
 */
#pragma once

#include <memory>
#include "Expr.h"

namespace pyscope::ast {

struct AwaitExpr final : Expr {
  std::unique_ptr<Expr> value;
  AwaitExpr() : Expr(NodeKind::AwaitExpr) {}
};

} // namespace pyscope::ast
