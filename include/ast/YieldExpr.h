/**
 * @file
 * @brief AST yield expression declarations.
 */
#pragma once

#include <memory>
#include "Expr.h"

namespace pyscope::ast {

struct YieldExpr final : Expr {
  bool isFrom{false};
  std::unique_ptr<Expr> value; // optional when not 'from'
  YieldExpr() : Expr(NodeKind::YieldExpr) {}
};

} // namespace pyscope::ast
