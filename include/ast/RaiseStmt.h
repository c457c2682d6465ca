/**
 * @file
 * @brief AST raise statement declarations.
 */
#pragma once

#include <memory>
#include "Stmt.h"
#include "Expr.h"

namespace pyscope::ast {

struct RaiseStmt final : Stmt {
  std::unique_ptr<Expr> exc;   // optional
  std::unique_ptr<Expr> cause; // optional after 'from'
  RaiseStmt() : Stmt(NodeKind::RaiseStmt) {}
};

} // namespace pyscope::ast
