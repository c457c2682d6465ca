/***
 * Name: pyscope::ast::AnnAssignStmt
 * Purpose: Annotated assignment `target: annotation [= value]`.
 */
#pragma once

#include <memory>

#include "Expr.h"
#include "Stmt.h"

namespace pyscope::ast {

struct AnnAssignStmt final : Stmt {
  std::unique_ptr<Expr> target;
  std::unique_ptr<Expr> annotation;
  std::unique_ptr<Expr> value; // optional
  AnnAssignStmt(std::unique_ptr<Expr> t, std::unique_ptr<Expr> a)
      : Stmt(NodeKind::AnnAssignStmt), target(std::move(t)), annotation(std::move(a)) {}
};

} // namespace pyscope::ast
