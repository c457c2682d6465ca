#pragma once

#include <memory>
#include "Stmt.h"
#include "Expr.h"

namespace pyscope::ast {

struct AssertStmt final : Stmt {
  std::unique_ptr<Expr> test;
  std::unique_ptr<Expr> msg; // optional
  AssertStmt() : Stmt(NodeKind::AssertStmt) {}
};

} // namespace pyscope::ast
