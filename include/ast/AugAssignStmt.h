#pragma once

#include <memory>

#include "Stmt.h"
#include "Expr.h"
#include "ast/BinaryOperator.h"

namespace pyscope::ast {

struct AugAssignStmt final : Stmt {
  std::unique_ptr<Expr> target;
  ast::BinaryOperator op; // Add/Sub/Mul/...
  std::unique_ptr<Expr> value;
  AugAssignStmt(std::unique_ptr<Expr> t, ast::BinaryOperator o, std::unique_ptr<Expr> v)
      : Stmt(NodeKind::AugAssignStmt), target(std::move(t)), op(o), value(std::move(v)) {}
};

} // namespace pyscope::ast
