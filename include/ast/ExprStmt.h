/**
 * @file
 * @brief AST declarations.
 */
/***
 * Name: pyscope::ast::ExprStmt
 * Purpose: Represent a standalone expression as a statement.
 * Theory of Operation:
 *   Wraps an Expr in a Stmt; a leading string ExprStmt in a body is its docstring.
 */
#pragma once

#include <memory>
#include "ast/Stmt.h"
#include "ast/Expr.h"

namespace pyscope::ast {

struct ExprStmt final : Stmt {
  std::unique_ptr<Expr> value;
  explicit ExprStmt(std::unique_ptr<Expr> v) : Stmt(NodeKind::ExprStmt), value(std::move(v)) {}
};

} // namespace pyscope::ast
