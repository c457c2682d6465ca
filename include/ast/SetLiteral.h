/**
 * @file
 * @brief AST set display declarations.
 */
#pragma once

#include <memory>
#include <vector>
#include "ast/Expr.h"

namespace pyscope::ast {

struct SetLiteral final : Expr {
  std::vector<std::unique_ptr<Expr>> elements; // may contain Starred
  SetLiteral() : Expr(NodeKind::SetLiteral) {}
};

} // namespace pyscope::ast
