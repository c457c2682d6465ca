/**
 * @file
 * @brief AST list display declarations.
 */
#pragma once

#include <memory>
#include <vector>
#include "ast/Expr.h"

namespace pyscope::ast {

struct ListLiteral final : Expr {
  std::vector<std::unique_ptr<Expr>> elements; // may contain Starred
  ListLiteral() : Expr(NodeKind::ListLiteral) {}
};

} // namespace pyscope::ast
