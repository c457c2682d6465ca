/**
 * @file
 * @brief AST tuple display declarations.
 */
#pragma once

#include <memory>
#include <vector>
#include "ast/Expr.h"

namespace pyscope::ast {

struct TupleLiteral final : Expr {
  std::vector<std::unique_ptr<Expr>> elements; // may contain Starred
  TupleLiteral() : Expr(NodeKind::TupleLiteral) {}
};

} // namespace pyscope::ast
