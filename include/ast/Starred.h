/**
 * @file
 * @brief AST starred expression (`*value` in displays and targets).
 */
#pragma once

#include <memory>
#include "ast/Expr.h"

namespace pyscope::ast {

struct Starred final : Expr {
  std::unique_ptr<Expr> value;
  explicit Starred(std::unique_ptr<Expr> v) : Expr(NodeKind::Starred), value(std::move(v)) {}
};

} // namespace pyscope::ast
