#pragma once

#include <memory>
#include "ast/Expr.h"

namespace pyscope::ast {

struct Subscript final : Expr {
  std::unique_ptr<Expr> value;
  std::unique_ptr<Expr> slice; // index, Slice, or TupleLiteral of those
  Subscript(std::unique_ptr<Expr> v, std::unique_ptr<Expr> s)
      : Expr(NodeKind::Subscript), value(std::move(v)), slice(std::move(s)) {}
};

} // namespace pyscope::ast
