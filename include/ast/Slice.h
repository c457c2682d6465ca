#pragma once

#include <memory>
#include "ast/Expr.h"

namespace pyscope::ast {

// lower:upper:step inside a subscript; every part optional
struct Slice final : Expr {
  std::unique_ptr<Expr> lower;
  std::unique_ptr<Expr> upper;
  std::unique_ptr<Expr> step;
  Slice() : Expr(NodeKind::Slice) {}
};

} // namespace pyscope::ast
