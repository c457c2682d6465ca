#pragma once

#include "ast/Expr.h"

namespace pyscope::ast {

struct EllipsisLiteral final : Expr {
  EllipsisLiteral() : Expr(NodeKind::EllipsisLiteral) {}
};

} // namespace pyscope::ast
