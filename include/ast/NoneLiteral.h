/***
 * Name: pyscope::ast::NoneLiteral
 * Purpose: Represent the Python None literal.
 */
#pragma once

#include "ast/Expr.h"

namespace pyscope::ast {

struct NoneLiteral final : Expr {
  NoneLiteral() : Expr(NodeKind::NoneLiteral) {}
};

}
