/**
 * @file
 * @brief AST declarations.
 */
#pragma once

#include <memory>
#include <string>
#include <vector>
#include "ast/Expr.h"

namespace pyscope::ast {

struct FStringSegment {
  bool isExpr{false};
  std::string text; // when !isExpr
  std::unique_ptr<Expr> expr; // when isExpr; conversion and format spec are not kept
};

struct FStringLiteral final : Expr {
  std::vector<FStringSegment> parts;
  FStringLiteral() : Expr(NodeKind::FStringLiteral) {}
};

} // namespace pyscope::ast
