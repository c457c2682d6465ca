#pragma once

#include <memory>
#include <vector>
#include "ast/Stmt.h"
#include "ast/Expr.h"
#include "ast/Pattern.h"

namespace pyscope::ast {

struct MatchCase final : Node {
  std::unique_ptr<Pattern> pattern;
  std::unique_ptr<Expr> guard; // optional; null when absent
  std::vector<std::unique_ptr<Stmt>> body;
  MatchCase() : Node(NodeKind::MatchCase) {}
};

struct MatchStmt final : Stmt {
  std::unique_ptr<Expr> subject;
  std::vector<std::unique_ptr<MatchCase>> cases;
  MatchStmt() : Stmt(NodeKind::MatchStmt) {}
};

} // namespace pyscope::ast
