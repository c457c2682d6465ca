/**
 * @file
 * @brief AST declarations.
 */
#pragma once

#include <string>
#include <vector>
#include "Stmt.h"

namespace pyscope::ast {

struct GlobalStmt final : Stmt {
  std::vector<std::string> names;
  GlobalStmt() : Stmt(NodeKind::GlobalStmt) {}
};

} // namespace pyscope::ast
