#pragma once

#include <string>
#include <vector>
#include "Stmt.h"

namespace pyscope::ast {

struct NonlocalStmt final : Stmt {
  std::vector<std::string> names;
  NonlocalStmt() : Stmt(NodeKind::NonlocalStmt) {}
};

} // namespace pyscope::ast
