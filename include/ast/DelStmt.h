#pragma once

#include <memory>
#include <vector>
#include "ast/Stmt.h"
#include "ast/Expr.h"

namespace pyscope::ast {
    struct DelStmt final : Stmt {
        std::vector<std::unique_ptr<Expr>> targets;
        DelStmt() : Stmt(NodeKind::DelStmt) {}
    };
}
