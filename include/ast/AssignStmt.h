#pragma once

#include <memory>
#include <vector>

#include "Expr.h"
#include "Stmt.h"

namespace pyscope::ast {

    // a = b = value keeps both targets in source order
    struct AssignStmt final : Stmt {
        std::vector<std::unique_ptr<Expr>> targets;
        std::unique_ptr<Expr> value;
        explicit AssignStmt(std::unique_ptr<Expr> v)
            : Stmt(NodeKind::AssignStmt), value(std::move(v)) {}
    };
} // namespace pyscope::ast
