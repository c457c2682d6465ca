/**
 * @file
 * @brief AST try/except declarations.
 */
#pragma once

#include <memory>
#include <vector>
#include "Stmt.h"
#include "ast/ExceptHandler.h"

namespace pyscope::ast {
    struct TryStmt final : Stmt {
        std::vector<std::unique_ptr<Stmt>> body;
        std::vector<std::unique_ptr<ExceptHandler>> handlers;
        std::vector<std::unique_ptr<Stmt>> orelse;
        std::vector<std::unique_ptr<Stmt>> finalbody;
        TryStmt() : Stmt(NodeKind::TryStmt) {}
    };
}
