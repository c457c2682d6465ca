/**
 * @file
 * @brief AST with statement declarations.
 */
#pragma once

#include <memory>
#include <vector>
#include "Stmt.h"
#include "ast/WithItem.h"

namespace pyscope::ast {
    struct WithStmt final : Stmt {
        std::vector<std::unique_ptr<WithItem>> items;
        std::vector<std::unique_ptr<Stmt>> body;
        bool isAsync{false};
        WithStmt() : Stmt(NodeKind::WithStmt) {}
    };
}
