/**
 * @file
 * @brief AST return statement declarations.
 */
#pragma once

#include <memory>
#include "ast/Expr.h"
#include "ast/Stmt.h"

namespace pyscope::ast {
    struct ReturnStmt final : Stmt {
        std::unique_ptr<Expr> value; // null for a bare 'return'
        explicit ReturnStmt(std::unique_ptr<Expr> v)
            : Stmt(NodeKind::ReturnStmt), value(std::move(v)) {}
    };

} // namespace pyscope::ast
