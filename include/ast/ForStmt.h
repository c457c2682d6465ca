#pragma once

#include <memory>
#include "Expr.h"
#include "Stmt.h"
#include "ast/HasBodyPair.h"

namespace pyscope::ast {
    struct ForStmt final : Stmt, HasBodyPair<Stmt> {
        std::unique_ptr<Expr> target;   // general target (name, tuple, list, attr, subscript)
        std::unique_ptr<Expr> iterable; // expression producing an iterable
        bool isAsync{false};
        ForStmt(std::unique_ptr<Expr> t, std::unique_ptr<Expr> it)
            : Stmt(NodeKind::ForStmt), target(std::move(t)), iterable(std::move(it)) {}
    };
}
