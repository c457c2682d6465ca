#pragma once

#include "Stmt.h"

namespace pyscope::ast {
    struct BreakStmt final : Stmt {
        BreakStmt() : Stmt(NodeKind::BreakStmt) {}
    };
}
