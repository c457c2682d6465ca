#pragma once

#include "Stmt.h"

namespace pyscope::ast {
    struct PassStmt final : Stmt {
        PassStmt() : Stmt(NodeKind::PassStmt) {}
    };
}
