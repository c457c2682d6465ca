#pragma once

#include "Stmt.h"

namespace pyscope::ast {
    struct ContinueStmt final : Stmt {
        ContinueStmt() : Stmt(NodeKind::ContinueStmt) {}
    };
}
