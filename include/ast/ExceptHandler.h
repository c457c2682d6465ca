#pragma once

#include <memory>
#include <string>
#include <vector>
#include "Expr.h"
#include "Stmt.h"

namespace pyscope::ast {
    struct ExceptHandler final : Node {
        std::unique_ptr<Expr> type; // may be null
        std::string name;           // optional name (empty if none)
        std::vector<std::unique_ptr<Stmt>> body;
        ExceptHandler() : Node(NodeKind::ExceptHandler) {}
    };
}
