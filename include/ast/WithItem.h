#pragma once

#include <memory>
#include "Expr.h"

namespace pyscope::ast {
    struct WithItem final : Node {
        std::unique_ptr<Expr> context;
        std::unique_ptr<Expr> optionalVars; // 'as' target, null if none
        WithItem() : Node(NodeKind::WithItem) {}
    };
}
