#pragma once

#include <vector>
#include "ast/Stmt.h"
#include "ast/Alias.h"

namespace pyscope::ast {
    struct Import final : Stmt {
        std::vector<Alias> names;
        Import() : Stmt(NodeKind::Import) {}
    };
}
