/**
 * @file
 * @brief AST declarations.
 */
#pragma once

#include <string>
#include <vector>
#include "ast/Stmt.h"
#include "ast/Alias.h"

namespace pyscope::ast {
    struct ImportFrom final : Stmt {
        std::string module; // empty for relative-only
        int level{0};       // number of leading dots
        std::vector<Alias> names; // a single "*" for star imports
        ImportFrom() : Stmt(NodeKind::ImportFrom) {}
    };
}
