/**
 * @file
 * @brief AST expression base declarations.
 */
#pragma once

#include "Node.h"

namespace pyscope::ast {
    struct Expr : Node {
        using Node::Node;
    };
} // namespace pyscope::ast
