/**
 * @file
 * @brief AST unary operator enumeration.
 */
#pragma once

namespace pyscope::ast {

enum class UnaryOperator {
    Neg,
    Pos,
    Not,
    BitNot
};

} // namespace pyscope::ast
