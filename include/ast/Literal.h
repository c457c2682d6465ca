#pragma once

#include "ast/Expr.h"

namespace pyscope::ast {

template <typename T, NodeKind K>
struct Literal final : Expr {
    T value;
    explicit Literal(T v) : Expr(K), value(std::move(v)) {}
};

} // namespace pyscope::ast
