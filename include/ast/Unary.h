#pragma once
#include <memory>

#include "Expr.h"
#include "UnaryOperator.h"

namespace pyscope::ast {
    struct Unary final : Expr {
        UnaryOperator op;
        std::unique_ptr<Expr> operand;
        Unary(const UnaryOperator o, std::unique_ptr<Expr> v)
            : Expr(NodeKind::UnaryExpr), op(o), operand(std::move(v)) {}
    };
} // namespace pyscope::ast
