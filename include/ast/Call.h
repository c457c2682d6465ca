#pragma once
#include <memory>
#include <string>
#include <vector>

#include "Expr.h"

namespace pyscope::ast {
    struct KeywordArg { std::string name; std::unique_ptr<Expr> value; };

    struct Call final : Expr {
        std::unique_ptr<Expr> callee; // Name, Attribute, Call, Subscript, ...
        std::vector<std::unique_ptr<Expr>> args;      // positional
        std::vector<KeywordArg> keywords;             // named args
        std::vector<std::unique_ptr<Expr>> starArgs;  // *expr
        std::vector<std::unique_ptr<Expr>> kwStarArgs;// **expr
        explicit Call(std::unique_ptr<Expr> c) : Expr(NodeKind::Call), callee(std::move(c)) {}
    };

} // namespace pyscope::ast
