#pragma once

#include <memory>
#include <string>

namespace pyscope::ast {
    struct Expr; // fwd
    struct Param {
        std::string name;
        std::unique_ptr<Expr> annotation{};   // optional, any expression
        std::unique_ptr<Expr> defaultValue{}; // optional
        bool isVarArg{false};   // *args
        bool isKwVarArg{false}; // **kwargs
        bool isKwOnly{false};   // kw-only param (after * or *args)
        bool isPosOnly{false};  // positional-only (before '/')
    };
} // namespace pyscope::ast
