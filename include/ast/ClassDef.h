#pragma once

#include <memory>
#include <string>
#include <vector>
#include "ast/Call.h"
#include "ast/Expr.h"
#include "ast/HasBody.h"
#include "ast/HasName.h"
#include "ast/Stmt.h"

namespace pyscope::ast {
    struct ClassDef final : Stmt, HasBody<Stmt>, HasName {
        std::vector<std::unique_ptr<Expr>> bases;       // positional bases
        std::vector<KeywordArg> keywords;               // metaclass=..., other class keywords
        std::vector<std::unique_ptr<Expr>> decorators;  // decorator expressions
        explicit ClassDef(std::string n) : Stmt(NodeKind::ClassDef), HasName{std::move(n)} {}
    };
}
