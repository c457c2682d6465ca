#pragma once

#include <string>
#include "ast/Literal.h"

namespace pyscope::ast {

    // Source spelling; Python integers are unbounded.
    using IntLiteral = Literal<std::string, NodeKind::IntLiteral>;

} // namespace pyscope::ast
