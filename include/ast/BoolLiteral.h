#pragma once

#include "ast/Literal.h"

namespace pyscope::ast {

    using BoolLiteral = Literal<bool, NodeKind::BoolLiteral>;

} // namespace pyscope::ast
