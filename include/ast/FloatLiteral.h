#pragma once

#include <string>
#include "ast/Literal.h"

namespace pyscope::ast {

    using FloatLiteral = Literal<std::string, NodeKind::FloatLiteral>;

} // namespace pyscope::ast
