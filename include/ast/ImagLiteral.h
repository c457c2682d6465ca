#pragma once

#include <string>
#include "ast/Literal.h"

namespace pyscope::ast {

    using ImagLiteral = Literal<std::string, NodeKind::ImagLiteral>;

} // namespace pyscope::ast
