#pragma once

#include <string>
#include "ast/Literal.h"

namespace pyscope::ast {
    using BytesLiteral = Literal<std::string, NodeKind::BytesLiteral>;
}
