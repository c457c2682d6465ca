/***
 * Name: pyscope::ast::StringLiteral
 * Purpose: String literal node; value holds the decoded text.
 */
#pragma once

#include <string>
#include "ast/Literal.h"

namespace pyscope::ast {
    using StringLiteral = Literal<std::string, NodeKind::StringLiteral>;
}
