/**
 * @file
 * @brief AST utility declarations (HasName mixin).
 */
#pragma once

#include <string>

namespace pyscope::ast {

struct HasName {
    std::string name;
};

}
