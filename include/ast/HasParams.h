/**
 * @file
 * @brief AST utility declarations (HasParams mixin).
 */
#pragma once

#include <vector>

namespace pyscope::ast {

template <typename ParamT>
struct HasParams {
    std::vector<ParamT> params;
};

}
