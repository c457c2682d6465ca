/***
 * Name: pyscope::ast::ComputeGeometry
 * Purpose: Summarize tree size for metrics (node count and maximum depth).
 */
#pragma once

#include <cstddef>
#include "ast/Node.h"

namespace pyscope::ast {

struct ASTGeometry {
  std::size_t node_count{0};
  std::size_t max_depth{0};
};

void ComputeGeometry(const Node& root, ASTGeometry& out);

} // namespace pyscope::ast
