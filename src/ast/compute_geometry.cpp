/***
 * Name: pyscope::ast::ComputeGeometry
 * Purpose: Compute AST geometry (node count and maximum depth) via DFS.
 * Inputs:
 *   - root: AST root node
 * Outputs:
 *   - out: populated geometry statistics
 * Theory of Operation: Recursive traversal over forEachChild counting nodes and
 *   tracking depth; the root has depth 1.
 */
#include <algorithm>
#include <cstddef>

#include "ast/Children.h"
#include "ast/Geometry.h"

namespace pyscope::ast {

static void DepthFirstAccumulate(const Node& node, std::size_t depth_value, ASTGeometry& out) {
  out.max_depth = std::max(depth_value, out.max_depth);
  ++out.node_count;
  forEachChild(node, [&](const Node& child) { DepthFirstAccumulate(child, depth_value + 1, out); });
}

void ComputeGeometry(const Node& root, ASTGeometry& out) {
  out = ASTGeometry{};
  constexpr std::size_t kInitialDepth = 1U;
  DepthFirstAccumulate(root, kInitialDepth, out);
}

} // namespace pyscope::ast
