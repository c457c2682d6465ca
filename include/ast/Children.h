/***
 * Name: pyscope::ast::forEachChild
 * Purpose: Enumerate the direct children of any node in source order.
 * Inputs: node, callback invoked once per non-null child
 * Outputs: None
 * Theory of Operation:
 *   One exhaustive switch over NodeKind. Walkers that only care about a few
 *   kinds handle those and delegate descent here.
 */
#pragma once

#include <functional>
#include "ast/Node.h"

namespace pyscope::ast {

void forEachChild(const Node& node, const std::function<void(const Node&)>& fn);

} // namespace pyscope::ast
