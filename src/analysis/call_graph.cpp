/***
 * Name: pyscope::analysis::CallGraph / CalleeDescriptor
 * Purpose: Accumulate call edges per scope; order and label descriptors.
 * Inputs: scope ids and descriptors produced by the extractor
 * Outputs: Ordered, deduplicated callee sets
 * Theory of Operation: std::map::try_emplace gives get-or-create in one step.
 */
#include "pyscope/analysis/model.h"

#include <cstddef>
#include <string>
#include <tuple>

namespace pyscope::analysis {

std::string CalleeDescriptor::label() const {
  switch (kind) {
    case CalleeKind::Call: return text;
    case CalleeKind::Condition: return "Condition: " + text;
    case CalleeKind::ForLoop: return "For Loop: " + text;
    case CalleeKind::WhileLoop: return "While Loop: " + text;
  }
  return text;
}

bool CalleeDescriptor::operator<(const CalleeDescriptor& other) const {
  const std::string lhs = label();
  const std::string rhs = other.label();
  return std::tie(lhs, kind) < std::tie(rhs, other.kind);
}

CallGraph::CalleeSet& CallGraph::insert(const std::string& scope_id) {
  return edges_.try_emplace(scope_id).first->second;
}

const CallGraph::CalleeSet* CallGraph::find(const std::string& scope_id) const {
  const auto it = edges_.find(scope_id);
  return it == edges_.end() ? nullptr : &it->second;
}

std::size_t CallGraph::edgeCount() const {
  std::size_t total = 0;
  for (const auto& entry : edges_) {
    total += entry.second.size();
  }
  return total;
}

}  // namespace pyscope::analysis
