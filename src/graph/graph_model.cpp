/***
 * Name: pyscope::graph::GraphModel
 * Purpose: Node and edge storage with uniqueness and self-loop suppression.
 * Inputs: nodes and (from, to, kind) triples
 * Outputs: ordered node/edge lists
 * Theory of Operation: Node ids are indexed in a hash map. Duplicate edges
 *   are found by a linear scan; graphs of a single module are small.
 */
#include "pyscope/graph/graph_model.h"

#include <algorithm>
#include <string>
#include <utility>

namespace pyscope::graph {

const char* ToString(NodeKind kind) {
  switch (kind) {
    case NodeKind::Module: return "module";
    case NodeKind::GlobalsGroup: return "globals";
    case NodeKind::GlobalVariable: return "global";
    case NodeKind::ImportsGroup: return "imports";
    case NodeKind::Import: return "import";
    case NodeKind::Class: return "class";
    case NodeKind::Function: return "function";
    case NodeKind::Method: return "method";
    case NodeKind::Attribute: return "attribute";
    case NodeKind::External: return "external";
    case NodeKind::Base: return "base";
    case NodeKind::MissingCaller: return "missing-caller";
    case NodeKind::ControlFlow: return "control-flow";
  }
  return "unknown";
}

const char* EdgeLabel(EdgeKind kind) {
  switch (kind) {
    case EdgeKind::Contains: return "contains";
    case EdgeKind::Defines: return "defines";
    case EdgeKind::Imports: return "imports";
    case EdgeKind::HasAttribute: return "has attribute";
    case EdgeKind::ContainsMethod: return "contains method";
    case EdgeKind::Calls: return "calls";
    case EdgeKind::Inherits: return "inherits";
  }
  return "";
}

const GraphNode* GraphModel::findNode(const std::string& id) const {
  const auto it = index_.find(id);
  return it == index_.end() ? nullptr : &nodes_[it->second];
}

bool GraphModel::addNode(GraphNode node) {
  if (hasNode(node.id)) {
    return false;
  }
  index_.emplace(node.id, nodes_.size());
  nodes_.push_back(std::move(node));
  return true;
}

bool GraphModel::hasEdge(const std::string& from, const std::string& to, EdgeKind kind) const {
  const GraphEdge probe{from, to, kind};
  return std::find(edges_.begin(), edges_.end(), probe) != edges_.end();
}

bool GraphModel::addEdge(const std::string& from, const std::string& to, EdgeKind kind) {
  if (from == to || hasEdge(from, to, kind)) {
    return false;
  }
  edges_.push_back(GraphEdge{from, to, kind});
  return true;
}

}  // namespace pyscope::graph
