/***
 * Name: pyscope::graph (graph model)
 * Purpose: Node/edge graph derived from a Structure, independent of DOT.
 * Inputs: Built by GraphModelBuilder
 * Outputs: Consumed by WriteDot and by tests
 * Theory of Operation: Nodes and edges are kept in insertion order; an id
 *   index makes lookups O(1). Clusters group the module's own nodes and
 *   each class's nodes for layout.
 */
#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <tuple>
#include <unordered_map>
#include <vector>

#include "pyscope/analysis/model.h"

namespace pyscope {
namespace graph {

enum class NodeKind {
  Module,
  GlobalsGroup,
  GlobalVariable,
  ImportsGroup,
  Import,
  Class,
  Function,
  Method,
  Attribute,
  External,       // unresolved callee
  Base,           // base class not defined in the module
  MissingCaller,  // scope id without a declaration node
  ControlFlow     // synthetic condition/loop label
};

enum class EdgeKind { Contains, Defines, Imports, HasAttribute, ContainsMethod, Calls, Inherits };

const char* ToString(NodeKind kind);
const char* EdgeLabel(EdgeKind kind);

struct GraphCluster {
  std::string name;   // DOT subgraph name, starts with "cluster_"
  std::string label;
  bool is_class{false};
};

struct GraphNode {
  std::string id;
  NodeKind kind{NodeKind::External};
  std::string label;
  std::optional<std::size_t> cluster;              // index into GraphModel::clusters
  analysis::CalleeKind flow{analysis::CalleeKind::Call};  // ControlFlow only
};

struct GraphEdge {
  std::string from;
  std::string to;
  EdgeKind kind{EdgeKind::Calls};

  bool operator==(const GraphEdge& other) const {
    return std::tie(from, to, kind) == std::tie(other.from, other.to, other.kind);
  }
};

class GraphModel {
 public:
  std::string module_name;
  std::vector<GraphCluster> clusters;

  const std::vector<GraphNode>& nodes() const { return nodes_; }
  const std::vector<GraphEdge>& edges() const { return edges_; }

  bool hasNode(const std::string& id) const { return index_.count(id) != 0U; }
  const GraphNode* findNode(const std::string& id) const;

  /*** addNode: append a node; returns false (and adds nothing) when the id is taken. */
  bool addNode(GraphNode node);
  /*** addEdge: append unless it is a self-loop or an exact duplicate. */
  bool addEdge(const std::string& from, const std::string& to, EdgeKind kind);
  bool hasEdge(const std::string& from, const std::string& to, EdgeKind kind) const;

 private:
  std::vector<GraphNode> nodes_;
  std::vector<GraphEdge> edges_;
  std::unordered_map<std::string, std::size_t> index_;
};

}  // namespace graph
}  // namespace pyscope
