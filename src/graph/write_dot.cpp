/***
 * Name: pyscope::graph::WriteDot
 * Purpose: Emit DOT source for the graph model.
 * Inputs:
 *   - graph: built model
 * Outputs: DOT text
 * Theory of Operation: Clusters are written first with their member nodes,
 *   then unclustered placeholder nodes, then all edges in model order.
 *   Styles are chosen per node kind.
 */
#include "pyscope/graph/dot_writer.h"

#include <cstddef>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace pyscope::graph {

namespace {

using Attrs = std::vector<std::pair<std::string, std::string>>;

Attrs NodeStyle(const GraphNode& node) {
  switch (node.kind) {
    case NodeKind::Module:
      return {{"shape", "folder"}, {"style", "filled"}, {"fillcolor", "#ADD8E6"}};
    case NodeKind::GlobalsGroup:
      return {{"shape", "note"}, {"style", "filled"}, {"fillcolor", "grey"}, {"fontcolor", "white"}};
    case NodeKind::GlobalVariable:
      return {{"shape", "rectangle"}, {"style", "filled"}, {"fillcolor", "#C0C0C0"}};
    case NodeKind::ImportsGroup:
      return {{"shape", "tab"}, {"style", "filled"}, {"fillcolor", "#E6E6FA"}};
    case NodeKind::Import:
      return {{"shape", "rectangle"}, {"style", "filled"}, {"fillcolor", "#F3F0FF"}};
    case NodeKind::Class:
      return {{"shape", "component"}, {"style", "filled"}, {"fillcolor", "#FFD700"}};
    case NodeKind::Function:
      return {{"shape", "ellipse"}, {"style", "filled"}, {"fillcolor", "#90EE90"}};
    case NodeKind::Method:
      return {{"shape", "octagon"}, {"style", "filled"}, {"fillcolor", "#FFB6C1"}};
    case NodeKind::Attribute:
      return {{"shape", "rectangle"}, {"style", "filled"}, {"fillcolor", "#D3D3D3"}};
    case NodeKind::External:
      return {{"shape", "box"}, {"style", "dashed"}, {"color", "gray"}, {"fillcolor", "white"}};
    case NodeKind::Base:
      return {{"shape", "box"}, {"style", "dashed"}, {"color", "grey"}, {"fillcolor", "white"}};
    case NodeKind::MissingCaller:
      return {{"shape", "box"}, {"style", "dashed"}, {"color", "red"}, {"fillcolor", "white"}};
    case NodeKind::ControlFlow: {
      const bool condition = node.flow == analysis::CalleeKind::Condition;
      return {{"shape", "diamond"}, {"style", "dashed"}, {"color", condition ? "blue" : "orange"}, {"fillcolor", "white"}};
    }
  }
  return {};
}

Attrs EdgeStyle(const GraphEdge& edge) {
  Attrs attrs{{"label", EdgeLabel(edge.kind)}};
  if (edge.kind == EdgeKind::Calls) {
    attrs.emplace_back("color", "purple");
  } else if (edge.kind == EdgeKind::Inherits) {
    attrs.emplace_back("style", "dashed");
    attrs.emplace_back("arrowhead", "empty");
  }
  return attrs;
}

void WriteAttrs(std::ostringstream& out, const Attrs& attrs) {
  out << " [";
  for (std::size_t i = 0; i < attrs.size(); ++i) {
    if (i != 0U) {
      out << ' ';
    }
    out << attrs[i].first << '=' << QuoteDot(attrs[i].second);
  }
  out << ']';
}

void WriteNode(std::ostringstream& out, const GraphNode& node, const char* indent) {
  Attrs attrs{{"label", node.label}};
  for (auto& attr : NodeStyle(node)) {
    attrs.push_back(std::move(attr));
  }
  // SVG output carries the kind as a CSS class
  attrs.emplace_back("class", ToString(node.kind));
  out << indent << QuoteDot(node.id);
  WriteAttrs(out, attrs);
  out << '\n';
}

}  // namespace

std::string QuoteDot(const std::string& text) {
  std::string out;
  out.reserve(text.size() + 2U);
  out += '"';
  for (const char chr : text) {
    switch (chr) {
      case '"': out += "\\\""; break;
      case '\\': out += "\\\\"; break;
      case '\n': out += "\\n"; break;
      case '\r': break;
      default: out += chr;
    }
  }
  out += '"';
  return out;
}

std::string WriteDot(const GraphModel& graph) {
  std::ostringstream out;
  out << "// Code Structure of " << graph.module_name << '\n';
  out << "digraph " << QuoteDot(graph.module_name) << " {\n";
  out << "  graph";
  WriteAttrs(out, {{"rankdir", "LR"}, {"overlap", "false"}, {"splines", "true"}, {"bgcolor", "transparent"}});
  out << "\n  node";
  WriteAttrs(out, {{"fontsize", "10"}, {"fontname", "Helvetica"}, {"shape", "box"}, {"style", "filled"}});
  out << "\n  edge";
  WriteAttrs(out, {{"fontsize", "8"}, {"fontname", "Helvetica"}});
  out << '\n';

  for (std::size_t index = 0; index < graph.clusters.size(); ++index) {
    const auto& cluster = graph.clusters[index];
    out << "  subgraph " << QuoteDot(cluster.name) << " {\n    graph";
    if (cluster.is_class) {
      WriteAttrs(out, {{"label", cluster.label}, {"color", "darkgreen"}, {"style", "rounded,filled"}, {"fillcolor", "#FFFACD"}});
    } else {
      WriteAttrs(out, {{"label", cluster.label}, {"color", "blue"}, {"style", "rounded,filled"}, {"fillcolor", "#E0FFFF"}});
    }
    out << '\n';
    for (const auto& node : graph.nodes()) {
      if (node.cluster && *node.cluster == index) {
        WriteNode(out, node, "    ");
      }
    }
    out << "  }\n";
  }
  for (const auto& node : graph.nodes()) {
    if (!node.cluster) {
      WriteNode(out, node, "  ");
    }
  }
  for (const auto& edge : graph.edges()) {
    out << "  " << QuoteDot(edge.from) << " -> " << QuoteDot(edge.to);
    WriteAttrs(out, EdgeStyle(edge));
    out << '\n';
  }
  out << "}\n";
  return out.str();
}

}  // namespace pyscope::graph
