/***
 * Name: pyscope::graph::WriteDot
 * Purpose: Serialize a GraphModel as Graphviz DOT source.
 * Inputs: GraphModel
 * Outputs: DOT text (digraph, clusters, styled nodes and edges)
 * Theory of Operation: Every id, label and attribute value is emitted as a
 *   quoted string; '"' and '\' are escaped and newlines become "\n".
 */
#pragma once

#include <string>

#include "pyscope/graph/graph_model.h"

namespace pyscope {
namespace graph {

std::string WriteDot(const GraphModel& graph);

/*** QuoteDot: "text" with DOT escaping applied. */
std::string QuoteDot(const std::string& text);

}  // namespace graph
}  // namespace pyscope
