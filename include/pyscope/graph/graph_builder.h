/***
 * Name: pyscope::graph::GraphModelBuilder
 * Purpose: Turn a Structure into a GraphModel with collision-free ids,
 *   resolved callers and callees, and synthesized placeholder nodes.
 * Inputs: analysis::Structure
 * Outputs: GraphModel
 * Theory of Operation:
 *   1. Declarations in structure order: module, globals group and one node
 *      per global, imports group and one node per import statement, global
 *      functions, then each class with its attributes and
 *      methods. A taken id gets "#2", "#3", ... appended; lookups by name
 *      keep pointing at the first declaration.
 *   2. Call edges in sorted scope-id then sorted descriptor order.
 *   3. Inheritance edges in class order, base placeholders as needed.
 */
#pragma once

#include <map>
#include <string>
#include <utility>
#include <vector>

#include "pyscope/analysis/model.h"
#include "pyscope/graph/graph_model.h"

namespace pyscope {
namespace graph {

class GraphModelBuilder {
 public:
  GraphModel build(const analysis::Structure& structure);

 private:
  GraphModel graph_{};
  std::string prefix_;  // "<module>."
  std::vector<std::string> class_ids_;  // first-claim id per class record
  std::map<std::pair<NodeKind, std::string>, std::string> placeholders_;  // (kind, natural id) -> node id
  std::map<std::string, std::string> method_ids_;  // "<module>.<Class>.<method>" -> first method node id

  std::string claim(const std::string& base_id);
  void addDeclarations(const analysis::Structure& structure);
  void addCallEdges(const analysis::Structure& structure);
  void addInheritance(const analysis::Structure& structure);

  std::string resolveCaller(const std::string& scope_id);
  std::string resolveCallee(const analysis::Structure& structure, const analysis::CalleeDescriptor& callee);
  std::string ensurePlaceholder(const std::string& key, NodeKind kind, const std::string& label,
                                analysis::CalleeKind flow = analysis::CalleeKind::Call);
  bool isKind(const std::string& id, NodeKind kind) const;
};

/*** FunctionLabel: "Function: f(\nargs) -> ret" / "Method: ..." with optional decorator line. */
std::string FunctionLabel(const char* title, const analysis::FunctionRecord& func);

}  // namespace graph
}  // namespace pyscope
