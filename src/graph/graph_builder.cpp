/***
 * Name: pyscope::graph::GraphModelBuilder::build
 * Purpose: Build the graph model for one Structure.
 * Inputs:
 *   - structure: extraction result
 * Outputs: GraphModel with unique node ids and no self-loop edges
 * Theory of Operation:
 *   Declaration ids are "<module>", "<module>.<globals>", "<module>.<imports>",
 *   "<module>.<globals>.<var>", "<module>.<imports>.<statement>",
 *   "<module>.<name>" and "<module>.<Class>.<member>". Placeholders are keyed
 *   by (kind, natural id); when a declaration already holds the natural id
 *   the placeholder claims a suffixed one instead of merging into it.
 *   Callers resolve by the number of components after the module prefix;
 *   anything that cannot be matched gets a missing-caller node named by the
 *   scope id so the edge is kept.
 */
#include "pyscope/graph/graph_builder.h"

#include "pyscope/analysis/text_renderer.h"

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace pyscope::graph {

namespace {

std::string JoinList(const std::vector<std::string>& items) {
  std::string out;
  for (std::size_t i = 0; i < items.size(); ++i) {
    if (i != 0U) {
      out += ", ";
    }
    out += items[i];
  }
  return out;
}

std::string AttributeLabel(const analysis::Variable& attr) {
  std::string label = "Attribute: " + attr.name;
  if (attr.annotation && !attr.annotation->empty()) {
    label += ": " + *attr.annotation;
  }
  if (attr.value) {
    label += " = " + *attr.value;
  }
  return label;
}

std::vector<std::string> SplitDots(const std::string& text) {
  std::vector<std::string> parts;
  std::string::size_type start = 0;
  while (true) {
    const auto dot = text.find('.', start);
    parts.push_back(text.substr(start, dot == std::string::npos ? std::string::npos : dot - start));
    if (dot == std::string::npos) {
      break;
    }
    start = dot + 1;
  }
  return parts;
}

}  // namespace

std::string FunctionLabel(const char* title, const analysis::FunctionRecord& func) {
  std::string label = std::string(title) + ": " + func.name + "(\n" + JoinList(func.args) + ")";
  if (func.return_annotation) {
    label += " -> " + *func.return_annotation;
  }
  if (!func.decorators.empty()) {
    label = "Decorators: " + JoinList(func.decorators) + "\n" + label;
  }
  return label;
}

GraphModel GraphModelBuilder::build(const analysis::Structure& structure) {
  graph_ = GraphModel{};
  graph_.module_name = structure.module_name;
  prefix_ = structure.module_name + ".";
  class_ids_.clear();
  placeholders_.clear();
  method_ids_.clear();

  addDeclarations(structure);
  addCallEdges(structure);
  addInheritance(structure);
  return std::move(graph_);
}

std::string GraphModelBuilder::claim(const std::string& base_id) {
  if (!graph_.hasNode(base_id)) {
    return base_id;
  }
  for (std::size_t suffix = 2;; ++suffix) {
    std::string candidate = base_id + "#" + std::to_string(suffix);
    if (!graph_.hasNode(candidate)) {
      return candidate;
    }
  }
}

bool GraphModelBuilder::isKind(const std::string& id, NodeKind kind) const {
  const GraphNode* node = graph_.findNode(id);
  return node != nullptr && node->kind == kind;
}

std::string GraphModelBuilder::ensurePlaceholder(const std::string& key, NodeKind kind, const std::string& label,
                                                 analysis::CalleeKind flow) {
  const auto it = placeholders_.find({kind, key});
  if (it != placeholders_.end()) {
    return it->second;
  }
  const std::string id = claim(key);
  graph_.addNode(GraphNode{id, kind, label, std::nullopt, flow});
  placeholders_.emplace(std::make_pair(kind, key), id);
  return id;
}

void GraphModelBuilder::addDeclarations(const analysis::Structure& structure) {
  const std::string& module_id = structure.module_name;
  graph_.clusters.push_back(GraphCluster{"cluster_module_" + module_id, "Module: " + module_id, false});
  constexpr std::size_t kModuleCluster = 0;

  graph_.addNode(GraphNode{module_id, NodeKind::Module, "Module: " + module_id, kModuleCluster});

  if (!structure.global_variables.empty()) {
    const std::string group_id = claim(prefix_ + "<globals>");
    graph_.addNode(GraphNode{group_id, NodeKind::GlobalsGroup, "Global Variables", kModuleCluster});
    graph_.addEdge(module_id, group_id, EdgeKind::Defines);
    for (const auto& var : structure.global_variables) {
      const std::string id = claim(group_id + "." + var.name);
      graph_.addNode(GraphNode{id, NodeKind::GlobalVariable, "Global: " + analysis::VariableText(var), kModuleCluster});
      graph_.addEdge(group_id, id, EdgeKind::Defines);
    }
  }
  const auto statements = analysis::ImportStatements(structure.imports);
  if (!statements.empty()) {
    const std::string group_id = claim(prefix_ + "<imports>");
    graph_.addNode(GraphNode{group_id, NodeKind::ImportsGroup, "Imports", kModuleCluster});
    graph_.addEdge(module_id, group_id, EdgeKind::Imports);
    for (const auto& statement : statements) {
      const std::string id = claim(group_id + "." + statement);
      graph_.addNode(GraphNode{id, NodeKind::Import, statement, kModuleCluster});
      graph_.addEdge(group_id, id, EdgeKind::Imports);
    }
  }

  for (const auto& func : structure.functions) {
    const std::string id = claim(prefix_ + func.name);
    graph_.addNode(GraphNode{id, NodeKind::Function, FunctionLabel("Function", func), kModuleCluster});
    graph_.addEdge(module_id, id, EdgeKind::Contains);
  }

  for (const auto& cls : structure.classes) {
    const std::string bases = cls.bases.empty() ? std::string{} : "(" + JoinList(cls.bases) + ")";
    const std::string decorators = cls.decorators.empty() ? std::string{} : "Decorators: " + JoinList(cls.decorators) + "\n";
    const std::size_t cluster = graph_.clusters.size();
    const std::string class_id = claim(prefix_ + cls.name);
    graph_.clusters.push_back(GraphCluster{"cluster_class_" + std::to_string(cluster), decorators + "Class: " + cls.name + bases, true});
    graph_.addNode(GraphNode{class_id, NodeKind::Class, "Class: " + cls.name + bases, cluster});
    graph_.addEdge(module_id, class_id, EdgeKind::Contains);
    class_ids_.push_back(class_id);

    for (const auto& attr : cls.attributes) {
      const std::string id = claim(class_id + "." + attr.name);
      graph_.addNode(GraphNode{id, NodeKind::Attribute, AttributeLabel(attr), cluster});
      graph_.addEdge(class_id, id, EdgeKind::HasAttribute);
    }
    for (const auto& method : cls.methods) {
      const std::string id = claim(class_id + "." + method.name);
      graph_.addNode(GraphNode{id, NodeKind::Method, FunctionLabel("Method", method), cluster});
      method_ids_.emplace(prefix_ + cls.name + "." + method.name, id);
      graph_.addEdge(class_id, id, EdgeKind::ContainsMethod);
    }
  }
}

std::string GraphModelBuilder::resolveCaller(const std::string& scope_id) {
  const std::string& module_id = graph_.module_name;
  if (scope_id == module_id) {
    return module_id;
  }
  if (scope_id.rfind(prefix_, 0) == 0U) {
    const auto parts = SplitDots(scope_id.substr(prefix_.size()));
    if (parts.size() == 1U &&
        (isKind(scope_id, NodeKind::Function) || isKind(scope_id, NodeKind::Class))) {
      return scope_id;
    }
    if (parts.size() == 2U) {
      if (const auto it = method_ids_.find(scope_id); it != method_ids_.end()) {
        return it->second;
      }
    }
  }
  return ensurePlaceholder(scope_id, NodeKind::MissingCaller, scope_id);
}

std::string GraphModelBuilder::resolveCallee(const analysis::Structure& structure,
                                             const analysis::CalleeDescriptor& callee) {
  if (callee.synthetic()) {
    const std::string label = callee.label();
    return ensurePlaceholder(label, NodeKind::ControlFlow, label, callee.kind);
  }
  const std::string direct = prefix_ + callee.text;
  if (isKind(direct, NodeKind::Function) || isKind(direct, NodeKind::Class)) {
    return direct;
  }
  for (const auto& cls : structure.classes) {
    if (const auto it = method_ids_.find(prefix_ + cls.name + "." + callee.text); it != method_ids_.end()) {
      return it->second;
    }
  }
  return ensurePlaceholder(callee.text, NodeKind::External, callee.text);
}

void GraphModelBuilder::addCallEdges(const analysis::Structure& structure) {
  for (const auto& [scope_id, callees] : structure.calls.entries()) {
    if (callees.empty()) {
      continue;
    }
    const std::string caller = resolveCaller(scope_id);
    for (const auto& callee : callees) {
      graph_.addEdge(caller, resolveCallee(structure, callee), EdgeKind::Calls);
    }
  }
}

void GraphModelBuilder::addInheritance(const analysis::Structure& structure) {
  for (std::size_t i = 0; i < structure.classes.size(); ++i) {
    for (const auto& base : structure.classes[i].bases) {
      std::string base_id = prefix_ + base;
      if (!isKind(base_id, NodeKind::Class)) {
        base_id = ensurePlaceholder(base_id, NodeKind::Base, base);
      }
      graph_.addEdge(base_id, class_ids_[i], EdgeKind::Inherits);
    }
  }
}

}  // namespace pyscope::graph
