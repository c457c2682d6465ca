/***
 * Name: pyscope::stages::Analyzer::{Extract, Render, BuildGraph}
 * Purpose: Timed wrappers over extraction, text rendering and graph building.
 * Inputs: AST root and module name; Structure
 * Outputs: Structure; report text; GraphModel
 * Theory of Operation: Each call owns one metrics phase and records the
 *   counters that describe its output.
 */
#include "pyscope/stages/analyzer.h"

#include <cstddef>
#include <string>

#include "pyscope/analysis/extractor.h"
#include "pyscope/analysis/text_renderer.h"
#include "pyscope/graph/graph_builder.h"

namespace pyscope::stages {

auto Analyzer::Extract(const ast::Module& root, const std::string& module_name) -> analysis::Structure {
  const metrics::Metrics::ScopedTimer timer(metrics::Metrics::Phase::Extract);
  analysis::StructuralExtractor extractor;
  analysis::Structure structure = extractor.extract(root, module_name);
  std::size_t methods = 0;
  for (const auto& cls : structure.classes) {
    methods += cls.methods.size();
  }
  metrics::Metrics::AddCounter("functions", structure.functions.size() + methods);
  metrics::Metrics::AddCounter("classes", structure.classes.size());
  metrics::Metrics::AddCounter("call_edges", structure.calls.edgeCount());
  return structure;
}

auto Analyzer::Render(const analysis::Structure& structure) -> std::string {
  const metrics::Metrics::ScopedTimer timer(metrics::Metrics::Phase::Render);
  return analysis::RenderText(structure);
}

auto Analyzer::BuildGraph(const analysis::Structure& structure) -> graph::GraphModel {
  const metrics::Metrics::ScopedTimer timer(metrics::Metrics::Phase::BuildGraph);
  graph::GraphModelBuilder builder;
  graph::GraphModel model = builder.build(structure);
  metrics::Metrics::AddCounter("graph_nodes", model.nodes().size());
  metrics::Metrics::AddCounter("graph_edges", model.edges().size());
  return model;
}

}  // namespace pyscope::stages
