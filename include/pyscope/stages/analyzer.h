/***
 * Name: pyscope::stages::Analyzer
 * Purpose: Stage class running the structural extraction and the renderers.
 * Inputs: AST root and module name; or a finished Structure
 * Outputs: Structure, report text, graph model; counters for metrics
 * Theory of Operation: Thin timing wrappers over analysis:: and graph::.
 */
#pragma once

#include <string>

#include "ast/Module.h"
#include "pyscope/analysis/model.h"
#include "pyscope/graph/graph_model.h"
#include "pyscope/metrics/metrics.h"

namespace pyscope {
namespace stages {

class Analyzer : public metrics::Metrics {
 public:
  /*** Extract: Build the Structure for a parsed module. */
  static analysis::Structure Extract(const ast::Module& root, const std::string& module_name);
  /*** Render: Text report for a Structure. */
  static std::string Render(const analysis::Structure& structure);
  /*** BuildGraph: Graph model for a Structure. */
  static graph::GraphModel BuildGraph(const analysis::Structure& structure);
};

}  // namespace stages
}  // namespace pyscope
