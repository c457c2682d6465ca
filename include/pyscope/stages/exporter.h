/***
 * Name: pyscope::stages::Exporter
 * Purpose: Stage class that exports a graph model to an artifact.
 * Inputs: GraphModel, destination, format, export options
 * Outputs: Artifact path or an Error (EngineMissing / ExportFailure)
 * Theory of Operation: Runs graph::GraphExporter under the Export timer and
 *   maps its exceptions to Error values with user-facing messages.
 */
#pragma once

#include <string>

#include "pyscope/graph/exporter.h"
#include "pyscope/graph/graph_model.h"
#include "pyscope/metrics/metrics.h"
#include "pyscope/support/error.h"

namespace pyscope {
namespace stages {

class Exporter : public metrics::Metrics {
 public:
  static bool Export(const graph::GraphModel& graph, const std::string& destination, graph::ExportFormat format,
                     const graph::ExportOptions& options, std::string& artifact, support::Error& err);
};

}  // namespace stages
}  // namespace pyscope
