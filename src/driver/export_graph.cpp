/***
 * Name: pyscope::driver::ExportGraph
 * Purpose: Build the graph model for a Structure and export it.
 * Inputs: structure, destination, format, options
 * Outputs: artifact path on success; err carries EngineMissing or ExportFailure
 */
#include "pyscope/driver/app.h"

#include <string>

#include "pyscope/stages/analyzer.h"
#include "pyscope/stages/exporter.h"

namespace pyscope::driver {

bool ExportGraph(const analysis::Structure& structure, const std::string& destination, graph::ExportFormat format,
                 const graph::ExportOptions& options, std::string& artifact, support::Error& err) {
  const graph::GraphModel model = stages::Analyzer::BuildGraph(structure);
  return stages::Exporter::Export(model, destination, format, options, artifact, err);
}

}  // namespace pyscope::driver
