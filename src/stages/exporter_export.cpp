/***
 * Name: pyscope::stages::Exporter::Export
 * Purpose: Export a graph and map export exceptions to Error values.
 * Inputs:
 *   - graph, destination, format, options
 * Outputs:
 *   - artifact: written artifact path on success
 *   - err: EngineMissing or ExportFailure
 * Theory of Operation: EngineMissingError is caught before its ExportError base.
 */
#include "pyscope/stages/exporter.h"

#include <string>

#include "pyscope/exceptions/engine_missing_error.h"
#include "pyscope/exceptions/pyscope_exception.h"

namespace pyscope::stages {

auto Exporter::Export(const graph::GraphModel& graph, const std::string& destination, graph::ExportFormat format,
                      const graph::ExportOptions& options, std::string& artifact, support::Error& err) -> bool {
  const metrics::Metrics::ScopedTimer timer(metrics::Metrics::Phase::Export);
  try {
    const graph::GraphExporter exporter{options};
    artifact = exporter.exportGraph(graph, destination, format);
  } catch (const exceptions::EngineMissingError&) {
    err = support::Error{support::ErrorKind::EngineMissing,
                         "Error: Graphviz executable (dot) not found. Please ensure Graphviz is installed and added "
                         "to your system's PATH."};
    return false;
  } catch (const exceptions::PyscopeException& ex) {
    err = support::Error{support::ErrorKind::ExportFailure, std::string("Error generating graph: ") + ex.what()};
    return false;
  }
  return true;
}

}  // namespace pyscope::stages
