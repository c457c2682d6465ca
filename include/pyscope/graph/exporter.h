/***
 * Name: pyscope::graph::GraphExporter
 * Purpose: Materialize a GraphModel as an artifact: DOT source written
 *   directly ("gv") or laid out by the Graphviz dot engine (png/svg/pdf/dot).
 * Inputs: GraphModel, destination path, ExportFormat, ExportOptions
 * Outputs: Artifact path (destination with its extension replaced)
 * Theory of Operation:
 *   DOT text goes to "<stem>.gv.tmp", the engine runs as
 *   `dot -T<fmt> -o <artifact> <tmp>` through fork/execvp, and the temporary
 *   file is removed on every path. Failures throw
 *   exceptions::EngineMissingError (engine not found or not executable) or
 *   exceptions::ExportError (anything else); no partial artifact remains.
 */
#pragma once

#include <string>
#include <utility>

#include "pyscope/graph/graph_model.h"

namespace pyscope {
namespace graph {

enum class ExportFormat { Png, Svg, Pdf, Dot, Gv };

/*** ParseExportFormat: "png", "svg", "pdf", "dot" or "gv" (case-sensitive). */
bool ParseExportFormat(const std::string& text, ExportFormat& out);
const char* FormatName(ExportFormat format);

/*** ArtifactPath: destination with its final extension replaced by the format's. */
std::string ArtifactPath(const std::string& destination, ExportFormat format);

struct ExportOptions {
  std::string engine;  // explicit dot binary; empty searches PATH for "dot"
};

class GraphExporter {
 public:
  explicit GraphExporter(ExportOptions options) : options_(std::move(options)) {}

  /*** exportGraph: write the artifact and return its path; throws on failure. */
  std::string exportGraph(const GraphModel& graph, const std::string& destination, ExportFormat format) const;

 private:
  ExportOptions options_;

  std::string locateEngine() const;
  void runEngine(const std::string& engine, const std::string& source, const std::string& artifact,
                 ExportFormat format) const;
};

}  // namespace graph
}  // namespace pyscope
