/***
 * Name: pyscope::graph::GraphExporter::exportGraph
 * Purpose: Write DOT source and drive the layout engine.
 * Inputs:
 *   - graph: model to export
 *   - destination: requested output path (extension replaced by format)
 *   - format: export format
 * Outputs: artifact path
 * Theory of Operation: A scope guard removes the temporary source; any
 *   engine failure also removes a partially written artifact before the
 *   exception leaves.
 */
#include "pyscope/graph/exporter.h"

#include <filesystem>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include "pyscope/backend/detail/exec.h"
#include "pyscope/exceptions/engine_missing_error.h"
#include "pyscope/exceptions/export_error.h"
#include "pyscope/graph/dot_writer.h"
#include "pyscope/support/fs.h"

namespace pyscope::graph {

namespace {

class TempFileGuard {
 public:
  explicit TempFileGuard(std::string path) : path_(std::move(path)) {}
  ~TempFileGuard() { (void)support::RemoveFile(path_); }
  TempFileGuard(const TempFileGuard&) = delete;
  TempFileGuard& operator=(const TempFileGuard&) = delete;

 private:
  std::string path_;
};

void EnsureParentDirectory(const std::string& path) {
  const std::filesystem::path parent = std::filesystem::path(path).parent_path();
  if (parent.empty()) {
    return;
  }
  std::error_code ec;
  std::filesystem::create_directories(parent, ec);
  if (ec) {
    throw exceptions::ExportError("cannot create directory '" + parent.string() + "': " + ec.message());
  }
}

}  // namespace

std::string GraphExporter::locateEngine() const {
  const std::string requested = options_.engine.empty() ? std::string{"dot"} : options_.engine;
  std::string resolved;
  if (!support::FindExecutable(requested, resolved)) {
    throw exceptions::EngineMissingError("Graphviz executable (dot) not found: " + requested);
  }
  return resolved;
}

void GraphExporter::runEngine(const std::string& engine, const std::string& source, const std::string& artifact,
                              ExportFormat format) const {
  std::vector<std::string> args{engine, std::string("-T") + FormatName(format), "-o", artifact, source};
  auto argv = backend::detail::BuildArgvMutable(args);
  int exit_code = 0;
  std::string err;
  if (!backend::detail::ExecAndWait(argv, exit_code, err)) {
    (void)support::RemoveFile(artifact);
    if (exit_code == backend::detail::kExecFailure) {
      throw exceptions::EngineMissingError("could not execute '" + engine + "'");
    }
    throw exceptions::ExportError(err);
  }
  if (!support::FileExists(artifact)) {
    throw exceptions::ExportError("layout engine produced no output: " + artifact);
  }
}

std::string GraphExporter::exportGraph(const GraphModel& graph, const std::string& destination,
                                       ExportFormat format) const {
  const std::string artifact = ArtifactPath(destination, format);
  EnsureParentDirectory(artifact);
  const std::string source_text = WriteDot(graph);
  std::string err;

  if (format == ExportFormat::Gv) {
    if (!support::WriteFile(artifact, source_text, err)) {
      (void)support::RemoveFile(artifact);
      throw exceptions::ExportError(err);
    }
    return artifact;
  }

  const std::string engine = locateEngine();
  const std::string stem = artifact.substr(0, artifact.size() - std::string(FormatName(format)).size() - 1U);
  const std::string source = stem + ".gv.tmp";
  const TempFileGuard guard{source};
  if (!support::WriteFile(source, source_text, err)) {
    throw exceptions::ExportError(err);
  }
  runEngine(engine, source, artifact, format);
  return artifact;
}

}  // namespace pyscope::graph
