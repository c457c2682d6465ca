/***
 * Name: pyscope::driver (app API)
 * Purpose: Declarations for top-level driver helpers used by main().
 * Inputs: CLI options and paths
 * Outputs: Structures, artifacts, status codes
 * Theory of Operation: Keep main() minimal by factoring helpers into separate
 *   translation units; one function per .cpp file.
 */
#pragma once

#include <string>
#include <vector>

#include "ast/Module.h"
#include "lexer/Token.h"
#include "pyscope/analysis/model.h"
#include "pyscope/driver/cli.h"
#include "pyscope/graph/exporter.h"
#include "pyscope/support/error.h"

namespace pyscope {
namespace driver {

/***
 * Name: pyscope::driver::AnalyzeFile
 * Purpose: Read, parse and extract one source file.
 * Inputs: path; opts (optional) for --log-lexer / --log-ast file logs
 * Outputs: true and a complete Structure, or false and err (NotFound,
 *   ReadFailure, SyntaxFailure, UnknownParseFailure)
 * Theory of Operation: Chains FileReader, Frontend and Analyzer::Extract.
 */
bool AnalyzeFile(const std::string& path, analysis::Structure& out, support::Error& err,
                 const CliOptions* opts = nullptr);

/***
 * Name: pyscope::driver::ExportGraph
 * Purpose: Build the graph model for a Structure and export it.
 * Inputs: structure, destination, format, options
 * Outputs: true and the artifact path, or false and err (EngineMissing, ExportFailure)
 */
bool ExportGraph(const analysis::Structure& structure, const std::string& destination, graph::ExportFormat format,
                 const graph::ExportOptions& options, std::string& artifact, support::Error& err);

/***
 * Name: pyscope::driver::WriteLogs
 * Purpose: Write the token log and/or AST dump requested on the command line.
 * Inputs: opts, source path, tokens, module
 * Outputs: true when every requested log was written (failures are reported
 *   on stderr and do not stop the analysis)
 */
bool WriteLogs(const CliOptions& opts, const std::string& path, const std::vector<lex::Token>& tokens,
               const ast::Module& module);

/*** WriteFileOrReport: Write file and print an error to stderr on failure. */
bool WriteFileOrReport(const std::string& path, const std::string& data, std::string& err);

/*** ReportMetricsIfRequested: Emit metrics in the requested format to stdout if enabled. */
void ReportMetricsIfRequested(const driver::CliOptions& opts);

/***
 * Name: pyscope::driver::RunOnce
 * Purpose: Execute one end-to-end analysis from source path to report/artifact.
 * Inputs: opts (CLI options)
 * Outputs: POSIX status code (0 success, 2 error)
 * Theory of Operation: AnalyzeFile, then the text report and/or ExportGraph.
 */
int RunOnce(const driver::CliOptions& opts);

}  // namespace driver
}  // namespace pyscope
