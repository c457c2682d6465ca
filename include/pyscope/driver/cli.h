/***
 * Name: pyscope::driver (cli)
 * Purpose: Declarations for CLI options, parsing, and usage printing.
 * Inputs: N/A (declarations only)
 * Outputs: Types and functions for CLI handling.
 * Theory of Operation: Configuration is command-line only. ParseCli walks
 *   argv through a table of option handlers; definitions live in .cpp files.
 */
#pragma once

#include <iosfwd>
#include <string>
#include <vector>

#include "pyscope/graph/exporter.h"

namespace pyscope {
namespace driver {

/***
 * Name: pyscope::driver::CliOptions
 * Purpose: Hold parsed command-line options for a pyscope invocation.
 * Inputs: Values are populated by ParseCli.
 * Outputs: Consumed by RunOnce to select reports, export and logging.
 */
struct CliOptions {
  std::vector<std::string> inputs;  // exactly one .py file
  bool show_help = false;           // -h, --help
  bool text = false;                // --text
  std::string graph_path;           // -o <path>, --graph=<path>
  graph::ExportFormat format = graph::ExportFormat::Png;  // --format=
  std::string engine;               // --engine=<path>
  bool metrics = false;             // --metrics, --metrics-json
  enum class MetricsFormat { Text, Json };
  MetricsFormat metrics_format = MetricsFormat::Text;
  std::string log_path;             // --log-path=<dir>
  bool log_lexer = false;           // --log-lexer
  bool log_ast = false;             // --log-ast

  /*** wantsText: the text report is printed when asked for or when no graph is requested. */
  bool wantsText() const { return text || graph_path.empty(); }
};

namespace detail {
/*** OptResult: Tri-state result for option handlers. */
enum class OptResult { NotMatched, Handled, Error };
}  // namespace detail

/***
 * Name: pyscope::driver::ParseCli
 * Purpose: Parse command-line arguments into a CliOptions structure.
 * Inputs:
 *   - argc, argv: process arguments
 *   - dst: Output options structure to populate
 *   - err: Stream for diagnostics on parse errors
 * Outputs:
 *   - bool: true on successful parse, false on a usage error
 * Theory of Operation: Iterates arguments left-to-right through RunHandlers,
 *   then validates combinations. Invalid values raise exceptions::ConfigError
 *   inside handlers; ParseCli reports them and returns false.
 */
bool ParseCli(int argc, const char* const* argv, CliOptions& dst, std::ostream& err);

/*** PrintUsage: Print CLI usage information for pyscope. */
void PrintUsage(std::ostream& out, const char* argv0);

}  // namespace driver
}  // namespace pyscope
