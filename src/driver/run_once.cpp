/***
 * Name: pyscope::driver::RunOnce
 * Purpose: Execute one end-to-end analysis for the single input.
 * Inputs:
 *   - opts: parsed CLI options (exactly one input)
 * Outputs:
 *   - int: 0 on success, 2 on any analysis or export error
 * Theory of Operation:
 *   AnalyzeFile, then the text report on stdout when wanted, then the
 *   graph export when a destination was given. The report is printed
 *   before export so a failing export still leaves the report visible.
 */
#include "pyscope/driver/app.h"

#include <iostream>
#include <string>

#include "pyscope/stages/analyzer.h"

namespace pyscope::driver {

int RunOnce(const driver::CliOptions& opts) {
  const std::string& input = opts.inputs.front();
  analysis::Structure structure;
  support::Error err;
  if (!AnalyzeFile(input, structure, err, &opts)) {
    std::cerr << err.message << '\n';
    return 2;
  }
  if (opts.wantsText()) {
    std::cout << stages::Analyzer::Render(structure) << '\n';
  }
  if (!opts.graph_path.empty()) {
    std::string artifact;
    const graph::ExportOptions export_options{opts.engine};
    if (!ExportGraph(structure, opts.graph_path, opts.format, export_options, artifact, err)) {
      std::cerr << err.message << '\n';
      return 2;
    }
    std::cout << "Visualization graph saved to: " << artifact << '\n';
  }
  return 0;
}

}  // namespace pyscope::driver
