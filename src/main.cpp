/***
 * Name: pyscope::main
 * Purpose: Entry point for the pyscope structure analyzer CLI.
 * Inputs:
 *   - argc, argv: Standard process arguments.
 * Outputs:
 *   - int: POSIX process status code (0 on success, 2 on error).
 * Theory of Operation:
 *   Parses CLI flags, enables metrics when asked, runs one analysis and
 *   reports metrics. Exceptions that escape the stages are reported here.
 */
#include <exception>
#include <iostream>

#include "pyscope/driver/app.h"
#include "pyscope/driver/cli.h"
#include "pyscope/exceptions/pyscope_exception.h"
#include "pyscope/metrics/metrics.h"

using pyscope::driver::CliOptions;

int main(int argc, char** argv) {
  try {
    using pyscope::driver::ParseCli;
    using pyscope::driver::PrintUsage;
    CliOptions opts;
    if (!ParseCli(argc, const_cast<const char* const*>(argv), opts, std::cerr)) {
      PrintUsage(std::cerr, argv[0]);  // NOLINT(*-pro-bounds-pointer-arithmetic)
      return 2;
    }
    if (opts.show_help) {
      PrintUsage(std::cout, argv[0]);  // NOLINT(*-pro-bounds-pointer-arithmetic)
      return 0;
    }
    pyscope::metrics::Metrics::Enable(opts.metrics);
    const int ret_code = pyscope::driver::RunOnce(opts);
    pyscope::driver::ReportMetricsIfRequested(opts);
    return ret_code;
  } catch (const pyscope::exceptions::PyscopeException& ex) {
    std::cerr << "pyscope: " << ex.what() << '\n';
    return 2;
  } catch (const std::exception& ex) {
    std::cerr << "pyscope: internal error: " << ex.what() << '\n';
    return 2;
  }
}
