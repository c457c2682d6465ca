/***
 * Name: pyscope::driver::detail::HandleMetricsArg
 * Purpose: Handle --metrics, --metrics-json and --metrics=json|text.
 * Inputs:
 *   - arg: current argument string
 *   - dst: CLI options destination
 *   - err: error stream
 * Outputs: OptResult indicating match and success/failure
 * Theory of Operation: Exact spellings first, then the "--metrics=" prefix with a validated value.
 */
#include "pyscope/driver/cli_parse.h"
#include "pyscope/driver/cli.h"  // direct use of CliOptions

#include <ostream>
#include <string>
#include <string_view>

namespace pyscope {
namespace driver {
namespace detail {

auto HandleMetricsArg(const std::string& arg, CliOptions& dst, std::ostream& err) -> OptResult {
  if (arg == "--metrics") {
    dst.metrics = true;
    dst.metrics_format = CliOptions::MetricsFormat::Text;
    return OptResult::Handled;
  }
  if (arg == "--metrics-json") {
    dst.metrics = true;
    dst.metrics_format = CliOptions::MetricsFormat::Json;
    return OptResult::Handled;
  }
  constexpr std::string_view kPrefix{"--metrics="};
  if (arg.rfind(kPrefix, 0) == 0U) {
    dst.metrics = true;
    const std::string value = arg.substr(kPrefix.size());
    if (value == "json") {
      dst.metrics_format = CliOptions::MetricsFormat::Json;
    } else if (value == "text") {
      dst.metrics_format = CliOptions::MetricsFormat::Text;
    } else {
      err << "pyscope: error: unknown metrics format '" << value << "' (expected json or text)" << '\n';
      return OptResult::Error;
    }
    return OptResult::Handled;
  }
  return OptResult::NotMatched;
}

}  // namespace detail
}  // namespace driver
}  // namespace pyscope
