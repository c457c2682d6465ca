/***
 * Name: pyscope::driver::detail::HandleValueArg
 * Purpose: Handle --format, --engine and --log-path with an attached or separate value.
 * Inputs:
 *   - args, index (advanced for a separate value), argc
 *   - dst: CLI options destination
 *   - err: error stream
 * Outputs: OptResult; throws exceptions::ConfigError for an unknown format
 * Theory of Operation: Table of option names to setters; the first match wins.
 */
#include "pyscope/driver/cli_parse.h"
#include "pyscope/driver/cli.h"  // direct use of CliOptions

#include <array>
#include <cstddef>
#include <functional>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

#include "pyscope/exceptions/config_error.h"
#include "pyscope/graph/exporter.h"

namespace pyscope {
namespace driver {
namespace detail {

static void SetFormat(const std::string& value, CliOptions& dst) {
  if (!graph::ParseExportFormat(value, dst.format)) {
    throw exceptions::ConfigError("unknown export format '" + value + "' (expected png, svg, pdf, dot or gv)");
  }
}

auto HandleValueArg(const std::vector<std::string>& args,
                    int& index,
                    int argc,
                    CliOptions& dst,
                    std::ostream& err) -> OptResult {
  using Setter = std::function<void(const std::string&)>;
  const std::array<std::pair<std::string, Setter>, 3> options{{
      {"--format", [&](const std::string& value) { SetFormat(value, dst); }},
      {"--engine", [&](const std::string& value) { dst.engine = value; }},
      {"--log-path", [&](const std::string& value) { dst.log_path = value; }},
  }};
  const std::string& arg = args[static_cast<std::size_t>(index)];
  for (const auto& [name, setter] : options) {
    if (arg.rfind(name + "=", 0) == 0U) {
      setter(arg.substr(name.size() + 1U));
      return OptResult::Handled;
    }
    if (arg == name) {
      if (index + 1 >= argc) {
        err << "pyscope: error: missing value after '" << name << "'" << '\n';
        return OptResult::Error;
      }
      ++index;
      setter(args[static_cast<std::size_t>(index)]);
      return OptResult::Handled;
    }
  }
  return OptResult::NotMatched;
}

}  // namespace detail
}  // namespace driver
}  // namespace pyscope
