/***
 * Name: pyscope::driver::PrintUsage
 * Purpose: Print CLI usage information for pyscope.
 * Inputs:
 *   - out: Destination stream
 *   - argv0: Program name used in usage examples
 * Outputs: None
 */
#include "pyscope/driver/cli.h"

#include <cstring>
#include <ostream>
#include <string_view>

namespace pyscope::driver {

static std::string_view Basename(const char* path) {
  if (path == nullptr || *path == '\0') {
    return std::string_view{"pyscope"};
  }
  const char* last_slash = std::strrchr(path, '/');
  return std::string_view(last_slash != nullptr ? last_slash + 1 : path);
}

auto PrintUsage(std::ostream& out, const char* argv0) -> void {
  const std::string_view program_name = Basename(argv0);
  out << "Usage: " << program_name << " [options] <file.py>" << '\n'
      << '\n'
      << "Options:" << '\n'
      << "  -h, --help                  Print this help and exit" << '\n'
      << "  --text                      Print the structure report (default without a graph)" << '\n'
      << "  -o <path>, --graph=<path>   Export the structure graph to <path>" << '\n'
      << "  --format=<png|svg|pdf|dot|gv>  Graph format (default: png)" << '\n'
      << "  --engine=<path>             Graphviz dot binary (default: dot on PATH)" << '\n'
      << "  --metrics, --metrics-json   Print phase timings and counters" << '\n'
      << "  --log-path=<dir>            Directory for file logs" << '\n'
      << "  --log-lexer                 Write the token stream to <dir>/<stem>.lex.log" << '\n'
      << "  --log-ast                   Write the AST dump to <dir>/<stem>.ast.log" << '\n'
      << "  --                          End of options" << '\n'
      << '\n'
      << "Exit status: 0 on success, 2 on usage or analysis errors." << '\n';
}

}  // namespace pyscope::driver
