/***
 * Name: pyscope::driver::WriteLogs
 * Purpose: Write <log_path>/<stem>.lex.log and/or <log_path>/<stem>.ast.log.
 * Inputs: opts, source path, tokens, module
 * Outputs: true when every requested log was written
 * Theory of Operation: The log directory is created on demand. A failed log
 *   is reported on stderr and never fails the run.
 */
#include "pyscope/driver/app.h"

#include <filesystem>
#include <iostream>
#include <string>
#include <system_error>
#include <vector>

#include "observability/AstPrinter.h"
#include "observability/TokenPrinter.h"
#include "pyscope/support/fs.h"

namespace pyscope::driver {

bool WriteLogs(const CliOptions& opts, const std::string& path, const std::vector<lex::Token>& tokens,
               const ast::Module& module) {
  namespace fs = std::filesystem;
  std::error_code ec;
  fs::create_directories(opts.log_path, ec);
  if (ec) {
    std::cerr << "pyscope: warning: cannot create log directory '" << opts.log_path << "': " << ec.message() << '\n';
    return false;
  }
  const fs::path base = fs::path(opts.log_path) / support::ModuleNameFromPath(path);
  bool is_ok = true;
  std::string err;
  if (opts.log_lexer) {
    is_ok = WriteFileOrReport(base.string() + ".lex.log", obs::FormatTokens(tokens), err) && is_ok;
  }
  if (opts.log_ast) {
    obs::AstPrinter printer;
    is_ok = WriteFileOrReport(base.string() + ".ast.log", printer.print(module), err) && is_ok;
  }
  return is_ok;
}

}  // namespace pyscope::driver
