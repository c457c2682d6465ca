/***
 * Name: pyscope::driver::AnalyzeFile
 * Purpose: Read, parse and extract one source file into a Structure.
 * Inputs:
 *   - path: source file
 *   - opts: optional CLI options; requested file logs are written after parsing
 * Outputs:
 *   - out: complete Structure on success (never partial)
 *   - err: NotFound, ReadFailure, SyntaxFailure or UnknownParseFailure
 * Theory of Operation: FileReader -> Frontend -> Analyzer::Extract. The module
 *   name is the file's base name without ".py".
 */
#include "pyscope/driver/app.h"

#include <memory>
#include <string>
#include <vector>

#include "pyscope/stages/analyzer.h"
#include "pyscope/stages/file_reader.h"
#include "pyscope/stages/frontend.h"
#include "pyscope/support/fs.h"

namespace pyscope::driver {

bool AnalyzeFile(const std::string& path, analysis::Structure& out, support::Error& err, const CliOptions* opts) {
  std::string src;
  if (!stages::FileReader::Read(path, src, err)) {
    return false;
  }
  const bool wants_tokens = opts != nullptr && opts->log_lexer;
  std::vector<lex::Token> tokens;
  std::unique_ptr<ast::Module> root;
  if (!stages::Frontend::Build(path, src, root, err, wants_tokens ? &tokens : nullptr)) {
    return false;
  }
  if (opts != nullptr && (opts->log_lexer || opts->log_ast)) {
    (void)WriteLogs(*opts, path, tokens, *root);
  }
  out = stages::Analyzer::Extract(*root, support::ModuleNameFromPath(path));
  return true;
}

}  // namespace pyscope::driver
