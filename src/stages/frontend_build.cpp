/***
 * Name: pyscope::stages::Frontend::Build
 * Purpose: Build an AST for the source and record geometry, token count and timing.
 * Inputs:
 *   - path: source path used in diagnostics
 *   - src: module text
 * Outputs:
 *   - out_root: AST root on success
 *   - err: SyntaxFailure or UnknownParseFailure
 *   - out_tokens: token stream when requested (token log)
 * Theory of Operation: Lexer + Parser over the in-memory text; the parser
 *   gets the same text for caret context lines. Exceptions stop here.
 */
#include "pyscope/stages/frontend.h"

#include <exception>
#include <memory>
#include <string>
#include <vector>

#include "ast/Geometry.h"
#include "lexer/Lexer.h"
#include "parser/Parser.h"
#include "pyscope/exceptions/pyscope_exception.h"
#include "pyscope/exceptions/syntax_error.h"

namespace pyscope::stages {

auto Frontend::Build(const std::string& path, const std::string& src, std::unique_ptr<ast::Module>& out_root,
                     support::Error& err, std::vector<lex::Token>* out_tokens) -> bool {
  metrics::Metrics::ScopedTimer timer(metrics::Metrics::Phase::Parse);
  try {
    lex::Lexer lexer;
    lexer.pushString(src, path);
    const auto tokens = lexer.tokens();
    metrics::Metrics::AddCounter("tokens", tokens.size());
    if (out_tokens != nullptr) {
      *out_tokens = tokens;
    }
    parse::Parser parser(lexer);
    parser.setSourceText(path, src);
    out_root = parser.parseModule();
  } catch (const exceptions::SyntaxError& ex) {
    err = support::Error{support::ErrorKind::SyntaxFailure,
                         "Parsing error: File '" + path + "' contains syntax error: " + ex.what()};
    return false;
  } catch (const exceptions::PyscopeException& ex) {
    err = support::Error{support::ErrorKind::UnknownParseFailure,
                         std::string("An unknown error occurred during parsing: ") + ex.what()};
    return false;
  } catch (const std::exception& ex) {
    err = support::Error{support::ErrorKind::UnknownParseFailure,
                         std::string("An unknown error occurred during parsing: ") + ex.what()};
    return false;
  }
  ast::ASTGeometry geometry{};
  ast::ComputeGeometry(*out_root, geometry);
  metrics::Metrics::SetASTGeometry(geometry);
  return true;
}

}  // namespace pyscope::stages
