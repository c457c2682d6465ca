/***
 * Name: pyscope::stages::Frontend
 * Purpose: Stage class for tokenizing and parsing a module.
 * Inputs: Source path (for diagnostics) and source text
 * Outputs: AST root, optionally the token stream; metrics (geometry, tokens)
 * Theory of Operation: Runs lex::Lexer over the in-memory text and
 *   parse::Parser over the tokens. Syntax exceptions become SyntaxFailure,
 *   anything else UnknownParseFailure.
 */
#pragma once

#include <memory>
#include <string>
#include <vector>

#include "ast/Module.h"
#include "lexer/Token.h"
#include "pyscope/metrics/metrics.h"
#include "pyscope/support/error.h"

namespace pyscope {
namespace stages {

class Frontend : public metrics::Metrics {
 public:
  /*** Build: Construct an AST for the source; out_tokens receives the tokens when non-null. */
  static bool Build(const std::string& path, const std::string& src, std::unique_ptr<ast::Module>& out_root,
                    support::Error& err, std::vector<lex::Token>* out_tokens = nullptr);
};

}  // namespace stages
}  // namespace pyscope
