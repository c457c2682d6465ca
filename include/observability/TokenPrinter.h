/***
 * Name: pyscope::obs::FormatTokens
 * Purpose: Token stream dump for --log-lexer.
 * Inputs: tokens as produced by lex::Lexer::tokens()
 * Outputs: one line per token: "file:line:col Kind 'text'"
 */
#pragma once

#include <string>
#include <vector>

#include "lexer/Token.h"

namespace pyscope::obs {

std::string FormatTokens(const std::vector<lex::Token>& tokens);

} // namespace pyscope::obs
