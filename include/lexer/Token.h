/**
 * Name: pyscope::lex::Token
 * Purpose: Token structure with source location and text.
 */
#pragma once

#include <string>
#include "lexer/TokenKind.h"

namespace pyscope::lex {

struct Token {
    TokenKind kind{TokenKind::End};
    std::string text{}; // original source text (strings keep prefix and quotes)
    std::string file{};
    int line{1}; // 1-based line number
    int col{1}; // 1-based column at token start
};

} // namespace pyscope::lex
