/**
 * Name: pyscope::lex::Lexer
 * Purpose: Tokenize a stack of input sources (LIFO) into one token stream.
 * Physical lines are joined into one logical line inside brackets, after a
 * trailing backslash, and across triple-quoted strings. Malformed input
 * raises exceptions::LexError carrying the offending location.
 */
#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <utility>
#include <vector>
#include "lexer/ITokenStream.h"
#include "lexer/InputSource.h"

namespace pyscope::lex {

class Lexer : public ITokenStream {
public:
    Lexer() = default;

    void pushFile(const std::string& path);

    void pushString(const std::string& text, const std::string& name);

    // ITokenStream
    const Token& peek(size_t lookahead = 0) override;

    Token next() override;

    std::vector<Token> tokens();

private:
    // Eager tokenization buffer to simplify streaming semantics safely
    bool finalized_{false};
    std::vector<Token> tokens_{};
    size_t pos_{0};

    struct State {
        std::unique_ptr<InputSource> src;
        std::string line; // current logical line, physical lines joined by '\n'
        std::vector<std::pair<size_t, int>> lineStarts; // (offset in line, physical line number)
        size_t index{0};
        int lineNo{0};
        std::vector<size_t> indentStack{0};
        int parenDepth{0};
    };

    std::vector<State> stack_{}; // LIFO of inputs

    // helpers
    static bool readNextLine(State& state); // load next physical line as a new logical line
    static bool appendNextLine(State& state); // join next physical line onto the logical line
    static void locate(const State& state, size_t offset, int& line, int& col);
    [[noreturn]] static void fail(const State& state, size_t offset, const std::string& message);
    bool emitIndentTokens(State& state, std::vector<Token>& out);

    Token scanOne(State& state); // scan a single token from current state
    Token scanString(State& state, size_t start, size_t quotePos, bool isBytes);
    Token scanNumber(State& state);
    Token scanIdentifier(State& state);

    void buildAll(); // build tokens_ from all inputs (LIFO)
};

} // namespace pyscope::lex
