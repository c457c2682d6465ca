/**
 * Name: pyscope::lex::TokenKind
 * Purpose: Token kinds for the lexer.
 */
#pragma once

namespace pyscope::lex {

enum class TokenKind {
    End, // EOF
    Newline, // end of logical line
    Indent, // indentation increase
    Dedent, // indentation decrease

    Def, // def
    Return, // return
    Del, // del
    If, // if
    Else, // else
    Elif, // elif
    While, // while
    For, // for
    In, // in
    Break, // break
    Continue, // continue
    Pass, // pass
    Try, // try
    Except, // except
    Finally, // finally
    With, // with
    As, // as
    Import, // import
    From, // from
    Class, // class
    Async, // async
    Assert, // assert
    Raise, // raise
    Global, // global
    Nonlocal, // nonlocal
    Yield, // yield
    Await, // await
    Is, // is
    And, // and
    Or, // or
    Not, // not
    Lambda, // lambda

    At, // @
    AtEqual, // @=
    Arrow, // ->
    Colon, // :
    ColonEqual, // := (named expression)
    Semicolon, // ;
    Comma, // ,
    Equal, // =
    PlusEqual, // +=
    Plus, // +
    MinusEqual, // -=
    Minus, // -
    StarEqual, // *=
    Star, // *
    StarStarEqual, // **=
    StarStar, // ** (power)
    SlashEqual, // /=
    Slash, // /
    SlashSlashEqual, // //=
    SlashSlash, // // (floor-div)
    PercentEqual, // %=
    Percent, // %
    LShiftEqual, // <<=
    LShift, // <<
    RShiftEqual, // >>=
    RShift, // >>
    AmpEqual, // &=
    Amp, // &
    CaretEqual, // ^=
    Caret, // ^
    Tilde, // ~
    PipeEqual, // |=
    Pipe, // |
    EqEq, // ==
    NotEq, // !=
    Lt, // <
    Le, // <=
    Gt, // >
    Ge, // >=
    Dot, // .
    LParen, // (
    RParen, // )
    LBracket, // [
    RBracket, // ]
    LBrace, // {
    RBrace, // }

    Ident, // identifier (includes soft keywords match/case/type)
    Int, // integer literal
    Float, // float literal
    Imag, // imaginary numeric (e.g., 1j)
    String, // string literal, raw text with prefix and quotes
    Bytes, // b'...'
    BoolLit, // True/False
    NoneLit, // None
    Ellipsis // ...
};

// Convert TokenKind to a stable string for diagnostics/logging
const char* to_string(TokenKind k);

} // namespace pyscope::lex
