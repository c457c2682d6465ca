/***
 * Name: test_lexer_structure
 * Purpose: Token kinds, indentation, joining, soft keywords and lexer errors.
 */
#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "lexer/Lexer.h"
#include "pyscope/exceptions/lex_error.h"

using namespace pyscope;

static std::vector<lex::Token> lexAll(const std::string& src) {
  lex::Lexer L;
  L.pushString(src, "lex.py");
  return L.tokens();
}

static std::vector<lex::TokenKind> kindsOf(const std::string& src) {
  std::vector<lex::TokenKind> kinds;
  for (const auto& t : lexAll(src)) { kinds.push_back(t.kind); }
  return kinds;
}

TEST(LexerStructure, SimpleFunctionTokenSequence) {
  using TK = lex::TokenKind;
  const auto kinds = kindsOf("def f(a):\n    return a\n");
  const std::vector<TK> expected{TK::Def, TK::Ident, TK::LParen, TK::Ident, TK::RParen, TK::Colon, TK::Newline,
                                 TK::Indent, TK::Return, TK::Ident, TK::Newline, TK::Dedent, TK::End};
  EXPECT_EQ(kinds, expected);
}

TEST(LexerStructure, BlankAndCommentLinesDoNotIndent) {
  using TK = lex::TokenKind;
  const auto kinds = kindsOf("def f():\n\n        # deep comment\n    pass\n");
  int indents = 0;
  for (auto k : kinds) { if (k == TK::Indent) ++indents; }
  EXPECT_EQ(indents, 1);
}

TEST(LexerStructure, TabAdvancesToMultipleOfEight) {
  // A tab and eight spaces land on the same column, so no unindent error
  EXPECT_NO_THROW(lexAll("if x:\n\ty = 1\n        z = 2\n"));
}

TEST(LexerStructure, BracketsJoinLines) {
  using TK = lex::TokenKind;
  const auto kinds = kindsOf("x = (1,\n     2)\n");
  int newlines = 0;
  for (auto k : kinds) { if (k == TK::Newline) ++newlines; }
  EXPECT_EQ(newlines, 1);
}

TEST(LexerStructure, BackslashJoinsLines) {
  using TK = lex::TokenKind;
  const auto kinds = kindsOf("x = 1 + \\\n    2\n");
  int newlines = 0;
  for (auto k : kinds) { if (k == TK::Newline) ++newlines; }
  EXPECT_EQ(newlines, 1);
}

TEST(LexerStructure, SoftKeywordsStayIdentifiers) {
  const auto toks = lexAll("match = case = type = _\n");
  EXPECT_EQ(toks[0].kind, lex::TokenKind::Ident);
  EXPECT_EQ(toks[0].text, "match");
  EXPECT_EQ(toks[2].kind, lex::TokenKind::Ident);
  EXPECT_EQ(toks[4].kind, lex::TokenKind::Ident);
  EXPECT_EQ(toks[6].kind, lex::TokenKind::Ident);
}

TEST(LexerStructure, ConstantsAndOperators) {
  using TK = lex::TokenKind;
  const auto kinds = kindsOf("x := True or None ... -> **= //= @=\n");
  const std::vector<TK> expected{TK::Ident, TK::ColonEqual, TK::BoolLit, TK::Or, TK::NoneLit, TK::Ellipsis,
                                 TK::Arrow, TK::StarStarEqual, TK::SlashSlashEqual, TK::AtEqual, TK::Newline, TK::End};
  EXPECT_EQ(kinds, expected);
}

TEST(LexerStructure, NumbersKeepTheirText) {
  const auto toks = lexAll("a = 0xff + 1_000 + 1.5e-3 + 2j\n");
  EXPECT_EQ(toks[2].kind, lex::TokenKind::Int);
  EXPECT_EQ(toks[2].text, "0xff");
  EXPECT_EQ(toks[4].text, "1_000");
  EXPECT_EQ(toks[6].kind, lex::TokenKind::Float);
  EXPECT_EQ(toks[8].kind, lex::TokenKind::Imag);
}

TEST(LexerStructure, TripleQuotedStringSpansLines) {
  const auto toks = lexAll("s = \"\"\"one\ntwo\"\"\"\nt = 1\n");
  ASSERT_EQ(toks[2].kind, lex::TokenKind::String);
  EXPECT_EQ(toks[2].text, "\"\"\"one\ntwo\"\"\"");
  EXPECT_EQ(toks[4].text, "t");
  EXPECT_EQ(toks[4].line, 3);
}

TEST(LexerStructure, UnicodeIdentifier) {
  const auto toks = lexAll("caf\xC3\xA9 = 1\n");
  ASSERT_EQ(toks[0].kind, lex::TokenKind::Ident);
  EXPECT_EQ(toks[0].text, "caf\xC3\xA9");
}

TEST(LexerStructure, LocationsAreOneBased) {
  const auto toks = lexAll("x = 1\n  \ny = 2\n");
  EXPECT_EQ(toks[0].line, 1);
  EXPECT_EQ(toks[0].col, 1);
  EXPECT_EQ(toks[2].col, 5);
  EXPECT_EQ(toks[4].text, "y");
  EXPECT_EQ(toks[4].line, 3);
}

TEST(LexerStructure, UnterminatedStringThrows) {
  try {
    lexAll("s = 'abc\n");
    FAIL() << "expected LexError";
  } catch (const exceptions::LexError& e) {
    EXPECT_EQ(e.line(), 1);
    EXPECT_EQ(e.col(), 5);
    EXPECT_NE(std::string(e.what()).find("unterminated string literal"), std::string::npos);
  }
}

TEST(LexerStructure, UnindentMismatchThrows) {
  EXPECT_THROW(lexAll("if x:\n    y = 1\n  z = 2\n"), exceptions::LexError);
}

TEST(LexerStructure, EofInsideBracketsThrows) {
  EXPECT_THROW(lexAll("x = (1,\n"), exceptions::LexError);
}

TEST(LexerStructure, InvalidCharacterThrows) {
  EXPECT_THROW(lexAll("x = $\n"), exceptions::LexError);
}
