/***
 * Name: pyscope::parse::Parser
 * Purpose: Build a typed AST for a Python 3 module from a token stream.
 * Inputs:
 *   - Token stream from Lexer (pull-based)
 * Outputs:
 *   - Module AST covering the full statement and expression grammar.
 * Theory of Operation:
 *   Recursive descent over a buffered token vector. Statements are parsed
 *   one logical line (or one compound block) at a time; a failing statement
 *   records a formatted diagnostic, the parser resynchronizes on the next
 *   line boundary, and parsing continues. parseModule throws
 *   exceptions::ParseError when any diagnostic was recorded. Expression
 *   precedence follows the Python grammar from lambda down to atoms.
 */
#pragma once

#include "ast/Nodes.h"
#include "lexer/Lexer.h"
#include "pyscope/exceptions/parse_error.h"
#include <cstddef>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace pyscope::parse {

class Parser {
 public:
  explicit Parser(lex::ITokenStream& stream) : ts_(stream) {}

  // Source text used for caret context lines; files are read on demand otherwise
  void setSourceText(const std::string& name, const std::string& text);

  std::unique_ptr<ast::Module> parseModule();

  // Parse a single expression list followed by end of input (f-string fields)
  std::unique_ptr<ast::Expr> parseExpressionOnly();

 private:
  lex::ITokenStream& ts_;
  std::vector<lex::Token> tokens_{};
  size_t pos_{0};
  bool initialized_{false};
  struct Diagnostic {
    std::string text; // formatted with location and caret context
    std::string file;
    int line{0};
    int col{0};
  };
  std::vector<Diagnostic> errors_{};
  std::unordered_map<std::string, std::vector<std::string>> fileLines_{};

  // Nesting limits keep recursive descent off the end of the native stack
  static constexpr size_t kMaxBracketDepth = 200;
  static constexpr size_t kMaxExprDepth = 1000;
  static constexpr size_t kMaxBlockDepth = 100;
  size_t bracketDepth_{0};
  size_t exprDepth_{0};
  size_t blockDepth_{0};

  /*** DepthGuard: counts one nesting level for its lifetime; fails at the current token past the limit. */
  class DepthGuard {
   public:
    DepthGuard(Parser& parser, size_t& depth, size_t limit, const char* msg);
    ~DepthGuard() { --depth_; }
    DepthGuard(const DepthGuard&) = delete;
    DepthGuard& operator=(const DepthGuard&) = delete;

   private:
    size_t& depth_;
  };

  void initBuffer();
  const lex::Token& peek() const;
  const lex::Token& peekNext() const;
  const lex::Token& peekAt(size_t ahead) const;
  lex::Token get();
  bool match(lex::TokenKind tokenKind);
  lex::Token expect(lex::TokenKind tokenKind, const char* msg);
  [[noreturn]] void fail(const lex::Token& tok, const std::string& msg);
  [[noreturn]] void failAt(const ast::Node& node, const std::string& msg);
  void addError(const exceptions::ParseError& err);
  void synchronize();
  void skipIndentedBlock();
  static std::string describe(const lex::Token& tok);
  bool loadFileIfNeeded(const std::string& path);
  std::string formatContext(const lex::Token& tok, const std::string& headMsg);

  // statements
  void parseStatementInto(std::vector<std::unique_ptr<ast::Stmt>>& out);
  void parseSimpleStatementsInto(std::vector<std::unique_ptr<ast::Stmt>>& out);
  std::unique_ptr<ast::Stmt> parseSimpleStatement();
  void parseSuiteInto(std::vector<std::unique_ptr<ast::Stmt>>& out);
  std::vector<std::unique_ptr<ast::Expr>> parseDecorators();
  std::unique_ptr<ast::Stmt> parseDecorated();
  std::unique_ptr<ast::FunctionDef> parseFunction(bool isAsync);
  std::unique_ptr<ast::ClassDef> parseClass();
  void parseParamList(std::vector<ast::Param>& outParams, lex::TokenKind closing, bool allowAnnotations);
  std::unique_ptr<ast::Stmt> parseIfStmt();
  std::unique_ptr<ast::Stmt> parseWhileStmt();
  std::unique_ptr<ast::Stmt> parseForStmt(bool isAsync);
  std::unique_ptr<ast::Stmt> parseTryStmt();
  std::unique_ptr<ast::Stmt> parseWithStmt(bool isAsync);
  std::unique_ptr<ast::Stmt> parseImportStmt();
  std::unique_ptr<ast::Stmt> parseFromImportStmt();
  std::unique_ptr<ast::Stmt> parseExprOrAssignStmt();
  std::unique_ptr<ast::Stmt> parseRaiseStmt();
  std::unique_ptr<ast::Stmt> parseGlobalStmt();
  std::unique_ptr<ast::Stmt> parseNonlocalStmt();
  std::unique_ptr<ast::Stmt> parseAssertStmt();
  std::unique_ptr<ast::Stmt> parseDelStmt();
  std::string parseDottedName();
  bool atSimpleStatementEnd() const;

  // Validate whether an expression is a legal assignment target
  static bool isValidAssignmentTarget(const ast::Expr* e);
  static const char* describeTarget(const ast::Expr* e);
  void checkTarget(const ast::Expr* e);

  // match/case (soft keywords)
  bool looksLikeMatchStmt() const;
  std::unique_ptr<ast::Stmt> parseMatchStmt();
  std::unique_ptr<ast::MatchCase> parseMatchCase();
  std::unique_ptr<ast::Pattern> parsePatternTop();
  std::unique_ptr<ast::Pattern> parsePattern();
  std::unique_ptr<ast::Pattern> parsePatternOr();
  std::unique_ptr<ast::Pattern> parseClosedPattern();
  std::unique_ptr<ast::Pattern> parseSequencePattern(lex::TokenKind closing, bool isList);
  std::unique_ptr<ast::Pattern> parseMappingPattern();
  std::unique_ptr<ast::Expr> parseDottedValue();

  // expressions
  static bool startsExpr(lex::TokenKind kind);
  std::unique_ptr<ast::Expr> parseStarExpressions();
  std::unique_ptr<ast::Expr> parseYieldOrStarExpressions();
  std::unique_ptr<ast::Expr> parseStarOrNamed();
  std::unique_ptr<ast::Expr> parseTargetList();
  std::unique_ptr<ast::Expr> parseNamedExpr();
  std::unique_ptr<ast::Expr> parseExpr();
  std::unique_ptr<ast::Expr> parseLambda();
  std::unique_ptr<ast::Expr> parseLogicalOr();
  std::unique_ptr<ast::Expr> parseLogicalAnd();
  std::unique_ptr<ast::Expr> parseLogicalNot();
  std::unique_ptr<ast::Expr> parseComparison();
  std::unique_ptr<ast::Expr> parseBitwiseOr();
  std::unique_ptr<ast::Expr> parseBitwiseXor();
  std::unique_ptr<ast::Expr> parseBitwiseAnd();
  std::unique_ptr<ast::Expr> parseShift();
  std::unique_ptr<ast::Expr> parseAdditive();
  std::unique_ptr<ast::Expr> parseMultiplicative();
  std::unique_ptr<ast::Expr> parseUnary();
  std::unique_ptr<ast::Expr> parsePower();
  std::unique_ptr<ast::Expr> parsePostfix(std::unique_ptr<ast::Expr> base);
  std::unique_ptr<ast::Expr> parseAtom();
  std::unique_ptr<ast::Expr> parseYieldExpr();
  std::unique_ptr<ast::Expr> parseTupleOrParen(const lex::Token& openTok);
  std::unique_ptr<ast::Expr> parseListLiteral(const lex::Token& openTok);
  std::unique_ptr<ast::Expr> parseDictOrSetLiteral(const lex::Token& openTok);
  std::unique_ptr<ast::Expr> parseSubscriptList();
  std::unique_ptr<ast::Expr> parseSliceItem();
  struct ArgList {
    std::vector<std::unique_ptr<ast::Expr>> positional;
    std::vector<ast::KeywordArg> keywords;
    std::vector<std::unique_ptr<ast::Expr>> starArgs;
    std::vector<std::unique_ptr<ast::Expr>> kwStarArgs;
  };
  ArgList parseArgList();
  std::vector<ast::ComprehensionFor> parseComprehensionFors();
  static ast::BinaryOperator mulOpFor(lex::TokenKind kind);
  static bool augOpFor(lex::TokenKind kind, ast::BinaryOperator& out);

  // string literals
  std::unique_ptr<ast::Expr> parseStringAtom();
  void appendFString(const lex::Token& tok, const std::string& body, bool raw, ast::FStringLiteral& out);
  std::unique_ptr<ast::Expr> parseFStringField(const lex::Token& tok, const std::string& text);
};

} // namespace pyscope::parse
