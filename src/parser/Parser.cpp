/***
 * Name: pyscope::parse::Parser (impl)
 * Purpose: Token buffering, diagnostics and statement grammar.
 */
#include "parser/Parser.h"

#include <cstddef>
#include <fstream>
#include <memory>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "ast/Nodes.h"
#include "lexer/Lexer.h"
#include "pyscope/exceptions/parse_error.h"

namespace pyscope::parse {

using TK = lex::TokenKind;

namespace {

void stamp(ast::Node& node, const lex::Token& tok) {
  node.file = tok.file;
  node.line = tok.line;
  node.col = tok.col;
}

constexpr size_t kMaxNotes = 3;

} // namespace

void Parser::setSourceText(const std::string& name, const std::string& text) {
  std::vector<std::string> lines;
  std::istringstream in(text);
  std::string line;
  while (std::getline(in, line)) {
    if (!line.empty() && line.back() == '\r') { line.pop_back(); }
    lines.push_back(line);
  }
  fileLines_[name] = std::move(lines);
}

void Parser::initBuffer() {
  if (initialized_) return;
  // Try to access the full token stream when backed by Lexer; otherwise, drain
  if (auto* lx = dynamic_cast<lex::Lexer*>(&ts_)) {
    tokens_ = lx->tokens();
  } else {
    tokens_.clear();
    for (;;) {
      auto t = ts_.next();
      tokens_.push_back(t);
      if (t.kind == TK::End) break;
    }
  }
  if (tokens_.empty() || tokens_.back().kind != TK::End) {
    lex::Token eof;
    eof.kind = TK::End;
    eof.text = "<EOF>";
    tokens_.push_back(eof);
  }
  pos_ = 0;
  initialized_ = true;
}

const lex::Token& Parser::peek() const {
  // Safe in presence of End sentry
  return tokens_[pos_ < tokens_.size() ? pos_ : (tokens_.size() - 1)];
}
const lex::Token& Parser::peekNext() const { return peekAt(1); }
const lex::Token& Parser::peekAt(size_t ahead) const {
  const size_t idx = pos_ + ahead;
  return tokens_[idx < tokens_.size() ? idx : (tokens_.size() - 1)];
}
lex::Token Parser::get() {
  if (pos_ < tokens_.size()) {
    return tokens_[pos_++];
  }
  return tokens_.back();
}

bool Parser::match(TK tokenKind) {
  if (peek().kind == tokenKind) { (void)get(); return true; }
  return false;
}

std::string Parser::describe(const lex::Token& tok) {
  switch (tok.kind) {
    case TK::Newline: return "end of line";
    case TK::End: return "end of file";
    case TK::Indent: return "indent";
    case TK::Dedent: return "dedent";
    default: return "'" + tok.text + "'";
  }
}

lex::Token Parser::expect(TK tokenKind, const char* msg) {
  if (peek().kind != tokenKind) {
    fail(peek(), std::string("expected ") + msg + ", got " + describe(peek()));
  }
  return get();
}

void Parser::fail(const lex::Token& tok, const std::string& msg) {
  lex::Token where = tok;
  if (where.kind == TK::End || where.line <= 0) {
    // Point just past the last real token
    for (size_t i = tokens_.size(); i-- > 0;) {
      const auto& prev = tokens_[i];
      if (prev.kind == TK::End || prev.kind == TK::Dedent || prev.line <= 0) continue;
      where = prev;
      where.kind = TK::End;
      if (prev.kind != TK::Newline) { where.col = prev.col + static_cast<int>(prev.text.size()); }
      break;
    }
  }
  throw exceptions::ParseError(formatContext(where, msg), where.file, where.line, where.col);
}

Parser::DepthGuard::DepthGuard(Parser& parser, size_t& depth, const size_t limit, const char* msg) : depth_(depth) {
  if (depth >= limit) { parser.fail(parser.peek(), msg); }
  ++depth_;
}

void Parser::failAt(const ast::Node& node, const std::string& msg) {
  lex::Token tok;
  tok.kind = TK::Ident;
  tok.file = node.file;
  tok.line = node.line;
  tok.col = node.col;
  fail(tok, msg);
}

void Parser::addError(const exceptions::ParseError& err) {
  errors_.push_back(Diagnostic{err.what(), err.file(), err.line(), err.col()});
}

void Parser::skipIndentedBlock() {
  int depth = 0;
  for (;;) {
    const auto kind = peek().kind;
    if (kind == TK::End) break;
    (void)get();
    if (kind == TK::Indent) { ++depth; }
    else if (kind == TK::Dedent && --depth <= 0) { break; }
  }
}

void Parser::synchronize() {
  // The lexer already joins bracketed lines, so the next Newline ends the statement.
  for (;;) {
    const auto& t = peek();
    if (t.kind == TK::End || t.kind == TK::Dedent) break;
    if (t.kind == TK::Newline) {
      (void)get();
      // A failed block header leaves its body behind; drop it with the header.
      if (peek().kind == TK::Indent) { skipIndentedBlock(); }
      break;
    }
    (void)get();
  }
}

bool Parser::loadFileIfNeeded(const std::string& path) {
  if (path.empty()) return false;
  if (fileLines_.find(path) != fileLines_.end()) return true;
  std::ifstream in(path);
  if (!in) { return false; }
  std::vector<std::string> lines;
  std::string line;
  while (std::getline(in, line)) {
    if (!line.empty() && line.back() == '\r') { line.pop_back(); }
    lines.push_back(line);
  }
  fileLines_[path] = std::move(lines);
  return true;
}

std::string Parser::formatContext(const lex::Token& tok, const std::string& headMsg) {
  std::ostringstream out;
  out << tok.file << ":" << tok.line << ":" << tok.col << ": " << headMsg;
  // Try to print the source line and a caret under the token
  if (tok.line > 0 && loadFileIfNeeded(tok.file)) {
    const auto& lines = fileLines_[tok.file];
    if (static_cast<size_t>(tok.line) - 1 < lines.size()) {
      const std::string& srcLine = lines[static_cast<size_t>(tok.line) - 1];
      out << "\n" << srcLine;
      std::string caret;
      const size_t col = tok.col < 1 ? 0 : static_cast<size_t>(tok.col - 1);
      for (size_t i = 0; i < col; ++i) {
        caret.push_back(i < srcLine.size() && srcLine[i] == '\t' ? '\t' : ' ');
      }
      caret.push_back('^');
      // underline single-line tokens
      const bool placeholder = tok.kind == TK::Newline || tok.kind == TK::Indent || tok.kind == TK::Dedent ||
                               tok.kind == TK::End;
      if (!placeholder && tok.text.size() > 1 && tok.text.find('\n') == std::string::npos) {
        caret.append(tok.text.size() - 1, '~');
      }
      out << "\n" << caret;
    }
  }
  return out.str();
}

std::unique_ptr<ast::Module> Parser::parseModule() {
  initBuffer();
  auto mod = std::make_unique<ast::Module>();
  mod->file = tokens_.front().file;
  mod->line = 1;
  mod->col = 1;
  while (peek().kind != TK::End) {
    const auto kind = peek().kind;
    if (kind == TK::Newline || kind == TK::Dedent) { (void)get(); continue; }
    try {
      if (kind == TK::Indent) { fail(peek(), "unexpected indent"); }
      parseStatementInto(mod->body);
    } catch (const exceptions::ParseError& ex) {
      addError(ex);
      if (peek().kind == TK::Indent) { skipIndentedBlock(); }
      else { synchronize(); }
    }
  }
  if (!errors_.empty()) {
    const auto& first = errors_.front();
    std::ostringstream oss;
    oss << first.text;
    // Append notes for additional recovered errors
    size_t notes = 0;
    for (size_t i = 1; i < errors_.size() && notes < kMaxNotes; ++i) {
      if (errors_[i].text == first.text) continue;
      oss << "\nnote: " << errors_[i].text;
      ++notes;
    }
    throw exceptions::ParseError(oss.str(), first.file, first.line, first.col);
  }
  return mod;
}

bool Parser::atSimpleStatementEnd() const {
  const auto kind = peek().kind;
  return kind == TK::Newline || kind == TK::Semicolon || kind == TK::End;
}

void Parser::parseSuiteInto(std::vector<std::unique_ptr<ast::Stmt>>& out) {
  if (!match(TK::Newline)) {
    // Simple statements on the header line: `if x: pass`
    parseSimpleStatementsInto(out);
    return;
  }
  if (peek().kind != TK::Indent) { fail(peek(), "expected an indented block"); }
  const DepthGuard guard(*this, blockDepth_, kMaxBlockDepth, "too many levels of indentation");
  (void)get();
  while (peek().kind != TK::Dedent && peek().kind != TK::End) {
    if (peek().kind == TK::Newline) { (void)get(); continue; }
    try {
      if (peek().kind == TK::Indent) { fail(peek(), "unexpected indent"); }
      parseStatementInto(out);
    } catch (const exceptions::ParseError& ex) {
      addError(ex);
      if (peek().kind == TK::Indent) { skipIndentedBlock(); }
      else { synchronize(); }
    }
  }
  (void)match(TK::Dedent);
}

void Parser::parseStatementInto(std::vector<std::unique_ptr<ast::Stmt>>& out) {
  const auto& tok = peek();
  switch (tok.kind) {
    case TK::At: out.emplace_back(parseDecorated()); return;
    case TK::Def: out.emplace_back(parseFunction(false)); return;
    case TK::Class: out.emplace_back(parseClass()); return;
    case TK::If: out.emplace_back(parseIfStmt()); return;
    case TK::While: out.emplace_back(parseWhileStmt()); return;
    case TK::For: out.emplace_back(parseForStmt(false)); return;
    case TK::Try: out.emplace_back(parseTryStmt()); return;
    case TK::With: out.emplace_back(parseWithStmt(false)); return;
    case TK::Async: {
      const auto asyncTok = get();
      switch (peek().kind) {
        case TK::Def: {
          auto fn = parseFunction(true);
          stamp(*fn, asyncTok);
          out.emplace_back(std::move(fn));
          return;
        }
        case TK::For: out.emplace_back(parseForStmt(true)); return;
        case TK::With: out.emplace_back(parseWithStmt(true)); return;
        default: fail(peek(), "expected 'def', 'for' or 'with' after 'async', got " + describe(peek()));
      }
      break;
    }
    default: break;
  }
  if (tok.kind == TK::Ident && tok.text == "match" && looksLikeMatchStmt()) {
    out.emplace_back(parseMatchStmt());
    return;
  }
  parseSimpleStatementsInto(out);
}

void Parser::parseSimpleStatementsInto(std::vector<std::unique_ptr<ast::Stmt>>& out) {
  out.emplace_back(parseSimpleStatement());
  while (match(TK::Semicolon)) {
    if (peek().kind == TK::Newline || peek().kind == TK::End) break;
    out.emplace_back(parseSimpleStatement());
  }
  if (peek().kind != TK::End) { (void)expect(TK::Newline, "end of line"); }
}

std::unique_ptr<ast::Stmt> Parser::parseSimpleStatement() {
  const auto tok = peek();
  switch (tok.kind) {
    case TK::Pass: {
      (void)get();
      auto node = std::make_unique<ast::PassStmt>();
      stamp(*node, tok);
      return node;
    }
    case TK::Break: {
      (void)get();
      auto node = std::make_unique<ast::BreakStmt>();
      stamp(*node, tok);
      return node;
    }
    case TK::Continue: {
      (void)get();
      auto node = std::make_unique<ast::ContinueStmt>();
      stamp(*node, tok);
      return node;
    }
    case TK::Return: {
      (void)get();
      std::unique_ptr<ast::Expr> value;
      if (!atSimpleStatementEnd()) { value = parseStarExpressions(); }
      auto node = std::make_unique<ast::ReturnStmt>(std::move(value));
      stamp(*node, tok);
      return node;
    }
    case TK::Raise: return parseRaiseStmt();
    case TK::Global: return parseGlobalStmt();
    case TK::Nonlocal: return parseNonlocalStmt();
    case TK::Assert: return parseAssertStmt();
    case TK::Del: return parseDelStmt();
    case TK::Import: return parseImportStmt();
    case TK::From: return parseFromImportStmt();
    default: return parseExprOrAssignStmt();
  }
}

std::vector<std::unique_ptr<ast::Expr>> Parser::parseDecorators() {
  std::vector<std::unique_ptr<ast::Expr>> decorators;
  while (match(TK::At)) {
    decorators.emplace_back(parseNamedExpr());
    (void)expect(TK::Newline, "end of line after decorator");
  }
  return decorators;
}

std::unique_ptr<ast::Stmt> Parser::parseDecorated() {
  auto decorators = parseDecorators();
  if (peek().kind == TK::Class) {
    auto cls = parseClass();
    cls->decorators = std::move(decorators);
    return cls;
  }
  bool isAsync = false;
  lex::Token asyncTok;
  if (peek().kind == TK::Async && peekNext().kind == TK::Def) {
    asyncTok = get();
    isAsync = true;
  }
  if (peek().kind != TK::Def) {
    fail(peek(), "expected 'def' or 'class' after decorator, got " + describe(peek()));
  }
  auto fn = parseFunction(isAsync);
  if (isAsync) { stamp(*fn, asyncTok); }
  fn->decorators = std::move(decorators);
  return fn;
}

std::unique_ptr<ast::FunctionDef> Parser::parseFunction(bool isAsync) {
  const auto defTok = expect(TK::Def, "'def'");
  const auto nameTok = expect(TK::Ident, "function name");
  auto func = std::make_unique<ast::FunctionDef>(nameTok.text);
  stamp(*func, defTok);
  func->isAsync = isAsync;
  (void)expect(TK::LParen, "'('");
  parseParamList(func->params, TK::RParen, true);
  (void)expect(TK::RParen, "')'");
  if (match(TK::Arrow)) { func->returns = parseExpr(); }
  (void)expect(TK::Colon, "':'");
  parseSuiteInto(func->body);
  return func;
}

std::unique_ptr<ast::ClassDef> Parser::parseClass() {
  const auto classTok = expect(TK::Class, "'class'");
  const auto nameTok = expect(TK::Ident, "class name");
  auto cls = std::make_unique<ast::ClassDef>(nameTok.text);
  stamp(*cls, classTok);
  if (match(TK::LParen)) {
    auto args = parseArgList();
    (void)expect(TK::RParen, "')'");
    cls->bases = std::move(args.positional);
    for (auto& star : args.starArgs) {
      auto starred = std::make_unique<ast::Starred>(std::move(star));
      starred->file = starred->value->file;
      starred->line = starred->value->line;
      starred->col = starred->value->col;
      cls->bases.emplace_back(std::move(starred));
    }
    cls->keywords = std::move(args.keywords);
    // `**kwargs` in a class header has no name
    for (auto& kw : args.kwStarArgs) { cls->keywords.push_back(ast::KeywordArg{"", std::move(kw)}); }
  }
  (void)expect(TK::Colon, "':'");
  parseSuiteInto(cls->body);
  return cls;
}

// NOLINTNEXTLINE(readability-function-cognitive-complexity)
void Parser::parseParamList(std::vector<ast::Param>& outParams, TK closing, bool allowAnnotations) {
  bool kwOnly = false;
  bool seenSlash = false;
  bool seenDefault = false;
  auto parseAnnotation = [&](ast::Param& param, bool allowStar) {
    if (!allowAnnotations || !match(TK::Colon)) { return; }
    if (allowStar && peek().kind == TK::Star) {
      const auto starTok = get();
      auto starred = std::make_unique<ast::Starred>(parseBitwiseOr());
      stamp(*starred, starTok);
      param.annotation = std::move(starred);
      return;
    }
    param.annotation = parseExpr();
  };
  while (peek().kind != closing) {
    if (peek().kind == TK::StarStar) {
      (void)get();
      ast::Param param;
      param.name = expect(TK::Ident, "parameter name after '**'").text;
      param.isKwVarArg = true;
      parseAnnotation(param, false);
      outParams.push_back(std::move(param));
    } else if (peek().kind == TK::Star) {
      const auto starTok = get();
      if (peek().kind == TK::Comma || peek().kind == closing) {
        if (peek().kind == closing) { fail(starTok, "named arguments must follow bare *"); }
      } else {
        ast::Param param;
        param.name = expect(TK::Ident, "parameter name after '*'").text;
        param.isVarArg = true;
        parseAnnotation(param, true);
        outParams.push_back(std::move(param));
      }
      kwOnly = true; // params after * or *args are kw-only
    } else if (peek().kind == TK::Slash) {
      // Positional-only divider; mark all prior non-var params as positional-only
      const auto slashTok = get();
      if (seenSlash) { fail(slashTok, "/ may appear only once"); }
      if (outParams.empty() || kwOnly) { fail(slashTok, "at least one argument must precede /"); }
      for (auto& p : outParams) { p.isPosOnly = true; }
      seenSlash = true;
    } else {
      const auto nameTok = expect(TK::Ident, "parameter name");
      ast::Param param;
      param.name = nameTok.text;
      param.isKwOnly = kwOnly;
      parseAnnotation(param, false);
      if (match(TK::Equal)) {
        param.defaultValue = parseExpr();
        seenDefault = true;
      } else if (seenDefault && !kwOnly) {
        fail(nameTok, "non-default argument follows default argument");
      }
      outParams.push_back(std::move(param));
    }
    if (!match(TK::Comma)) break;
  }
}

std::unique_ptr<ast::Stmt> Parser::parseIfStmt() {
  const auto ifTok = get();
  auto cond = parseNamedExpr();
  (void)expect(TK::Colon, "':'");
  auto ifs = std::make_unique<ast::IfStmt>(std::move(cond));
  stamp(*ifs, ifTok);
  parseSuiteInto(ifs->thenBody);
  // elif chain as nested IfStmt in else
  ast::IfStmt* cur = ifs.get();
  while (peek().kind == TK::Elif) {
    const auto elifTok = get();
    auto econd = parseNamedExpr();
    (void)expect(TK::Colon, "':'");
    auto elifNode = std::make_unique<ast::IfStmt>(std::move(econd));
    stamp(*elifNode, elifTok);
    parseSuiteInto(elifNode->thenBody);
    ast::IfStmt* next = elifNode.get();
    cur->elseBody.emplace_back(std::move(elifNode));
    cur = next;
  }
  if (match(TK::Else)) {
    (void)expect(TK::Colon, "':'");
    parseSuiteInto(cur->elseBody);
  }
  return ifs;
}

std::unique_ptr<ast::Stmt> Parser::parseWhileStmt() {
  const auto whileTok = get();
  auto cond = parseNamedExpr();
  (void)expect(TK::Colon, "':'");
  auto node = std::make_unique<ast::WhileStmt>(std::move(cond));
  stamp(*node, whileTok);
  parseSuiteInto(node->thenBody);
  if (match(TK::Else)) {
    (void)expect(TK::Colon, "':'");
    parseSuiteInto(node->elseBody);
  }
  return node;
}

std::unique_ptr<ast::Stmt> Parser::parseForStmt(bool isAsync) {
  const auto forTok = expect(TK::For, "'for'");
  auto target = parseTargetList();
  checkTarget(target.get());
  (void)expect(TK::In, "'in'");
  auto iterable = parseStarExpressions();
  (void)expect(TK::Colon, "':'");
  auto node = std::make_unique<ast::ForStmt>(std::move(target), std::move(iterable));
  stamp(*node, forTok);
  node->isAsync = isAsync;
  parseSuiteInto(node->thenBody);
  if (match(TK::Else)) {
    (void)expect(TK::Colon, "':'");
    parseSuiteInto(node->elseBody);
  }
  return node;
}

std::unique_ptr<ast::Stmt> Parser::parseTryStmt() {
  const auto tryTok = get();
  (void)expect(TK::Colon, "':'");
  auto node = std::make_unique<ast::TryStmt>();
  stamp(*node, tryTok);
  parseSuiteInto(node->body);
  while (peek().kind == TK::Except) {
    const auto exceptTok = get();
    (void)match(TK::Star); // except* groups
    auto handler = std::make_unique<ast::ExceptHandler>();
    stamp(*handler, exceptTok);
    if (peek().kind != TK::Colon) {
      handler->type = parseExpr();
      if (peek().kind == TK::Comma) {
        // Python 2 spelling `except A, B:`
        fail(peek(), "multiple exception types must be parenthesized");
      }
      if (match(TK::As)) { handler->name = expect(TK::Ident, "name after 'as'").text; }
    }
    (void)expect(TK::Colon, "':'");
    parseSuiteInto(handler->body);
    node->handlers.emplace_back(std::move(handler));
  }
  if (!node->handlers.empty() && match(TK::Else)) {
    (void)expect(TK::Colon, "':'");
    parseSuiteInto(node->orelse);
  }
  if (match(TK::Finally)) {
    (void)expect(TK::Colon, "':'");
    parseSuiteInto(node->finalbody);
  }
  if (node->handlers.empty() && node->finalbody.empty()) {
    fail(peek(), "expected 'except' or 'finally' block");
  }
  return node;
}

std::unique_ptr<ast::Stmt> Parser::parseWithStmt(bool isAsync) {
  const auto withTok = expect(TK::With, "'with'");
  auto node = std::make_unique<ast::WithStmt>();
  stamp(*node, withTok);
  node->isAsync = isAsync;
  auto parseItem = [&]() {
    auto item = std::make_unique<ast::WithItem>();
    stamp(*item, peek());
    item->context = parseExpr();
    if (match(TK::As)) {
      item->optionalVars = parseBitwiseOr();
      checkTarget(item->optionalVars.get());
    }
    node->items.emplace_back(std::move(item));
  };
  // Parenthesized item list: `with (a as b, c as d):`
  bool parenthesized = false;
  if (peek().kind == TK::LParen) {
    int depth = 0;
    for (size_t ahead = 0;; ++ahead) {
      const auto kind = peekAt(ahead).kind;
      if (kind == TK::End || kind == TK::Newline) break;
      if (kind == TK::LParen || kind == TK::LBracket || kind == TK::LBrace) { ++depth; }
      else if (kind == TK::RParen || kind == TK::RBracket || kind == TK::RBrace) {
        if (--depth == 0) {
          parenthesized = peekAt(ahead + 1).kind == TK::Colon;
          break;
        }
      }
    }
  }
  if (parenthesized) {
    (void)get();
    while (peek().kind != TK::RParen) {
      parseItem();
      if (!match(TK::Comma)) break;
    }
    (void)expect(TK::RParen, "')'");
  } else {
    do { parseItem(); } while (match(TK::Comma));
  }
  (void)expect(TK::Colon, "':'");
  parseSuiteInto(node->body);
  return node;
}

std::string Parser::parseDottedName() {
  std::string name = expect(TK::Ident, "module name").text;
  while (match(TK::Dot)) {
    name += ".";
    name += expect(TK::Ident, "name after '.'").text;
  }
  return name;
}

std::unique_ptr<ast::Stmt> Parser::parseImportStmt() {
  const auto importTok = get();
  auto node = std::make_unique<ast::Import>();
  stamp(*node, importTok);
  do {
    ast::Alias alias;
    alias.name = parseDottedName();
    if (match(TK::As)) { alias.asname = expect(TK::Ident, "name after 'as'").text; }
    node->names.push_back(std::move(alias));
  } while (match(TK::Comma));
  return node;
}

std::unique_ptr<ast::Stmt> Parser::parseFromImportStmt() {
  const auto fromTok = get();
  auto node = std::make_unique<ast::ImportFrom>();
  stamp(*node, fromTok);
  for (;;) {
    if (match(TK::Dot)) { node->level += 1; continue; }
    if (match(TK::Ellipsis)) { node->level += 3; continue; }
    break;
  }
  if (peek().kind != TK::Import || node->level == 0) { node->module = parseDottedName(); }
  (void)expect(TK::Import, "'import'");
  if (match(TK::Star)) {
    node->names.push_back(ast::Alias{"*", ""});
    return node;
  }
  const bool paren = match(TK::LParen);
  for (;;) {
    ast::Alias alias;
    alias.name = expect(TK::Ident, "name to import").text;
    if (match(TK::As)) { alias.asname = expect(TK::Ident, "name after 'as'").text; }
    node->names.push_back(std::move(alias));
    if (!match(TK::Comma)) break;
    if (paren && peek().kind == TK::RParen) break;
    if (!paren && atSimpleStatementEnd()) {
      fail(peek(), "trailing comma not allowed without surrounding parentheses");
    }
  }
  if (paren) { (void)expect(TK::RParen, "')'"); }
  return node;
}

std::unique_ptr<ast::Stmt> Parser::parseRaiseStmt() {
  const auto raiseTok = get();
  auto node = std::make_unique<ast::RaiseStmt>();
  stamp(*node, raiseTok);
  if (!atSimpleStatementEnd()) {
    node->exc = parseExpr();
    if (match(TK::From)) { node->cause = parseExpr(); }
  }
  return node;
}

std::unique_ptr<ast::Stmt> Parser::parseGlobalStmt() {
  const auto tok = get();
  auto node = std::make_unique<ast::GlobalStmt>();
  stamp(*node, tok);
  do { node->names.push_back(expect(TK::Ident, "name").text); } while (match(TK::Comma));
  return node;
}

std::unique_ptr<ast::Stmt> Parser::parseNonlocalStmt() {
  const auto tok = get();
  auto node = std::make_unique<ast::NonlocalStmt>();
  stamp(*node, tok);
  do { node->names.push_back(expect(TK::Ident, "name").text); } while (match(TK::Comma));
  return node;
}

std::unique_ptr<ast::Stmt> Parser::parseAssertStmt() {
  const auto tok = get();
  auto node = std::make_unique<ast::AssertStmt>();
  stamp(*node, tok);
  node->test = parseExpr();
  if (match(TK::Comma)) { node->msg = parseExpr(); }
  return node;
}

std::unique_ptr<ast::Stmt> Parser::parseDelStmt() {
  const auto tok = get();
  auto node = std::make_unique<ast::DelStmt>();
  stamp(*node, tok);
  do {
    if (atSimpleStatementEnd()) break;
    auto target = parseBitwiseOr();
    checkTarget(target.get());
    node->targets.emplace_back(std::move(target));
  } while (match(TK::Comma));
  if (node->targets.empty()) { fail(peek(), "expected target after 'del', got " + describe(peek())); }
  return node;
}

// NOLINTNEXTLINE(readability-function-cognitive-complexity)
std::unique_ptr<ast::Stmt> Parser::parseExprOrAssignStmt() {
  auto first = parseYieldOrStarExpressions();
  // Annotated assignment: target ':' annotation ['=' value]
  if (peek().kind == TK::Colon) {
    (void)get();
    if (first->kind == ast::NodeKind::TupleLiteral) {
      failAt(*first, "only single target (not tuple) can be annotated");
    }
    if (first->kind == ast::NodeKind::ListLiteral) {
      failAt(*first, "only single target (not list) can be annotated");
    }
    checkTarget(first.get());
    auto annotation = parseExpr();
    auto node = std::make_unique<ast::AnnAssignStmt>(std::move(first), std::move(annotation));
    node->file = node->target->file;
    node->line = node->target->line;
    node->col = node->target->col;
    if (match(TK::Equal)) { node->value = parseYieldOrStarExpressions(); }
    return node;
  }
  // Augmented assignment (single target only)
  ast::BinaryOperator op{};
  if (augOpFor(peek().kind, op)) {
    const auto opTok = get();
    const auto k = first->kind;
    if (k != ast::NodeKind::Name && k != ast::NodeKind::Attribute && k != ast::NodeKind::Subscript) {
      fail(opTok, std::string("'") + describeTarget(first.get()) + "' is an illegal expression for augmented assignment");
    }
    auto rhs = parseYieldOrStarExpressions();
    auto node = std::make_unique<ast::AugAssignStmt>(std::move(first), op, std::move(rhs));
    node->file = node->target->file;
    node->line = node->target->line;
    node->col = node->target->col;
    return node;
  }
  if (peek().kind == TK::Equal) {
    std::vector<std::unique_ptr<ast::Expr>> chain;
    chain.emplace_back(std::move(first));
    while (match(TK::Equal)) { chain.emplace_back(parseYieldOrStarExpressions()); }
    auto value = std::move(chain.back());
    chain.pop_back();
    auto asg = std::make_unique<ast::AssignStmt>(std::move(value));
    for (auto& target : chain) {
      checkTarget(target.get());
      asg->targets.emplace_back(std::move(target));
    }
    const auto* t0 = asg->targets.front().get();
    asg->file = t0->file;
    asg->line = t0->line;
    asg->col = t0->col;
    return asg;
  }
  auto node = std::make_unique<ast::ExprStmt>(std::move(first));
  node->file = node->value->file;
  node->line = node->value->line;
  node->col = node->value->col;
  return node;
}

bool Parser::isValidAssignmentTarget(const ast::Expr* e) {
  if (e == nullptr) return false;
  switch (e->kind) {
    case ast::NodeKind::Name:
    case ast::NodeKind::Attribute:
    case ast::NodeKind::Subscript:
      return true;
    case ast::NodeKind::Starred:
      return isValidAssignmentTarget(static_cast<const ast::Starred*>(e)->value.get());
    case ast::NodeKind::TupleLiteral:
      for (const auto& el : static_cast<const ast::TupleLiteral*>(e)->elements) {
        if (!isValidAssignmentTarget(el.get())) return false;
      }
      return true;
    case ast::NodeKind::ListLiteral:
      for (const auto& el : static_cast<const ast::ListLiteral*>(e)->elements) {
        if (!isValidAssignmentTarget(el.get())) return false;
      }
      return true;
    default:
      return false;
  }
}

const char* Parser::describeTarget(const ast::Expr* e) {
  switch (e->kind) {
    case ast::NodeKind::Call: return "function call";
    case ast::NodeKind::IntLiteral:
    case ast::NodeKind::FloatLiteral:
    case ast::NodeKind::ImagLiteral:
    case ast::NodeKind::StringLiteral:
    case ast::NodeKind::BytesLiteral:
    case ast::NodeKind::BoolLiteral:
    case ast::NodeKind::NoneLiteral:
    case ast::NodeKind::EllipsisLiteral:
      return "literal";
    case ast::NodeKind::FStringLiteral: return "f-string expression";
    case ast::NodeKind::Compare: return "comparison";
    case ast::NodeKind::LambdaExpr: return "lambda";
    case ast::NodeKind::NamedExpr: return "named expression";
    case ast::NodeKind::IfExpr: return "conditional expression";
    case ast::NodeKind::YieldExpr: return "yield expression";
    case ast::NodeKind::AwaitExpr: return "await expression";
    case ast::NodeKind::GeneratorExpr: return "generator expression";
    case ast::NodeKind::ListComp: return "list comprehension";
    case ast::NodeKind::SetComp: return "set comprehension";
    case ast::NodeKind::DictComp: return "dict comprehension";
    case ast::NodeKind::DictLiteral: return "dict literal";
    case ast::NodeKind::SetLiteral: return "set display";
    case ast::NodeKind::TupleLiteral: return "tuple";
    case ast::NodeKind::ListLiteral: return "list";
    case ast::NodeKind::Starred: return "starred";
    default: return "expression";
  }
}

void Parser::checkTarget(const ast::Expr* e) {
  if (isValidAssignmentTarget(e)) return;
  // Report the innermost offending element
  const std::vector<std::unique_ptr<ast::Expr>>* elements = nullptr;
  if (e->kind == ast::NodeKind::TupleLiteral) { elements = &static_cast<const ast::TupleLiteral*>(e)->elements; }
  if (e->kind == ast::NodeKind::ListLiteral) { elements = &static_cast<const ast::ListLiteral*>(e)->elements; }
  if (e->kind == ast::NodeKind::Starred) { checkTarget(static_cast<const ast::Starred*>(e)->value.get()); }
  if (elements != nullptr) {
    for (const auto& el : *elements) { checkTarget(el.get()); }
  }
  failAt(*e, std::string("cannot assign to ") + describeTarget(e));
}

bool Parser::looksLikeMatchStmt() const {
  // `match` is a soft keyword: `match x:` starts a statement, `match = 1` does not
  switch (peekNext().kind) {
    case TK::Equal: case TK::Dot: case TK::Comma: case TK::RParen: case TK::RBracket:
    case TK::Colon: case TK::Newline: case TK::End: case TK::Semicolon:
    case TK::PlusEqual: case TK::MinusEqual: case TK::StarEqual: case TK::SlashEqual:
    case TK::SlashSlashEqual: case TK::PercentEqual: case TK::StarStarEqual: case TK::AtEqual:
    case TK::LShiftEqual: case TK::RShiftEqual: case TK::AmpEqual: case TK::PipeEqual:
    case TK::CaretEqual:
      return false;
    default:
      break;
  }
  TK last = TK::End;
  for (size_t ahead = 1;; ++ahead) {
    const auto kind = peekAt(ahead).kind;
    if (kind == TK::Newline || kind == TK::End) break;
    if (kind == TK::Equal) return false;
    last = kind;
  }
  return last == TK::Colon;
}

std::unique_ptr<ast::Stmt> Parser::parseMatchStmt() {
  const auto matchTok = get();
  auto node = std::make_unique<ast::MatchStmt>();
  stamp(*node, matchTok);
  node->subject = parseStarExpressions();
  (void)expect(TK::Colon, "':'");
  (void)expect(TK::Newline, "end of line");
  if (peek().kind != TK::Indent) { fail(peek(), "expected an indented block"); }
  (void)get();
  while (peek().kind != TK::Dedent && peek().kind != TK::End) {
    if (peek().kind == TK::Newline) { (void)get(); continue; }
    if (peek().kind != TK::Ident || peek().text != "case") {
      fail(peek(), "expected 'case' block, got " + describe(peek()));
    }
    node->cases.emplace_back(parseMatchCase());
  }
  (void)match(TK::Dedent);
  if (node->cases.empty()) { fail(matchTok, "expected 'case' block"); }
  return node;
}

std::unique_ptr<ast::MatchCase> Parser::parseMatchCase() {
  const auto caseTok = get();
  auto mc = std::make_unique<ast::MatchCase>();
  stamp(*mc, caseTok);
  mc->pattern = parsePatternTop();
  if (match(TK::If)) { mc->guard = parseNamedExpr(); }
  (void)expect(TK::Colon, "':'");
  parseSuiteInto(mc->body);
  return mc;
}

std::unique_ptr<ast::Pattern> Parser::parsePatternTop() {
  const auto startTok = peek();
  auto first = parsePattern();
  if (peek().kind != TK::Comma) return first;
  // open sequence: `case a, *rest:`
  auto seq = std::make_unique<ast::PatternSequence>();
  stamp(*seq, startTok);
  seq->isList = false;
  seq->elements.emplace_back(std::move(first));
  while (match(TK::Comma)) {
    if (peek().kind == TK::Colon || peek().kind == TK::If) break;
    seq->elements.emplace_back(parsePattern());
  }
  return seq;
}

std::unique_ptr<ast::Pattern> Parser::parsePattern() {
  const DepthGuard guard(*this, exprDepth_, kMaxExprDepth, "pattern nested too deeply");
  auto pat = parsePatternOr();
  if (peek().kind == TK::As) {
    (void)get();
    const auto nameTok = expect(TK::Ident, "name after 'as'");
    auto as = std::make_unique<ast::PatternAs>(std::move(pat), nameTok.text);
    as->file = as->pattern->file;
    as->line = as->pattern->line;
    as->col = as->pattern->col;
    return as;
  }
  return pat;
}

std::unique_ptr<ast::Pattern> Parser::parsePatternOr() {
  auto first = parseClosedPattern();
  if (peek().kind != TK::Pipe) return first;
  auto alt = std::make_unique<ast::PatternOr>();
  alt->file = first->file;
  alt->line = first->line;
  alt->col = first->col;
  alt->patterns.emplace_back(std::move(first));
  while (match(TK::Pipe)) { alt->patterns.emplace_back(parseClosedPattern()); }
  return alt;
}

std::unique_ptr<ast::Expr> Parser::parseDottedValue() {
  const auto nameTok = expect(TK::Ident, "name");
  std::unique_ptr<ast::Expr> value = std::make_unique<ast::Name>(nameTok.text);
  stamp(*value, nameTok);
  while (match(TK::Dot)) {
    const auto attrTok = expect(TK::Ident, "attribute name");
    auto attr = std::make_unique<ast::Attribute>(std::move(value), attrTok.text);
    stamp(*attr, nameTok);
    value = std::move(attr);
  }
  return value;
}

// NOLINTNEXTLINE(readability-function-size,readability-function-cognitive-complexity)
std::unique_ptr<ast::Pattern> Parser::parseClosedPattern() {
  const auto tok = peek();
  switch (tok.kind) {
    case TK::Star: {
      (void)get();
      auto star = std::make_unique<ast::PatternStar>(expect(TK::Ident, "name after '*'").text);
      stamp(*star, tok);
      return star;
    }
    case TK::Ident: {
      const auto nextKind = peekNext().kind;
      if (nextKind != TK::Dot && nextKind != TK::LParen) {
        (void)get();
        std::unique_ptr<ast::Pattern> pat;
        if (tok.text == "_") { pat = std::make_unique<ast::PatternWildcard>(); }
        else { pat = std::make_unique<ast::PatternName>(tok.text); }
        stamp(*pat, tok);
        return pat;
      }
      auto value = parseDottedValue();
      if (peek().kind != TK::LParen) {
        auto lit = std::make_unique<ast::PatternLiteral>(std::move(value));
        stamp(*lit, tok);
        return lit;
      }
      (void)get();
      auto cls = std::make_unique<ast::PatternClass>(std::move(value));
      stamp(*cls, tok);
      while (peek().kind != TK::RParen) {
        if (peek().kind == TK::Ident && peekNext().kind == TK::Equal) {
          auto key = get().text;
          (void)get();
          cls->kwargs.emplace_back(std::move(key), parsePattern());
        } else {
          if (!cls->kwargs.empty()) { fail(peek(), "positional patterns follow keyword patterns"); }
          cls->args.emplace_back(parsePattern());
        }
        if (!match(TK::Comma)) break;
      }
      (void)expect(TK::RParen, "')'");
      return cls;
    }
    case TK::LParen: {
      (void)get();
      if (peek().kind == TK::RParen) {
        (void)get();
        auto seq = std::make_unique<ast::PatternSequence>();
        stamp(*seq, tok);
        seq->isList = false;
        return seq;
      }
      auto inner = parsePattern();
      if (peek().kind != TK::Comma) {
        (void)expect(TK::RParen, "')'");
        return inner;
      }
      auto seq = std::make_unique<ast::PatternSequence>();
      stamp(*seq, tok);
      seq->isList = false;
      seq->elements.emplace_back(std::move(inner));
      while (match(TK::Comma)) {
        if (peek().kind == TK::RParen) break;
        seq->elements.emplace_back(parsePattern());
      }
      (void)expect(TK::RParen, "')'");
      return seq;
    }
    case TK::LBracket: {
      (void)get();
      auto seq = parseSequencePattern(TK::RBracket, true);
      stamp(*seq, tok);
      return seq;
    }
    case TK::LBrace: return parseMappingPattern();
    case TK::Int: case TK::Float: case TK::Imag: case TK::String: case TK::Bytes:
    case TK::Minus: case TK::NoneLit: case TK::BoolLit: {
      auto lit = std::make_unique<ast::PatternLiteral>(parseAdditive());
      stamp(*lit, tok);
      return lit;
    }
    default:
      fail(tok, "expected pattern, got " + describe(tok));
  }
}

std::unique_ptr<ast::Pattern> Parser::parseSequencePattern(TK closing, bool isList) {
  auto seq = std::make_unique<ast::PatternSequence>();
  seq->isList = isList;
  while (peek().kind != closing) {
    seq->elements.emplace_back(parsePattern());
    if (!match(TK::Comma)) break;
  }
  (void)expect(closing, isList ? "']'" : "')'");
  return seq;
}

std::unique_ptr<ast::Pattern> Parser::parseMappingPattern() {
  const auto openTok = get();
  auto map = std::make_unique<ast::PatternMapping>();
  stamp(*map, openTok);
  while (peek().kind != TK::RBrace) {
    if (match(TK::StarStar)) {
      map->hasRest = true;
      map->restName = expect(TK::Ident, "name after '**'").text;
    } else {
      if (map->hasRest) { fail(peek(), "'**' pattern must be last in a mapping pattern"); }
      std::unique_ptr<ast::Expr> key = peek().kind == TK::Ident ? parseDottedValue() : parseAdditive();
      (void)expect(TK::Colon, "':'");
      map->items.emplace_back(std::move(key), parsePattern());
    }
    if (!match(TK::Comma)) break;
  }
  (void)expect(TK::RBrace, "'}'");
  return map;
}

} // namespace pyscope::parse
