/***
 * Name: pyscope::parse::Parser (expressions)
 * Purpose: Expression grammar from starred lists down to atoms.
 * Theory of Operation:
 *   One method per precedence level, lowest first:
 *     lambda, ternary, or, and, not, comparison, |, ^, &, shifts,
 *     + -, * @ / // %, unary, **, await, primary (call, subscript, attribute)
 */
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "ast/Nodes.h"
#include "parser/Parser.h"

namespace pyscope::parse {

using TK = lex::TokenKind;

namespace {

void stamp(ast::Node& node, const lex::Token& tok) {
  node.file = tok.file;
  node.line = tok.line;
  node.col = tok.col;
}

void stampFrom(ast::Node& node, const ast::Node& from) {
  node.file = from.file;
  node.line = from.line;
  node.col = from.col;
}

std::unique_ptr<ast::Expr> makeBinary(ast::BinaryOperator op, std::unique_ptr<ast::Expr> lhs,
                                      std::unique_ptr<ast::Expr> rhs) {
  auto node = std::make_unique<ast::Binary>(op, std::move(lhs), std::move(rhs));
  stampFrom(*node, *node->lhs);
  return node;
}

} // namespace

bool Parser::startsExpr(TK kind) {
  switch (kind) {
    case TK::Ident: case TK::Int: case TK::Float: case TK::Imag: case TK::String: case TK::Bytes:
    case TK::BoolLit: case TK::NoneLit: case TK::Ellipsis:
    case TK::LParen: case TK::LBracket: case TK::LBrace:
    case TK::Minus: case TK::Plus: case TK::Tilde: case TK::Not: case TK::Lambda: case TK::Await:
    case TK::Star:
      return true;
    default:
      return false;
  }
}

std::unique_ptr<ast::Expr> Parser::parseExpressionOnly() {
  initBuffer();
  auto expr = parseYieldOrStarExpressions();
  (void)match(TK::Newline);
  if (peek().kind != TK::End) { fail(peek(), "expected end of expression, got " + describe(peek())); }
  return expr;
}

std::unique_ptr<ast::Expr> Parser::parseStarOrNamed() {
  if (peek().kind == TK::Star) {
    const auto starTok = get();
    auto starred = std::make_unique<ast::Starred>(parseBitwiseOr());
    stamp(*starred, starTok);
    return starred;
  }
  return parseNamedExpr();
}

std::unique_ptr<ast::Expr> Parser::parseStarExpressions() {
  auto first = parseStarOrNamed();
  if (peek().kind != TK::Comma) return first;
  auto tup = std::make_unique<ast::TupleLiteral>();
  stampFrom(*tup, *first);
  tup->elements.emplace_back(std::move(first));
  while (match(TK::Comma)) {
    if (!startsExpr(peek().kind)) break;
    tup->elements.emplace_back(parseStarOrNamed());
  }
  return tup;
}

std::unique_ptr<ast::Expr> Parser::parseYieldOrStarExpressions() {
  if (peek().kind == TK::Yield) return parseYieldExpr();
  return parseStarExpressions();
}

std::unique_ptr<ast::Expr> Parser::parseYieldExpr() {
  const auto yieldTok = expect(TK::Yield, "'yield'");
  auto node = std::make_unique<ast::YieldExpr>();
  stamp(*node, yieldTok);
  if (match(TK::From)) {
    node->isFrom = true;
    node->value = parseExpr();
  } else if (startsExpr(peek().kind)) {
    node->value = parseStarExpressions();
  }
  return node;
}

// for-loop and comprehension targets stop before 'in'
std::unique_ptr<ast::Expr> Parser::parseTargetList() {
  auto parseOne = [&]() -> std::unique_ptr<ast::Expr> {
    if (peek().kind == TK::Star) {
      const auto starTok = get();
      auto starred = std::make_unique<ast::Starred>(parseBitwiseOr());
      stamp(*starred, starTok);
      return starred;
    }
    return parseBitwiseOr();
  };
  auto first = parseOne();
  if (peek().kind != TK::Comma) return first;
  auto tup = std::make_unique<ast::TupleLiteral>();
  stampFrom(*tup, *first);
  tup->elements.emplace_back(std::move(first));
  while (match(TK::Comma)) {
    if (!startsExpr(peek().kind)) break;
    tup->elements.emplace_back(parseOne());
  }
  return tup;
}

std::unique_ptr<ast::Expr> Parser::parseNamedExpr() {
  if (peek().kind == TK::Ident && peekNext().kind == TK::ColonEqual) {
    const auto nameTok = get();
    (void)get();
    auto node = std::make_unique<ast::NamedExpr>(nameTok.text, parseExpr());
    stamp(*node, nameTok);
    return node;
  }
  return parseExpr();
}

std::unique_ptr<ast::Expr> Parser::parseExpr() {
  const DepthGuard guard(*this, exprDepth_, kMaxExprDepth, "expression nested too deeply");
  if (peek().kind == TK::Lambda) return parseLambda();
  auto body = parseLogicalOr();
  if (peek().kind != TK::If) return body;
  (void)get();
  auto test = parseLogicalOr();
  (void)expect(TK::Else, "'else' in conditional expression");
  auto orelse = parseExpr();
  auto node = std::make_unique<ast::IfExpr>(std::move(body), std::move(test), std::move(orelse));
  stampFrom(*node, *node->body);
  return node;
}

std::unique_ptr<ast::Expr> Parser::parseLambda() {
  const auto lambdaTok = get();
  auto node = std::make_unique<ast::LambdaExpr>();
  stamp(*node, lambdaTok);
  parseParamList(node->params, TK::Colon, false);
  (void)expect(TK::Colon, "':'");
  node->body = parseExpr();
  return node;
}

std::unique_ptr<ast::Expr> Parser::parseLogicalOr() {
  auto lhs = parseLogicalAnd();
  while (match(TK::Or)) { lhs = makeBinary(ast::BinaryOperator::Or, std::move(lhs), parseLogicalAnd()); }
  return lhs;
}

std::unique_ptr<ast::Expr> Parser::parseLogicalAnd() {
  auto lhs = parseLogicalNot();
  while (match(TK::And)) { lhs = makeBinary(ast::BinaryOperator::And, std::move(lhs), parseLogicalNot()); }
  return lhs;
}

std::unique_ptr<ast::Expr> Parser::parseLogicalNot() {
  if (peek().kind == TK::Not) {
    const DepthGuard guard(*this, exprDepth_, kMaxExprDepth, "expression nested too deeply");
    const auto notTok = get();
    auto node = std::make_unique<ast::Unary>(ast::UnaryOperator::Not, parseLogicalNot());
    stamp(*node, notTok);
    return node;
  }
  return parseComparison();
}

std::unique_ptr<ast::Expr> Parser::parseComparison() {
  auto left = parseBitwiseOr();
  std::unique_ptr<ast::Compare> cmp;
  for (;;) {
    ast::BinaryOperator op{};
    switch (peek().kind) {
      case TK::Lt: op = ast::BinaryOperator::Lt; break;
      case TK::Le: op = ast::BinaryOperator::Le; break;
      case TK::Gt: op = ast::BinaryOperator::Gt; break;
      case TK::Ge: op = ast::BinaryOperator::Ge; break;
      case TK::EqEq: op = ast::BinaryOperator::Eq; break;
      case TK::NotEq: op = ast::BinaryOperator::Ne; break;
      case TK::In: op = ast::BinaryOperator::In; break;
      case TK::Not:
        if (peekNext().kind != TK::In) {
          if (cmp) return cmp;
          return left;
        }
        (void)get();
        op = ast::BinaryOperator::NotIn;
        break;
      case TK::Is:
        if (peekNext().kind == TK::Not) {
          (void)get();
          op = ast::BinaryOperator::IsNot;
        } else {
          op = ast::BinaryOperator::Is;
        }
        break;
      default:
        if (cmp) return cmp;
        return left;
    }
    (void)get();
    if (!cmp) {
      cmp = std::make_unique<ast::Compare>();
      stampFrom(*cmp, *left);
      cmp->left = std::move(left);
    }
    cmp->ops.push_back(op);
    cmp->comparators.emplace_back(parseBitwiseOr());
  }
}

std::unique_ptr<ast::Expr> Parser::parseBitwiseOr() {
  auto lhs = parseBitwiseXor();
  while (match(TK::Pipe)) { lhs = makeBinary(ast::BinaryOperator::BitOr, std::move(lhs), parseBitwiseXor()); }
  return lhs;
}

std::unique_ptr<ast::Expr> Parser::parseBitwiseXor() {
  auto lhs = parseBitwiseAnd();
  while (match(TK::Caret)) { lhs = makeBinary(ast::BinaryOperator::BitXor, std::move(lhs), parseBitwiseAnd()); }
  return lhs;
}

std::unique_ptr<ast::Expr> Parser::parseBitwiseAnd() {
  auto lhs = parseShift();
  while (match(TK::Amp)) { lhs = makeBinary(ast::BinaryOperator::BitAnd, std::move(lhs), parseShift()); }
  return lhs;
}

std::unique_ptr<ast::Expr> Parser::parseShift() {
  auto lhs = parseAdditive();
  for (;;) {
    if (match(TK::LShift)) { lhs = makeBinary(ast::BinaryOperator::LShift, std::move(lhs), parseAdditive()); }
    else if (match(TK::RShift)) { lhs = makeBinary(ast::BinaryOperator::RShift, std::move(lhs), parseAdditive()); }
    else { return lhs; }
  }
}

std::unique_ptr<ast::Expr> Parser::parseAdditive() {
  auto lhs = parseMultiplicative();
  for (;;) {
    if (match(TK::Plus)) { lhs = makeBinary(ast::BinaryOperator::Add, std::move(lhs), parseMultiplicative()); }
    else if (match(TK::Minus)) { lhs = makeBinary(ast::BinaryOperator::Sub, std::move(lhs), parseMultiplicative()); }
    else { return lhs; }
  }
}

ast::BinaryOperator Parser::mulOpFor(TK kind) {
  switch (kind) {
    case TK::Slash: return ast::BinaryOperator::Div;
    case TK::SlashSlash: return ast::BinaryOperator::FloorDiv;
    case TK::Percent: return ast::BinaryOperator::Mod;
    case TK::At: return ast::BinaryOperator::MatMul;
    default: return ast::BinaryOperator::Mul;
  }
}

bool Parser::augOpFor(TK kind, ast::BinaryOperator& out) {
  switch (kind) {
    case TK::PlusEqual: out = ast::BinaryOperator::Add; return true;
    case TK::MinusEqual: out = ast::BinaryOperator::Sub; return true;
    case TK::StarEqual: out = ast::BinaryOperator::Mul; return true;
    case TK::AtEqual: out = ast::BinaryOperator::MatMul; return true;
    case TK::SlashEqual: out = ast::BinaryOperator::Div; return true;
    case TK::SlashSlashEqual: out = ast::BinaryOperator::FloorDiv; return true;
    case TK::PercentEqual: out = ast::BinaryOperator::Mod; return true;
    case TK::StarStarEqual: out = ast::BinaryOperator::Pow; return true;
    case TK::LShiftEqual: out = ast::BinaryOperator::LShift; return true;
    case TK::RShiftEqual: out = ast::BinaryOperator::RShift; return true;
    case TK::AmpEqual: out = ast::BinaryOperator::BitAnd; return true;
    case TK::PipeEqual: out = ast::BinaryOperator::BitOr; return true;
    case TK::CaretEqual: out = ast::BinaryOperator::BitXor; return true;
    default: return false;
  }
}

std::unique_ptr<ast::Expr> Parser::parseMultiplicative() {
  auto lhs = parseUnary();
  for (;;) {
    const auto kind = peek().kind;
    if (kind != TK::Star && kind != TK::Slash && kind != TK::SlashSlash && kind != TK::Percent && kind != TK::At) {
      return lhs;
    }
    (void)get();
    lhs = makeBinary(mulOpFor(kind), std::move(lhs), parseUnary());
  }
}

std::unique_ptr<ast::Expr> Parser::parseUnary() {
  const DepthGuard guard(*this, exprDepth_, kMaxExprDepth, "expression nested too deeply");
  const auto tok = peek();
  ast::UnaryOperator op{};
  switch (tok.kind) {
    case TK::Minus: op = ast::UnaryOperator::Neg; break;
    case TK::Plus: op = ast::UnaryOperator::Pos; break;
    case TK::Tilde: op = ast::UnaryOperator::BitNot; break;
    default: return parsePower();
  }
  (void)get();
  auto operand = parseUnary();
  // -1 and -2.5 stay literals so they render as written
  if (op == ast::UnaryOperator::Neg) {
    switch (operand->kind) {
      case ast::NodeKind::IntLiteral: {
        auto& lit = static_cast<ast::IntLiteral&>(*operand);
        lit.value = "-" + lit.value;
        stamp(lit, tok);
        return operand;
      }
      case ast::NodeKind::FloatLiteral: {
        auto& lit = static_cast<ast::FloatLiteral&>(*operand);
        lit.value = "-" + lit.value;
        stamp(lit, tok);
        return operand;
      }
      case ast::NodeKind::ImagLiteral: {
        auto& lit = static_cast<ast::ImagLiteral&>(*operand);
        lit.value = "-" + lit.value;
        stamp(lit, tok);
        return operand;
      }
      default:
        break;
    }
  }
  auto node = std::make_unique<ast::Unary>(op, std::move(operand));
  stamp(*node, tok);
  return node;
}

std::unique_ptr<ast::Expr> Parser::parsePower() {
  std::unique_ptr<ast::Expr> base;
  if (peek().kind == TK::Await) {
    const auto awaitTok = get();
    auto node = std::make_unique<ast::AwaitExpr>();
    stamp(*node, awaitTok);
    node->value = parsePostfix(parseAtom());
    base = std::move(node);
  } else {
    base = parsePostfix(parseAtom());
  }
  if (match(TK::StarStar)) {
    // right-associative, binds tighter than unary on its left only
    return makeBinary(ast::BinaryOperator::Pow, std::move(base), parseUnary());
  }
  return base;
}

std::unique_ptr<ast::Expr> Parser::parsePostfix(std::unique_ptr<ast::Expr> base) {
  for (;;) {
    switch (peek().kind) {
      case TK::LParen: {
        const DepthGuard guard(*this, bracketDepth_, kMaxBracketDepth, "too many nested parentheses");
        (void)get();
        auto args = parseArgList();
        (void)expect(TK::RParen, "')'");
        auto call = std::make_unique<ast::Call>(std::move(base));
        stampFrom(*call, *call->callee);
        call->args = std::move(args.positional);
        call->keywords = std::move(args.keywords);
        call->starArgs = std::move(args.starArgs);
        call->kwStarArgs = std::move(args.kwStarArgs);
        base = std::move(call);
        break;
      }
      case TK::LBracket: {
        const DepthGuard guard(*this, bracketDepth_, kMaxBracketDepth, "too many nested parentheses");
        (void)get();
        auto slice = parseSubscriptList();
        (void)expect(TK::RBracket, "']'");
        auto sub = std::make_unique<ast::Subscript>(std::move(base), std::move(slice));
        stampFrom(*sub, *sub->value);
        base = std::move(sub);
        break;
      }
      case TK::Dot: {
        (void)get();
        const auto attrTok = expect(TK::Ident, "attribute name after '.'");
        auto attr = std::make_unique<ast::Attribute>(std::move(base), attrTok.text);
        stampFrom(*attr, *attr->value);
        base = std::move(attr);
        break;
      }
      default:
        return base;
    }
  }
}

Parser::ArgList Parser::parseArgList() {
  ArgList out;
  while (peek().kind != TK::RParen) {
    if (match(TK::Star)) {
      out.starArgs.emplace_back(parseExpr());
    } else if (match(TK::StarStar)) {
      out.kwStarArgs.emplace_back(parseExpr());
    } else if (peek().kind == TK::Ident && peekNext().kind == TK::Equal) {
      auto name = get().text;
      (void)get();
      out.keywords.push_back(ast::KeywordArg{std::move(name), parseExpr()});
    } else {
      auto arg = parseNamedExpr();
      if (peek().kind == TK::For || (peek().kind == TK::Async && peekNext().kind == TK::For)) {
        // f(x for x in xs)
        auto gen = std::make_unique<ast::GeneratorExpr>();
        stampFrom(*gen, *arg);
        gen->elt = std::move(arg);
        gen->fors = parseComprehensionFors();
        arg = std::move(gen);
      }
      if (!out.keywords.empty() || !out.kwStarArgs.empty()) {
        failAt(*arg, out.kwStarArgs.empty() ? "positional argument follows keyword argument"
                                            : "positional argument follows keyword argument unpacking");
      }
      out.positional.emplace_back(std::move(arg));
    }
    if (!match(TK::Comma)) break;
  }
  return out;
}

std::vector<ast::ComprehensionFor> Parser::parseComprehensionFors() {
  std::vector<ast::ComprehensionFor> fors;
  while (peek().kind == TK::For || (peek().kind == TK::Async && peekNext().kind == TK::For)) {
    ast::ComprehensionFor gen;
    gen.isAsync = match(TK::Async);
    (void)expect(TK::For, "'for'");
    gen.target = parseTargetList();
    checkTarget(gen.target.get());
    (void)expect(TK::In, "'in'");
    gen.iter = parseLogicalOr();
    while (match(TK::If)) { gen.ifs.emplace_back(parseLogicalOr()); }
    fors.push_back(std::move(gen));
  }
  return fors;
}

std::unique_ptr<ast::Expr> Parser::parseSubscriptList() {
  auto first = parseSliceItem();
  if (peek().kind != TK::Comma) return first;
  auto tup = std::make_unique<ast::TupleLiteral>();
  stampFrom(*tup, *first);
  tup->elements.emplace_back(std::move(first));
  while (match(TK::Comma)) {
    if (peek().kind == TK::RBracket) break;
    tup->elements.emplace_back(parseSliceItem());
  }
  return tup;
}

std::unique_ptr<ast::Expr> Parser::parseSliceItem() {
  if (peek().kind == TK::Star) return parseStarOrNamed();
  const auto startTok = peek();
  std::unique_ptr<ast::Expr> lower;
  if (peek().kind != TK::Colon) {
    lower = parseNamedExpr();
    if (peek().kind != TK::Colon) return lower;
  }
  (void)get(); // ':'
  auto slice = std::make_unique<ast::Slice>();
  stamp(*slice, startTok);
  slice->lower = std::move(lower);
  auto atItemEnd = [&]() {
    const auto kind = peek().kind;
    return kind == TK::RBracket || kind == TK::Comma || kind == TK::Colon;
  };
  if (!atItemEnd()) { slice->upper = parseExpr(); }
  if (match(TK::Colon)) {
    if (!atItemEnd()) { slice->step = parseExpr(); }
  }
  return slice;
}

// NOLINTNEXTLINE(readability-function-cognitive-complexity)
std::unique_ptr<ast::Expr> Parser::parseAtom() {
  const auto tok = peek();
  switch (tok.kind) {
    case TK::Ident: {
      (void)get();
      auto name = std::make_unique<ast::Name>(tok.text);
      stamp(*name, tok);
      return name;
    }
    case TK::Int: {
      (void)get();
      auto lit = std::make_unique<ast::IntLiteral>(tok.text);
      stamp(*lit, tok);
      return lit;
    }
    case TK::Float: {
      (void)get();
      auto lit = std::make_unique<ast::FloatLiteral>(tok.text);
      stamp(*lit, tok);
      return lit;
    }
    case TK::Imag: {
      (void)get();
      auto lit = std::make_unique<ast::ImagLiteral>(tok.text);
      stamp(*lit, tok);
      return lit;
    }
    case TK::String:
    case TK::Bytes:
      return parseStringAtom();
    case TK::BoolLit: {
      (void)get();
      auto lit = std::make_unique<ast::BoolLiteral>(tok.text == "True");
      stamp(*lit, tok);
      return lit;
    }
    case TK::NoneLit: {
      (void)get();
      auto lit = std::make_unique<ast::NoneLiteral>();
      stamp(*lit, tok);
      return lit;
    }
    case TK::Ellipsis: {
      (void)get();
      auto lit = std::make_unique<ast::EllipsisLiteral>();
      stamp(*lit, tok);
      return lit;
    }
    case TK::LParen: {
      const DepthGuard guard(*this, bracketDepth_, kMaxBracketDepth, "too many nested parentheses");
      (void)get();
      return parseTupleOrParen(tok);
    }
    case TK::LBracket: {
      const DepthGuard guard(*this, bracketDepth_, kMaxBracketDepth, "too many nested parentheses");
      (void)get();
      return parseListLiteral(tok);
    }
    case TK::LBrace: {
      const DepthGuard guard(*this, bracketDepth_, kMaxBracketDepth, "too many nested parentheses");
      (void)get();
      return parseDictOrSetLiteral(tok);
    }
    case TK::Indent:
      fail(tok, "unexpected indent");
    default:
      fail(tok, "expected expression, got " + describe(tok));
  }
}

std::unique_ptr<ast::Expr> Parser::parseTupleOrParen(const lex::Token& openTok) {
  if (match(TK::RParen)) {
    auto empty = std::make_unique<ast::TupleLiteral>();
    stamp(*empty, openTok);
    return empty;
  }
  if (peek().kind == TK::Yield) {
    auto y = parseYieldExpr();
    (void)expect(TK::RParen, "')'");
    return y;
  }
  auto first = parseStarOrNamed();
  if (peek().kind == TK::For || (peek().kind == TK::Async && peekNext().kind == TK::For)) {
    auto gen = std::make_unique<ast::GeneratorExpr>();
    stamp(*gen, openTok);
    gen->elt = std::move(first);
    gen->fors = parseComprehensionFors();
    (void)expect(TK::RParen, "')'");
    return gen;
  }
  if (peek().kind != TK::Comma) {
    (void)expect(TK::RParen, "')'");
    return first;
  }
  auto tup = std::make_unique<ast::TupleLiteral>();
  stamp(*tup, openTok);
  tup->elements.emplace_back(std::move(first));
  while (match(TK::Comma)) {
    if (peek().kind == TK::RParen) break;
    tup->elements.emplace_back(parseStarOrNamed());
  }
  (void)expect(TK::RParen, "')'");
  return tup;
}

std::unique_ptr<ast::Expr> Parser::parseListLiteral(const lex::Token& openTok) {
  if (match(TK::RBracket)) {
    auto empty = std::make_unique<ast::ListLiteral>();
    stamp(*empty, openTok);
    return empty;
  }
  auto first = parseStarOrNamed();
  if (peek().kind == TK::For || (peek().kind == TK::Async && peekNext().kind == TK::For)) {
    auto comp = std::make_unique<ast::ListComp>();
    stamp(*comp, openTok);
    comp->elt = std::move(first);
    comp->fors = parseComprehensionFors();
    (void)expect(TK::RBracket, "']'");
    return comp;
  }
  auto list = std::make_unique<ast::ListLiteral>();
  stamp(*list, openTok);
  list->elements.emplace_back(std::move(first));
  while (match(TK::Comma)) {
    if (peek().kind == TK::RBracket) break;
    list->elements.emplace_back(parseStarOrNamed());
  }
  (void)expect(TK::RBracket, "']'");
  return list;
}

// NOLINTNEXTLINE(readability-function-cognitive-complexity)
std::unique_ptr<ast::Expr> Parser::parseDictOrSetLiteral(const lex::Token& openTok) {
  if (match(TK::RBrace)) {
    auto empty = std::make_unique<ast::DictLiteral>();
    stamp(*empty, openTok);
    return empty;
  }
  auto comprehensionFollows = [&]() {
    return peek().kind == TK::For || (peek().kind == TK::Async && peekNext().kind == TK::For);
  };
  const bool dictStart = peek().kind == TK::StarStar;
  std::unique_ptr<ast::Expr> first;
  if (!dictStart) { first = parseStarOrNamed(); }
  if (dictStart || peek().kind == TK::Colon) {
    auto dict = std::make_unique<ast::DictLiteral>();
    stamp(*dict, openTok);
    if (dictStart) {
      (void)get();
      dict->unpacks.emplace_back(parseBitwiseOr());
    } else {
      (void)get(); // ':'
      auto value = parseExpr();
      if (comprehensionFollows()) {
        auto comp = std::make_unique<ast::DictComp>();
        stamp(*comp, openTok);
        comp->key = std::move(first);
        comp->value = std::move(value);
        comp->fors = parseComprehensionFors();
        (void)expect(TK::RBrace, "'}'");
        return comp;
      }
      dict->items.emplace_back(std::move(first), std::move(value));
    }
    while (match(TK::Comma)) {
      if (peek().kind == TK::RBrace) break;
      if (match(TK::StarStar)) {
        dict->unpacks.emplace_back(parseBitwiseOr());
        continue;
      }
      auto key = parseExpr();
      (void)expect(TK::Colon, "':'");
      dict->items.emplace_back(std::move(key), parseExpr());
    }
    (void)expect(TK::RBrace, "'}'");
    return dict;
  }
  if (comprehensionFollows()) {
    auto comp = std::make_unique<ast::SetComp>();
    stamp(*comp, openTok);
    comp->elt = std::move(first);
    comp->fors = parseComprehensionFors();
    (void)expect(TK::RBrace, "'}'");
    return comp;
  }
  auto set = std::make_unique<ast::SetLiteral>();
  stamp(*set, openTok);
  set->elements.emplace_back(std::move(first));
  while (match(TK::Comma)) {
    if (peek().kind == TK::RBrace) break;
    set->elements.emplace_back(parseStarOrNamed());
  }
  (void)expect(TK::RBrace, "'}'");
  return set;
}

} // namespace pyscope::parse
