/***
 * Name: pyscope::parse string literals
 * Purpose: Decode string and bytes tokens, concatenate adjacent literals and
 *   parse f-string replacement fields.
 * Inputs:
 *   - Raw String/Bytes tokens (prefix and quotes included)
 * Outputs:
 *   - StringLiteral, BytesLiteral or FStringLiteral nodes
 * Theory of Operation:
 *   Adjacent literals concatenate; any f-string part turns the result into an
 *   FStringLiteral whose plain parts become text segments. A replacement
 *   field's expression text is wrapped in parentheses and parsed by a fresh
 *   Lexer/Parser pair, so it may span lines inside triple-quoted f-strings.
 *   Conversions (!r), format specs and the trailing '=' are split off first;
 *   fields nested in a format spec are parsed as well.
 */
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <unicode/uchar.h>
#include <unicode/utf8.h>

#include "ast/Nodes.h"
#include "lexer/Lexer.h"
#include "parser/Parser.h"
#include "parser/Strings.h"
#include "pyscope/exceptions/syntax_error.h"

namespace pyscope::parse {

using TK = lex::TokenKind;

namespace {

int hexValue(const char chr) {
  if (chr >= '0' && chr <= '9') return chr - '0';
  if (chr >= 'a' && chr <= 'f') return chr - 'a' + 10;
  if (chr >= 'A' && chr <= 'F') return chr - 'A' + 10;
  return -1;
}

void appendCodePoint(std::string& out, const UChar32 cp) {
  uint8_t buf[U8_MAX_LENGTH];
  int32_t len = 0;
  UBool isError = false;
  U8_APPEND(buf, len, U8_MAX_LENGTH, cp, isError);
  if (isError) { return; }
  out.append(reinterpret_cast<const char*>(buf), static_cast<size_t>(len));
}

// Read exactly `digits` hex digits at body[pos]; -1 when malformed
long readHex(const std::string& body, const size_t pos, const size_t digits) {
  if (pos + digits > body.size()) return -1;
  long value = 0;
  for (size_t i = 0; i < digits; ++i) {
    const int digit = hexValue(body[pos + i]);
    if (digit < 0) return -1;
    value = value * 16 + digit;
  }
  return value;
}

} // namespace

StringParts splitStringToken(const std::string& text) {
  StringParts parts;
  size_t idx = 0;
  while (idx < text.size() && text[idx] != '\'' && text[idx] != '"') {
    switch (std::tolower(static_cast<unsigned char>(text[idx]))) {
      case 'r': parts.raw = true; break;
      case 'b': parts.bytes = true; break;
      case 'f': parts.fstring = true; break;
      default: break;
    }
    ++idx;
  }
  if (idx >= text.size()) { return parts; }
  const char quote = text[idx];
  const bool triple = idx + 2 < text.size() && text[idx + 1] == quote && text[idx + 2] == quote &&
                      text.size() >= idx + 6;
  const size_t width = triple ? 3 : 1;
  if (text.size() >= idx + 2 * width) {
    parts.body = text.substr(idx + width, text.size() - idx - 2 * width);
  }
  return parts;
}

// NOLINTNEXTLINE(readability-function-cognitive-complexity)
std::string decodeEscapes(const std::string& body, const bool bytes) {
  std::string out;
  out.reserve(body.size());
  for (size_t i = 0; i < body.size(); ++i) {
    const char chr = body[i];
    if (chr != '\\' || i + 1 >= body.size()) {
      out.push_back(chr);
      continue;
    }
    const char esc = body[++i];
    switch (esc) {
      case '\n': break; // line continuation inside the literal
      case '\\': out.push_back('\\'); break;
      case '\'': out.push_back('\''); break;
      case '"': out.push_back('"'); break;
      case 'a': out.push_back('\a'); break;
      case 'b': out.push_back('\b'); break;
      case 'f': out.push_back('\f'); break;
      case 'n': out.push_back('\n'); break;
      case 'r': out.push_back('\r'); break;
      case 't': out.push_back('\t'); break;
      case 'v': out.push_back('\v'); break;
      case '0': case '1': case '2': case '3': case '4': case '5': case '6': case '7': {
        int value = esc - '0';
        for (int n = 0; n < 2 && i + 1 < body.size() && body[i + 1] >= '0' && body[i + 1] <= '7'; ++n) {
          value = value * 8 + (body[++i] - '0');
        }
        if (bytes) { out.push_back(static_cast<char>(value & 0xFF)); }
        else { appendCodePoint(out, value); }
        break;
      }
      case 'x': {
        const long value = readHex(body, i + 1, 2);
        if (value < 0) {
          out.push_back('\\');
          out.push_back(esc);
          break;
        }
        if (bytes) { out.push_back(static_cast<char>(value)); }
        else { appendCodePoint(out, static_cast<UChar32>(value)); }
        i += 2;
        break;
      }
      case 'u':
      case 'U': {
        const size_t digits = esc == 'u' ? 4 : 8;
        const long value = bytes ? -1 : readHex(body, i + 1, digits);
        if (value < 0 || value > 0x10FFFF) {
          out.push_back('\\');
          out.push_back(esc);
          break;
        }
        appendCodePoint(out, static_cast<UChar32>(value));
        i += digits;
        break;
      }
      case 'N': {
        const size_t close = body.find('}', i);
        if (bytes || i + 1 >= body.size() || body[i + 1] != '{' || close == std::string::npos) {
          out.push_back('\\');
          out.push_back(esc);
          break;
        }
        const std::string name = body.substr(i + 2, close - i - 2);
        UErrorCode status = U_ZERO_ERROR;
        const UChar32 cp = u_charFromName(U_EXTENDED_CHAR_NAME, name.c_str(), &status);
        if (U_FAILURE(status)) {
          out.append(body, i - 1, close - i + 2);
        } else {
          appendCodePoint(out, cp);
        }
        i = close;
        break;
      }
      default:
        // unknown escapes keep the backslash
        out.push_back('\\');
        out.push_back(esc);
        break;
    }
  }
  return out;
}

std::unique_ptr<ast::Expr> Parser::parseStringAtom() {
  const auto firstTok = peek();
  std::vector<std::pair<lex::Token, StringParts>> pieces;
  bool anyBytes = false;
  bool anyText = false;
  bool anyF = false;
  while (peek().kind == TK::String || peek().kind == TK::Bytes) {
    auto tok = get();
    auto parts = splitStringToken(tok.text);
    anyBytes = anyBytes || parts.bytes;
    anyText = anyText || !parts.bytes;
    anyF = anyF || parts.fstring;
    pieces.emplace_back(std::move(tok), std::move(parts));
  }
  if (anyBytes && anyText) { fail(firstTok, "cannot mix bytes and nonbytes literals"); }
  if (anyBytes) {
    std::string value;
    for (const auto& [tok, parts] : pieces) { value += parts.raw ? parts.body : decodeEscapes(parts.body, true); }
    auto lit = std::make_unique<ast::BytesLiteral>(std::move(value));
    lit->file = firstTok.file;
    lit->line = firstTok.line;
    lit->col = firstTok.col;
    return lit;
  }
  if (!anyF) {
    std::string value;
    for (const auto& [tok, parts] : pieces) { value += parts.raw ? parts.body : decodeEscapes(parts.body, false); }
    auto lit = std::make_unique<ast::StringLiteral>(std::move(value));
    lit->file = firstTok.file;
    lit->line = firstTok.line;
    lit->col = firstTok.col;
    return lit;
  }
  auto fstr = std::make_unique<ast::FStringLiteral>();
  fstr->file = firstTok.file;
  fstr->line = firstTok.line;
  fstr->col = firstTok.col;
  for (const auto& [tok, parts] : pieces) {
    if (parts.fstring) {
      appendFString(tok, parts.body, parts.raw, *fstr);
      continue;
    }
    ast::FStringSegment seg;
    seg.text = parts.raw ? parts.body : decodeEscapes(parts.body, false);
    fstr->parts.push_back(std::move(seg));
  }
  // merge adjacent text segments
  std::vector<ast::FStringSegment> merged;
  for (auto& seg : fstr->parts) {
    if (!seg.isExpr && !merged.empty() && !merged.back().isExpr) {
      merged.back().text += seg.text;
      continue;
    }
    if (!seg.isExpr && seg.text.empty()) continue;
    merged.push_back(std::move(seg));
  }
  fstr->parts = std::move(merged);
  return fstr;
}

// NOLINTNEXTLINE(readability-function-size,readability-function-cognitive-complexity)
void Parser::appendFString(const lex::Token& tok, const std::string& body, const bool raw, ast::FStringLiteral& out) {
  std::string literal;
  auto flushLiteral = [&]() {
    if (literal.empty()) return;
    ast::FStringSegment seg;
    seg.text = raw ? literal : decodeEscapes(literal, false);
    out.parts.push_back(std::move(seg));
    literal.clear();
  };
  size_t i = 0;
  while (i < body.size()) {
    const char chr = body[i];
    if (chr == '}') {
      if (i + 1 < body.size() && body[i + 1] == '}') {
        literal.push_back('}');
        i += 2;
        continue;
      }
      fail(tok, "f-string: single '}' is not allowed");
    }
    if (chr != '{') {
      literal.push_back(chr);
      ++i;
      continue;
    }
    if (i + 1 < body.size() && body[i + 1] == '{') {
      literal.push_back('{');
      i += 2;
      continue;
    }
    // replacement field: find its closing brace and the end of the expression part
    size_t j = i + 1;
    int depth = 0;
    char quote = 0;
    size_t exprEnd = std::string::npos;
    bool selfDocumenting = false;
    for (; j < body.size(); ++j) {
      const char cur = body[j];
      if (quote != 0) {
        if (cur == '\\') { ++j; continue; }
        if (cur == quote) { quote = 0; }
        continue;
      }
      if (exprEnd == std::string::npos && (cur == '\'' || cur == '"')) { quote = cur; continue; }
      if (cur == '(' || cur == '[' || cur == '{') { ++depth; continue; }
      if (cur == ')' || cur == ']') { --depth; continue; }
      if (cur == '}') {
        if (depth == 0) break;
        --depth;
        continue;
      }
      if (depth != 0 || exprEnd != std::string::npos) continue;
      const char next = j + 1 < body.size() ? body[j + 1] : '\0';
      const char prev = body[j - 1];
      if (cur == '!' && next != '=') { exprEnd = j; }
      else if (cur == ':') { exprEnd = j; }
      else if (cur == '=' && next != '=' && prev != '=' && prev != '!' && prev != '<' && prev != '>') {
        exprEnd = j;
        selfDocumenting = true;
      }
    }
    if (j >= body.size()) { fail(tok, "f-string: expecting '}'"); }
    const size_t stop = exprEnd == std::string::npos ? j : exprEnd;
    const std::string exprText = body.substr(i + 1, stop - i - 1);
    if (exprText.find_first_not_of(" \t\r\n") == std::string::npos) {
      fail(tok, "f-string: empty expression not allowed");
    }
    if (selfDocumenting) { literal += exprText + "="; }
    flushLiteral();
    ast::FStringSegment seg;
    seg.isExpr = true;
    seg.expr = parseFStringField(tok, exprText);
    out.parts.push_back(std::move(seg));
    // nested fields inside the format spec: f"{value:{width}}"
    if (exprEnd != std::string::npos) {
      const size_t colon = body.find(':', exprEnd);
      if (colon != std::string::npos && colon < j) {
        ast::FStringLiteral spec;
        appendFString(tok, body.substr(colon + 1, j - colon - 1), raw, spec);
        for (auto& part : spec.parts) {
          if (part.isExpr) { out.parts.push_back(std::move(part)); }
        }
      }
    }
    i = j + 1;
  }
  flushLiteral();
}

std::unique_ptr<ast::Expr> Parser::parseFStringField(const lex::Token& tok, const std::string& text) {
  lex::Lexer lexer;
  lexer.pushString("(" + text + ")", tok.file);
  Parser sub(lexer);
  try {
    auto expr = sub.parseExpressionOnly();
    return expr;
  } catch (const exceptions::SyntaxError&) {
    fail(tok, "f-string: invalid syntax in expression '" + text + "'");
  }
}

} // namespace pyscope::parse
