/***
 * Name: pyscope::lex::Lexer
 * Purpose: Tokenize Python source(s) into a single token stream (LIFO inputs).
 */
#include "lexer/Lexer.h"

#include <unicode/uchar.h>
#include <unicode/utf8.h>

#include <cctype>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <fstream>
#include <memory>
#include <sstream>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "pyscope/exceptions/file_read_error.h"
#include "pyscope/exceptions/lex_error.h"

namespace pyscope::lex {

namespace {

constexpr size_t kTabStop = 8;

// Decode the UTF-8 code point at pos; negative result means malformed input.
UChar32 decodeAt(const std::string& text, const size_t pos, size_t& next) {
  const auto* bytes = reinterpret_cast<const uint8_t*>(text.data());  // NOLINT(cppcoreguidelines-pro-type-reinterpret-cast)
  auto offset = static_cast<int32_t>(pos);
  const auto length = static_cast<int32_t>(text.size());
  UChar32 codePoint = 0;
  U8_NEXT(bytes, offset, length, codePoint);
  next = static_cast<size_t>(offset);
  return codePoint;
}

bool isIdentStart(const UChar32 cp) {
  if (cp < 0x80) { return (std::isalpha(static_cast<int>(cp)) != 0) || cp == '_'; }
  return u_hasBinaryProperty(cp, UCHAR_XID_START) != 0;
}

bool isIdentContinue(const UChar32 cp) {
  if (cp < 0x80) { return (std::isalnum(static_cast<int>(cp)) != 0) || cp == '_'; }
  return u_hasBinaryProperty(cp, UCHAR_XID_CONTINUE) != 0;
}

bool isStringPrefix(const char chr) {
  return chr == 'b' || chr == 'B' || chr == 'r' || chr == 'R' || chr == 'u' || chr == 'U' || chr == 'f' || chr == 'F';
}

const std::unordered_map<std::string, TokenKind>& keywordTable() {
  static const std::unordered_map<std::string, TokenKind> table{
      {"def", TokenKind::Def},         {"return", TokenKind::Return},     {"del", TokenKind::Del},
      {"if", TokenKind::If},           {"else", TokenKind::Else},         {"elif", TokenKind::Elif},
      {"while", TokenKind::While},     {"for", TokenKind::For},           {"in", TokenKind::In},
      {"break", TokenKind::Break},     {"continue", TokenKind::Continue}, {"pass", TokenKind::Pass},
      {"try", TokenKind::Try},         {"except", TokenKind::Except},     {"finally", TokenKind::Finally},
      {"with", TokenKind::With},       {"as", TokenKind::As},             {"import", TokenKind::Import},
      {"from", TokenKind::From},       {"class", TokenKind::Class},       {"async", TokenKind::Async},
      {"assert", TokenKind::Assert},   {"raise", TokenKind::Raise},       {"global", TokenKind::Global},
      {"nonlocal", TokenKind::Nonlocal}, {"yield", TokenKind::Yield},     {"await", TokenKind::Await},
      {"is", TokenKind::Is},           {"and", TokenKind::And},           {"or", TokenKind::Or},
      {"not", TokenKind::Not},         {"lambda", TokenKind::Lambda},     {"True", TokenKind::BoolLit},
      {"False", TokenKind::BoolLit},   {"None", TokenKind::NoneLit},
  };
  return table;
}

} // namespace

// FileInput implementation
FileInput::FileInput(std::string path) : path_(std::move(path)), in_(nullptr) {
  auto ifs = std::make_unique<std::ifstream>(path_, std::ios::binary);
  if (!ifs->good()) {
    throw exceptions::FileReadError("failed to open file: " + path_);
  }
  in_ = std::move(ifs);
}

bool FileInput::getline(std::string& out) {
  if (!in_ || !(*in_)) { return false; }
  if (!std::getline(*in_, out)) { return false; }
  return true;
}

// StringInput implementation
StringInput::StringInput(std::string text, std::string name)
  : name_(std::move(name)), in_(nullptr) {
  auto iss = std::make_unique<std::istringstream>(std::move(text));
  in_ = std::move(iss);
}

bool StringInput::getline(std::string& out) {
  if (!in_ || !(*in_)) { return false; }
  if (!std::getline(*in_, out)) { return false; }
  return true;
}


void Lexer::pushFile(const std::string& path) {
  State state;
  state.src = std::make_unique<FileInput>(path);
  stack_.push_back(std::move(state));
}


void Lexer::pushString(const std::string& text, const std::string& name) {
  State state;
  state.src = std::make_unique<StringInput>(text, name);
  stack_.push_back(std::move(state));
}


bool Lexer::readNextLine(State& state) {
  std::string physical;
  if (!state.src->getline(physical)) { return false; }
  ++state.lineNo;
  // Handle CRLF
  if (!physical.empty() && physical.back() == '\r') { physical.pop_back(); }
  if (state.lineNo == 1 && physical.rfind("\xEF\xBB\xBF", 0) == 0) { physical.erase(0, 3); }
  state.line = std::move(physical);
  state.lineStarts.assign(1, {0, state.lineNo});
  state.index = 0;
  return true;
}

bool Lexer::appendNextLine(State& state) {
  std::string physical;
  if (!state.src->getline(physical)) { return false; }
  ++state.lineNo;
  if (!physical.empty() && physical.back() == '\r') { physical.pop_back(); }
  state.line.push_back('\n');
  state.lineStarts.emplace_back(state.line.size(), state.lineNo);
  state.line += physical;
  return true;
}

void Lexer::locate(const State& state, const size_t offset, int& line, int& col) {
  line = state.lineNo;
  col = 1;
  for (auto it = state.lineStarts.rbegin(); it != state.lineStarts.rend(); ++it) {
    if (it->first <= offset) {
      line = it->second;
      col = static_cast<int>(offset - it->first) + 1;
      return;
    }
  }
}

void Lexer::fail(const State& state, const size_t offset, const std::string& message) {
  int line = 0;
  int col = 0;
  locate(state, offset, line, col);
  const std::string& file = state.src->name();
  throw exceptions::LexError(file + ":" + std::to_string(line) + ":" + std::to_string(col) + ": " + message,
                             file, line, col);
}

// Returns true when the line is blank or comment-only and must be skipped.
bool Lexer::emitIndentTokens(State& state, std::vector<Token>& out) {
  const auto& line = state.line;
  size_t idx = 0;
  size_t width = 0;
  while (idx < line.size()) {
    const char chr = line[idx];
    if (chr == ' ') { ++width; }
    else if (chr == '\t') { width = (width / kTabStop + 1) * kTabStop; }
    else if (chr == '\f') { width = 0; }
    else { break; }
    ++idx;
  }
  if (idx >= line.size() || line[idx] == '#') { return true; }
  // A lone continuation backslash does not start a statement either.
  if (line[idx] == '\\' && idx + 1 == line.size()) { return true; }

  auto makeTok = [&](TokenKind kind, const char* text) {
    Token tok; tok.kind = kind; tok.text = text; tok.file = state.src->name(); tok.line = state.lineNo; tok.col = static_cast<int>(idx + 1);
    return tok;
  };
  if (width > state.indentStack.back()) {
    state.indentStack.push_back(width);
    out.push_back(makeTok(TokenKind::Indent, "<INDENT>"));
  } else {
    while (width < state.indentStack.back()) {
      state.indentStack.pop_back();
      out.push_back(makeTok(TokenKind::Dedent, "<DEDENT>"));
    }
    if (width != state.indentStack.back()) {
      fail(state, idx, "unindent does not match any outer indentation level");
    }
  }
  state.index = idx; // start scanning after indent
  return false;
}

Token Lexer::scanString(State& state, const size_t start, const size_t quotePos, const bool isBytes) {
  auto& line = state.line;
  const char quote = line[quotePos];
  const bool triple = quotePos + 2 < line.size() && line[quotePos + 1] == quote && line[quotePos + 2] == quote;
  size_t pos = quotePos + (triple ? 3 : 1);
  while (true) {
    if (pos >= line.size()) {
      if (triple && appendNextLine(state)) { continue; }
      fail(state, start, triple ? "unterminated triple-quoted string literal" : "unterminated string literal");
    }
    const char chr = line[pos];
    if (chr == '\\') {
      if (pos + 1 >= line.size()) {
        // escaped newline: the literal continues on the next physical line
        if (!appendNextLine(state)) { fail(state, start, "unterminated string literal"); }
      }
      pos += 2;
      continue;
    }
    if (chr == quote) {
      if (!triple) { ++pos; break; }
      if (pos + 2 < line.size() && line[pos + 1] == quote && line[pos + 2] == quote) { pos += 3; break; }
    }
    ++pos;
  }
  Token tok;
  tok.kind = isBytes ? TokenKind::Bytes : TokenKind::String;
  tok.text = line.substr(start, pos - start);
  tok.file = state.src->name();
  locate(state, start, tok.line, tok.col);
  state.index = pos;
  return tok;
}

// NOLINTNEXTLINE(readability-function-size,readability-function-cognitive-complexity)
Token Lexer::scanNumber(State& state) {
  const auto& line = state.line;
  size_t& idx = state.index;
  auto makeTok = [&](TokenKind kind, size_t begin, size_t endExclusive) {
    Token tok;
    tok.kind = kind;
    tok.text = line.substr(begin, endExclusive - begin);
    tok.file = state.src->name();
    locate(state, begin, tok.line, tok.col);
    idx = endExclusive;
    return tok;
  };
  auto isDecDigit = [](char c){ return std::isdigit(static_cast<unsigned char>(c)) != 0; };
  auto isHexDigit = [](char c){ return std::isxdigit(static_cast<unsigned char>(c)) != 0; };
  auto isBinDigit = [](char c){ return c=='0'||c=='1'; };
  auto isOctDigit = [](char c){ return c>='0'&&c<='7'; };
  auto scanDigitsUnderscore = [&](size_t pos, auto isOk) {
    size_t i = pos; bool have = false; bool prevUnderscore=false;
    while (i < line.size()) {
      const char c = line[i];
      if (isOk(c)) { have = true; prevUnderscore=false; ++i; continue; }
      if (c=='_' && have && !prevUnderscore) { prevUnderscore=true; ++i; continue; }
      break;
    }
    if (prevUnderscore) --i; // trim trailing underscore
    return i;
  };
  auto scanExponent = [&](size_t pos) -> size_t {
    if (pos < line.size() && (line[pos] == 'e' || line[pos] == 'E')) {
      size_t i = pos + 1;
      if (i < line.size() && (line[i] == '+' || line[i] == '-')) { ++i; }
      const size_t digitsEnd = scanDigitsUnderscore(i, isDecDigit);
      if (digitsEnd == i) { return pos; } // back out if no digits
      return digitsEnd;
    }
    return pos;
  };
  auto finishFloat = [&](size_t begin, size_t end) {
    if (end < line.size() && (line[end]=='j'||line[end]=='J')) { return makeTok(TokenKind::Imag, begin, end + 1); }
    return makeTok(TokenKind::Float, begin, end);
  };

  const size_t begin = idx;
  if (line[idx] == '.') {
    const size_t fracEnd = scanDigitsUnderscore(idx + 1, isDecDigit);
    return finishFloat(begin, scanExponent(fracEnd));
  }
  // Base prefixes 0b/0o/0x
  if (line[idx] == '0' && idx + 1 < line.size()) {
    const char p1 = line[idx+1];
    if (p1=='b'||p1=='B'||p1=='o'||p1=='O'||p1=='x'||p1=='X') {
      size_t end = idx + 2;
      if (p1=='b'||p1=='B') end = scanDigitsUnderscore(end, isBinDigit);
      else if (p1=='o'||p1=='O') end = scanDigitsUnderscore(end, isOctDigit);
      else end = scanDigitsUnderscore(end, isHexDigit);
      if (end == idx + 2) { fail(state, begin, "invalid numeric literal"); }
      return makeTok(TokenKind::Int, begin, end);
    }
  }
  const size_t intEnd = scanDigitsUnderscore(idx, isDecDigit);
  if (intEnd < line.size() && line[intEnd] == '.') {
    const size_t fracEnd = scanDigitsUnderscore(intEnd + 1, isDecDigit);
    return finishFloat(begin, scanExponent(fracEnd));
  }
  const size_t expEnd = scanExponent(intEnd);
  if (expEnd != intEnd) { return finishFloat(begin, expEnd); }
  if (intEnd < line.size() && (line[intEnd]=='j'||line[intEnd]=='J')) { return makeTok(TokenKind::Imag, begin, intEnd + 1); }
  return makeTok(TokenKind::Int, begin, intEnd);
}

Token Lexer::scanIdentifier(State& state) {
  const auto& line = state.line;
  const size_t begin = state.index;
  size_t pos = begin;
  while (pos < line.size()) {
    size_t next = pos;
    const UChar32 cp = decodeAt(line, pos, next);
    if (cp < 0 || !isIdentContinue(cp)) { break; }
    pos = next;
  }
  Token tok;
  tok.text = line.substr(begin, pos - begin);
  tok.file = state.src->name();
  locate(state, begin, tok.line, tok.col);
  const auto& keywords = keywordTable();
  const auto found = keywords.find(tok.text);
  tok.kind = found == keywords.end() ? TokenKind::Ident : found->second;
  state.index = pos;
  return tok;
}

// NOLINTNEXTLINE(readability-function-size,readability-function-cognitive-complexity)
Token Lexer::scanOne(State& state) {
  const auto& line = state.line;
  size_t& idx = state.index;

  auto makeTok = [&](TokenKind kind, size_t width) {
    Token tok;
    tok.kind = kind;
    tok.text = line.substr(idx, width);
    tok.file = state.src->name();
    locate(state, idx, tok.line, tok.col);
    idx += width;
    return tok;
  };
  auto at = [&](size_t ahead) -> char { return idx + ahead < line.size() ? line[idx + ahead] : '\0'; };

  const char chr = line[idx];
  switch (chr) {
    case '(': return makeTok(TokenKind::LParen, 1);
    case ')': return makeTok(TokenKind::RParen, 1);
    case '[': return makeTok(TokenKind::LBracket, 1);
    case ']': return makeTok(TokenKind::RBracket, 1);
    case '{': return makeTok(TokenKind::LBrace, 1);
    case '}': return makeTok(TokenKind::RBrace, 1);
    case ',': return makeTok(TokenKind::Comma, 1);
    case ';': return makeTok(TokenKind::Semicolon, 1);
    case '~': return makeTok(TokenKind::Tilde, 1);
    case ':': return at(1) == '=' ? makeTok(TokenKind::ColonEqual, 2) : makeTok(TokenKind::Colon, 1);
    case '@': return at(1) == '=' ? makeTok(TokenKind::AtEqual, 2) : makeTok(TokenKind::At, 1);
    case '+': return at(1) == '=' ? makeTok(TokenKind::PlusEqual, 2) : makeTok(TokenKind::Plus, 1);
    case '%': return at(1) == '=' ? makeTok(TokenKind::PercentEqual, 2) : makeTok(TokenKind::Percent, 1);
    case '=': return at(1) == '=' ? makeTok(TokenKind::EqEq, 2) : makeTok(TokenKind::Equal, 1);
    case '|': return at(1) == '=' ? makeTok(TokenKind::PipeEqual, 2) : makeTok(TokenKind::Pipe, 1);
    case '&': return at(1) == '=' ? makeTok(TokenKind::AmpEqual, 2) : makeTok(TokenKind::Amp, 1);
    case '^': return at(1) == '=' ? makeTok(TokenKind::CaretEqual, 2) : makeTok(TokenKind::Caret, 1);
    case '!':
      if (at(1) == '=') { return makeTok(TokenKind::NotEq, 2); }
      break;
    case '-':
      if (at(1) == '>') { return makeTok(TokenKind::Arrow, 2); }
      return at(1) == '=' ? makeTok(TokenKind::MinusEqual, 2) : makeTok(TokenKind::Minus, 1);
    case '*':
      if (at(1) == '*') { return at(2) == '=' ? makeTok(TokenKind::StarStarEqual, 3) : makeTok(TokenKind::StarStar, 2); }
      return at(1) == '=' ? makeTok(TokenKind::StarEqual, 2) : makeTok(TokenKind::Star, 1);
    case '/':
      if (at(1) == '/') { return at(2) == '=' ? makeTok(TokenKind::SlashSlashEqual, 3) : makeTok(TokenKind::SlashSlash, 2); }
      return at(1) == '=' ? makeTok(TokenKind::SlashEqual, 2) : makeTok(TokenKind::Slash, 1);
    case '<':
      if (at(1) == '<') { return at(2) == '=' ? makeTok(TokenKind::LShiftEqual, 3) : makeTok(TokenKind::LShift, 2); }
      if (at(1) == '>') { break; }
      return at(1) == '=' ? makeTok(TokenKind::Le, 2) : makeTok(TokenKind::Lt, 1);
    case '>':
      if (at(1) == '>') { return at(2) == '=' ? makeTok(TokenKind::RShiftEqual, 3) : makeTok(TokenKind::RShift, 2); }
      return at(1) == '=' ? makeTok(TokenKind::Ge, 2) : makeTok(TokenKind::Gt, 1);
    case '.':
      if (at(1) == '.' && at(2) == '.') { return makeTok(TokenKind::Ellipsis, 3); }
      if (std::isdigit(static_cast<unsigned char>(at(1))) != 0) { return scanNumber(state); }
      return makeTok(TokenKind::Dot, 1);
    case '"':
    case '\'':
      return scanString(state, idx, idx, /*isBytes=*/false);
    default:
      break;
  }

  // prefixes: b/B, f/F, r/R, u/U and two-letter combos (rb, br, fr, rf)
  if (isStringPrefix(chr)) {
    size_t pos = idx; bool hasB = false; int count = 0;
    while (count < 2 && pos < line.size() && isStringPrefix(line[pos])) {
      hasB = hasB || line[pos] == 'b' || line[pos] == 'B';
      ++pos; ++count;
    }
    if (pos < line.size() && (line[pos] == '\'' || line[pos] == '"')) {
      return scanString(state, idx, pos, hasB);
    }
  }
  if (std::isdigit(static_cast<unsigned char>(chr)) != 0) { return scanNumber(state); }

  size_t next = idx;
  const UChar32 cp = decodeAt(line, idx, next);
  if (cp >= 0 && isIdentStart(cp)) { return scanIdentifier(state); }

  char code[16];
  std::snprintf(code, sizeof(code), "U+%04X", static_cast<unsigned>(cp < 0 ? 0xFFFD : cp));
  fail(state, idx, std::string("invalid character '") + line.substr(idx, next - idx) + "' (" + code + ")");
}

// NOLINTNEXTLINE(readability-function-size,readability-function-cognitive-complexity)
void Lexer::buildAll() {
  if (finalized_) { return; }
  finalized_ = true;
  // Process stack in LIFO order
  while (!stack_.empty()) {
    State state = std::move(stack_.back());
    stack_.pop_back();
    while (readNextLine(state)) {
      // Handle indent/dedent and skip empty/comment lines
      if (emitIndentTokens(state, tokens_)) { continue; }
      state.parenDepth = 0;
      bool continuation = false;
      while (true) {
        const auto& line = state.line;
        // Joined physical lines are separated by '\n' and count as whitespace
        while (state.index < line.size() && (line[state.index] == ' ' || line[state.index] == '\t' || line[state.index] == '\f' ||
                                             line[state.index] == '\n')) {
          ++state.index;
        }
        if (state.index >= line.size()) {
          if (state.parenDepth > 0 || continuation) {
            continuation = false;
            if (!appendNextLine(state)) {
              fail(state, line.size(), state.parenDepth > 0 ? "unexpected EOF in multi-line statement" : "unexpected EOF after line continuation");
            }
            continue;
          }
          Token newlineTok; newlineTok.kind = TokenKind::Newline; newlineTok.text = "\n"; newlineTok.file = state.src->name();
          locate(state, line.size(), newlineTok.line, newlineTok.col);
          tokens_.push_back(std::move(newlineTok));
          break;
        }
        const char chr = line[state.index];
        if (chr == '#') { state.index = line.size(); continue; }
        if (chr == '\\') {
          if (state.index + 1 == line.size()) { continuation = true; ++state.index; continue; }
          fail(state, state.index, "unexpected character after line continuation character");
        }
        Token tok = scanOne(state);
        switch (tok.kind) {
          case TokenKind::LParen: case TokenKind::LBracket: case TokenKind::LBrace: ++state.parenDepth; break;
          case TokenKind::RParen: case TokenKind::RBracket: case TokenKind::RBrace:
            if (state.parenDepth > 0) { --state.parenDepth; }
            break;
          default: break;
        }
        tokens_.push_back(std::move(tok));
      }
    }
    // flush dedents
    while (state.indentStack.size() > 1) {
      state.indentStack.pop_back();
      Token ded; ded.kind = TokenKind::Dedent; ded.text = "<DEDENT>"; ded.file = state.src->name(); ded.line = state.lineNo + 1; ded.col = 1;
      tokens_.push_back(ded);
    }
  }
  // Final EOF
  Token eof; eof.kind = TokenKind::End; eof.text = "<EOF>"; eof.file = ""; eof.line = 0; eof.col = 1; tokens_.push_back(eof);
}

const Token& Lexer::peek(size_t lookahead) {
  if (!finalized_) { buildAll(); }
  if (pos_ + lookahead < tokens_.size()) {
    return tokens_[pos_ + lookahead];
  }
  return tokens_.back();
}

Token Lexer::next() {
  if (!finalized_) { buildAll(); }
  if (pos_ < tokens_.size()) {
    return tokens_[pos_++];
  }
  return tokens_.back();
}

std::vector<Token> Lexer::tokens() {
  if (!finalized_) { buildAll(); }
  return tokens_;
}

} // namespace pyscope::lex
