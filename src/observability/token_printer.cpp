/***
 * Name: pyscope::obs::FormatTokens (impl)
 * Purpose: Render tokens one per line; newlines inside token text are escaped.
 */
#include "observability/TokenPrinter.h"

#include <sstream>
#include <string>
#include <vector>

namespace pyscope::obs {

static std::string EscapeNewlines(const std::string& text) {
  std::string out;
  out.reserve(text.size());
  for (const char ch : text) {
    if (ch == '\n') {
      out += "\\n";
    } else if (ch == '\r') {
      out += "\\r";
    } else {
      out.push_back(ch);
    }
  }
  return out;
}

std::string FormatTokens(const std::vector<lex::Token>& tokens) {
  std::ostringstream oss;
  for (const auto& tok : tokens) {
    oss << tok.file << ':' << tok.line << ':' << tok.col << ' ' << lex::to_string(tok.kind);
    if (!tok.text.empty()) {
      oss << " '" << EscapeNewlines(tok.text) << "'";
    }
    oss << '\n';
  }
  return oss.str();
}

} // namespace pyscope::obs
