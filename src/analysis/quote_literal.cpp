/***
 * Name: pyscope::analysis::QuoteLiteral
 * Purpose: Render decoded string or bytes contents as a single-quoted literal.
 * Inputs:
 *   - value: decoded contents (UTF-8 for text, raw octets for bytes)
 *   - bytes: prefix with b and escape non-ASCII octets
 * Outputs: e.g. 'it\'s' or b'\x00'
 * Theory of Operation: Escapes quote, backslash and control characters;
 *   UTF-8 text is otherwise kept verbatim.
 */
#include "pyscope/analysis/name_resolver.h"

#include <array>
#include <string>

namespace pyscope::analysis {

static void AppendHexEscape(std::string& out, unsigned char byte) {
  constexpr std::array<char, 16> kHex{'0', '1', '2', '3', '4', '5', '6', '7',
                                      '8', '9', 'a', 'b', 'c', 'd', 'e', 'f'};
  constexpr unsigned kNibble = 4U;
  constexpr unsigned kMask = 0x0FU;
  out += "\\x";
  out += kHex[(byte >> kNibble) & kMask];
  out += kHex[byte & kMask];
}

std::string QuoteLiteral(const std::string& value, bool bytes) {
  std::string out;
  out.reserve(value.size() + 3U);
  if (bytes) {
    out += 'b';
  }
  out += '\'';
  constexpr unsigned char kFirstPrintable = 0x20;
  constexpr unsigned char kDelete = 0x7F;
  for (const char raw : value) {
    const auto byte = static_cast<unsigned char>(raw);
    switch (raw) {
      case '\'': out += "\\'"; break;
      case '\\': out += "\\\\"; break;
      case '\n': out += "\\n"; break;
      case '\r': out += "\\r"; break;
      case '\t': out += "\\t"; break;
      default:
        if (byte < kFirstPrintable || byte == kDelete || (bytes && byte > kDelete)) {
          AppendHexEscape(out, byte);
        } else {
          out += raw;
        }
    }
  }
  out += '\'';
  return out;
}

}  // namespace pyscope::analysis
