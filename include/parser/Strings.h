/***
 * Name: pyscope::parse string literal helpers
 * Purpose: Split raw string tokens into prefix flags and body, and decode
 *   backslash escapes.
 * Inputs:
 *   - text: raw token text including prefix and quotes
 * Outputs:
 *   - StringParts / decoded text
 * Theory of Operation:
 *   Prefix letters are case-insensitive. The body excludes the opening and
 *   closing quotes (one or three). Escapes follow Python: \N{name} resolves
 *   through ICU's character name table, \u and \U are text-only.
 */
#pragma once

#include <string>

namespace pyscope::parse {

struct StringParts {
  bool raw{false};
  bool bytes{false};
  bool fstring{false};
  std::string body{};
};

StringParts splitStringToken(const std::string& text);

std::string decodeEscapes(const std::string& body, bool bytes);

} // namespace pyscope::parse
