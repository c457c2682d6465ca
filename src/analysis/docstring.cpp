/***
 * Name: pyscope::analysis::GetDocstring / CleanDoc / FirstLine
 * Purpose: Docstring detection and normalization.
 * Inputs: statement body or raw docstring text
 * Outputs: cleaned docstring; first display line
 * Theory of Operation: Line-based processing; tab stops every 8 columns.
 */
#include "pyscope/analysis/docstring.h"

#include <algorithm>
#include <cstddef>
#include <limits>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "ast/ExprStmt.h"
#include "ast/StringLiteral.h"

namespace pyscope::analysis {

namespace {

constexpr std::size_t kTabWidth = 8;

std::string ExpandTabs(const std::string& line) {
  std::string out;
  for (const char chr : line) {
    if (chr == '\t') {
      out.append(kTabWidth - (out.size() % kTabWidth), ' ');
    } else {
      out += chr;
    }
  }
  return out;
}

std::vector<std::string> SplitLines(const std::string& text) {
  std::vector<std::string> lines;
  std::string current;
  for (std::size_t i = 0; i < text.size(); ++i) {
    const char chr = text[i];
    if (chr == '\r' || chr == '\n') {
      lines.push_back(current);
      current.clear();
      if (chr == '\r' && i + 1 < text.size() && text[i + 1] == '\n') {
        ++i;
      }
      continue;
    }
    current += chr;
  }
  lines.push_back(current);
  return lines;
}

bool IsBlank(const std::string& line) {
  return line.find_first_not_of(" \t\f\v") == std::string::npos;
}

std::string TrimBoth(const std::string& text) {
  constexpr const char* kSpace = " \t\n\r\f\v";
  const auto first = text.find_first_not_of(kSpace);
  if (first == std::string::npos) {
    return {};
  }
  const auto last = text.find_last_not_of(kSpace);
  return text.substr(first, last - first + 1);
}

}  // namespace

std::string CleanDoc(const std::string& raw) {
  std::vector<std::string> lines = SplitLines(raw);
  for (auto& line : lines) {
    line = ExpandTabs(line);
  }
  std::size_t margin = std::numeric_limits<std::size_t>::max();
  for (std::size_t i = 1; i < lines.size(); ++i) {
    const auto content = lines[i].find_first_not_of(' ');
    if (content != std::string::npos) {
      margin = std::min(margin, content);
    }
  }
  if (!lines.empty()) {
    const auto content = lines[0].find_first_not_of(' ');
    lines[0] = content == std::string::npos ? std::string{} : lines[0].substr(content);
  }
  if (margin != std::numeric_limits<std::size_t>::max()) {
    for (std::size_t i = 1; i < lines.size(); ++i) {
      lines[i] = lines[i].size() > margin ? lines[i].substr(margin) : std::string{};
    }
  }
  while (!lines.empty() && IsBlank(lines.back())) {
    lines.pop_back();
  }
  std::size_t start = 0;
  while (start < lines.size() && IsBlank(lines[start])) {
    ++start;
  }
  std::ostringstream joined;
  for (std::size_t i = start; i < lines.size(); ++i) {
    if (i != start) {
      joined << '\n';
    }
    joined << lines[i];
  }
  return joined.str();
}

std::optional<std::string> GetDocstring(const std::vector<std::unique_ptr<ast::Stmt>>& body) {
  if (body.empty() || !body.front() || body.front()->kind != ast::NodeKind::ExprStmt) {
    return std::nullopt;
  }
  const auto& stmt = static_cast<const ast::ExprStmt&>(*body.front());
  if (!stmt.value || stmt.value->kind != ast::NodeKind::StringLiteral) {
    return std::nullopt;
  }
  return CleanDoc(static_cast<const ast::StringLiteral&>(*stmt.value).value);
}

std::string FirstLine(const std::string& doc) {
  const std::string stripped = TrimBoth(doc);
  const auto end = stripped.find_first_of("\r\n");
  return end == std::string::npos ? stripped : stripped.substr(0, end);
}

}  // namespace pyscope::analysis
