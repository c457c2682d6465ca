/***
 * Name: pyscope::analysis (docstrings)
 * Purpose: Recognize and normalize docstrings of modules, classes and functions.
 * Theory of Operation: A docstring is a leading expression statement whose
 *   value is a plain string literal (not bytes, not an f-string). Text is
 *   normalized the way Python's inspect.cleandoc does it.
 */
#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "ast/Stmt.h"

namespace pyscope {
namespace analysis {

/*** GetDocstring: cleaned docstring of a body, if its first statement is one. */
std::optional<std::string> GetDocstring(const std::vector<std::unique_ptr<ast::Stmt>>& body);

/***
 * CleanDoc: expand tabs, strip the first line's leading blanks, remove the
 * common indentation of the remaining lines, drop leading and trailing
 * blank lines.
 */
std::string CleanDoc(const std::string& raw);

/*** FirstLine: first line of the stripped docstring; empty when there is none. */
std::string FirstLine(const std::string& doc);

}  // namespace analysis
}  // namespace pyscope
