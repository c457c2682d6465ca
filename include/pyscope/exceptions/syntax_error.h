/***
 * Name: pyscope::exceptions::SyntaxError
 * Purpose: Base for failures where the input is not valid Python source.
 * Inputs: Rendered message plus the offending file, line and column
 * Outputs: Exception object
 * Theory of Operation: Carries the first error location so callers can report it
 *   separately from the rendered text. Line and column are 1-based; 0 means unknown.
 */
#pragma once

#include <string>

#include "pyscope/exceptions/pyscope_exception.h"

namespace pyscope {
namespace exceptions {

class SyntaxError : public PyscopeException {
 public:
  SyntaxError(std::string msg, std::string file, int line, int col) noexcept;

  const std::string& file() const noexcept { return file_; }
  int line() const noexcept { return line_; }
  int col() const noexcept { return col_; }

 private:
  std::string file_;
  int line_{0};
  int col_{0};
};

}  // namespace exceptions
}  // namespace pyscope
