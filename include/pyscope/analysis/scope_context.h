/***
 * Name: pyscope::analysis::ScopeContext
 * Purpose: Immutable lexical position during the extraction walk: module
 *   name plus the stack of enclosing class/function names.
 * Theory of Operation: push() returns a new context; the walk passes
 *   contexts by value so nothing needs to be popped. id() is the single
 *   place scope ids ("m", "m.foo", "m.A.meth") are spelled.
 */
#pragma once

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace pyscope {
namespace analysis {

class ScopeContext {
 public:
  explicit ScopeContext(std::string module_name) : module_(std::move(module_name)) {}

  [[nodiscard]] ScopeContext push(const std::string& name) const;
  [[nodiscard]] std::string id() const;

  bool atModuleLevel() const { return stack_.empty(); }
  // Only valid when !atModuleLevel()
  const std::string& innermost() const { return stack_.back(); }
  const std::string& moduleName() const { return module_; }
  std::size_t depth() const { return stack_.size(); }

 private:
  std::string module_;
  std::vector<std::string> stack_;
};

}  // namespace analysis
}  // namespace pyscope
