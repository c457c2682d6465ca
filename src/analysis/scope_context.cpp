/***
 * Name: pyscope::analysis::ScopeContext::push / id
 * Purpose: Derive nested contexts and spell scope ids.
 * Inputs: enclosing class/function name
 * Outputs: new context; dotted scope id
 * Theory of Operation: Copy-on-push; the id joins module name and stack with '.'.
 */
#include "pyscope/analysis/scope_context.h"

#include <string>

namespace pyscope::analysis {

ScopeContext ScopeContext::push(const std::string& name) const {
  ScopeContext nested = *this;
  nested.stack_.push_back(name);
  return nested;
}

std::string ScopeContext::id() const {
  std::string out = module_;
  for (const auto& part : stack_) {
    out += '.';
    out += part;
  }
  return out;
}

}  // namespace pyscope::analysis
