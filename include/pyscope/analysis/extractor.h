/***
 * Name: pyscope::analysis::StructuralExtractor
 * Purpose: Single depth-first walk of a module AST producing a Structure:
 *   declarations, variables, imports and the raw call graph.
 * Inputs:
 *   - ast::Module and the module name (file stem)
 * Outputs:
 *   - analysis::Structure
 * Theory of Operation:
 *   walk() switches over every ast::NodeKind. Kinds that produce records are
 *   handled first, then all children are visited with the same
 *   ScopeContext; class and function definitions push their name and visit
 *   their own children (decorators, bases, parameters, body) in the pushed
 *   context. Class-membership decisions use the classes registered so far,
 *   first match by name.
 */
#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "ast/Nodes.h"
#include "pyscope/analysis/model.h"
#include "pyscope/analysis/scope_context.h"

namespace pyscope {
namespace analysis {

class StructuralExtractor {
 public:
  Structure extract(const ast::Module& module, const std::string& module_name);

 private:
  Structure out_{};

  void walk(const ast::Node& node, const ScopeContext& scope);
  void walkChildren(const ast::Node& node, const ScopeContext& scope);

  void onClassDef(const ast::ClassDef& cls, const ScopeContext& scope);
  void onFunctionDef(const ast::FunctionDef& def, const ScopeContext& scope);
  void onAssign(const ast::AssignStmt& assign, const ScopeContext& scope);
  void onAnnAssign(const ast::AnnAssignStmt& assign, const ScopeContext& scope);
  void onImport(const ast::Import& imp);
  void onImportFrom(const ast::ImportFrom& imp);
  void onCall(const ast::Call& call, const ScopeContext& scope);
  void addFlow(CalleeKind kind, const ast::Expr* expr, const ScopeContext& scope);

  void recordVariable(Variable var, const ScopeContext& scope);
  std::optional<std::size_t> findClass(const std::string& name) const;

  static std::vector<std::string> formatArgs(const std::vector<ast::Param>& params);
  static std::vector<std::string> resolveAll(const std::vector<std::unique_ptr<ast::Expr>>& exprs);
};

}  // namespace analysis
}  // namespace pyscope
