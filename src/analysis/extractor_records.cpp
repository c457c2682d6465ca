/***
 * Name: pyscope::analysis::StructuralExtractor (record handlers)
 * Purpose: Build class, function, variable and import records.
 * Inputs: individual definition/assignment/import nodes plus the scope
 * Outputs: records appended to the Structure under construction
 * Theory of Operation:
 *   Classes are registered before their body is walked so methods can find
 *   them. A def is a method when the innermost scope name equals a
 *   registered class name. Any assignment inside a non-module scope is
 *   attributed to the class named like the innermost scope, which also
 *   catches locals of a function sharing a class's name; otherwise it is
 *   dropped.
 */
#include "pyscope/analysis/extractor.h"

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "pyscope/analysis/docstring.h"
#include "pyscope/analysis/name_resolver.h"

namespace pyscope::analysis {

std::optional<std::size_t> StructuralExtractor::findClass(const std::string& name) const {
  for (std::size_t i = 0; i < out_.classes.size(); ++i) {
    if (out_.classes[i].name == name) {
      return i;
    }
  }
  return std::nullopt;
}

std::vector<std::string> StructuralExtractor::resolveAll(const std::vector<std::unique_ptr<ast::Expr>>& exprs) {
  std::vector<std::string> out;
  out.reserve(exprs.size());
  for (const auto& expr : exprs) {
    out.push_back(ResolveName(expr.get()));
  }
  return out;
}

// Parameters arrive in source order: positional-only, positional, then
// keyword-only. *args and **kwargs take no argument slot.
std::vector<std::string> StructuralExtractor::formatArgs(const std::vector<ast::Param>& params) {
  std::vector<std::string> args;
  args.reserve(params.size());
  for (const auto& param : params) {
    if (param.isVarArg || param.isKwVarArg) {
      continue;
    }
    std::string text = param.name;
    if (param.annotation) {
      text += ": " + ResolveName(param.annotation.get());
    }
    if (param.defaultValue) {
      text += "=" + ResolveName(param.defaultValue.get());
    }
    args.push_back(std::move(text));
  }
  return args;
}

void StructuralExtractor::onClassDef(const ast::ClassDef& cls, const ScopeContext& scope) {
  ClassRecord record;
  record.name = cls.name;
  for (const auto& base : cls.bases) {
    if (base && (base->kind == ast::NodeKind::Name || base->kind == ast::NodeKind::Attribute)) {
      record.bases.push_back(ResolveName(base.get()));
    }
  }
  record.docstring = GetDocstring(cls.body);
  record.decorators = resolveAll(cls.decorators);
  out_.classes.push_back(std::move(record));

  walkChildren(cls, scope.push(cls.name));
}

void StructuralExtractor::onFunctionDef(const ast::FunctionDef& def, const ScopeContext& scope) {
  FunctionRecord record;
  record.name = def.name;
  record.args = formatArgs(def.params);
  record.docstring = GetDocstring(def.body);
  if (def.returns) {
    record.return_annotation = ResolveName(def.returns.get());
  }
  record.decorators = resolveAll(def.decorators);
  record.is_async = def.isAsync;

  std::optional<std::size_t> owner;
  if (!scope.atModuleLevel()) {
    owner = findClass(scope.innermost());
  }
  if (owner) {
    out_.classes[*owner].methods.push_back(std::move(record));
  } else {
    out_.functions.push_back(std::move(record));
  }

  walkChildren(def, scope.push(def.name));
}

void StructuralExtractor::recordVariable(Variable var, const ScopeContext& scope) {
  if (scope.atModuleLevel()) {
    out_.global_variables.push_back(std::move(var));
    return;
  }
  if (const auto owner = findClass(scope.innermost())) {
    out_.classes[*owner].attributes.push_back(std::move(var));
  }
}

void StructuralExtractor::onAssign(const ast::AssignStmt& assign, const ScopeContext& scope) {
  for (const auto& target : assign.targets) {
    if (!target || target->kind != ast::NodeKind::Name) {
      continue;
    }
    Variable var;
    var.name = static_cast<const ast::Name&>(*target).id;
    var.value = ResolveName(assign.value.get());
    recordVariable(std::move(var), scope);
  }
}

void StructuralExtractor::onAnnAssign(const ast::AnnAssignStmt& assign, const ScopeContext& scope) {
  if (!assign.target || assign.target->kind != ast::NodeKind::Name) {
    return;
  }
  Variable var;
  var.name = static_cast<const ast::Name&>(*assign.target).id;
  var.annotation = ResolveName(assign.annotation.get());
  if (assign.value) {
    var.value = ResolveName(assign.value.get());
  }
  recordVariable(std::move(var), scope);
}

void StructuralExtractor::onImport(const ast::Import& imp) {
  for (const auto& alias : imp.names) {
    out_.imports.direct.push_back(alias.name);
  }
}

void StructuralExtractor::onImportFrom(const ast::ImportFrom& imp) {
  for (const auto& alias : imp.names) {
    out_.imports.from.push_back(imp.module.empty() ? alias.name : imp.module + "." + alias.name);
  }
}

}  // namespace pyscope::analysis
