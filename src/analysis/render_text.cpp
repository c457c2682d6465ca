/***
 * Name: pyscope::analysis::RenderText
 * Purpose: Render the structural report.
 * Inputs:
 *   - structure: extraction result
 * Outputs: report text
 * Theory of Operation: Builds a vector of lines, then joins. Calls are
 *   looked up by scope id ("m.f", "m.C.meth", "m" for module level).
 */
#include "pyscope/analysis/text_renderer.h"

#include <cstddef>
#include <set>
#include <sstream>
#include <string>
#include <vector>

#include "pyscope/analysis/docstring.h"

namespace pyscope::analysis {

namespace {

using Lines = std::vector<std::string>;

std::string JoinArgs(const std::vector<std::string>& args) {
  std::string out;
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (i != 0U) {
      out += ", ";
    }
    out += args[i];
  }
  return out;
}

std::vector<std::string> RealCallees(const Structure& structure, const std::string& scope_id) {
  std::vector<std::string> out;
  if (const auto* callees = structure.calls.find(scope_id)) {
    for (const auto& callee : *callees) {
      if (!callee.synthetic()) {
        out.push_back(callee.label());
      }
    }
  }
  return out;
}

void AppendFunction(Lines& lines, const Structure& structure, const FunctionRecord& func,
                    const std::string& scope_id, const std::string& indent) {
  for (const auto& decorator : func.decorators) {
    lines.push_back(indent + "@" + decorator);
  }
  std::string signature = indent + "def " + func.name + "(" + JoinArgs(func.args) + ")";
  if (func.return_annotation) {
    signature += " -> " + *func.return_annotation;
  }
  lines.push_back(signature);
  if (func.docstring) {
    if (const std::string first = FirstLine(*func.docstring); !first.empty()) {
      lines.push_back(indent + "  Doc: \"\"\"" + first + "\"\"\"");
    }
  }
  const auto callees = RealCallees(structure, scope_id);
  if (!callees.empty()) {
    lines.push_back(indent + "  Calls:");
    for (const auto& callee : callees) {
      lines.push_back(indent + "    - " + callee);
    }
  }
}

void AppendImports(Lines& lines, const Imports& imports) {
  const auto statements = ImportStatements(imports);
  if (statements.empty()) {
    return;
  }
  lines.emplace_back("");
  lines.emplace_back("--- Imports ---");
  for (const auto& statement : statements) {
    lines.push_back("  - " + statement);
  }
}

void AppendClass(Lines& lines, const Structure& structure, const ClassRecord& cls) {
  for (const auto& decorator : cls.decorators) {
    lines.push_back("  @" + decorator);
  }
  const std::string bases = cls.bases.empty() ? std::string{} : "(" + JoinArgs(cls.bases) + ")";
  lines.push_back("  class " + cls.name + bases + ":");
  if (cls.docstring) {
    if (const std::string first = FirstLine(*cls.docstring); !first.empty()) {
      lines.push_back("    Doc: \"\"\"" + first + "\"\"\"");
    }
  }
  if (!cls.attributes.empty()) {
    lines.emplace_back("    --- Class Attributes ---");
    for (const auto& attr : cls.attributes) {
      lines.push_back("    - " + VariableText(attr));
    }
  }
  if (!cls.methods.empty()) {
    lines.emplace_back("    --- Methods ---");
    for (const auto& method : cls.methods) {
      AppendFunction(lines, structure, method, structure.module_name + "." + cls.name + "." + method.name, "      ");
    }
  }
}

}  // namespace

std::string VariableText(const Variable& var) {
  std::string text = var.name;
  if (var.annotation && !var.annotation->empty()) {
    text += ": " + *var.annotation;
  }
  if (var.value) {
    text += " = " + *var.value;
  }
  return text;
}

std::vector<std::string> ImportStatements(const Imports& imports) {
  std::vector<std::string> out;
  const std::set<std::string> direct(imports.direct.begin(), imports.direct.end());
  for (const auto& name : direct) {
    out.push_back("import " + name);
  }
  const std::set<std::string> from(imports.from.begin(), imports.from.end());
  for (const auto& name : from) {
    const auto dot = name.find('.');
    if (dot == std::string::npos) {
      out.push_back("from . import " + name);
    } else {
      out.push_back("from " + name.substr(0, dot) + " import " + name.substr(dot + 1));
    }
  }
  return out;
}

std::string RenderText(const Structure& structure) {
  Lines lines;
  lines.push_back("--- Module: " + structure.module_name + " ---");

  AppendImports(lines, structure.imports);

  if (!structure.global_variables.empty()) {
    lines.emplace_back("");
    lines.emplace_back("--- Global Variables ---");
    for (const auto& var : structure.global_variables) {
      lines.push_back("  - " + VariableText(var));
    }
  }

  if (!structure.functions.empty()) {
    lines.emplace_back("");
    lines.emplace_back("--- Global Functions ---");
    for (const auto& func : structure.functions) {
      AppendFunction(lines, structure, func, structure.module_name + "." + func.name, "  ");
    }
  }

  if (!structure.classes.empty()) {
    lines.emplace_back("");
    lines.emplace_back("--- Classes ---");
    for (const auto& cls : structure.classes) {
      AppendClass(lines, structure, cls);
    }
  }

  const auto module_calls = RealCallees(structure, structure.module_name);
  if (!module_calls.empty()) {
    lines.emplace_back("");
    lines.emplace_back("--- Module-Level Calls ---");
    for (const auto& callee : module_calls) {
      lines.push_back("  - " + callee);
    }
  }

  std::ostringstream out;
  for (std::size_t i = 0; i < lines.size(); ++i) {
    if (i != 0U) {
      out << '\n';
    }
    out << lines[i];
  }
  return out.str();
}

}  // namespace pyscope::analysis
