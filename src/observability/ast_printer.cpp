/***
 * Name: pyscope::obs::AstPrinter (impl)
 * Purpose: Render an AST as an indented outline.
 */
#include "observability/AstPrinter.h"

#include <cstddef>
#include <string>

#include "ast/Children.h"
#include "ast/Nodes.h"

namespace pyscope::obs {

std::string AstPrinter::print(const ast::Node& root) {
  ss_.str("");
  ss_.clear();
  depth_ = 0;
  emit(root);
  return ss_.str();
}

void AstPrinter::emit(const ast::Node& node) {
  for (int i = 0; i < depth_; ++i) {
    ss_ << "  ";
  }
  ss_ << ast::to_string(node.kind);
  const std::string extra = detail(node);
  if (!extra.empty()) {
    ss_ << ' ' << extra;
  }
  ss_ << " @" << node.line << ':' << node.col << '\n';
  ++depth_;
  ast::forEachChild(node, [this](const ast::Node& child) { emit(child); });
  --depth_;
}

std::string AstPrinter::detail(const ast::Node& node) {
  using NK = ast::NodeKind;
  if (node.kind == NK::FunctionDef) {
    const auto& fn = static_cast<const ast::FunctionDef&>(node);
    return std::string("name=") + fn.name + (fn.isAsync ? " async" : "");
  }
  if (node.kind == NK::ClassDef) {
    return "name=" + static_cast<const ast::ClassDef&>(node).name;
  }
  if (node.kind == NK::Name) {
    return static_cast<const ast::Name&>(node).id;
  }
  if (node.kind == NK::Attribute) {
    return "." + static_cast<const ast::Attribute&>(node).attr;
  }
  if (node.kind == NK::Import) {
    std::string out;
    for (const auto& alias : static_cast<const ast::Import&>(node).names) {
      out += (out.empty() ? "" : ", ") + alias.name;
    }
    return out;
  }
  if (node.kind == NK::ImportFrom) {
    const auto& imp = static_cast<const ast::ImportFrom&>(node);
    std::string out = "from " + std::string(static_cast<std::size_t>(imp.level), '.') + imp.module + ":";
    for (const auto& alias : imp.names) {
      out += " " + alias.name;
    }
    return out;
  }
  if (node.kind == NK::IntLiteral) { return static_cast<const ast::IntLiteral&>(node).value; }
  if (node.kind == NK::FloatLiteral) { return static_cast<const ast::FloatLiteral&>(node).value; }
  if (node.kind == NK::StringLiteral) { return "\"" + static_cast<const ast::StringLiteral&>(node).value + "\""; }
  if (node.kind == NK::BoolLiteral) { return static_cast<const ast::BoolLiteral&>(node).value ? "True" : "False"; }
  return {};
}

} // namespace pyscope::obs
