// Utility: parse and extract in-memory Python sources for tests
#pragma once

#include <memory>
#include <string>

#include "ast/Module.h"
#include "lexer/Lexer.h"
#include "parser/Parser.h"
#include "pyscope/analysis/extractor.h"
#include "pyscope/analysis/model.h"

namespace testutil {

inline std::unique_ptr<pyscope::ast::Module> ParseSource(const std::string& src, const std::string& name = "m.py") {
  pyscope::lex::Lexer lexer;
  lexer.pushString(src, name);
  pyscope::parse::Parser parser(lexer);
  parser.setSourceText(name, src);
  return parser.parseModule();
}

inline pyscope::analysis::Structure ExtractSource(const std::string& src, const std::string& module = "m") {
  const auto root = ParseSource(src, module + ".py");
  pyscope::analysis::StructuralExtractor extractor;
  return extractor.extract(*root, module);
}

} // namespace testutil
