/***
 * Name: pyscope::analysis::RenderText
 * Purpose: Format a Structure as a deterministic human-readable report.
 * Inputs: Structure
 * Outputs: Report text, lines joined with '\n', no trailing newline
 * Theory of Operation: Sections appear only when non-empty. Imports and
 *   callees are sorted and deduplicated; every other sequence keeps
 *   definition order. Synthetic condition/loop descriptors are left to the
 *   graph view.
 */
#pragma once

#include <string>
#include <vector>

#include "pyscope/analysis/model.h"

namespace pyscope {
namespace analysis {

std::string RenderText(const Structure& structure);

/*** ImportStatements: deduplicated "import a.b" lines, then "from a import b" lines, each group sorted. */
std::vector<std::string> ImportStatements(const Imports& imports);

/*** VariableText: "name[: annotation][ = value]". */
std::string VariableText(const Variable& var);

}  // namespace analysis
}  // namespace pyscope
