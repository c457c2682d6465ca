/***
 * Name: pyscope::graph::ParseExportFormat / FormatName / ArtifactPath
 * Purpose: Closed set of export formats and artifact naming.
 * Inputs: format text; destination path
 * Outputs: ExportFormat; artifact path
 * Theory of Operation: Only the extension of the last path component is
 *   replaced; a leading dot (hidden file) is not an extension.
 */
#include "pyscope/graph/exporter.h"

#include <array>
#include <string>
#include <utility>

namespace pyscope::graph {

namespace {
constexpr std::array<std::pair<const char*, ExportFormat>, 5> kFormats{{
    {"png", ExportFormat::Png},
    {"svg", ExportFormat::Svg},
    {"pdf", ExportFormat::Pdf},
    {"dot", ExportFormat::Dot},
    {"gv", ExportFormat::Gv},
}};
}  // namespace

bool ParseExportFormat(const std::string& text, ExportFormat& out) {
  for (const auto& [name, format] : kFormats) {
    if (text == name) {
      out = format;
      return true;
    }
  }
  return false;
}

const char* FormatName(ExportFormat format) {
  for (const auto& [name, candidate] : kFormats) {
    if (candidate == format) {
      return name;
    }
  }
  return "png";
}

std::string ArtifactPath(const std::string& destination, ExportFormat format) {
  const auto slash = destination.find_last_of('/');
  const auto name_start = slash == std::string::npos ? 0 : slash + 1;
  const auto dot = destination.find_last_of('.');
  std::string stem = destination;
  if (dot != std::string::npos && dot > name_start) {
    stem = destination.substr(0, dot);
  }
  return stem + "." + FormatName(format);
}

}  // namespace pyscope::graph
