/***
 * Name: test_export_format
 * Purpose: Format names and artifact path derivation.
 */
#include <gtest/gtest.h>

#include "pyscope/graph/exporter.h"

using namespace pyscope;

TEST(ExportFormat, ParsesClosedSet) {
  graph::ExportFormat f{};
  EXPECT_TRUE(graph::ParseExportFormat("svg", f));
  EXPECT_EQ(f, graph::ExportFormat::Svg);
  EXPECT_TRUE(graph::ParseExportFormat("gv", f));
  EXPECT_EQ(f, graph::ExportFormat::Gv);
  EXPECT_FALSE(graph::ParseExportFormat("jpeg", f));
  EXPECT_FALSE(graph::ParseExportFormat("PNG", f));
}

TEST(ExportFormat, ArtifactPathReplacesExtension) {
  EXPECT_EQ(graph::ArtifactPath("out/graph", graph::ExportFormat::Png), "out/graph.png");
  EXPECT_EQ(graph::ArtifactPath("out/graph.png", graph::ExportFormat::Svg), "out/graph.svg");
  EXPECT_EQ(graph::ArtifactPath("a.b/graph", graph::ExportFormat::Pdf), "a.b/graph.pdf");
  EXPECT_EQ(graph::ArtifactPath(".hidden", graph::ExportFormat::Gv), ".hidden.gv");
}
