/***
 * Name: test_graph_exporter
 * Purpose: Export to gv without an engine, engine-missing reporting, and a
 *   real render when dot is on PATH.
 */
#include <gtest/gtest.h>

#include <filesystem>
#include <string>
#include <system_error>
#include <unistd.h>

#include "pyscope/graph/graph_builder.h"
#include "pyscope/stages/exporter.h"
#include "pyscope/support/fs.h"
#include "util/SourceFixtures.h"

namespace fs = std::filesystem;
using namespace pyscope;

static fs::path scratchDir(const std::string& name) {
  const fs::path dir = fs::temp_directory_path() / ("pyscope_export_" + name + "_" + std::to_string(::getpid()));
  std::error_code ec;
  fs::remove_all(dir, ec);
  return dir;
}

static graph::GraphModel sampleGraph() {
  graph::GraphModelBuilder builder;
  return builder.build(testutil::ExtractSource("class A(B):\n    def m(self):\n        self.other()\n"));
}

TEST(GraphExporter, GvIsWrittenWithoutEngine) {
  const auto dir = scratchDir("gv");
  std::string artifact;
  support::Error err;
  graph::ExportOptions options{"/nonexistent/dot"};
  ASSERT_TRUE(stages::Exporter::Export(sampleGraph(), (dir / "nested" / "out.png").string(), graph::ExportFormat::Gv,
                                       options, artifact, err)) << err.message;
  EXPECT_EQ(artifact, (dir / "nested" / "out.gv").string());
  std::string text;
  std::string read_err;
  ASSERT_TRUE(support::ReadFile(artifact, text, read_err));
  EXPECT_NE(text.find("digraph \"m\""), std::string::npos);
  std::error_code ec;
  fs::remove_all(dir, ec);
}

TEST(GraphExporter, MissingEngineIsReported) {
  const auto dir = scratchDir("missing");
  std::string artifact;
  support::Error err;
  graph::ExportOptions options{"/nonexistent/bin/dot"};
  EXPECT_FALSE(stages::Exporter::Export(sampleGraph(), (dir / "out").string(), graph::ExportFormat::Png, options,
                                        artifact, err));
  EXPECT_EQ(err.kind, support::ErrorKind::EngineMissing);
  EXPECT_NE(err.message.find("Graphviz executable (dot) not found"), std::string::npos);
  EXPECT_FALSE(fs::exists(dir / "out.png"));
  EXPECT_FALSE(fs::exists(dir / "out.gv.tmp"));
  std::error_code ec;
  fs::remove_all(dir, ec);
}

TEST(GraphExporter, FailingEngineLeavesNoArtifact) {
  std::string false_bin;
  if (!support::FindExecutable("false", false_bin)) {
    GTEST_SKIP() << "false(1) not available";
  }
  const auto dir = scratchDir("failing");
  std::string artifact;
  support::Error err;
  graph::ExportOptions options{false_bin};
  EXPECT_FALSE(stages::Exporter::Export(sampleGraph(), (dir / "out").string(), graph::ExportFormat::Svg, options,
                                        artifact, err));
  EXPECT_EQ(err.kind, support::ErrorKind::ExportFailure);
  EXPECT_EQ(err.message.rfind("Error generating graph: ", 0), 0u);
  EXPECT_FALSE(fs::exists(dir / "out.svg"));
  EXPECT_FALSE(fs::exists(dir / "out.gv.tmp"));
  std::error_code ec;
  fs::remove_all(dir, ec);
}

TEST(GraphExporter, RendersSvgWithDot) {
  std::string dot;
  if (!support::FindExecutable("dot", dot)) {
    GTEST_SKIP() << "Graphviz dot not on PATH";
  }
  const auto dir = scratchDir("svg");
  std::string artifact;
  support::Error err;
  ASSERT_TRUE(stages::Exporter::Export(sampleGraph(), (dir / "graph").string(), graph::ExportFormat::Svg,
                                       graph::ExportOptions{}, artifact, err)) << err.message;
  EXPECT_EQ(artifact, (dir / "graph.svg").string());
  EXPECT_TRUE(fs::exists(artifact));
  EXPECT_FALSE(fs::exists(dir / "graph.gv.tmp"));
  std::error_code ec;
  fs::remove_all(dir, ec);
}
