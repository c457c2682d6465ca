/***
 * Name: test_pyscope_cli
 * Purpose: Run the built pyscope binary: report, export, errors, metrics and logs.
 */
#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <system_error>
#include <sys/wait.h>
#include <unistd.h>

namespace fs = std::filesystem;

static fs::path testingDir() {
  const fs::path dir = fs::temp_directory_path() / ("pyscope_e2e_" + std::to_string(::getpid()));
  std::error_code ec;
  fs::create_directories(dir, ec);
  return dir;
}

static void write_file(const fs::path& path, const std::string& s) {
  std::ofstream out(path);
  out << s;
}

static std::string read_all(const fs::path& path) {
  std::ifstream in(path);
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

// Runs pyscope with args; stdout/stderr land in files under the testing dir
static int run(const std::string& args, const std::string& tag) {
  const auto dir = testingDir();
  const std::string cmd = std::string(PYSCOPE_BINARY) + " " + args + " > " + (dir / (tag + ".out")).string() +
                          " 2> " + (dir / (tag + ".err")).string();
  const int status = std::system(cmd.c_str());
  return WIFEXITED(status) ? WEXITSTATUS(status) : -1;
}

static const char* kSample =
    "import os\n"
    "class A(B):\n"
    "    \"\"\"An A.\"\"\"\n"
    "    def m(self):\n"
    "        self.other()\n"
    "def main():\n"
    "    A().m()\n";

TEST(CLI_EndToEnd, HelpPrintsUsage) {
  ASSERT_EQ(run("--help", "help"), 0);
  EXPECT_NE(read_all(testingDir() / "help.out").find("Usage: pyscope [options] <file.py>"), std::string::npos);
}

TEST(CLI_EndToEnd, TextReportByDefault) {
  const auto src = testingDir() / "sample.py";
  write_file(src, kSample);
  ASSERT_EQ(run(src.string(), "text"), 0);
  const auto out = read_all(testingDir() / "text.out");
  EXPECT_EQ(out.rfind("--- Module: sample ---\n", 0), 0u) << out;
  EXPECT_NE(out.find("  class A(B):\n    Doc: \"\"\"An A.\"\"\"\n"), std::string::npos) << out;
  EXPECT_NE(out.find("          - self.other\n"), std::string::npos) << out;
}

TEST(CLI_EndToEnd, GvExportWritesArtifactAndMessage) {
  const auto dir = testingDir();
  const auto src = dir / "sample.py";
  write_file(src, kSample);
  const auto dest = dir / "graphs" / "sample";
  ASSERT_EQ(run("--format=gv -o " + dest.string() + " " + src.string(), "gv"), 0);
  const auto out = read_all(dir / "gv.out");
  EXPECT_NE(out.find("Visualization graph saved to: " + (dir / "graphs" / "sample.gv").string()), std::string::npos)
      << out;
  EXPECT_EQ(out.find("--- Module:"), std::string::npos);
  const auto dot = read_all(dir / "graphs" / "sample.gv");
  EXPECT_NE(dot.find("\"sample.B\" -> \"sample.A\" [label=\"inherits\""), std::string::npos) << dot;
}

TEST(CLI_EndToEnd, MissingEngineFails) {
  const auto dir = testingDir();
  const auto src = dir / "sample.py";
  write_file(src, kSample);
  EXPECT_EQ(run("--text --engine=/nonexistent/dot -o " + (dir / "x").string() + " " + src.string(), "noengine"), 2);
  EXPECT_NE(read_all(dir / "noengine.err").find("Graphviz executable (dot) not found"), std::string::npos);
  // the report still printed before the export was attempted
  EXPECT_NE(read_all(dir / "noengine.out").find("--- Module: sample ---"), std::string::npos);
  EXPECT_FALSE(fs::exists(dir / "x.png"));
}

TEST(CLI_EndToEnd, MissingFileFails) {
  EXPECT_EQ(run("/nonexistent/nothing.py", "missing"), 2);
  const auto err = read_all(testingDir() / "missing.err");
  EXPECT_NE(err.find("Error: File does not exist '/nonexistent/nothing.py'"), std::string::npos) << err;
}

TEST(CLI_EndToEnd, SyntaxErrorFails) {
  const auto src = testingDir() / "broken.py";
  write_file(src, "def f(:\n    pass\n");
  EXPECT_EQ(run(src.string(), "syntax"), 2);
  EXPECT_NE(read_all(testingDir() / "syntax.err").find("contains syntax error"), std::string::npos);
}

TEST(CLI_EndToEnd, UsageErrorPrintsUsage) {
  EXPECT_EQ(run("--format=jpeg x.py", "usage"), 2);
  const auto err = read_all(testingDir() / "usage.err");
  EXPECT_NE(err.find("pyscope: error: unknown export format"), std::string::npos) << err;
  EXPECT_NE(err.find("Usage: pyscope"), std::string::npos);
}

TEST(CLI_EndToEnd, MetricsTextAndJson) {
  const auto src = testingDir() / "sample.py";
  write_file(src, kSample);
  ASSERT_EQ(run("--metrics " + src.string(), "metrics"), 0);
  const auto txt = read_all(testingDir() / "metrics.out");
  EXPECT_NE(txt.find("== Metrics =="), std::string::npos);
  EXPECT_NE(txt.find("Parse: "), std::string::npos);
  EXPECT_NE(txt.find("- functions: 2"), std::string::npos) << txt;
  ASSERT_EQ(run("--metrics-json " + src.string(), "metrics_json"), 0);
  const auto js = read_all(testingDir() / "metrics_json.out");
  EXPECT_NE(js.find("\"phase\": \"Extract\""), std::string::npos);
  EXPECT_NE(js.find("\"classes\": 1"), std::string::npos) << js;
}

TEST(CLI_EndToEnd, LexerAndAstLogs) {
  const auto dir = testingDir();
  const auto src = dir / "logged.py";
  write_file(src, "x = 1\n");
  const auto logs = dir / "logs";
  ASSERT_EQ(run("--log-path=" + logs.string() + " --log-lexer --log-ast " + src.string(), "logs"), 0);
  EXPECT_NE(read_all(logs / "logged.lex.log").find(":1:1 Ident 'x'"), std::string::npos);
  EXPECT_NE(read_all(logs / "logged.ast.log").find("AssignStmt"), std::string::npos);
}
