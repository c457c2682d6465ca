/***
 * Name: test_cli_parse
 * Purpose: Option handlers, validation and usage errors.
 */
#include <gtest/gtest.h>

#include <sstream>
#include <string>
#include <vector>

#include "pyscope/driver/cli.h"

using namespace pyscope;

static bool parseArgs(const std::vector<std::string>& args, driver::CliOptions& opts, std::string& err_text) {
  std::vector<const char*> argv{"pyscope"};
  for (const auto& a : args) argv.push_back(a.c_str());
  std::ostringstream err;
  const bool ok = driver::ParseCli(static_cast<int>(argv.size()), argv.data(), opts, err);
  err_text = err.str();
  return ok;
}

TEST(CliParse, DefaultsWithSingleInput) {
  driver::CliOptions o;
  std::string err;
  ASSERT_TRUE(parseArgs({"mod.py"}, o, err)) << err;
  ASSERT_EQ(o.inputs.size(), 1u);
  EXPECT_EQ(o.inputs[0], "mod.py");
  EXPECT_EQ(o.format, graph::ExportFormat::Png);
  EXPECT_TRUE(o.graph_path.empty());
  EXPECT_TRUE(o.wantsText());
  EXPECT_FALSE(o.metrics);
}

TEST(CliParse, GraphOptionsInBothSpellings) {
  driver::CliOptions o;
  std::string err;
  ASSERT_TRUE(parseArgs({"--graph=out/g", "--format", "svg", "--engine=/usr/bin/dot", "a.py"}, o, err)) << err;
  EXPECT_EQ(o.graph_path, "out/g");
  EXPECT_EQ(o.format, graph::ExportFormat::Svg);
  EXPECT_EQ(o.engine, "/usr/bin/dot");
  EXPECT_FALSE(o.wantsText());
  ASSERT_TRUE(parseArgs({"-o", "g2", "--text", "--format=gv", "a.py"}, o, err)) << err;
  EXPECT_EQ(o.graph_path, "g2");
  EXPECT_EQ(o.format, graph::ExportFormat::Gv);
  EXPECT_TRUE(o.wantsText());
}

TEST(CliParse, MetricsVariants) {
  driver::CliOptions o;
  std::string err;
  ASSERT_TRUE(parseArgs({"--metrics", "a.py"}, o, err));
  EXPECT_TRUE(o.metrics);
  EXPECT_EQ(o.metrics_format, driver::CliOptions::MetricsFormat::Text);
  ASSERT_TRUE(parseArgs({"--metrics-json", "a.py"}, o, err));
  EXPECT_EQ(o.metrics_format, driver::CliOptions::MetricsFormat::Json);
  ASSERT_TRUE(parseArgs({"--metrics=json", "a.py"}, o, err));
  EXPECT_EQ(o.metrics_format, driver::CliOptions::MetricsFormat::Json);
  EXPECT_FALSE(parseArgs({"--metrics=yaml", "a.py"}, o, err));
  EXPECT_NE(err.find("unknown metrics format"), std::string::npos);
}

TEST(CliParse, LogOptions) {
  driver::CliOptions o;
  std::string err;
  ASSERT_TRUE(parseArgs({"--log-path=logs", "--log-lexer", "--log-ast", "a.py"}, o, err)) << err;
  EXPECT_EQ(o.log_path, "logs");
  EXPECT_TRUE(o.log_lexer);
  EXPECT_TRUE(o.log_ast);
  EXPECT_FALSE(parseArgs({"--log-ast", "a.py"}, o, err));
  EXPECT_NE(err.find("--log-path"), std::string::npos);
}

TEST(CliParse, HelpSkipsInputValidation) {
  driver::CliOptions o;
  std::string err;
  ASSERT_TRUE(parseArgs({"--help"}, o, err));
  EXPECT_TRUE(o.show_help);
  ASSERT_TRUE(parseArgs({"-h"}, o, err));
  EXPECT_TRUE(o.show_help);
}

TEST(CliParse, UsageErrors) {
  driver::CliOptions o;
  std::string err;
  EXPECT_FALSE(parseArgs({}, o, err));
  EXPECT_NE(err.find("no input file"), std::string::npos);
  EXPECT_FALSE(parseArgs({"a.py", "b.py"}, o, err));
  EXPECT_NE(err.find("exactly one input"), std::string::npos);
  EXPECT_FALSE(parseArgs({"--bogus", "a.py"}, o, err));
  EXPECT_NE(err.find("unknown option '--bogus'"), std::string::npos);
  EXPECT_FALSE(parseArgs({"-o"}, o, err));
  EXPECT_NE(err.find("missing path"), std::string::npos);
  EXPECT_FALSE(parseArgs({"--format=jpeg", "a.py"}, o, err));
  EXPECT_NE(err.find("pyscope: error: unknown export format 'jpeg'"), std::string::npos);
  EXPECT_FALSE(parseArgs({"a.py", "--engine"}, o, err));
  EXPECT_NE(err.find("missing value"), std::string::npos);
}

TEST(CliParse, EndOfOptions) {
  driver::CliOptions o;
  std::string err;
  ASSERT_TRUE(parseArgs({"--", "-weird.py"}, o, err)) << err;
  ASSERT_EQ(o.inputs.size(), 1u);
  EXPECT_EQ(o.inputs[0], "-weird.py");
}

TEST(CliParse, ParseResetsPreviousState) {
  driver::CliOptions o;
  std::string err;
  ASSERT_TRUE(parseArgs({"--metrics", "a.py"}, o, err));
  ASSERT_TRUE(parseArgs({"b.py"}, o, err));
  EXPECT_FALSE(o.metrics);
  ASSERT_EQ(o.inputs.size(), 1u);
  EXPECT_EQ(o.inputs[0], "b.py");
}

TEST(CliUsage, MentionsEveryOption) {
  std::ostringstream out;
  driver::PrintUsage(out, "/usr/local/bin/pyscope");
  const auto text = out.str();
  EXPECT_EQ(text.rfind("Usage: pyscope [options] <file.py>", 0), 0u);
  for (const char* opt : {"--text", "--graph", "--format", "--engine", "--metrics-json", "--log-path", "--log-lexer",
                          "--log-ast"}) {
    EXPECT_NE(text.find(opt), std::string::npos) << opt;
  }
}
