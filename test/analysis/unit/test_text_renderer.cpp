/***
 * Name: test_text_renderer
 * Purpose: Layout of the structure report.
 */
#include <gtest/gtest.h>

#include <string>

#include "pyscope/analysis/text_renderer.h"
#include "util/SourceFixtures.h"

using namespace pyscope;

TEST(TextRenderer, FullReportLayout) {
  const auto s = testutil::ExtractSource(
      "import os\n"
      "from a import b\n"
      "X = 1\n"
      "def foo(a, b=2):\n"
      "    \"\"\"Doc line.\n    more\"\"\"\n"
      "    if a:\n"
      "        bar()\n"
      "class A(B):\n"
      "    y: int = 3\n"
      "    @property\n"
      "    def m(self) -> int:\n"
      "        self.other()\n"
      "main()\n");
  const std::string expected =
      "--- Module: m ---\n"
      "\n"
      "--- Imports ---\n"
      "  - import os\n"
      "  - from a import b\n"
      "\n"
      "--- Global Variables ---\n"
      "  - X = 1\n"
      "\n"
      "--- Global Functions ---\n"
      "  def foo(a, b=2)\n"
      "    Doc: \"\"\"Doc line.\"\"\"\n"
      "    Calls:\n"
      "      - bar\n"
      "\n"
      "--- Classes ---\n"
      "  class A(B):\n"
      "    --- Class Attributes ---\n"
      "    - y: int = 3\n"
      "    --- Methods ---\n"
      "      @property\n"
      "      def m(self) -> int\n"
      "        Calls:\n"
      "          - self.other\n"
      "\n"
      "--- Module-Level Calls ---\n"
      "  - main";
  EXPECT_EQ(analysis::RenderText(s), expected);
}

TEST(TextRenderer, EmptyModuleHasOnlyHeader) {
  EXPECT_EQ(analysis::RenderText(testutil::ExtractSource("")), "--- Module: m ---");
}

TEST(TextRenderer, SyntheticCalleesAreNotListed) {
  const auto text = analysis::RenderText(testutil::ExtractSource("def f(xs):\n    for x in xs:\n        pass\n"));
  EXPECT_EQ(text.find("For Loop"), std::string::npos);
  EXPECT_EQ(text.find("Calls:"), std::string::npos);
}

TEST(TextRenderer, ImportsAreSortedAndDeduplicated) {
  const auto text = analysis::RenderText(testutil::ExtractSource("import sys\nimport os\nimport sys\nfrom . import z\n"));
  EXPECT_NE(text.find("  - import os\n  - import sys\n  - from . import z"), std::string::npos) << text;
}

TEST(TextRenderer, CalleesAreSortedByLabel) {
  const auto text = analysis::RenderText(testutil::ExtractSource("def f():\n    zeta()\n    alpha()\n"));
  EXPECT_NE(text.find("      - alpha\n      - zeta"), std::string::npos) << text;
}

TEST(TextRenderer, BlankDocstringIsOmitted) {
  const auto text = analysis::RenderText(testutil::ExtractSource("def f():\n    '''   '''\n"));
  EXPECT_EQ(text.find("Doc:"), std::string::npos);
}
