/***
 * Name: test_metrics
 * Purpose: Registry timers, counters and text/JSON printing.
 */
#include <gtest/gtest.h>

#include <sstream>
#include <string>

#include "pyscope/metrics/metrics.h"
#include "pyscope/metrics/phase_name.h"

using pyscope::metrics::Metrics;

class MetricsTest : public ::testing::Test {
 protected:
  void SetUp() override {
    Metrics::Reset();
    Metrics::Enable(true);
  }
  void TearDown() override {
    Metrics::Reset();
    Metrics::Enable(false);
  }
};

TEST_F(MetricsTest, TimerRecordsPhase) {
  { const Metrics::ScopedTimer timer(Metrics::Phase::Extract); }
  const auto& reg = Metrics::GetRegistry();
  ASSERT_EQ(reg.durations_ns.size(), 1u);
  EXPECT_EQ(reg.durations_ns[0].first, Metrics::Phase::Extract);
}

TEST_F(MetricsTest, CountersAccumulateInFirstRecordedOrder) {
  Metrics::AddCounter("functions", 2);
  Metrics::AddCounter("classes", 1);
  Metrics::AddCounter("functions", 3);
  const auto& reg = Metrics::GetRegistry();
  ASSERT_EQ(reg.counters.size(), 2u);
  EXPECT_EQ(reg.counters[0].first, "functions");
  EXPECT_EQ(reg.counters[0].second, 5u);
  EXPECT_EQ(reg.counters[1].first, "classes");
}

TEST_F(MetricsTest, DisabledRegistryRecordsNothing) {
  Metrics::Enable(false);
  { const Metrics::ScopedTimer timer(Metrics::Phase::Parse); }
  Metrics::AddCounter("tokens", 10);
  const auto& reg = Metrics::GetRegistry();
  EXPECT_TRUE(reg.durations_ns.empty());
  EXPECT_TRUE(reg.counters.empty());
}

TEST_F(MetricsTest, TextOutput) {
  { const Metrics::ScopedTimer timer(Metrics::Phase::ReadFile); }
  Metrics::AddCounter("tokens", 7);
  Metrics::SetASTGeometry(pyscope::ast::ASTGeometry{12, 4});
  std::ostringstream out;
  Metrics::PrintMetrics(Metrics::GetRegistry(), out);
  const auto text = out.str();
  EXPECT_EQ(text.rfind("== Metrics ==\n  ReadFile: ", 0), 0u) << text;
  EXPECT_NE(text.find("  AST: nodes=12, max_depth=4\n"), std::string::npos);
  EXPECT_NE(text.find("  Counters (1):\n    - tokens: 7\n"), std::string::npos);
}

TEST_F(MetricsTest, JsonOutput) {
  { const Metrics::ScopedTimer timer(Metrics::Phase::BuildGraph); }
  Metrics::AddCounter("graph \"nodes\"", 3);
  std::ostringstream out;
  Metrics::PrintMetricsJson(Metrics::GetRegistry(), out);
  const auto json = out.str();
  EXPECT_NE(json.find("\"durations_ns\": ["), std::string::npos);
  EXPECT_NE(json.find("\"phase\": \"BuildGraph\""), std::string::npos);
  EXPECT_NE(json.find("\"graph \\\"nodes\\\"\": 3"), std::string::npos) << json;
}

TEST(MetricsPhaseName, AllPhases) {
  EXPECT_STREQ(pyscope::metrics::PhaseName(Metrics::Phase::Render), "Render");
  EXPECT_STREQ(pyscope::metrics::PhaseName(Metrics::Phase::Export), "Export");
}
