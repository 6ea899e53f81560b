/***
 * Name: test_metrics
 * Purpose: Stage timing, counters and the text and JSON summaries.
 */
#include <gtest/gtest.h>
#include <string>

#include "observability/Metrics.h"

using namespace rbparse;

TEST(Metrics, ScopedStageRecordsDuration) {
  obs::Metrics metrics;
  { const obs::ScopedStage stage(&metrics, "Lex"); }
  EXPECT_EQ(metrics.durations().count("Lex"), 1u);
}

TEST(Metrics, ScopedStageAcceptsNullMetrics) {
  const obs::ScopedStage stage(nullptr, "Lex");
  SUCCEED();
}

TEST(Metrics, StopWithoutStartIsIgnored) {
  obs::Metrics metrics;
  metrics.stop("Parse");
  EXPECT_TRUE(metrics.durations().empty());
}

TEST(Metrics, CountersAccumulate) {
  obs::Metrics metrics;
  metrics.incCounter("parse.tokens");
  metrics.incCounter("parse.tokens", 4);
  metrics.setCounter("parse.reductions", 9);
  EXPECT_EQ(metrics.counters().at("parse.tokens"), 5u);
  EXPECT_EQ(metrics.counters().at("parse.reductions"), 9u);
}

TEST(Metrics, StagesKeepFinishOrder) {
  obs::Metrics metrics;
  metrics.start("Parse");
  metrics.stop("Parse");
  metrics.start("Lex");
  metrics.stop("Lex");
  metrics.start("Parse");
  metrics.stop("Parse");
  const auto stages = metrics.stages();
  ASSERT_EQ(stages.size(), 2u);
  EXPECT_EQ(stages[0].name, "Parse");
  EXPECT_EQ(stages[1].name, "Lex");
  EXPECT_EQ(metrics.totalMicros(), stages[0].micros + stages[1].micros);
}

TEST(Metrics, TextSummary) {
  obs::Metrics metrics;
  metrics.start("Lex");
  metrics.stop("Lex");
  metrics.setCounter("parse.tokens", 3);
  metrics.setAstGeometry(obs::AstGeometry{7, 4});
  const std::string text = metrics.summaryText();
  EXPECT_EQ(text.rfind("== Metrics ==\n  Lex ", 0), 0u);
  EXPECT_NE(text.find("  total "), std::string::npos);
  EXPECT_NE(text.find("  parse.tokens = 3\n"), std::string::npos);
  EXPECT_NE(text.find("  AST: nodes=7, max_depth=4\n"), std::string::npos);
}

TEST(Metrics, JsonSummary) {
  obs::Metrics metrics;
  metrics.start("LocalVariableResolver");
  metrics.stop("LocalVariableResolver");
  metrics.setCounter("parse.tokens", 3);
  metrics.setAstGeometry(obs::AstGeometry{7, 4});
  const std::string json = metrics.summaryJson();
  EXPECT_NE(json.find("\"stages\": [\n    { \"name\": \"local_variable_resolver\", \"ms\": "), std::string::npos);
  EXPECT_NE(json.find("\"total_ms\": "), std::string::npos);
  EXPECT_NE(json.find("\"counters\": {\n    \"parse.tokens\": 3\n  }"), std::string::npos);
  EXPECT_NE(json.find("\"ast\": { \"nodes\": 7, \"max_depth\": 4 }"), std::string::npos);
  EXPECT_EQ(json.back(), '\n');
}

TEST(Metrics, EmptyJson) {
  const obs::Metrics metrics;
  EXPECT_EQ(metrics.summaryJson(), "{\n  \"stages\": [],\n  \"total_ms\": 0.000\n}\n");
}
