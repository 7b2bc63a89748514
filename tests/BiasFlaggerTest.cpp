#include "BiasFlagger.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>

namespace {
FairnessMetricSet metricSet(double di, double spd, double eo = 0.0, bool fromActuals = false) {
    FairnessMetricSet m;
    m.disparateImpact = di;
    m.statisticalParityDiff = spd;
    m.equalOpportunity = fromActuals ? eo : spd;
    m.equalOpportunityFromActuals = fromActuals;
    m.biasSeverity = std::max(std::abs(1.0 - di), spd);
    return m;
}

GroupAnalysis twoGroups(const std::string& attribute, size_t first, size_t second) {
    GroupAnalysis analysis;
    analysis.attribute = attribute;
    analysis.keyColumns = {attribute};
    analysis.totalRecords = first + second;
    GroupSummary a;
    a.key = "Male";
    a.count = first;
    GroupSummary b;
    b.key = "Female";
    b.count = second;
    analysis.groups = {a, b};
    return analysis;
}
} // namespace

TEST(BiasFlaggerTest, RaisesImpactAndParityFlags) {
    MetricsByAttribute metrics;
    metrics["gender"]["approved"] = metricSet(0.5, 0.15);
    metrics["race"]["approved"] = metricSet(0.7, 0.3);

    const auto flags = BiasFlagger::flag(metrics, {"gender", "race"}, FairnessConfig{});
    ASSERT_EQ(flags.size(), 4u);
    EXPECT_EQ(flags[0].type, "DISPARATE_IMPACT");
    EXPECT_EQ(flags[0].severity, Severity::HIGH);
    EXPECT_EQ(flags[0].attribute, "gender");
    EXPECT_DOUBLE_EQ(flags[0].threshold, 0.8);
    EXPECT_EQ(flags[1].type, "STATISTICAL_PARITY");
    EXPECT_EQ(flags[1].severity, Severity::MEDIUM);
    EXPECT_EQ(flags[3].type, "STATISTICAL_PARITY");
    EXPECT_EQ(flags[3].severity, Severity::HIGH);
    EXPECT_EQ(flags[3].attribute, "race");
    EXPECT_FALSE(flags[0].message.empty());
}

TEST(BiasFlaggerTest, EqualRatesRaiseNothing) {
    MetricsByAttribute metrics;
    metrics["gender"]["approved"] = metricSet(1.0, 0.0);
    EXPECT_TRUE(BiasFlagger::flag(metrics, {"gender"}, FairnessConfig{}).empty());
}

TEST(BiasFlaggerTest, EqualOpportunityNeedsActualOutcomes) {
    MetricsByAttribute metrics;
    metrics["gender"]["proxy"] = metricSet(0.9, 0.05, 0.5, false);
    metrics["gender"]["high"] = metricSet(0.9, 0.05, 0.25, true);
    metrics["gender"]["medium"] = metricSet(0.9, 0.05, 0.15, true);

    const auto flags = BiasFlagger::flag(metrics, {"gender"}, FairnessConfig{});
    ASSERT_EQ(flags.size(), 2u);
    // Targets iterate in name order.
    EXPECT_EQ(flags[0].target, "high");
    EXPECT_EQ(flags[0].type, "EQUAL_OPPORTUNITY");
    EXPECT_EQ(flags[0].severity, Severity::HIGH);
    EXPECT_EQ(flags[1].target, "medium");
    EXPECT_EQ(flags[1].severity, Severity::MEDIUM);
}

TEST(BiasFlaggerTest, ThresholdsComeFromConfig) {
    MetricsByAttribute metrics;
    metrics["gender"]["approved"] = metricSet(0.85, 0.08);
    FairnessConfig strict;
    strict.disparateImpactThreshold = 0.9;
    strict.statisticalParityThreshold = 0.05;
    EXPECT_EQ(BiasFlagger::flag(metrics, {"gender"}, strict).size(), 2u);
    EXPECT_TRUE(BiasFlagger::flag(metrics, {"gender"}, FairnessConfig{}).empty());
}

TEST(BiasFlaggerTest, DataBalancingForSmallGroups) {
    const OverallMetrics calm{};
    const auto skewed = BiasFlagger::recommend({twoGroups("gender", 80, 20)}, {}, calm);
    ASSERT_EQ(skewed.size(), 1u);
    EXPECT_EQ(skewed[0].type, "DATA_BALANCING");
    EXPECT_EQ(skewed[0].priority, Severity::HIGH);
    EXPECT_EQ(skewed[0].attribute.value_or(""), "gender");
    EXPECT_NE(skewed[0].action.find("Female"), std::string::npos);

    EXPECT_TRUE(BiasFlagger::recommend({twoGroups("gender", 70, 30)}, {}, calm).empty());
}

TEST(BiasFlaggerTest, ThresholdAdjustmentAndRetraining) {
    BiasFlag di;
    di.type = "DISPARATE_IMPACT";
    di.severity = Severity::HIGH;
    di.attribute = "gender";
    di.target = "approved";
    di.value = 0.6;
    di.threshold = 0.8;
    BiasFlag sp = di;
    sp.type = "STATISTICAL_PARITY";

    OverallMetrics overall;
    overall.averageBiasSeverity = 0.4;

    const auto recs = BiasFlagger::recommend({twoGroups("gender", 50, 50)}, {di, sp}, overall);
    ASSERT_EQ(recs.size(), 2u);
    EXPECT_EQ(recs[0].type, "THRESHOLD_ADJUSTMENT");
    EXPECT_EQ(recs[0].priority, Severity::MEDIUM);
    EXPECT_EQ(recs[1].type, "MODEL_RETRAINING");
    EXPECT_EQ(recs[1].priority, Severity::HIGH);
    EXPECT_FALSE(recs[1].attribute.has_value());
}

TEST(BiasFlaggerTest, SummarizeAveragesAndRanksAttributes) {
    MetricsByAttribute metrics;
    metrics["gender"]["approved"] = metricSet(0.8, 0.2);
    metrics["race"]["approved"] = metricSet(0.5, 0.4);

    const OverallMetrics overall = BiasFlagger::summarize(metrics, {"gender", "race"});
    EXPECT_EQ(overall.pairCount, 2u);
    EXPECT_NEAR(overall.averageDisparateImpact, 0.65, 1e-12);
    EXPECT_NEAR(overall.averageStatisticalParity, 0.3, 1e-12);
    EXPECT_NEAR(overall.averageBiasSeverity, 0.35, 1e-12);
    EXPECT_NEAR(overall.overallBiasScore(), 0.35, 1e-12);
    EXPECT_EQ(overall.mostBiasedAttribute.value_or(""), "race");
    EXPECT_NEAR(overall.mostBiasedSeverity, 0.5, 1e-12);
    EXPECT_EQ(overall.leastBiasedAttribute.value_or(""), "gender");
}

TEST(BiasFlaggerTest, SummarizeWithoutPairs) {
    const OverallMetrics overall = BiasFlagger::summarize({}, {"gender"});
    EXPECT_EQ(overall.pairCount, 0u);
    EXPECT_DOUBLE_EQ(overall.overallBiasScore(), 0.0);
    EXPECT_FALSE(overall.mostBiasedAttribute.has_value());
}

TEST(BiasFlaggerTest, SeverityNames) {
    EXPECT_STREQ(severityName(Severity::LOW), "LOW");
    EXPECT_STREQ(severityName(Severity::HIGH), "HIGH");
}
