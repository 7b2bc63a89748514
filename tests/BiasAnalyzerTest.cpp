#include "BiasAnalyzer.h"
#include "TestHelpers.h"

#include <gtest/gtest.h>

#include <algorithm>

using TestHelpers::makeDataset;

namespace {
bool hasFlag(const AnalysisResult& r, const std::string& type, Severity severity) {
    return std::any_of(r.flags.begin(), r.flags.end(),
                       [&](const BiasFlag& f) { return f.type == type && f.severity == severity; });
}

bool hasRecommendation(const AnalysisResult& r, const std::string& type) {
    return std::any_of(r.recommendations.begin(), r.recommendations.end(),
                       [&](const Recommendation& rec) { return rec.type == type; });
}
} // namespace

TEST(BiasAnalyzerTest, GenderApprovalEndToEnd) {
    const AnalysisOutcome outcome = BiasAnalyzer::analyze(TestHelpers::genderApprovalDataset(), FairnessConfig{});
    ASSERT_TRUE(outcome.ok()) << outcome.error.message;
    EXPECT_FALSE(outcome.extended.has_value());

    const AnalysisResult& r = *outcome.result;
    EXPECT_EQ(r.totalRecords, 100u);
    EXPECT_EQ(r.totalGroups, 2u);
    EXPECT_FALSE(r.timestamp.empty());
    EXPECT_EQ(r.profile.protectedAttributes, (std::vector<std::string>{"gender"}));
    EXPECT_EQ(r.profile.targetColumns, (std::vector<std::string>{"approved"}));

    const FairnessMetricSet& m = r.fairnessMetrics.at("gender").at("approved");
    EXPECT_NEAR(m.disparateImpact, 0.667, 1e-3);
    EXPECT_NEAR(m.statisticalParityDiff, 0.3, 1e-9);
    EXPECT_NEAR(m.biasSeverity, 0.333, 1e-3);

    EXPECT_TRUE(hasFlag(r, "DISPARATE_IMPACT", Severity::HIGH));
    EXPECT_TRUE(hasFlag(r, "STATISTICAL_PARITY", Severity::HIGH));
    EXPECT_TRUE(hasRecommendation(r, "THRESHOLD_ADJUSTMENT"));
    EXPECT_TRUE(hasRecommendation(r, "MODEL_RETRAINING"));
    // 30 records is above half of the 50-record average group size.
    EXPECT_FALSE(hasRecommendation(r, "DATA_BALANCING"));

    EXPECT_EQ(r.overallMetrics.mostBiasedAttribute.value_or(""), "gender");
    EXPECT_EQ(r.overallMetrics.pairCount, 1u);
}

TEST(BiasAnalyzerTest, SmallGroupTriggersBalancing) {
    const Dataset data = TestHelpers::makeBinaryOutcomes("gender", "approved", {{"Male", 80, 40}, {"Female", 20, 10}});
    const AnalysisOutcome outcome = BiasAnalyzer::analyze(data, FairnessConfig{});
    ASSERT_TRUE(outcome.ok());
    EXPECT_TRUE(hasRecommendation(*outcome.result, "DATA_BALANCING"));
    EXPECT_TRUE(outcome.result->flags.empty());
}

TEST(BiasAnalyzerTest, EqualRatesProduceNoFlags) {
    const Dataset data = TestHelpers::makeBinaryOutcomes("gender", "approved", {{"Male", 10, 7}, {"Female", 10, 7}});
    const AnalysisOutcome outcome = BiasAnalyzer::analyze(data, FairnessConfig{});
    ASSERT_TRUE(outcome.ok());
    const FairnessMetricSet& m = outcome.result->fairnessMetrics.at("gender").at("approved");
    EXPECT_DOUBLE_EQ(m.disparateImpact, 1.0);
    EXPECT_DOUBLE_EQ(m.statisticalParityDiff, 0.0);
    EXPECT_DOUBLE_EQ(m.biasSeverity, 0.0);
    EXPECT_TRUE(outcome.result->flags.empty());
    EXPECT_TRUE(outcome.result->recommendations.empty());
}

TEST(BiasAnalyzerTest, InsufficientData) {
    const Dataset data = makeDataset({"gender", "approved"}, {});
    const AnalysisOutcome outcome = BiasAnalyzer::analyze(data, FairnessConfig{});
    EXPECT_FALSE(outcome.ok());
    EXPECT_EQ(outcome.error.kind, AnalysisErrorKind::INSUFFICIENT_DATA);
    EXPECT_FALSE(outcome.result.has_value());
}

TEST(BiasAnalyzerTest, SingleRecordIsAnalyzed) {
    const Dataset data = makeDataset({"gender", "approved"}, {{"Male", "1"}});
    const AnalysisOutcome outcome = BiasAnalyzer::analyze(data, FairnessConfig{});
    ASSERT_TRUE(outcome.ok());
    EXPECT_EQ(outcome.result->totalRecords, 1u);
    EXPECT_EQ(outcome.result->totalGroups, 1u);
}

TEST(BiasAnalyzerTest, NoProtectedAttributes) {
    const Dataset data = makeDataset({"income", "approved"}, {{"10", "1"}, {"20", "0"}});
    const AnalysisOutcome outcome = BiasAnalyzer::analyze(data, FairnessConfig{});
    EXPECT_EQ(outcome.error.kind, AnalysisErrorKind::NO_PROTECTED_ATTRIBUTES);
    EXPECT_FALSE(outcome.error.message.empty());
    EXPECT_STREQ(analysisErrorName(outcome.error.kind), "NoProtectedAttributes");
}

TEST(BiasAnalyzerTest, MissingTargetsYieldEmptyMetrics) {
    const Dataset data = makeDataset({"gender", "city"}, {{"Male", "oslo"}, {"Female", "lima"}});
    const AnalysisOutcome outcome = BiasAnalyzer::analyze(data, FairnessConfig{});
    ASSERT_TRUE(outcome.ok());
    EXPECT_TRUE(outcome.result->fairnessMetrics.at("gender").empty());
    EXPECT_TRUE(outcome.result->flags.empty());
    EXPECT_EQ(outcome.result->overallMetrics.pairCount, 0u);
}

TEST(BiasAnalyzerTest, ExtendedStagesRunOnRequest) {
    const Dataset data = makeDataset({"gender", "race", "decided_on", "income", "approved"},
                                     {{"Male", "White", "2024-01-02", "10", "1"},
                                      {"Female", "Black", "2024-01-09", "20", "0"},
                                      {"Male", "Black", "2024-02-03", "30", "1"},
                                      {"Female", "White", "2024-02-10", "40", "1"},
                                      {"Male", "White", "2024-03-01", "50", "0"},
                                      {"Female", "Black", "2024-03-08", "60", "0"}});
    std::vector<std::string> stages;
    const AnalysisOutcome outcome = BiasAnalyzer::analyze(
        data, FairnessConfig{}, true,
        [&stages](const std::string& stage, const std::string&) { stages.push_back(stage); });
    ASSERT_TRUE(outcome.ok()) << outcome.error.message;
    ASSERT_TRUE(outcome.extended.has_value());

    const ExtendedAnalysisResult& ext = *outcome.extended;
    ASSERT_EQ(ext.statisticalTests.count("gender"), 1u);
    EXPECT_TRUE(ext.statisticalTests.at("gender").at("approved").chiSquare.has_value());
    EXPECT_TRUE(ext.statisticalTests.at("gender").at("approved").tTest.has_value());
    EXPECT_FALSE(ext.statisticalTests.at("gender").at("approved").ksTest.has_value());
    EXPECT_EQ(ext.advancedMetrics.count("race"), 1u);
    EXPECT_EQ(ext.intersectionalBias.count("gender_x_race"), 1u);
    ASSERT_EQ(ext.temporalAnalysis.count("decided_on"), 1u);
    EXPECT_EQ(ext.temporalAnalysis.at("decided_on").periods.size(), 3u);
    EXPECT_FALSE(ext.featureImportance.empty());

    EXPECT_NE(std::find(stages.begin(), stages.end(), "Profile"), stages.end());
    EXPECT_NE(std::find(stages.begin(), stages.end(), "Temporal"), stages.end());
}
