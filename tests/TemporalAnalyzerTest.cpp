#include "TemporalAnalyzer.h"
#include "TestHelpers.h"

#include <gtest/gtest.h>

using TestHelpers::makeDataset;

TEST(TemporalAnalyzerTest, ClassifiesTrends) {
    EXPECT_EQ(TemporalAnalyzer::classifyTrend({0.4, 0.35, 0.3, 0.2, 0.15, 0.1}), TrendDirection::IMPROVING);
    EXPECT_EQ(TemporalAnalyzer::classifyTrend({0.2, 0.2, 0.2, 0.2}), TrendDirection::STABLE);
    EXPECT_EQ(TemporalAnalyzer::classifyTrend({0.3}), TrendDirection::INSUFFICIENT_DATA);
    EXPECT_EQ(TemporalAnalyzer::classifyTrend({}), TrendDirection::INSUFFICIENT_DATA);
    EXPECT_EQ(TemporalAnalyzer::classifyTrend({0.1, 0.2, 0.4}), TrendDirection::WORSENING);
}

TEST(TemporalAnalyzerTest, OddLengthSkipsMiddleScore) {
    // The middle value belongs to neither half.
    EXPECT_EQ(TemporalAnalyzer::classifyTrend({0.2, 0.9, 0.22}), TrendDirection::STABLE);
}

TEST(TemporalAnalyzerTest, TrendNames) {
    EXPECT_STREQ(trendName(TrendDirection::IMPROVING), "improving");
    EXPECT_STREQ(trendName(TrendDirection::INSUFFICIENT_DATA), "insufficient_data");
}

TEST(TemporalAnalyzerTest, DetectsDateLikeColumns) {
    const Dataset data = makeDataset({"decided_on", "month", "city"},
                                     {{"2024-01-15", "2024-03", "oslo"}, {"2024-02-01", "2024-04", "lima"}});
    EXPECT_TRUE(TemporalAnalyzer::isDateLike(data, 0));
    EXPECT_TRUE(TemporalAnalyzer::isDateLike(data, 1));
    EXPECT_FALSE(TemporalAnalyzer::isDateLike(data, 2));
}

TEST(TemporalAnalyzerTest, PeriodKeys) {
    EXPECT_EQ(TemporalAnalyzer::periodKey(CellValue::parse("2024-02-10")).value_or(""), "2024-02");
    EXPECT_EQ(TemporalAnalyzer::periodKey(CellValue::parse("2023-11")).value_or(""), "2023-11");
    EXPECT_EQ(TemporalAnalyzer::periodKey(CellValue::parse("2024-03-05T10:30:00Z")).value_or(""), "2024-03");
    EXPECT_FALSE(TemporalAnalyzer::periodKey(CellValue::parse("2024-13")).has_value());
    EXPECT_FALSE(TemporalAnalyzer::periodKey(CellValue::parse("")).has_value());
    EXPECT_FALSE(TemporalAnalyzer::periodKey(CellValue::parse("soon")).has_value());
}

TEST(TemporalAnalyzerTest, ScoresEachMonthAndSortsPeriods) {
    const Dataset data = makeDataset({"decided_on", "gender", "approved"},
                                     {{"2024-02-03", "M", "1"}, {"2024-02-09", "M", "1"},
                                      {"2024-02-11", "F", "0"}, {"2024-02-20", "F", "0"},
                                      {"2024-01-04", "M", "1"}, {"2024-01-05", "F", "1"},
                                      {"2024-01-06", "M", "0"}, {"2024-01-07", "F", "0"},
                                      {"unknown", "F", "1"}});
    const auto results = TemporalAnalyzer::analyze(data, FairnessConfig{});

    ASSERT_EQ(results.count("decided_on"), 1u);
    const TemporalAnalysis& t = results.at("decided_on");
    ASSERT_EQ(t.periods.size(), 2u);
    EXPECT_EQ(t.periods[0].period, "2024-01");
    EXPECT_EQ(t.periods[0].recordCount, 4u);
    EXPECT_DOUBLE_EQ(t.periods[0].overallBiasScore, 0.0);
    EXPECT_EQ(t.periods[1].period, "2024-02");
    EXPECT_DOUBLE_EQ(t.periods[1].overallBiasScore, 1.0);
    EXPECT_EQ(t.trend, TrendDirection::WORSENING);
}

TEST(TemporalAnalyzerTest, NoDateColumnsMeansNoAnalysis) {
    EXPECT_TRUE(TemporalAnalyzer::analyze(TestHelpers::genderApprovalDataset(), FairnessConfig{}).empty());
}
