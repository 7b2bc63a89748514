#include "BiasAnalyzer.h"
#include "FairLensExceptions.h"
#include "FairnessReport.h"
#include "ReportEngine.h"
#include "TestHelpers.h"

#include <gtest/gtest.h>

#include <fstream>
#include <sstream>

TEST(ReportEngineTest, BuildsMarkdownBlocks) {
    ReportEngine report;
    report.addTitle("Audit");
    report.addSection("Findings");
    report.addParagraph("Two groups compared.");
    report.addBulletList({"first", "second"});
    report.addBulletList({});

    EXPECT_EQ(report.body(), "# Audit\n\n## Findings\n\nTwo groups compared.\n\n- first\n- second\n\n");
}

TEST(ReportEngineTest, TableEscapesCellsAndPadsShortRows) {
    ReportEngine report;
    report.addTable("Groups", {"Group", "Rate"}, {{"a|b", "0.5"}, {"line\nbreak"}});

    const std::string& body = report.body();
    EXPECT_NE(body.find("### Groups\n| Group | Rate |\n| --- | --- |\n"), std::string::npos);
    EXPECT_NE(body.find("| a\\|b | 0.5 |"), std::string::npos);
    EXPECT_NE(body.find("| line<br>break |  |"), std::string::npos);
}

TEST(ReportEngineTest, EmptyTableIsMarked) {
    ReportEngine report;
    report.addTable("Flags", {"Type"}, {});
    EXPECT_EQ(report.body(), "### Flags\n_No rows._\n\n");
}

TEST(ReportEngineTest, TallTableShowsPreview) {
    std::vector<std::vector<std::string>> rows;
    for (int i = 0; i < 130; ++i) rows.push_back({std::to_string(i)});

    ReportEngine report;
    report.addTable("Periods", {"Index"}, rows);
    EXPECT_NE(report.body().find("120 of 130 rows"), std::string::npos);
    EXPECT_NE(report.body().find("<details>"), std::string::npos);
}

TEST(ReportEngineTest, SaveWritesAndReportsFailure) {
    ReportEngine report;
    report.addTitle("Saved");

    TestHelpers::TempFile file("report.md");
    report.save(file.path());
    std::ifstream in(file.path());
    std::stringstream content;
    content << in.rdbuf();
    EXPECT_EQ(content.str(), "# Saved\n\n");

    EXPECT_THROW(report.save("/nonexistent_dir/x.md"), FairLens::IOException);
}

TEST(ReportEngineTest, RendersFairnessReport) {
    const AnalysisOutcome outcome = BiasAnalyzer::analyze(TestHelpers::genderApprovalDataset(), FairnessConfig{}, true);
    ASSERT_TRUE(outcome.ok());
    ASSERT_TRUE(outcome.extended.has_value());

    ReportEngine report;
    FairnessReport::render(report, *outcome.result, &*outcome.extended);
    const std::string& body = report.body();

    EXPECT_EQ(body.rfind("# Fairness Analysis Report", 0), 0u);
    EXPECT_NE(body.find("## Summary"), std::string::npos);
    EXPECT_NE(body.find("DISPARATE_IMPACT"), std::string::npos);
    EXPECT_NE(body.find("## Statistical Tests"), std::string::npos);
    EXPECT_NE(body.find("## Proxy Correlations"), std::string::npos);
}

TEST(ReportEngineTest, CoreReportOmitsExtendedSections) {
    const AnalysisOutcome outcome = BiasAnalyzer::analyze(TestHelpers::genderApprovalDataset(), FairnessConfig{});
    ASSERT_TRUE(outcome.ok());

    ReportEngine report;
    FairnessReport::render(report, *outcome.result, nullptr);
    EXPECT_EQ(report.body().find("## Statistical Tests"), std::string::npos);
}

TEST(ReportEngineTest, DescribesSignificanceTests) {
    EXPECT_EQ(FairnessReport::describeTest(std::nullopt), "n/a");

    SignificanceTestResult test;
    test.statistic = 24.0;
    test.pValue = 0.0;
    test.degreesOfFreedom = 1.0;
    test.significant = true;
    EXPECT_EQ(FairnessReport::describeTest(test), "24.000, p=0.000, df=1.0 (significant)");
}
