#include "FairnessReport.h"
#include "CommonUtils.h"
#include "HistoryLog.h"

namespace {
std::string yesNo(bool v) { return v ? "yes" : "no"; }

void renderCore(ReportEngine& report, const AnalysisResult& result) {
    const OverallMetrics& overall = result.overallMetrics;

    report.addTitle("Fairness Analysis Report");
    report.addParagraph("Generated " + result.timestamp + " over " + std::to_string(result.totalRecords) +
                        " records and " + std::to_string(result.totalGroups) + " groups.");

    report.addSection("Summary");
    report.addTable("Overall Metrics", {"Metric", "Value"}, {
        {"Risk level", severityName(HistoryLog::riskLevel(result))},
        {"Overall bias score", CommonUtils::toFixed(overall.overallBiasScore())},
        {"Average disparate impact", CommonUtils::toFixed(overall.averageDisparateImpact)},
        {"Average statistical parity difference", CommonUtils::toFixed(overall.averageStatisticalParity)},
        {"Attribute/target pairs", std::to_string(overall.pairCount)},
        {"Most biased attribute", overall.mostBiasedAttribute
                                      ? *overall.mostBiasedAttribute + " (" + CommonUtils::toFixed(overall.mostBiasedSeverity) + ")"
                                      : "n/a"},
        {"Least biased attribute", overall.leastBiasedAttribute
                                       ? *overall.leastBiasedAttribute + " (" + CommonUtils::toFixed(overall.leastBiasedSeverity) + ")"
                                       : "n/a"},
    });

    report.addSection("Columns");
    report.addBulletList({
        "Protected attributes: " + CommonUtils::joinList(result.profile.protectedAttributes),
        "Target columns: " + CommonUtils::joinList(result.profile.targetColumns) +
            (result.profile.targetsFromFallback ? " (low confidence: trailing numeric columns)" : ""),
        "Numeric columns: " + CommonUtils::joinList(result.profile.numericColumns),
    });

    report.addSection("Groups");
    for (const auto& analysis : result.groupAnalyses) {
        std::vector<std::vector<std::string>> rows;
        for (const auto& group : analysis.groups) {
            std::string rates;
            for (const auto& [target, stats] : group.targetStats) {
                if (!rates.empty()) rates += "; ";
                rates += target + "=" + CommonUtils::toFixed(stats.positiveRate);
            }
            rows.push_back({group.key, std::to_string(group.count), CommonUtils::toFixed(group.percentage, 1) + "%",
                            rates.empty() ? "-" : rates});
        }
        report.addTable(analysis.attribute, {"Group", "Count", "Share", "Positive rate"}, rows);
    }

    report.addSection("Fairness Metrics");
    std::vector<std::vector<std::string>> metricRows;
    for (const auto& attribute : result.profile.protectedAttributes) {
        auto it = result.fairnessMetrics.find(attribute);
        if (it == result.fairnessMetrics.end()) continue;
        for (const auto& [target, m] : it->second) {
            metricRows.push_back({attribute, target, CommonUtils::toFixed(m.disparateImpact),
                                  CommonUtils::toFixed(m.statisticalParityDiff),
                                  CommonUtils::toFixed(m.equalOpportunity) + (m.equalOpportunityFromActuals ? "" : " (proxy)"),
                                  CommonUtils::toFixed(m.biasSeverity)});
        }
    }
    report.addTable("Per attribute and target",
                    {"Attribute", "Target", "Disparate impact", "Parity diff", "Equal opportunity", "Severity"},
                    metricRows);

    report.addSection("Flags");
    std::vector<std::vector<std::string>> flagRows;
    for (const auto& f : result.flags) {
        flagRows.push_back({f.type, severityName(f.severity), f.attribute, f.target,
                            CommonUtils::toFixed(f.value), CommonUtils::toFixed(f.threshold, 2), f.message});
    }
    report.addTable("Raised flags", {"Type", "Severity", "Attribute", "Target", "Value", "Threshold", "Message"},
                    flagRows);

    report.addSection("Recommendations");
    std::vector<std::vector<std::string>> recRows;
    for (const auto& r : result.recommendations) {
        recRows.push_back({r.type, severityName(r.priority), r.attribute.value_or("-"), r.action, r.details});
    }
    report.addTable("Suggested actions", {"Type", "Priority", "Attribute", "Action", "Details"}, recRows);
}

void renderExtended(ReportEngine& report, const ExtendedAnalysisResult& ext) {
    report.addSection("Statistical Tests");
    std::vector<std::vector<std::string>> testRows;
    for (const auto& [attribute, byTarget] : ext.statisticalTests) {
        for (const auto& [target, tests] : byTarget) {
            testRows.push_back({attribute, target, FairnessReport::describeTest(tests.chiSquare),
                                FairnessReport::describeTest(tests.tTest), FairnessReport::describeTest(tests.ksTest)});
        }
    }
    report.addTable("Significance", {"Attribute", "Target", "Chi-square", "Welch t", "KS"}, testRows);

    report.addSection("Advanced Metrics");
    std::vector<std::vector<std::string>> advRows;
    for (const auto& [attribute, byTarget] : ext.advancedMetrics) {
        for (const auto& [target, m] : byTarget) {
            advRows.push_back({
                attribute, target,
                "TPR " + CommonUtils::toFixed(m.equalizedOdds.tprDifference) + ", FPR " +
                    CommonUtils::toFixed(m.equalizedOdds.fprDifference) + " (" + yesNo(m.equalizedOdds.satisfied) + ")",
                CommonUtils::toFixed(m.calibration.calibrationDifference) + " (" + yesNo(m.calibration.wellCalibrated) + ")",
                CommonUtils::toFixed(m.individualFairness.averageOutcomeDifference) + " over " +
                    std::to_string(m.individualFairness.similarPairs) + " pairs",
                CommonUtils::toFixed(m.counterfactualFairness.score) + " (" +
                    std::to_string(m.counterfactualFairness.violations) + "/" +
                    std::to_string(m.counterfactualFairness.comparisons) + ")",
                CommonUtils::toFixed(m.treatmentEquality.ratioSpread) + " (" + yesNo(m.treatmentEquality.satisfied) + ")",
            });
        }
    }
    report.addTable("Extended fairness",
                    {"Attribute", "Target", "Equalized odds", "Calibration gap", "Individual", "Counterfactual",
                     "Treatment equality"},
                    advRows);

    report.addSection("Intersectional Bias");
    std::vector<std::vector<std::string>> interRows;
    for (const auto& [key, inter] : ext.intersectionalBias) {
        for (const auto& [target, m] : inter.metrics) {
            interRows.push_back({key, std::to_string(inter.groups.groups.size()), target,
                                 CommonUtils::toFixed(m.disparateImpact), CommonUtils::toFixed(m.statisticalParityDiff),
                                 CommonUtils::toFixed(m.biasSeverity)});
        }
    }
    report.addTable("Attribute pairs", {"Pair", "Groups", "Target", "Disparate impact", "Parity diff", "Severity"},
                    interRows);

    report.addSection("Temporal Analysis");
    for (const auto& [column, temporal] : ext.temporalAnalysis) {
        std::vector<std::vector<std::string>> rows;
        for (const auto& p : temporal.periods) {
            rows.push_back({p.period, std::to_string(p.recordCount), CommonUtils::toFixed(p.overallBiasScore)});
        }
        report.addTable(column + " (trend: " + trendName(temporal.trend) + ")", {"Period", "Records", "Bias score"},
                        rows);
    }

    report.addSection("Proxy Correlations");
    std::vector<std::vector<std::string>> corrRows;
    for (const auto& pc : ext.featureImportance) {
        corrRows.push_back({pc.feature, pc.protectedAttribute, CommonUtils::toFixed(pc.correlation),
                            severityName(pc.risk), pc.recommendation});
    }
    report.addTable("Feature vs protected attribute",
                    {"Feature", "Protected attribute", "Pearson r", "Risk", "Recommendation"}, corrRows);
}
} // namespace

std::string FairnessReport::describeTest(const std::optional<SignificanceTestResult>& test) {
    if (!test) return "n/a";
    std::string out = CommonUtils::toFixed(test->statistic);
    if (test->pValue) out += ", p=" + CommonUtils::toFixed(*test->pValue);
    if (test->degreesOfFreedom) out += ", df=" + CommonUtils::toFixed(*test->degreesOfFreedom, 1);
    out += test->significant ? " (significant)" : "";
    return out;
}

void FairnessReport::render(ReportEngine& report, const AnalysisResult& result, const ExtendedAnalysisResult* extended) {
    renderCore(report, result);
    if (extended) renderExtended(report, *extended);
}
