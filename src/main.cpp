#include "BiasAnalyzer.h"
#include "CommonUtils.h"
#include "DataSource.h"
#include "FairLensExceptions.h"
#include "FairnessReport.h"
#include "HistoryLog.h"
#include "ReportEngine.h"
#include "RunConfig.h"

#include <iostream>
#include <string>

namespace {
constexpr int kExitOk = 0;
constexpr int kExitIoOrConfig = 1;
constexpr int kExitValidation = 2;
constexpr int kExitComputation = 3;

void printSummary(const AnalysisResult& result) {
    const OverallMetrics& overall = result.overallMetrics;
    std::cout << "\n[FairLens] Records: " << result.totalRecords << ", groups: " << result.totalGroups
              << ", pairs scored: " << overall.pairCount << "\n";
    std::cout << "[FairLens] Protected: " << CommonUtils::joinList(result.profile.protectedAttributes) << "\n";
    std::cout << "[FairLens] Targets: " << CommonUtils::joinList(result.profile.targetColumns)
              << (result.profile.targetsFromFallback ? " (fallback)" : "") << "\n";
    std::cout << "[FairLens] Overall bias score: " << CommonUtils::toFixed(overall.overallBiasScore())
              << " (" << severityName(HistoryLog::riskLevel(result)) << " risk)\n";
    if (overall.mostBiasedAttribute) {
        std::cout << "[FairLens] Most biased attribute: " << *overall.mostBiasedAttribute
                  << " (severity " << CommonUtils::toFixed(overall.mostBiasedSeverity) << ")\n";
    }
    for (const auto& f : result.flags) {
        std::cout << "[FairLens][Flag][" << severityName(f.severity) << "] " << f.message << "\n";
    }
    for (const auto& r : result.recommendations) {
        std::cout << "[FairLens][Recommendation][" << severityName(r.priority) << "] " << r.action << "\n";
    }
}
} // namespace

int main(int argc, char* argv[]) {
    RunConfig config;
    try {
        config = RunConfig::fromArgs(argc, argv);
    } catch (const FairLens::FairLensException& e) {
        std::cerr << "[FairLens][Error] " << e.what() << "\n";
        return kExitIoOrConfig;
    }

    Dataset dataset;
    try {
        if (config.verbose) std::cout << "[FairLens] Loading " << config.datasetPath << "\n";
        dataset = DataSource::load(config.datasetPath, config.delimiter);
    } catch (const FairLens::FairLensException& e) {
        std::cerr << "[FairLens][Error] " << e.what() << "\n";
        return kExitIoOrConfig;
    } catch (const std::exception& e) {
        std::cerr << "[FairLens][Error] Unexpected failure while loading: " << e.what() << "\n";
        return kExitIoOrConfig;
    }
    std::cout << "[FairLens] Loaded " << dataset.rowCount() << " rows x " << dataset.colCount() << " columns\n";

    BiasAnalyzer::ProgressCallback progress;
    if (config.verbose) {
        progress = [](const std::string& stage, const std::string& detail) {
            std::cout << "[FairLens][" << stage << "] " << detail << "\n";
        };
    }

    const AnalysisOutcome outcome = BiasAnalyzer::analyze(dataset, config.fairness, config.extended, progress);
    if (!outcome.ok()) {
        std::cerr << "[FairLens][Error] " << analysisErrorName(outcome.error.kind) << ": "
                  << outcome.error.message << "\n";
        return outcome.error.kind == AnalysisErrorKind::COMPUTATION_ERROR ? kExitComputation : kExitValidation;
    }

    const AnalysisResult& result = *outcome.result;
    if (result.profile.targetColumns.empty()) {
        std::cerr << "[FairLens][Warning] No target columns detected; fairness metrics are empty.\n";
    } else if (result.profile.targetsFromFallback) {
        std::cerr << "[FairLens][Warning] No outcome-like header found; using trailing numeric columns as targets.\n";
    }
    printSummary(result);

    try {
        ReportEngine report;
        FairnessReport::render(report, result, outcome.extended ? &*outcome.extended : nullptr);
        report.save(config.reportFile);
        std::cout << "[FairLens] Report written to " << config.reportFile << "\n";

        if (!config.historyFile.empty()) {
            HistoryLog(config.historyFile).append(result);
            if (config.verbose) std::cout << "[FairLens] History appended to " << config.historyFile << "\n";
        }
    } catch (const FairLens::FairLensException& e) {
        std::cerr << "[FairLens][Error] " << e.what() << "\n";
        return kExitIoOrConfig;
    }

    return kExitOk;
}
