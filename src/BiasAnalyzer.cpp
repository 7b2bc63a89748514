#include "BiasAnalyzer.h"
#include "FairLensExceptions.h"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

const char* analysisErrorName(AnalysisErrorKind kind) noexcept {
    switch (kind) {
        case AnalysisErrorKind::NONE: return "None";
        case AnalysisErrorKind::INSUFFICIENT_DATA: return "InsufficientData";
        case AnalysisErrorKind::NO_PROTECTED_ATTRIBUTES: return "NoProtectedAttributes";
        case AnalysisErrorKind::COMPUTATION_ERROR: return "ComputationError";
    }
    return "ComputationError";
}

namespace {
void report(const BiasAnalyzer::ProgressCallback& progress, const std::string& stage, const std::string& detail) {
    if (progress) progress(stage, detail);
}

AnalysisOutcome failure(AnalysisErrorKind kind, std::string message) {
    AnalysisOutcome outcome;
    outcome.error.kind = kind;
    outcome.error.message = std::move(message);
    return outcome;
}
} // namespace

std::string BiasAnalyzer::currentTimestamp() {
    const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm utc{};
    gmtime_r(&now, &utc);
    std::ostringstream os;
    os << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
    return os.str();
}

AnalysisResult BiasAnalyzer::runCore(const Dataset& data, const FairnessConfig& config,
                                     const ProgressCallback& progress) {
    AnalysisResult result;
    result.timestamp = currentTimestamp();
    result.totalRecords = data.rowCount();
    result.profile = ColumnProfiler::profile(data, config);
    report(progress, "Profile",
           std::to_string(result.profile.protectedAttributes.size()) + " protected, " +
               std::to_string(result.profile.targetColumns.size()) + " target" +
               (result.profile.targetsFromFallback ? " (fallback)" : ""));

    const auto& targets = result.profile.targetColumns;
    for (const auto& attribute : result.profile.protectedAttributes) {
        GroupAnalysis groups = GroupAggregator::aggregate(data, attribute, targets);
        result.totalGroups += groups.groups.size();
        result.fairnessMetrics[attribute] = FairnessMetricEngine::compute(data, groups, targets, config);
        report(progress, "Metrics",
               attribute + ": " + std::to_string(groups.groups.size()) + " groups, " +
                   std::to_string(result.fairnessMetrics[attribute].size()) + " target(s) scored");
        result.groupAnalyses.push_back(std::move(groups));
    }

    const auto& order = result.profile.protectedAttributes;
    result.overallMetrics = BiasFlagger::summarize(result.fairnessMetrics, order);
    result.flags = BiasFlagger::flag(result.fairnessMetrics, order, config);
    result.recommendations = BiasFlagger::recommend(result.groupAnalyses, result.flags, result.overallMetrics);
    report(progress, "Flags",
           std::to_string(result.flags.size()) + " flag(s), " + std::to_string(result.recommendations.size()) +
               " recommendation(s)");
    return result;
}

ExtendedAnalysisResult BiasAnalyzer::runExtended(const Dataset& data, const AnalysisResult& core,
                                                 const FairnessConfig& config, const ProgressCallback& progress) {
    ExtendedAnalysisResult ext;
    const auto& targets = core.profile.targetColumns;

    for (const auto& groups : core.groupAnalyses) {
        for (const auto& target : targets) {
            if (target == groups.attribute) continue;
            ext.statisticalTests[groups.attribute][target] = SignificanceTester::run(data, groups, target);
            ext.advancedMetrics[groups.attribute][target] =
                FairnessMetricEngine::computeExtended(data, groups, target, config);
        }
    }
    report(progress, "Tests", std::to_string(ext.statisticalTests.size()) + " attribute(s) tested");

    ext.intersectionalBias = IntersectionalAnalyzer::analyze(data, core.profile.protectedAttributes, targets, config);
    report(progress, "Intersectional", std::to_string(ext.intersectionalBias.size()) + " attribute pair(s)");

    ext.temporalAnalysis = TemporalAnalyzer::analyze(data, config);
    report(progress, "Temporal", std::to_string(ext.temporalAnalysis.size()) + " date column(s)");

    ext.featureImportance = CorrelationAnalyzer::analyze(data, core.profile);
    report(progress, "Correlation", std::to_string(ext.featureImportance.size()) + " feature pair(s)");
    return ext;
}

AnalysisOutcome BiasAnalyzer::analyze(const Dataset& data,
                                      const FairnessConfig& config,
                                      bool extended,
                                      const ProgressCallback& progress) {
    if (data.rowCount() == 0) {
        return failure(AnalysisErrorKind::INSUFFICIENT_DATA, "Dataset has no data rows beyond the header");
    }

    try {
        AnalysisResult core = runCore(data, config, progress);
        if (core.profile.protectedAttributes.empty()) {
            return failure(AnalysisErrorKind::NO_PROTECTED_ATTRIBUTES,
                           "No protected attribute columns detected among " +
                               std::to_string(data.colCount()) + " column(s)");
        }

        AnalysisOutcome outcome;
        if (extended) outcome.extended = runExtended(data, core, config, progress);
        outcome.result = std::move(core);
        return outcome;
    } catch (const FairLens::FairLensException& ex) {
        return failure(AnalysisErrorKind::COMPUTATION_ERROR, ex.what());
    } catch (const std::exception& ex) {
        return failure(AnalysisErrorKind::COMPUTATION_ERROR, std::string("Unexpected failure: ") + ex.what());
    }
}
