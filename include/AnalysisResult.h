#pragma once

#include "BiasFlagger.h"
#include "ColumnProfiler.h"
#include "CorrelationAnalyzer.h"
#include "FairnessMetrics.h"
#include "GroupAggregator.h"
#include "IntersectionalAnalyzer.h"
#include "SignificanceTester.h"
#include "TemporalAnalyzer.h"

#include <map>
#include <optional>
#include <string>
#include <vector>

struct AnalysisResult {
    std::string timestamp;
    size_t totalRecords = 0;
    size_t totalGroups = 0;
    ProfileResult profile;
    // One per protected attribute, in profile order.
    std::vector<GroupAnalysis> groupAnalyses;
    MetricsByAttribute fairnessMetrics;
    OverallMetrics overallMetrics;
    std::vector<BiasFlag> flags;
    std::vector<Recommendation> recommendations;
};

struct ExtendedAnalysisResult {
    // attribute -> target -> ...
    std::map<std::string, std::map<std::string, StatisticalTests>> statisticalTests;
    std::map<std::string, std::map<std::string, ExtendedMetricSet>> advancedMetrics;
    std::map<std::string, IntersectionalResult> intersectionalBias;
    std::map<std::string, TemporalAnalysis> temporalAnalysis;
    std::vector<ProxyCorrelation> featureImportance;
};

enum class AnalysisErrorKind { NONE, INSUFFICIENT_DATA, NO_PROTECTED_ATTRIBUTES, COMPUTATION_ERROR };

const char* analysisErrorName(AnalysisErrorKind kind) noexcept;

struct AnalysisError {
    AnalysisErrorKind kind = AnalysisErrorKind::NONE;
    std::string message;
};

struct AnalysisOutcome {
    std::optional<AnalysisResult> result;
    std::optional<ExtendedAnalysisResult> extended;
    AnalysisError error;

    bool ok() const noexcept { return error.kind == AnalysisErrorKind::NONE && result.has_value(); }
};
