#pragma once

#include "Dataset.h"
#include "FairnessConfig.h"
#include "GroupAggregator.h"

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

struct FairnessMetricSet {
    double disparateImpact = 0.0;
    double statisticalParityDiff = 0.0;
    double equalOpportunity = 0.0;
    double biasSeverity = 0.0;
    // Group order of the underlying analysis.
    std::vector<std::pair<std::string, double>> positiveRates;
    bool equalOpportunityFromActuals = false;
};

// target -> metrics for one grouped attribute
using AttributeMetrics = std::map<std::string, FairnessMetricSet>;

struct EqualizedOddsResult {
    std::map<std::string, double> truePositiveRates;
    std::map<std::string, double> falsePositiveRates;
    double tprDifference = 0.0;
    double fprDifference = 0.0;
    bool satisfied = true;
};

struct CalibrationResult {
    std::map<std::string, double> groupErrors;
    double calibrationDifference = 0.0;
    bool wellCalibrated = true;
};

struct IndividualFairnessResult {
    size_t comparedRecords = 0;
    size_t similarPairs = 0;
    double averageOutcomeDifference = 0.0;
    bool fairnessViolations = false;
};

struct CounterfactualResult {
    size_t comparisons = 0;
    size_t violations = 0;
    double score = 1.0;
};

struct TreatmentEqualityResult {
    std::map<std::string, size_t> falsePositives;
    std::map<std::string, size_t> falseNegatives;
    std::map<std::string, double> errorRatios;
    double ratioSpread = 0.0;
    bool satisfied = true;
};

struct ExtendedMetricSet {
    EqualizedOddsResult equalizedOdds;
    CalibrationResult calibration;
    IndividualFairnessResult individualFairness;
    CounterfactualResult counterfactualFairness;
    TreatmentEqualityResult treatmentEquality;
};

namespace Similarity {
/**
 * @brief Average per-field agreement of two records over every column not excluded.
 * Numbers contribute 1 - |a-b| / max(|a|, |b|, 1); equal non-empty texts contribute 1;
 * anything else, an empty cell included, contributes 0.
 * @return 0 when no field could be compared.
 */
double between(const Dataset& data, size_t rowA, size_t rowB, const std::vector<size_t>& excludedColumns);
}

class FairnessMetricEngine {
public:
    /**
     * @brief Core metrics for every usable target of one grouped attribute.
     * @post Targets equal to the attribute, or with fewer than two groups carrying stats, are absent.
     */
    static AttributeMetrics compute(const Dataset& data,
                                    const GroupAnalysis& analysis,
                                    const std::vector<std::string>& targets,
                                    const FairnessConfig& config);

    static std::optional<FairnessMetricSet> computeForTarget(const Dataset& data,
                                                             const GroupAnalysis& analysis,
                                                             const std::string& target,
                                                             const FairnessConfig& config);

    // Disparate impact, parity gap and severity from per-group positive rates.
    static FairnessMetricSet fromRates(std::vector<std::pair<std::string, double>> rates);

    static ExtendedMetricSet computeExtended(const Dataset& data,
                                             const GroupAnalysis& analysis,
                                             const std::string& target,
                                             const FairnessConfig& config);

    static EqualizedOddsResult equalizedOdds(const Dataset& data, const GroupAnalysis& analysis,
                                             const std::string& target, const FairnessConfig& config);
    static CalibrationResult calibration(const Dataset& data, const GroupAnalysis& analysis,
                                         const std::string& target, const FairnessConfig& config);
    // Similarity ignores the grouping columns and the target.
    static IndividualFairnessResult individualFairness(const Dataset& data, const GroupAnalysis& analysis,
                                                       const std::string& target, const FairnessConfig& config);
    static CounterfactualResult counterfactualFairness(const Dataset& data, const GroupAnalysis& analysis,
                                                       const std::string& target, const FairnessConfig& config);
    static TreatmentEqualityResult treatmentEquality(const Dataset& data, const GroupAnalysis& analysis,
                                                     const std::string& target, const FairnessConfig& config);
};
