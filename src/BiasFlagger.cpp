#include "BiasFlagger.h"
#include "CommonUtils.h"

const char* severityName(Severity severity) noexcept {
    switch (severity) {
        case Severity::LOW: return "LOW";
        case Severity::MEDIUM: return "MEDIUM";
        case Severity::HIGH: return "HIGH";
    }
    return "LOW";
}

std::vector<BiasFlag> BiasFlagger::flag(const MetricsByAttribute& metrics,
                                        const std::vector<std::string>& attributeOrder,
                                        const FairnessConfig& config) {
    std::vector<BiasFlag> flags;
    for (const auto& attribute : attributeOrder) {
        auto attrIt = metrics.find(attribute);
        if (attrIt == metrics.end()) continue;

        for (const auto& [target, m] : attrIt->second) {
            if (m.disparateImpact < config.disparateImpactThreshold) {
                flags.push_back({"DISPARATE_IMPACT", Severity::HIGH, attribute, target, m.disparateImpact,
                                 config.disparateImpactThreshold,
                                 "Disparate impact of " + CommonUtils::toFixed(m.disparateImpact) + " for '" +
                                     target + "' across " + attribute + " groups is below " +
                                     CommonUtils::toFixed(config.disparateImpactThreshold, 2)});
            }
            if (m.statisticalParityDiff > config.statisticalParityThreshold) {
                const Severity sev = m.statisticalParityDiff > kHighParityGap ? Severity::HIGH : Severity::MEDIUM;
                flags.push_back({"STATISTICAL_PARITY", sev, attribute, target, m.statisticalParityDiff,
                                 config.statisticalParityThreshold,
                                 "Positive-rate gap of " + CommonUtils::toFixed(m.statisticalParityDiff) + " for '" +
                                     target + "' across " + attribute + " groups exceeds " +
                                     CommonUtils::toFixed(config.statisticalParityThreshold, 2)});
            }
            if (m.equalOpportunityFromActuals && m.equalOpportunity > config.equalOpportunityThreshold) {
                const Severity sev = m.equalOpportunity > 2.0 * config.equalOpportunityThreshold ? Severity::HIGH
                                                                                                  : Severity::MEDIUM;
                flags.push_back({"EQUAL_OPPORTUNITY", sev, attribute, target, m.equalOpportunity,
                                 config.equalOpportunityThreshold,
                                 "True-positive-rate gap of " + CommonUtils::toFixed(m.equalOpportunity) + " for '" +
                                     target + "' across " + attribute + " groups exceeds " +
                                     CommonUtils::toFixed(config.equalOpportunityThreshold, 2)});
            }
        }
    }
    return flags;
}

std::vector<Recommendation> BiasFlagger::recommend(const std::vector<GroupAnalysis>& groupAnalyses,
                                                   const std::vector<BiasFlag>& flags,
                                                   const OverallMetrics& overall) {
    std::vector<Recommendation> recs;

    for (const auto& analysis : groupAnalyses) {
        if (analysis.groups.empty()) continue;
        const double average = static_cast<double>(analysis.totalRecords) / static_cast<double>(analysis.groups.size());
        for (const auto& group : analysis.groups) {
            if (static_cast<double>(group.count) >= kSmallGroupRatio * average) continue;
            recs.push_back({"DATA_BALANCING", Severity::HIGH, analysis.attribute,
                            "Collect more data for the '" + group.key + "' group of " + analysis.attribute,
                            group.key + " has " + std::to_string(group.count) + " records against an average of " +
                                CommonUtils::toFixed(average, 1) + " per group"});
        }
    }

    for (const auto& f : flags) {
        if (f.type != "DISPARATE_IMPACT") continue;
        recs.push_back({"THRESHOLD_ADJUSTMENT", Severity::MEDIUM, f.attribute,
                        "Review decision thresholds for '" + f.target + "' across " + f.attribute + " groups",
                        "Disparate impact " + CommonUtils::toFixed(f.value) + " is below " +
                            CommonUtils::toFixed(f.threshold, 2) + "; group-aware thresholds can close the gap"});
    }

    if (overall.overallBiasScore() > kRetrainingScore) {
        recs.push_back({"MODEL_RETRAINING", Severity::HIGH, std::nullopt,
                        "Retrain the model with fairness constraints",
                        "Overall bias score " + CommonUtils::toFixed(overall.overallBiasScore()) + " exceeds " +
                            CommonUtils::toFixed(kRetrainingScore, 1)});
    }
    return recs;
}

OverallMetrics BiasFlagger::summarize(const MetricsByAttribute& metrics,
                                      const std::vector<std::string>& attributeOrder) {
    OverallMetrics out;
    double diSum = 0.0;
    double spSum = 0.0;
    double sevSum = 0.0;

    for (const auto& attribute : attributeOrder) {
        auto attrIt = metrics.find(attribute);
        if (attrIt == metrics.end()) continue;

        for (const auto& kv : attrIt->second) {
            const FairnessMetricSet& m = kv.second;
            diSum += m.disparateImpact;
            spSum += m.statisticalParityDiff;
            sevSum += m.biasSeverity;
            ++out.pairCount;

            if (!out.mostBiasedAttribute || m.biasSeverity > out.mostBiasedSeverity) {
                out.mostBiasedAttribute = attribute;
                out.mostBiasedSeverity = m.biasSeverity;
            }
            if (!out.leastBiasedAttribute || m.biasSeverity < out.leastBiasedSeverity) {
                out.leastBiasedAttribute = attribute;
                out.leastBiasedSeverity = m.biasSeverity;
            }
        }
    }

    if (out.pairCount > 0) {
        const double n = static_cast<double>(out.pairCount);
        out.averageDisparateImpact = diSum / n;
        out.averageStatisticalParity = spSum / n;
        out.averageBiasSeverity = sevSum / n;
    }
    return out;
}
