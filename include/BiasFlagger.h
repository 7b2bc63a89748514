#pragma once

#include "FairnessConfig.h"
#include "FairnessMetrics.h"
#include "GroupAggregator.h"

#include <map>
#include <optional>
#include <string>
#include <vector>

enum class Severity { LOW, MEDIUM, HIGH };

const char* severityName(Severity severity) noexcept;

struct BiasFlag {
    std::string type;
    Severity severity = Severity::LOW;
    std::string attribute;
    std::string target;
    double value = 0.0;
    double threshold = 0.0;
    std::string message;
};

struct Recommendation {
    std::string type;
    Severity priority = Severity::LOW;
    std::optional<std::string> attribute;
    std::string action;
    std::string details;
};

struct OverallMetrics {
    double averageDisparateImpact = 0.0;
    double averageStatisticalParity = 0.0;
    double averageBiasSeverity = 0.0;
    std::optional<std::string> mostBiasedAttribute;
    double mostBiasedSeverity = 0.0;
    std::optional<std::string> leastBiasedAttribute;
    double leastBiasedSeverity = 0.0;
    size_t pairCount = 0;

    double overallBiasScore() const noexcept { return averageBiasSeverity; }
};

// attribute -> target -> metrics
using MetricsByAttribute = std::map<std::string, AttributeMetrics>;

class BiasFlagger {
public:
    static constexpr double kHighParityGap = 0.2;
    static constexpr double kSmallGroupRatio = 0.5;
    static constexpr double kRetrainingScore = 0.3;

    /**
     * @brief Thresholds every (attribute, target) metric set into flags.
     * @param attributeOrder Protected attributes in profile order; flags follow it.
     */
    static std::vector<BiasFlag> flag(const MetricsByAttribute& metrics,
                                      const std::vector<std::string>& attributeOrder,
                                      const FairnessConfig& config);

    static std::vector<Recommendation> recommend(const std::vector<GroupAnalysis>& groupAnalyses,
                                                 const std::vector<BiasFlag>& flags,
                                                 const OverallMetrics& overall);

    /**
     * @brief Averages across all pairs; most/least biased by per-pair severity.
     * Ties keep the first attribute in `attributeOrder`.
     */
    static OverallMetrics summarize(const MetricsByAttribute& metrics,
                                    const std::vector<std::string>& attributeOrder);
};
