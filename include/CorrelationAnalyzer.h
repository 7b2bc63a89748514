#pragma once

#include "BiasFlagger.h"
#include "ColumnProfiler.h"
#include "Dataset.h"

#include <string>
#include <vector>

struct ProxyCorrelation {
    std::string feature;
    std::string protectedAttribute;
    double correlation = 0.0;
    Severity risk = Severity::LOW;
    std::string recommendation;
};

class CorrelationAnalyzer {
public:
    static constexpr double kHighRisk = 0.3;
    static constexpr double kMediumRisk = 0.1;

    /**
     * @brief Correlates every non-protected, non-target column with each protected attribute.
     * Rows where either cell is not a number are skipped.
     */
    static std::vector<ProxyCorrelation> analyze(const Dataset& data, const ProfileResult& profile);

    // Pearson r over rows with two numeric cells; 0 with fewer than two such rows or zero variance.
    static double correlate(const Dataset& data, size_t columnA, size_t columnB);

    static Severity riskFor(double correlation);
    static std::string recommendationFor(Severity risk);
};
