#pragma once

#include "Dataset.h"
#include "GroupAggregator.h"

#include <array>
#include <optional>
#include <vector>

struct SignificanceTestResult {
    double statistic = 0.0;
    std::optional<double> pValue;
    std::optional<double> degreesOfFreedom;
    bool significant = false;
};

// An absent test means its preconditions (group count, sample size) were not met.
struct StatisticalTests {
    std::optional<SignificanceTestResult> chiSquare;
    std::optional<SignificanceTestResult> tTest;
    std::optional<SignificanceTestResult> ksTest;
};

class SignificanceTester {
public:
    static constexpr double kAlpha = 0.05;
    static constexpr double kTCritical = 1.96;
    static constexpr double kKsThreshold = 0.05;
    static constexpr size_t kKsMinSamples = 5;

    static StatisticalTests run(const Dataset& data, const GroupAnalysis& analysis, const std::string& target);

    /**
     * @brief Pearson chi-square on a groups x {positive, negative} table split at the 0.5 cutoff.
     * @return std::nullopt with fewer than two non-empty groups.
     */
    static std::optional<SignificanceTestResult> chiSquare(const std::vector<std::vector<double>>& groupSamples);
    static std::optional<SignificanceTestResult> chiSquareFromTable(const std::vector<std::array<double, 2>>& table);

    /**
     * @brief Coarse p-value lookup keyed on df=1 critical values, shifted linearly for larger df.
     * This is an approximation, not the chi-square CDF.
     */
    static double chiSquarePValue(double statistic, double degreesOfFreedom);

    // Welch two-sample t-test; requires at least two samples per side and a non-zero standard error.
    static std::optional<SignificanceTestResult> tTest(const std::vector<double>& a, const std::vector<double>& b);

    // Two-sample Kolmogorov-Smirnov distance; requires kKsMinSamples per side. No p-value is reported.
    static std::optional<SignificanceTestResult> ksTest(const std::vector<double>& a, const std::vector<double>& b);
};
