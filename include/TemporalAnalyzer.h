#pragma once

#include "Dataset.h"
#include "FairnessConfig.h"

#include <map>
#include <optional>
#include <string>
#include <vector>

enum class TrendDirection { IMPROVING, WORSENING, STABLE, INSUFFICIENT_DATA };

const char* trendName(TrendDirection trend) noexcept;

struct PeriodAnalysis {
    std::string period; // YYYY-MM
    size_t recordCount = 0;
    size_t pairCount = 0;
    double overallBiasScore = 0.0;
};

struct TemporalAnalysis {
    std::string column;
    std::vector<PeriodAnalysis> periods;
    TrendDirection trend = TrendDirection::INSUFFICIENT_DATA;
};

class TemporalAnalyzer {
public:
    static constexpr size_t kDetectionSample = 5;
    static constexpr double kTrendThreshold = 0.05;

    /**
     * @brief Reruns profiling, grouping and core metrics per monthly period of every date-like column.
     * @return One entry per date-like column, periods in chronological order.
     */
    static std::map<std::string, TemporalAnalysis> analyze(const Dataset& data, const FairnessConfig& config);

    static bool isDateLike(const Dataset& data, size_t column);

    // YYYY-MM bucket of a cell, or std::nullopt when the cell carries no date.
    static std::optional<std::string> periodKey(const CellValue& cell);

    /**
     * @brief Compares the mean of the first floor(n/2) scores with the mean from index ceil(n/2).
     * A drop of more than kTrendThreshold is improving, a rise of more is worsening.
     */
    static TrendDirection classifyTrend(const std::vector<double>& scores);
};
