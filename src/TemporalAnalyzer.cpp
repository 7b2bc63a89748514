#include "TemporalAnalyzer.h"
#include "ColumnProfiler.h"
#include "FairnessMetrics.h"
#include "GroupAggregator.h"
#include "Statistics.h"

#include <regex>

namespace {
const std::regex& datePrefixPattern() {
    static const std::regex pattern(R"(^\d{4}-\d{2}(-\d{2})?)");
    return pattern;
}
} // namespace

const char* trendName(TrendDirection trend) noexcept {
    switch (trend) {
        case TrendDirection::IMPROVING: return "improving";
        case TrendDirection::WORSENING: return "worsening";
        case TrendDirection::STABLE: return "stable";
        case TrendDirection::INSUFFICIENT_DATA: return "insufficient_data";
    }
    return "insufficient_data";
}

bool TemporalAnalyzer::isDateLike(const Dataset& data, size_t column) {
    size_t sampled = 0;
    for (const auto& record : data.records()) {
        const CellValue& cell = record.at(column);
        if (cell.isEmpty()) continue;
        if (cell.isDate()) return true;
        if (std::regex_search(cell.text, datePrefixPattern())) return true;
        if (++sampled >= kDetectionSample) break;
    }
    return false;
}

std::optional<std::string> TemporalAnalyzer::periodKey(const CellValue& cell) {
    if (cell.isDate()) return DateUtils::formatIsoDate(cell.unixSeconds).substr(0, 7);
    if (cell.isEmpty()) return std::nullopt;

    std::smatch match;
    if (std::regex_search(cell.text, match, datePrefixPattern())) {
        const std::string prefix = match.str(0).substr(0, 7);
        const int month = std::stoi(prefix.substr(5, 2));
        if (month >= 1 && month <= 12) return prefix;
    }
    return std::nullopt;
}

TrendDirection TemporalAnalyzer::classifyTrend(const std::vector<double>& scores) {
    if (scores.size() < 2) return TrendDirection::INSUFFICIENT_DATA;

    const size_t half = scores.size() / 2;
    const size_t secondStart = (scores.size() + 1) / 2;
    const std::vector<double> first(scores.begin(), scores.begin() + static_cast<std::ptrdiff_t>(half));
    const std::vector<double> second(scores.begin() + static_cast<std::ptrdiff_t>(secondStart), scores.end());

    const double delta = Statistics::meanOf(first) - Statistics::meanOf(second);
    if (delta > kTrendThreshold) return TrendDirection::IMPROVING;
    if (delta < -kTrendThreshold) return TrendDirection::WORSENING;
    return TrendDirection::STABLE;
}

std::map<std::string, TemporalAnalysis> TemporalAnalyzer::analyze(const Dataset& data, const FairnessConfig& config) {
    std::map<std::string, TemporalAnalysis> out;

    for (size_t c = 0; c < data.colCount(); ++c) {
        if (!isDateLike(data, c)) continue;

        std::map<std::string, std::vector<size_t>> buckets;
        for (size_t row = 0; row < data.rowCount(); ++row) {
            if (auto key = periodKey(data.value(row, c))) buckets[*key].push_back(row);
        }

        TemporalAnalysis temporal;
        temporal.column = data.columns()[c];
        std::vector<double> scores;

        for (const auto& [period, rows] : buckets) {
            const Dataset slice = data.subset(rows);
            const ProfileResult profile = ColumnProfiler::profile(slice, config);
            if (profile.protectedAttributes.empty()) continue;

            PeriodAnalysis pa;
            pa.period = period;
            pa.recordCount = rows.size();

            double severitySum = 0.0;
            for (const auto& attribute : profile.protectedAttributes) {
                const GroupAnalysis groups = GroupAggregator::aggregate(slice, attribute, profile.targetColumns);
                for (const auto& kv : FairnessMetricEngine::compute(slice, groups, profile.targetColumns, config)) {
                    severitySum += kv.second.biasSeverity;
                    ++pa.pairCount;
                }
            }
            pa.overallBiasScore = pa.pairCount == 0 ? 0.0 : severitySum / static_cast<double>(pa.pairCount);
            scores.push_back(pa.overallBiasScore);
            temporal.periods.push_back(std::move(pa));
        }

        temporal.trend = classifyTrend(scores);
        out.emplace(temporal.column, std::move(temporal));
    }
    return out;
}
