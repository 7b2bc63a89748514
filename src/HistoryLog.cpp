#include "HistoryLog.h"
#include "CommonUtils.h"
#include "FairLensExceptions.h"

#include <algorithm>
#include <filesystem>
#include <fstream>

namespace {
constexpr double kHighRiskScore = 0.3;
constexpr double kMediumRiskScore = 0.1;
} // namespace

std::string HistoryLog::header() {
    return "timestamp,total_records,total_groups,overall_bias_score,flag_count,risk_level";
}

Severity HistoryLog::riskLevel(const AnalysisResult& result) {
    const double score = result.overallMetrics.overallBiasScore();
    const bool anyHigh = std::any_of(result.flags.begin(), result.flags.end(),
                                     [](const BiasFlag& f) { return f.severity == Severity::HIGH; });
    if (score > kHighRiskScore || anyHigh) return Severity::HIGH;
    if (score > kMediumRiskScore || !result.flags.empty()) return Severity::MEDIUM;
    return Severity::LOW;
}

std::string HistoryLog::formatRow(const AnalysisResult& result) {
    return result.timestamp + "," +
           std::to_string(result.totalRecords) + "," +
           std::to_string(result.totalGroups) + "," +
           CommonUtils::toFixed(result.overallMetrics.overallBiasScore(), 4) + "," +
           std::to_string(result.flags.size()) + "," +
           severityName(riskLevel(result));
}

void HistoryLog::append(const AnalysisResult& result) const {
    std::error_code ec;
    const bool needsHeader = !std::filesystem::exists(path_, ec) || std::filesystem::file_size(path_, ec) == 0;

    std::ofstream out(path_, std::ios::app);
    if (!out) throw FairLens::IOException("Could not open history file: " + path_);
    if (needsHeader) out << header() << "\n";
    out << formatRow(result) << "\n";
    if (!out) throw FairLens::IOException("Failed while appending history: " + path_);
}
