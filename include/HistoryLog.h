#pragma once

#include "AnalysisResult.h"

#include <string>
#include <utility>

/**
 * Appends one summary row per analysis run to a CSV file:
 * timestamp,total_records,total_groups,overall_bias_score,flag_count,risk_level
 */
class HistoryLog {
public:
    explicit HistoryLog(std::string path) : path_(std::move(path)) {}

    /**
     * @brief Appends the result's summary row, writing the header first when the file is new or empty.
     * @throws FairLens::IOException when the file cannot be opened for appending.
     */
    void append(const AnalysisResult& result) const;

    static std::string header();
    static std::string formatRow(const AnalysisResult& result);

    // HIGH above a 0.3 score or with any HIGH flag, MEDIUM above 0.1 or with any flag, else LOW.
    static Severity riskLevel(const AnalysisResult& result);

    const std::string& path() const noexcept { return path_; }

private:
    std::string path_;
};
