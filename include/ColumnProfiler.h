#pragma once

#include "Dataset.h"
#include "FairnessConfig.h"

#include <string>
#include <vector>

struct ColumnProfile {
    std::string name;
    bool isProtected = false;
    bool isTarget = false;
    bool isNumeric = false;
};

struct ProfileResult {
    std::vector<ColumnProfile> columns;
    std::vector<std::string> protectedAttributes;
    std::vector<std::string> targetColumns;
    std::vector<std::string> numericColumns;
    std::vector<std::string> allColumns;
    // Set when no header matched a target keyword and the trailing numeric columns were used instead.
    bool targetsFromFallback = false;
};

class ColumnProfiler {
public:
    static constexpr size_t kSampleSize = 10;

    /**
     * @brief Classifies every column from its header and the first sampled non-empty values.
     * @post Never throws for a well-formed Dataset; empty role lists are left for the caller to judge.
     */
    static ProfileResult profile(const Dataset& data, const FairnessConfig& config);

    static bool matchesKeyword(const std::string& header, const std::vector<std::string>& keywords);
    static bool isNumericColumn(const Dataset& data, size_t column);
};
