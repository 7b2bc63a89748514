#pragma once

#include "Dataset.h"

#include <map>
#include <string>
#include <vector>

struct TargetStats {
    size_t sampleCount = 0;
    double mean = 0.0;
    double median = 0.0;
    double stddev = 0.0;
    double positiveRate = 0.0;
};

struct GroupSummary {
    std::string key;
    std::vector<size_t> members;
    size_t count = 0;
    double percentage = 0.0;
    // Targets with no numeric value in this group are absent.
    std::map<std::string, TargetStats> targetStats;

    bool hasStats(const std::string& target) const { return targetStats.count(target) > 0; }
};

struct GroupAnalysis {
    std::string attribute;
    std::vector<std::string> keyColumns;
    size_t totalRecords = 0;
    // First-appearance order.
    std::vector<GroupSummary> groups;

    const GroupSummary* find(const std::string& key) const;
};

class GroupAggregator {
public:
    static inline const std::string kUnknownKey = "Unknown";

    /**
     * @brief Partitions records by the trimmed text of one attribute column.
     * @post Every record lands in exactly one group; an unknown column yields a single "Unknown" group.
     */
    static GroupAnalysis aggregate(const Dataset& data,
                                   const std::string& attribute,
                                   const std::vector<std::string>& targets);

    /**
     * @brief Partitions by a composite key joining each key column's value with '_'.
     * The resulting analysis is labelled with the columns joined by "_x_".
     */
    static GroupAnalysis aggregate(const Dataset& data,
                                   const std::vector<std::string>& keyColumns,
                                   const std::vector<std::string>& targets);

    static std::string groupKey(const CellValue& cell);

    // NUMBER values of `column` among `members`, in member order.
    static std::vector<double> numericValues(const Dataset& data,
                                             const std::vector<size_t>& members,
                                             int column);

    static TargetStats describe(const std::vector<double>& values);
};
