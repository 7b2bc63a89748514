#include "GroupAggregator.h"
#include "CommonUtils.h"
#include "FairnessConfig.h"
#include "Statistics.h"

#include <unordered_map>

const GroupSummary* GroupAnalysis::find(const std::string& key) const {
    for (const auto& group : groups) {
        if (group.key == key) return &group;
    }
    return nullptr;
}

std::string GroupAggregator::groupKey(const CellValue& cell) {
    if (cell.isEmpty()) return kUnknownKey;
    const std::string key = CommonUtils::trim(cell.text);
    return key.empty() ? kUnknownKey : key;
}

std::vector<double> GroupAggregator::numericValues(const Dataset& data,
                                                   const std::vector<size_t>& members,
                                                   int column) {
    std::vector<double> out;
    if (column < 0) return out;
    out.reserve(members.size());
    for (size_t row : members) {
        const CellValue& cell = data.value(row, static_cast<size_t>(column));
        if (cell.isNumber()) out.push_back(cell.number);
    }
    return out;
}

TargetStats GroupAggregator::describe(const std::vector<double>& values) {
    TargetStats stats;
    const ColumnStats cs = Statistics::calculateStats(values);
    stats.sampleCount = values.size();
    stats.mean = cs.mean;
    stats.median = cs.median;
    stats.stddev = cs.stddev;
    stats.positiveRate = Statistics::positiveRate(values, FairnessConfig::kPositiveThreshold);
    return stats;
}

GroupAnalysis GroupAggregator::aggregate(const Dataset& data,
                                         const std::string& attribute,
                                         const std::vector<std::string>& targets) {
    GroupAnalysis analysis = aggregate(data, std::vector<std::string>{attribute}, targets);
    analysis.attribute = attribute;
    return analysis;
}

GroupAnalysis GroupAggregator::aggregate(const Dataset& data,
                                         const std::vector<std::string>& keyColumns,
                                         const std::vector<std::string>& targets) {
    GroupAnalysis analysis;
    analysis.attribute = CommonUtils::joinList(keyColumns, "_x_");
    analysis.keyColumns = keyColumns;
    analysis.totalRecords = data.rowCount();

    std::vector<int> keyIdx;
    keyIdx.reserve(keyColumns.size());
    for (const auto& col : keyColumns) keyIdx.push_back(data.findColumnIndex(col));

    std::unordered_map<std::string, size_t> slot;
    for (size_t row = 0; row < data.rowCount(); ++row) {
        std::string key;
        for (size_t k = 0; k < keyIdx.size(); ++k) {
            if (k > 0) key += '_';
            key += keyIdx[k] < 0 ? kUnknownKey : groupKey(data.value(row, static_cast<size_t>(keyIdx[k])));
        }

        auto it = slot.find(key);
        if (it == slot.end()) {
            it = slot.emplace(key, analysis.groups.size()).first;
            GroupSummary group;
            group.key = key;
            analysis.groups.push_back(std::move(group));
        }
        analysis.groups[it->second].members.push_back(row);
    }

    const double total = static_cast<double>(analysis.totalRecords);
    for (auto& group : analysis.groups) {
        group.count = group.members.size();
        group.percentage = total > 0.0 ? (static_cast<double>(group.count) / total) * 100.0 : 0.0;

        for (const auto& target : targets) {
            const std::vector<double> values = numericValues(data, group.members, data.findColumnIndex(target));
            if (values.empty()) continue;
            group.targetStats[target] = describe(values);
        }
    }

    return analysis;
}
