#include "ColumnProfiler.h"
#include "CommonUtils.h"

bool ColumnProfiler::matchesKeyword(const std::string& header, const std::vector<std::string>& keywords) {
    const std::string lowered = CommonUtils::toLower(header);
    const std::string compact = CommonUtils::stripSeparators(lowered);
    for (const auto& raw : keywords) {
        const std::string keyword = CommonUtils::toLower(CommonUtils::trim(raw));
        if (keyword.empty()) continue;
        if (lowered.find(keyword) != std::string::npos) return true;

        const std::string compactKeyword = CommonUtils::stripSeparators(keyword);
        if (!compactKeyword.empty() && compact.find(compactKeyword) != std::string::npos) return true;
    }
    return false;
}

bool ColumnProfiler::isNumericColumn(const Dataset& data, size_t column) {
    size_t sampled = 0;
    for (const auto& record : data.records()) {
        const CellValue& cell = record.at(column);
        if (cell.isEmpty()) continue;
        if (!cell.isNumber()) return false;
        if (++sampled >= kSampleSize) break;
    }
    return sampled > 0;
}

ProfileResult ColumnProfiler::profile(const Dataset& data, const FairnessConfig& config) {
    ProfileResult result;
    result.allColumns = data.columns();
    result.columns.reserve(data.colCount());

    for (size_t c = 0; c < data.colCount(); ++c) {
        ColumnProfile col;
        col.name = data.columns()[c];
        col.isProtected = matchesKeyword(col.name, config.protectedAttributeKeywords) ||
                          matchesKeyword(col.name, config.fallbackDemographicKeywords);
        col.isTarget = matchesKeyword(col.name, config.targetKeywords);
        col.isNumeric = isNumericColumn(data, c);
        result.columns.push_back(col);
    }

    for (const auto& col : result.columns) {
        if (col.isProtected) result.protectedAttributes.push_back(col.name);
        if (col.isTarget) result.targetColumns.push_back(col.name);
        if (col.isNumeric) result.numericColumns.push_back(col.name);
    }

    if (result.targetColumns.empty() && !result.numericColumns.empty()) {
        const size_t start = result.numericColumns.size() > 2 ? result.numericColumns.size() - 2 : 0;
        for (size_t i = start; i < result.numericColumns.size(); ++i) {
            const std::string& name = result.numericColumns[i];
            result.targetColumns.push_back(name);
            for (auto& col : result.columns) {
                if (col.name == name) col.isTarget = true;
            }
        }
        result.targetsFromFallback = true;
    }

    return result;
}
