#include "IntersectionalAnalyzer.h"

std::map<std::string, IntersectionalResult> IntersectionalAnalyzer::analyze(
    const Dataset& data,
    const std::vector<std::string>& protectedAttributes,
    const std::vector<std::string>& targets,
    const FairnessConfig& config) {
    std::map<std::string, IntersectionalResult> out;
    if (protectedAttributes.size() < 2) return out;

    for (const auto& pair : combinations(protectedAttributes, 2)) {
        IntersectionalResult result;
        result.attributes = pair;
        result.groups = GroupAggregator::aggregate(data, pair, targets);
        result.metrics = FairnessMetricEngine::compute(data, result.groups, targets, config);
        const std::string key = result.groups.attribute;
        out.emplace(key, std::move(result));
    }
    return out;
}
