#pragma once

#include "Dataset.h"
#include "FairnessConfig.h"
#include "FairnessMetrics.h"
#include "GroupAggregator.h"

#include <map>
#include <string>
#include <vector>

/**
 * @brief All k-element subsets of `items`, preserving input order within and across subsets.
 * For each head element, emits head followed by every (k-1)-subset of the elements after it.
 */
template <typename T>
std::vector<std::vector<T>> combinations(const std::vector<T>& items, size_t k) {
    if (k == 0) return {std::vector<T>{}};
    if (items.size() < k) return {};

    std::vector<std::vector<T>> out;
    for (size_t head = 0; head + k <= items.size(); ++head) {
        const std::vector<T> tail(items.begin() + static_cast<std::ptrdiff_t>(head) + 1, items.end());
        for (auto& rest : combinations(tail, k - 1)) {
            std::vector<T> combo;
            combo.reserve(k);
            combo.push_back(items[head]);
            combo.insert(combo.end(), rest.begin(), rest.end());
            out.push_back(std::move(combo));
        }
    }
    return out;
}

struct IntersectionalResult {
    std::vector<std::string> attributes;
    GroupAnalysis groups;
    AttributeMetrics metrics;
};

class IntersectionalAnalyzer {
public:
    /**
     * @brief Regroups the data by every pair of protected attributes and recomputes core metrics.
     * @return Results keyed "attr1_x_attr2"; empty with fewer than two protected attributes.
     */
    static std::map<std::string, IntersectionalResult> analyze(const Dataset& data,
                                                               const std::vector<std::string>& protectedAttributes,
                                                               const std::vector<std::string>& targets,
                                                               const FairnessConfig& config);
};
