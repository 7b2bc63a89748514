#include "FairnessMetrics.h"

#include <algorithm>
#include <array>
#include <cmath>
#include <limits>

namespace {
constexpr double kSimilarPairThreshold = 0.8;
constexpr double kCounterfactualMatchThreshold = 0.7;
constexpr double kOutcomeTolerance = 0.1;
constexpr double kMetricTolerance = 0.1;
constexpr size_t kCalibrationBins = 10;

struct ConfusionCounts {
    size_t tp = 0;
    size_t fp = 0;
    size_t tn = 0;
    size_t fn = 0;
    size_t total() const noexcept { return tp + fp + tn + fn; }
};

bool isPositive(double v) { return v > FairnessConfig::kPositiveThreshold; }

int actualColumnIndex(const Dataset& data, const std::string& target, const FairnessConfig& config) {
    return data.findColumnIndex(target + config.actualColumnSuffix);
}

// Actual outcome for a row: the <target>_actual cell when that column exists, else the prediction itself.
std::optional<double> actualOutcome(const Dataset& data, size_t row, int actualIdx, double predicted) {
    if (actualIdx < 0) return predicted;
    const CellValue& cell = data.value(row, static_cast<size_t>(actualIdx));
    if (!cell.isNumber()) return std::nullopt;
    return cell.number;
}

ConfusionCounts confusionFor(const Dataset& data, const GroupSummary& group, int targetIdx, int actualIdx) {
    ConfusionCounts counts;
    for (size_t row : group.members) {
        const CellValue& cell = data.value(row, static_cast<size_t>(targetIdx));
        if (!cell.isNumber()) continue;
        const auto actual = actualOutcome(data, row, actualIdx, cell.number);
        if (!actual) continue;

        const bool predicted = isPositive(cell.number);
        const bool observed = isPositive(*actual);
        if (predicted && observed) ++counts.tp;
        else if (predicted) ++counts.fp;
        else if (observed) ++counts.fn;
        else ++counts.tn;
    }
    return counts;
}

double spread(const std::map<std::string, double>& values) {
    if (values.empty()) return 0.0;
    double lo = std::numeric_limits<double>::infinity();
    double hi = -std::numeric_limits<double>::infinity();
    for (const auto& kv : values) {
        lo = std::min(lo, kv.second);
        hi = std::max(hi, kv.second);
    }
    return hi - lo;
}

// Numeric-outcome rows among the first `cap` members.
std::vector<size_t> numericPrefix(const Dataset& data, const std::vector<size_t>& rows, int column, size_t cap) {
    std::vector<size_t> out;
    const size_t limit = std::min(rows.size(), cap);
    for (size_t i = 0; i < limit; ++i) {
        if (data.value(rows[i], static_cast<size_t>(column)).isNumber()) out.push_back(rows[i]);
    }
    return out;
}

std::vector<size_t> groupingColumns(const Dataset& data, const GroupAnalysis& analysis) {
    std::vector<size_t> out;
    for (const auto& name : analysis.keyColumns) {
        const int idx = data.findColumnIndex(name);
        if (idx >= 0) out.push_back(static_cast<size_t>(idx));
    }
    return out;
}
} // namespace

double Similarity::between(const Dataset& data, size_t rowA, size_t rowB, const std::vector<size_t>& excludedColumns) {
    double sum = 0.0;
    size_t compared = 0;
    for (size_t c = 0; c < data.colCount(); ++c) {
        if (std::find(excludedColumns.begin(), excludedColumns.end(), c) != excludedColumns.end()) continue;
        const CellValue& a = data.value(rowA, c);
        const CellValue& b = data.value(rowB, c);

        ++compared;
        if (a.isNumber() && b.isNumber()) {
            const double scale = std::max({std::abs(a.number), std::abs(b.number), 1.0});
            sum += 1.0 - std::abs(a.number - b.number) / scale;
        } else if (!a.isEmpty() && !b.isEmpty() && a.text == b.text) {
            sum += 1.0;
        }
    }
    return compared == 0 ? 0.0 : sum / static_cast<double>(compared);
}

FairnessMetricSet FairnessMetricEngine::fromRates(std::vector<std::pair<std::string, double>> rates) {
    FairnessMetricSet metrics;
    metrics.positiveRates = std::move(rates);
    if (metrics.positiveRates.empty()) return metrics;

    double lo = metrics.positiveRates.front().second;
    double hi = lo;
    for (const auto& kv : metrics.positiveRates) {
        lo = std::min(lo, kv.second);
        hi = std::max(hi, kv.second);
    }

    metrics.disparateImpact = hi == 0.0 ? 0.0 : lo / hi;
    metrics.statisticalParityDiff = hi - lo;
    metrics.equalOpportunity = metrics.statisticalParityDiff;
    metrics.biasSeverity = std::max(std::abs(1.0 - metrics.disparateImpact), metrics.statisticalParityDiff);
    return metrics;
}

std::optional<FairnessMetricSet> FairnessMetricEngine::computeForTarget(const Dataset& data,
                                                                        const GroupAnalysis& analysis,
                                                                        const std::string& target,
                                                                        const FairnessConfig& config) {
    if (target == analysis.attribute) return std::nullopt;
    if (analysis.groups.size() < 2) return std::nullopt;

    std::vector<std::pair<std::string, double>> rates;
    for (const auto& group : analysis.groups) {
        auto it = group.targetStats.find(target);
        if (it == group.targetStats.end()) continue;
        rates.emplace_back(group.key, it->second.positiveRate);
    }
    if (rates.size() < 2) return std::nullopt;

    FairnessMetricSet metrics = fromRates(std::move(rates));

    const int targetIdx = data.findColumnIndex(target);
    const int actualIdx = actualColumnIndex(data, target, config);
    if (targetIdx >= 0 && actualIdx >= 0) {
        std::map<std::string, double> tprs;
        for (const auto& group : analysis.groups) {
            const ConfusionCounts counts = confusionFor(data, group, targetIdx, actualIdx);
            const size_t actualPositives = counts.tp + counts.fn;
            if (actualPositives == 0) continue;
            tprs[group.key] = static_cast<double>(counts.tp) / static_cast<double>(actualPositives);
        }
        if (tprs.size() >= 2) {
            metrics.equalOpportunity = spread(tprs);
            metrics.equalOpportunityFromActuals = true;
        }
    }
    return metrics;
}

AttributeMetrics FairnessMetricEngine::compute(const Dataset& data,
                                               const GroupAnalysis& analysis,
                                               const std::vector<std::string>& targets,
                                               const FairnessConfig& config) {
    AttributeMetrics out;
    for (const auto& target : targets) {
        if (auto metrics = computeForTarget(data, analysis, target, config)) {
            out.emplace(target, std::move(*metrics));
        }
    }
    return out;
}

EqualizedOddsResult FairnessMetricEngine::equalizedOdds(const Dataset& data, const GroupAnalysis& analysis,
                                                        const std::string& target, const FairnessConfig& config) {
    EqualizedOddsResult out;
    const int targetIdx = data.findColumnIndex(target);
    if (targetIdx < 0) return out;
    const int actualIdx = actualColumnIndex(data, target, config);

    for (const auto& group : analysis.groups) {
        const ConfusionCounts counts = confusionFor(data, group, targetIdx, actualIdx);
        if (counts.total() == 0) continue;
        const size_t pos = counts.tp + counts.fn;
        const size_t neg = counts.fp + counts.tn;
        out.truePositiveRates[group.key] = pos == 0 ? 0.0 : static_cast<double>(counts.tp) / static_cast<double>(pos);
        out.falsePositiveRates[group.key] = neg == 0 ? 0.0 : static_cast<double>(counts.fp) / static_cast<double>(neg);
    }

    out.tprDifference = spread(out.truePositiveRates);
    out.fprDifference = spread(out.falsePositiveRates);
    out.satisfied = out.tprDifference < kMetricTolerance && out.fprDifference < kMetricTolerance;
    return out;
}

CalibrationResult FairnessMetricEngine::calibration(const Dataset& data, const GroupAnalysis& analysis,
                                                    const std::string& target, const FairnessConfig& config) {
    CalibrationResult out;
    const int targetIdx = data.findColumnIndex(target);
    if (targetIdx < 0) return out;
    const int actualIdx = actualColumnIndex(data, target, config);

    for (const auto& group : analysis.groups) {
        std::array<double, kCalibrationBins> scoreSum{};
        std::array<size_t, kCalibrationBins> positives{};
        std::array<size_t, kCalibrationBins> counts{};

        for (size_t row : group.members) {
            const CellValue& cell = data.value(row, static_cast<size_t>(targetIdx));
            if (!cell.isNumber()) continue;
            const auto actual = actualOutcome(data, row, actualIdx, cell.number);
            if (!actual) continue;

            const double binPos = std::floor(cell.number * static_cast<double>(kCalibrationBins));
            const size_t bin = static_cast<size_t>(std::clamp(binPos, 0.0, static_cast<double>(kCalibrationBins - 1)));
            scoreSum[bin] += cell.number;
            counts[bin] += 1;
            if (isPositive(*actual)) positives[bin] += 1;
        }

        double gapSum = 0.0;
        size_t usedBins = 0;
        for (size_t b = 0; b < kCalibrationBins; ++b) {
            if (counts[b] == 0) continue;
            const double n = static_cast<double>(counts[b]);
            gapSum += std::abs(scoreSum[b] / n - static_cast<double>(positives[b]) / n);
            ++usedBins;
        }
        if (usedBins > 0) out.groupErrors[group.key] = gapSum / static_cast<double>(usedBins);
    }

    out.calibrationDifference = spread(out.groupErrors);
    out.wellCalibrated = out.calibrationDifference < kMetricTolerance;
    return out;
}

IndividualFairnessResult FairnessMetricEngine::individualFairness(const Dataset& data, const GroupAnalysis& analysis,
                                                                  const std::string& target,
                                                                  const FairnessConfig& config) {
    IndividualFairnessResult out;
    const int targetIdx = data.findColumnIndex(target);
    if (targetIdx < 0) return out;
    std::vector<size_t> excluded = groupingColumns(data, analysis);
    excluded.push_back(static_cast<size_t>(targetIdx));

    const size_t limit = std::min(data.rowCount(), config.individualFairnessMaxRecords);
    out.comparedRecords = limit;

    double diffSum = 0.0;
    for (size_t i = 0; i < limit; ++i) {
        const CellValue& a = data.value(i, static_cast<size_t>(targetIdx));
        if (!a.isNumber()) continue;
        for (size_t j = i + 1; j < limit; ++j) {
            const CellValue& b = data.value(j, static_cast<size_t>(targetIdx));
            if (!b.isNumber()) continue;
            if (Similarity::between(data, i, j, excluded) <= kSimilarPairThreshold) continue;
            diffSum += std::abs(a.number - b.number);
            ++out.similarPairs;
        }
    }

    out.averageOutcomeDifference = out.similarPairs == 0 ? 0.0 : diffSum / static_cast<double>(out.similarPairs);
    out.fairnessViolations = out.averageOutcomeDifference > kOutcomeTolerance;
    return out;
}

CounterfactualResult FairnessMetricEngine::counterfactualFairness(const Dataset& data, const GroupAnalysis& analysis,
                                                                  const std::string& target,
                                                                  const FairnessConfig& config) {
    CounterfactualResult out;
    const int targetIdx = data.findColumnIndex(target);
    if (targetIdx < 0) return out;
    const std::vector<size_t> excluded = groupingColumns(data, analysis);

    const size_t cap = config.counterfactualMaxRecords;
    for (size_t gi = 0; gi < analysis.groups.size(); ++gi) {
        const std::vector<size_t> left = numericPrefix(data, analysis.groups[gi].members, targetIdx, cap);
        for (size_t gj = gi + 1; gj < analysis.groups.size(); ++gj) {
            const std::vector<size_t> right = numericPrefix(data, analysis.groups[gj].members, targetIdx, cap);
            if (right.empty()) continue;

            for (size_t a : left) {
                double bestSim = -1.0;
                size_t best = right.front();
                for (size_t b : right) {
                    const double sim = Similarity::between(data, a, b, excluded);
                    if (sim > bestSim) {
                        bestSim = sim;
                        best = b;
                    }
                }
                if (bestSim <= kCounterfactualMatchThreshold) continue;

                ++out.comparisons;
                const double diff = std::abs(data.value(a, static_cast<size_t>(targetIdx)).number -
                                             data.value(best, static_cast<size_t>(targetIdx)).number);
                if (diff > kOutcomeTolerance) ++out.violations;
            }
        }
    }

    out.score = out.comparisons == 0
                    ? 1.0
                    : 1.0 - static_cast<double>(out.violations) / static_cast<double>(out.comparisons);
    return out;
}

TreatmentEqualityResult FairnessMetricEngine::treatmentEquality(const Dataset& data, const GroupAnalysis& analysis,
                                                                const std::string& target,
                                                                const FairnessConfig& config) {
    TreatmentEqualityResult out;
    const int targetIdx = data.findColumnIndex(target);
    if (targetIdx < 0) return out;
    const int actualIdx = actualColumnIndex(data, target, config);

    std::map<std::string, double> finiteRatios;
    for (const auto& group : analysis.groups) {
        const ConfusionCounts counts = confusionFor(data, group, targetIdx, actualIdx);
        if (counts.total() == 0) continue;
        out.falsePositives[group.key] = counts.fp;
        out.falseNegatives[group.key] = counts.fn;

        double ratio = 1.0;
        if (counts.fn == 0) {
            ratio = counts.fp > 0 ? std::numeric_limits<double>::infinity() : 1.0;
        } else {
            ratio = static_cast<double>(counts.fp) / static_cast<double>(counts.fn);
        }
        out.errorRatios[group.key] = ratio;
        if (std::isfinite(ratio)) finiteRatios[group.key] = ratio;
    }

    out.ratioSpread = spread(finiteRatios);
    out.satisfied = out.ratioSpread < kMetricTolerance;
    return out;
}

ExtendedMetricSet FairnessMetricEngine::computeExtended(const Dataset& data,
                                                        const GroupAnalysis& analysis,
                                                        const std::string& target,
                                                        const FairnessConfig& config) {
    ExtendedMetricSet out;
    out.equalizedOdds = equalizedOdds(data, analysis, target, config);
    out.calibration = calibration(data, analysis, target, config);
    out.individualFairness = individualFairness(data, analysis, target, config);
    out.counterfactualFairness = counterfactualFairness(data, analysis, target, config);
    out.treatmentEquality = treatmentEquality(data, analysis, target, config);
    return out;
}
