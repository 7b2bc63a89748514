#include "SignificanceTester.h"
#include "FairnessConfig.h"
#include "Statistics.h"

#include <algorithm>
#include <cmath>

namespace {
struct CriticalValue {
    double base;
    double slope;
    double pValue;
};

constexpr CriticalValue kChiSquareTable[] = {
    {10.83, 2.7, 0.001},
    {6.63, 2.4, 0.01},
    {3.84, 2.0, 0.05},
    {2.71, 1.8, 0.1},
};
constexpr double kChiSquareFloorP = 0.5;
} // namespace

double SignificanceTester::chiSquarePValue(double statistic, double degreesOfFreedom) {
    const double extra = std::max(0.0, degreesOfFreedom - 1.0);
    for (const auto& row : kChiSquareTable) {
        if (statistic > row.base + row.slope * extra) return row.pValue;
    }
    return kChiSquareFloorP;
}

std::optional<SignificanceTestResult> SignificanceTester::chiSquareFromTable(
    const std::vector<std::array<double, 2>>& table) {
    if (table.size() < 2) return std::nullopt;

    double total = 0.0;
    std::array<double, 2> colTotals{0.0, 0.0};
    std::vector<double> rowTotals;
    rowTotals.reserve(table.size());
    for (const auto& row : table) {
        rowTotals.push_back(row[0] + row[1]);
        colTotals[0] += row[0];
        colTotals[1] += row[1];
        total += row[0] + row[1];
    }
    if (total <= 0.0) return std::nullopt;

    double statistic = 0.0;
    for (size_t r = 0; r < table.size(); ++r) {
        for (size_t c = 0; c < 2; ++c) {
            const double expected = rowTotals[r] * colTotals[c] / total;
            if (expected <= 0.0) continue;
            const double diff = table[r][c] - expected;
            statistic += diff * diff / expected;
        }
    }

    SignificanceTestResult out;
    out.statistic = statistic;
    out.degreesOfFreedom = static_cast<double>(table.size() - 1);
    out.pValue = chiSquarePValue(statistic, *out.degreesOfFreedom);
    out.significant = *out.pValue < kAlpha;
    return out;
}

std::optional<SignificanceTestResult> SignificanceTester::chiSquare(
    const std::vector<std::vector<double>>& groupSamples) {
    std::vector<std::array<double, 2>> table;
    for (const auto& samples : groupSamples) {
        if (samples.empty()) continue;
        const auto positives = std::count_if(samples.begin(), samples.end(),
                                             [](double v) { return v > FairnessConfig::kPositiveThreshold; });
        table.push_back({static_cast<double>(positives), static_cast<double>(samples.size()) - static_cast<double>(positives)});
    }
    return chiSquareFromTable(table);
}

std::optional<SignificanceTestResult> SignificanceTester::tTest(const std::vector<double>& a,
                                                                const std::vector<double>& b) {
    if (a.size() < 2 || b.size() < 2) return std::nullopt;

    const ColumnStats sa = Statistics::calculateStats(a);
    const ColumnStats sb = Statistics::calculateStats(b);
    const double na = static_cast<double>(a.size());
    const double nb = static_cast<double>(b.size());
    const double va = sa.variance / na;
    const double vb = sb.variance / nb;
    const double se = std::sqrt(va + vb);
    if (se <= 0.0) return std::nullopt;

    SignificanceTestResult out;
    out.statistic = (sa.mean - sb.mean) / se;
    const double denom = (va * va) / (na - 1.0) + (vb * vb) / (nb - 1.0);
    if (denom > 0.0) out.degreesOfFreedom = (va + vb) * (va + vb) / denom;
    out.pValue = Statistics::normalTail2Sided(std::abs(out.statistic));
    out.significant = std::abs(out.statistic) > kTCritical;
    return out;
}

std::optional<SignificanceTestResult> SignificanceTester::ksTest(const std::vector<double>& a,
                                                                 const std::vector<double>& b) {
    if (a.size() < kKsMinSamples || b.size() < kKsMinSamples) return std::nullopt;

    std::vector<double> sa = a;
    std::vector<double> sb = b;
    std::sort(sa.begin(), sa.end());
    std::sort(sb.begin(), sb.end());

    double maxDiff = 0.0;
    auto scan = [&](const std::vector<double>& points) {
        for (double v : points) {
            maxDiff = std::max(maxDiff, std::abs(Statistics::empiricalCdf(sa, v) - Statistics::empiricalCdf(sb, v)));
        }
    };
    scan(sa);
    scan(sb);

    SignificanceTestResult out;
    out.statistic = maxDiff;
    out.significant = maxDiff > kKsThreshold;
    return out;
}

StatisticalTests SignificanceTester::run(const Dataset& data, const GroupAnalysis& analysis, const std::string& target) {
    StatisticalTests tests;
    const int targetIdx = data.findColumnIndex(target);
    if (targetIdx < 0) return tests;

    std::vector<std::vector<double>> samples;
    samples.reserve(analysis.groups.size());
    for (const auto& group : analysis.groups) {
        samples.push_back(GroupAggregator::numericValues(data, group.members, targetIdx));
    }

    tests.chiSquare = chiSquare(samples);
    if (samples.size() == 2) {
        tests.tTest = tTest(samples[0], samples[1]);
        tests.ksTest = ksTest(samples[0], samples[1]);
    }
    return tests;
}
