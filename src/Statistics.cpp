#include "Statistics.h"

#include <algorithm>
#include <cmath>
#include <functional>
#include <numeric>

ColumnStats Statistics::calculateStats(const std::vector<double>& col) {
    ColumnStats stats;
    if (col.empty()) return stats;

    std::vector<double> finite;
    finite.reserve(col.size());
    for (double value : col) {
        if (std::isfinite(value)) {
            finite.push_back(value);
        }
    }
    if (finite.empty()) return stats;

    const size_t n = finite.size();
    stats.count = n;

    double mean = 0.0;
    double m2 = 0.0;
    size_t count = 0;
    for (double value : finite) {
        ++count;
        double delta = value - mean;
        mean += delta / static_cast<double>(count);
        double delta2 = value - mean;
        m2 += delta * delta2;
    }
    stats.mean = mean;
    stats.variance = (count > 1) ? (m2 / static_cast<double>(count - 1)) : 0.0;
    stats.stddev = std::sqrt(stats.variance);

    std::vector<double> medianWork = finite;
    size_t mid = n / 2;
    std::nth_element(medianWork.begin(), medianWork.begin() + mid, medianWork.end());
    double upper = medianWork[mid];
    if (n % 2 == 0) {
        // After nth_element the lower half holds everything <= upper; its max is the other middle value.
        double lower = *std::max_element(medianWork.begin(), medianWork.begin() + mid);
        stats.median = (lower + upper) / 2.0;
    } else {
        stats.median = upper;
    }

    return stats;
}

double Statistics::positiveRate(const std::vector<double>& col, double threshold) {
    if (col.empty()) return 0.0;
    const auto positives = std::count_if(col.begin(), col.end(), [threshold](double v) { return v > threshold; });
    return static_cast<double>(positives) / static_cast<double>(col.size());
}

std::optional<double> Statistics::pearson(const std::vector<double>& x, const std::vector<double>& y) {
    if (x.size() != y.size() || x.size() < 2) return std::nullopt;
    const ColumnStats statsX = calculateStats(x);
    const ColumnStats statsY = calculateStats(y);
    if (statsX.count != x.size() || statsY.count != y.size()) return std::nullopt;
    if (statsX.stddev == 0 || statsY.stddev == 0) return std::nullopt;

    const size_t n = x.size();
    double covarianceSum = std::inner_product(x.begin(), x.end(), y.begin(), 0.0,
        std::plus<>(),
        [&statsX, &statsY](double valX, double valY) {
            return (valX - statsX.mean) * (valY - statsY.mean);
        });

    double covariance = covarianceSum / static_cast<double>(n - 1);
    double r = covariance / (statsX.stddev * statsY.stddev);
    return std::clamp(r, -1.0, 1.0);
}

double Statistics::normalTail2Sided(double zAbs) {
    if (std::isnan(zAbs)) return 1.0;
    if (std::isinf(zAbs)) return 0.0;
    return std::erfc(std::abs(zAbs) / std::sqrt(2.0));
}

double Statistics::empiricalCdf(const std::vector<double>& sorted, double v) {
    if (sorted.empty()) return 0.0;
    const auto it = std::upper_bound(sorted.begin(), sorted.end(), v);
    return static_cast<double>(it - sorted.begin()) / static_cast<double>(sorted.size());
}

double Statistics::meanOf(const std::vector<double>& values) {
    if (values.empty()) return 0.0;
    return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
}
