#pragma once

#include <cstddef>
#include <optional>
#include <vector>

struct ColumnStats {
    size_t count = 0;
    double mean = 0.0;
    double median = 0.0;
    double variance = 0.0;
    double stddev = 0.0;
};

namespace Statistics {
/**
 * @brief Mean (Welford), median (average of the middle pair for even n) and
 *        sample variance with an n-1 denominator, 0 when fewer than two values.
 * @post Non-finite values are ignored; an empty input yields all zeros.
 */
ColumnStats calculateStats(const std::vector<double>& col);

// Fraction of values strictly above `threshold`; 0 for an empty input.
double positiveRate(const std::vector<double>& col, double threshold);

/**
 * @brief Pearson correlation of paired samples.
 * @return std::nullopt when sizes differ, fewer than two pairs, or either side has zero variance.
 */
std::optional<double> pearson(const std::vector<double>& x, const std::vector<double>& y);

// Two-sided standard normal tail probability P(|Z| > zAbs).
double normalTail2Sided(double zAbs);

// Empirical CDF: fraction of `sorted` values <= v.
double empiricalCdf(const std::vector<double>& sorted, double v);

double meanOf(const std::vector<double>& values);
}
