#pragma once

#include "../physics/types.hpp"
#include <cstddef>
#include <limits>
#include <vector>

namespace motor_design {

/**
 * @brief Single-pass mean/variance accumulator (Welford)
 *
 * Two accumulators over disjoint samples merge exactly (Chan et al.), which
 * lets every Monte Carlo worker keep its own partial.
 */
class RunningStats {
public:
    RunningStats() = default;

    /**
     * @brief Add one observation; non-finite values are ignored
     */
    void push(double value);

    /**
     * @brief Fold another accumulator into this one
     * @param other Accumulator over a disjoint set of observations
     */
    void merge(const RunningStats& other);

    size_t count() const { return count_; }
    double mean() const { return mean_; }

    /**
     * @brief Sample variance (n - 1 denominator), zero below two observations
     */
    double variance() const;
    double stdDev() const;
    double min() const { return count_ ? min_ : 0.0; }
    double max() const { return count_ ? max_ : 0.0; }

private:
    size_t count_ = 0;
    double mean_ = 0.0;
    double m2_ = 0.0;
    double min_ = std::numeric_limits<double>::infinity();
    double max_ = -std::numeric_limits<double>::infinity();
};

/**
 * @brief Percentile of sorted data with linear interpolation between ranks
 * @param sorted Ascending values
 * @param fraction Percentile as a fraction in [0, 1]
 * @return Interpolated value, 0 for empty input
 */
double percentile(const std::vector<double>& sorted, double fraction);

/**
 * @brief Running statistics plus the raw values needed for percentiles
 */
class OutputSeries {
public:
    void push(double value);
    void merge(const OutputSeries& other);

    size_t count() const { return stats_.count(); }
    const RunningStats& stats() const { return stats_; }

    /**
     * @brief Summarize into mean, spread, extremes and 5th/95th percentiles
     */
    OutputStatistics summarize() const;

private:
    RunningStats stats_;
    std::vector<double> values_;
};

} // namespace motor_design
