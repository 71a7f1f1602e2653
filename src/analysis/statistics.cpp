#include "statistics.hpp"

#include <algorithm>
#include <cmath>

namespace motor_design {

void RunningStats::push(double value) {
    if (!std::isfinite(value)) return;

    ++count_;
    min_ = std::min(min_, value);
    max_ = std::max(max_, value);

    const double delta = value - mean_;
    mean_ += delta / static_cast<double>(count_);
    m2_ += delta * (value - mean_);
}

void RunningStats::merge(const RunningStats& other) {
    if (other.count_ == 0) return;
    if (count_ == 0) {
        *this = other;
        return;
    }

    const double n_a = static_cast<double>(count_);
    const double n_b = static_cast<double>(other.count_);
    const double n = n_a + n_b;
    const double delta = other.mean_ - mean_;

    mean_ += delta * n_b / n;
    m2_ += other.m2_ + delta * delta * n_a * n_b / n;
    count_ += other.count_;
    min_ = std::min(min_, other.min_);
    max_ = std::max(max_, other.max_);
}

double RunningStats::variance() const {
    if (count_ < 2) return 0.0;
    return std::max(0.0, m2_ / static_cast<double>(count_ - 1));
}

double RunningStats::stdDev() const {
    return std::sqrt(variance());
}

double percentile(const std::vector<double>& sorted, double fraction) {
    if (sorted.empty()) return 0.0;
    if (sorted.size() == 1) return sorted.front();

    const double position = std::clamp(fraction, 0.0, 1.0) * static_cast<double>(sorted.size() - 1);
    const size_t lower = static_cast<size_t>(std::floor(position));
    const size_t upper = std::min(lower + 1, sorted.size() - 1);
    const double weight = position - static_cast<double>(lower);
    return sorted[lower] + weight * (sorted[upper] - sorted[lower]);
}

void OutputSeries::push(double value) {
    if (!std::isfinite(value)) return;
    stats_.push(value);
    values_.push_back(value);
}

void OutputSeries::merge(const OutputSeries& other) {
    stats_.merge(other.stats_);
    values_.insert(values_.end(), other.values_.begin(), other.values_.end());
}

OutputStatistics OutputSeries::summarize() const {
    OutputStatistics summary;
    summary.count = stats_.count();
    if (summary.count == 0) return summary;

    summary.mean = stats_.mean();
    summary.std_dev = stats_.stdDev();
    summary.coefficient_of_variation = summary.mean != 0.0 ? summary.std_dev / std::abs(summary.mean) : 0.0;
    summary.min = stats_.min();
    summary.max = stats_.max();

    std::vector<double> sorted = values_;
    std::sort(sorted.begin(), sorted.end());
    summary.p05 = percentile(sorted, 0.05);
    summary.p95 = percentile(sorted, 0.95);
    return summary;
}

} // namespace motor_design
