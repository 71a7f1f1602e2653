#include <gtest/gtest.h>
#include "../src/analysis/statistics.hpp"
#include <cmath>
#include <limits>
#include <vector>

using namespace motor_design;

class StatisticsTest : public ::testing::Test {
protected:
    void SetUp() override {
        data_ = {2.0, 4.0, 4.0, 4.0, 5.0, 5.0, 7.0, 9.0};
    }

    std::vector<double> data_;
};

TEST_F(StatisticsTest, MeanAndSampleVariance) {
    RunningStats stats;
    for (double x : data_) stats.push(x);

    EXPECT_EQ(stats.count(), 8u);
    EXPECT_DOUBLE_EQ(stats.mean(), 5.0);
    EXPECT_NEAR(stats.variance(), 32.0 / 7.0, 1e-12);
    EXPECT_DOUBLE_EQ(stats.min(), 2.0);
    EXPECT_DOUBLE_EQ(stats.max(), 9.0);
}

TEST_F(StatisticsTest, EmptyAndSingleObservation) {
    RunningStats stats;
    EXPECT_EQ(stats.count(), 0u);
    EXPECT_DOUBLE_EQ(stats.variance(), 0.0);
    EXPECT_DOUBLE_EQ(stats.min(), 0.0);

    stats.push(3.0);
    EXPECT_DOUBLE_EQ(stats.mean(), 3.0);
    EXPECT_DOUBLE_EQ(stats.variance(), 0.0);
}

TEST_F(StatisticsTest, NonFiniteValuesIgnored) {
    OutputSeries series;
    series.push(1.0);
    series.push(std::numeric_limits<double>::quiet_NaN());
    series.push(std::numeric_limits<double>::infinity());
    series.push(3.0);

    EXPECT_EQ(series.count(), 2u);
    EXPECT_DOUBLE_EQ(series.summarize().mean, 2.0);
}

TEST_F(StatisticsTest, MergeMatchesSinglePass) {
    RunningStats whole;
    RunningStats left;
    RunningStats right;
    for (size_t i = 0; i < data_.size(); ++i) {
        whole.push(data_[i]);
        (i < 3 ? left : right).push(data_[i]);
    }
    left.merge(right);

    EXPECT_EQ(left.count(), whole.count());
    EXPECT_NEAR(left.mean(), whole.mean(), 1e-12);
    EXPECT_NEAR(left.variance(), whole.variance(), 1e-12);
    EXPECT_DOUBLE_EQ(left.min(), whole.min());
    EXPECT_DOUBLE_EQ(left.max(), whole.max());

    RunningStats empty;
    empty.merge(whole);
    EXPECT_NEAR(empty.variance(), whole.variance(), 1e-12);
}

TEST_F(StatisticsTest, PercentileInterpolation) {
    std::vector<double> sorted = {10.0, 20.0, 30.0, 40.0, 50.0};
    EXPECT_DOUBLE_EQ(percentile(sorted, 0.0), 10.0);
    EXPECT_DOUBLE_EQ(percentile(sorted, 1.0), 50.0);
    EXPECT_DOUBLE_EQ(percentile(sorted, 0.5), 30.0);
    EXPECT_NEAR(percentile(sorted, 0.05), 12.0, 1e-12);
    EXPECT_NEAR(percentile(sorted, 0.95), 48.0, 1e-12);
    EXPECT_DOUBLE_EQ(percentile({}, 0.5), 0.0);
    EXPECT_DOUBLE_EQ(percentile({7.0}, 0.95), 7.0);
}

TEST_F(StatisticsTest, SeriesSummary) {
    OutputSeries first;
    OutputSeries second;
    for (size_t i = 0; i < data_.size(); ++i) {
        (i % 2 == 0 ? first : second).push(data_[i]);
    }
    first.merge(second);

    OutputStatistics summary = first.summarize();
    EXPECT_EQ(summary.count, 8u);
    EXPECT_NEAR(summary.mean, 5.0, 1e-12);
    EXPECT_NEAR(summary.std_dev, std::sqrt(32.0 / 7.0), 1e-12);
    EXPECT_NEAR(summary.coefficient_of_variation, std::sqrt(32.0 / 7.0) / 5.0, 1e-12);
    EXPECT_NEAR(summary.p05, 2.0 + 0.35 * 2.0, 1e-12);
    EXPECT_NEAR(summary.p95, 7.0 + 0.65 * 2.0, 1e-12);
}
