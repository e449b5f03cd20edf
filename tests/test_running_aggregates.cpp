#include "core/errors.hpp"
#include "stats/custom_aggregate.hpp"
#include "stats/running_extremum.hpp"
#include "stats/running_mean.hpp"
#include "stats/running_variance.hpp"

#include <algorithm>
#include <cmath>
#include <gtest/gtest.h>
#include <numeric>
#include <random>
#include <stdexcept>
#include <vector>

using namespace stats;

namespace {

constexpr double TOLERANCE = 1e-9;

template <typename Agg> Agg aggregate_over(const std::vector<double> &values) {
    Agg aggregate;
    for (double v : values)
        aggregate.update(v);
    return aggregate;
}

double batch_mean(const std::vector<double> &values) {
    return std::accumulate(values.begin(), values.end(), 0.0) /
           static_cast<double>(values.size());
}

// Two-pass population variance
double batch_variance(const std::vector<double> &values) {
    double mean = batch_mean(values);
    double squared = 0.0;
    for (double v : values)
        squared += (v - mean) * (v - mean);
    return squared / static_cast<double>(values.size());
}

std::vector<double> random_values(size_t n, unsigned seed) {
    std::mt19937 gen(seed);
    std::normal_distribution<> dist(250.0, 40.0);
    std::vector<double> values(n);
    for (auto &v : values)
        v = dist(gen);
    return values;
}

} // namespace

TEST(RunningMeanTest, ZeroToFour) {
    RunningMean mean = aggregate_over<RunningMean>({0, 1, 2, 3, 4});
    EXPECT_EQ(mean.count(), 5u);
    EXPECT_DOUBLE_EQ(mean.mean(), 2.0);
    EXPECT_DOUBLE_EQ(mean.sum(), 10.0);
}

TEST(RunningMeanTest, UpdateReturnsCurrentMean) {
    RunningMean mean;
    EXPECT_DOUBLE_EQ(mean.update(4.0), 4.0);
    EXPECT_DOUBLE_EQ(mean.update(8.0), 6.0);
    EXPECT_DOUBLE_EQ(mean.update(0.0), 4.0);
}

TEST(RunningMeanTest, MatchesBatchMean) {
    auto values = random_values(10000, 7);
    RunningMean mean = aggregate_over<RunningMean>(values);
    EXPECT_NEAR(mean.mean(), batch_mean(values), TOLERANCE);
}

TEST(RunningMeanTest, EmptyThrows) {
    RunningMean mean;
    EXPECT_TRUE(mean.empty());
    EXPECT_THROW(mean.mean(), EmptyAggregateError);
    EXPECT_THROW(mean.value(), EmptyAggregateError);
}

TEST(RunningVarianceTest, ZeroToFour) {
    RunningVariance variance = aggregate_over<RunningVariance>({0, 1, 2, 3, 4});
    EXPECT_DOUBLE_EQ(variance.mean(), 2.0);
    EXPECT_DOUBLE_EQ(variance.variance(), 2.0);
    EXPECT_NEAR(variance.stddev(), std::sqrt(2.0), TOLERANCE);
    EXPECT_DOUBLE_EQ(variance.sample_variance(), 2.5);
}

TEST(RunningVarianceTest, SingleValueHasZeroVariance) {
    RunningVariance variance;
    EXPECT_DOUBLE_EQ(variance.update(42.0), 0.0);
    EXPECT_THROW(variance.sample_variance(), StatsError);
}

TEST(RunningVarianceTest, ConstantStreamNeverGoesNegative) {
    RunningVariance variance;
    for (int i = 0; i < 1000; ++i)
        EXPECT_GE(variance.update(0.1), 0.0);
    EXPECT_NEAR(variance.variance(), 0.0, TOLERANCE);
}

TEST(RunningVarianceTest, MatchesTwoPassVariance) {
    auto values = random_values(10000, 11);
    RunningVariance variance = aggregate_over<RunningVariance>(values);
    EXPECT_NEAR(variance.variance(), batch_variance(values), 1e-6);
}

TEST(RunningVarianceTest, EmptyThrows) {
    RunningVariance variance;
    EXPECT_THROW(variance.variance(), EmptyAggregateError);
    EXPECT_THROW(variance.mean(), EmptyAggregateError);
}

TEST(RunningVarianceTest, MergeOfHalvesEqualsWhole) {
    RunningVariance low = aggregate_over<RunningVariance>({0, 1, 2, 3, 4});
    RunningVariance high = aggregate_over<RunningVariance>({5, 6, 7, 8, 9});
    RunningVariance whole =
        aggregate_over<RunningVariance>({0, 1, 2, 3, 4, 5, 6, 7, 8, 9});

    RunningVariance merged = merge(low, high);
    EXPECT_EQ(merged.count(), whole.count());
    EXPECT_NEAR(merged.mean(), whole.mean(), TOLERANCE);
    EXPECT_NEAR(merged.variance(), whole.variance(), TOLERANCE);
    EXPECT_DOUBLE_EQ(merged.variance(), 8.25);

    // The inputs are untouched
    EXPECT_EQ(low.count(), 5u);
    EXPECT_EQ(high.count(), 5u);
}

TEST(RunningVarianceTest, ArbitraryPartitioningsMatchWhole) {
    auto values = random_values(5000, 3);
    RunningVariance whole = aggregate_over<RunningVariance>(values);

    std::mt19937 gen(5);
    for (int trial = 0; trial < 20; ++trial) {
        std::uniform_int_distribution<size_t> parts_dist(1, 12);
        size_t parts = parts_dist(gen);

        std::vector<size_t> cuts = {0, values.size()};
        std::uniform_int_distribution<size_t> cut_dist(0, values.size());
        for (size_t i = 1; i < parts; ++i)
            cuts.push_back(cut_dist(gen));
        std::sort(cuts.begin(), cuts.end());

        RunningVariance merged;
        for (size_t i = 0; i + 1 < cuts.size(); ++i) {
            RunningVariance part;
            for (size_t j = cuts[i]; j < cuts[i + 1]; ++j)
                part.update(values[j]);
            merged.merge(part);
        }

        EXPECT_EQ(merged.count(), whole.count());
        EXPECT_NEAR(merged.variance(), whole.variance(), 1e-6);
        EXPECT_NEAR(merged.mean(), whole.mean(), TOLERANCE);
    }
}

TEST(RunningVarianceTest, MergeIsCommutativeAndAssociative) {
    auto a = aggregate_over<RunningVariance>(random_values(100, 21));
    auto b = aggregate_over<RunningVariance>(random_values(250, 22));
    auto c = aggregate_over<RunningVariance>(random_values(75, 23));

    auto ab = merge(a, b);
    auto ba = merge(b, a);
    EXPECT_EQ(ab.count(), ba.count());
    EXPECT_NEAR(ab.variance(), ba.variance(), 1e-6);

    auto left = merge(merge(a, b), c);
    auto right = merge(a, merge(b, c));
    EXPECT_EQ(left.count(), right.count());
    EXPECT_NEAR(left.mean(), right.mean(), TOLERANCE);
    EXPECT_NEAR(left.variance(), right.variance(), 1e-6);
}

TEST(RunningVarianceTest, EmptyIsMergeIdentity) {
    auto a = aggregate_over<RunningVariance>({1, 2, 3});
    auto merged = merge(a, RunningVariance());
    EXPECT_EQ(merged.count(), 3u);
    EXPECT_DOUBLE_EQ(merged.variance(), a.variance());

    auto reversed = merge(RunningVariance(), a);
    EXPECT_DOUBLE_EQ(reversed.variance(), a.variance());
}

TEST(RunningVarianceTest, FromFieldsRestoresState) {
    auto original = aggregate_over<RunningVariance>({0, 1, 2, 3, 4});
    auto restored = RunningVariance::from_fields(
        original.count(), original.sum(), original.sum_squares());
    EXPECT_DOUBLE_EQ(restored.variance(), 2.0);
    EXPECT_DOUBLE_EQ(restored.mean(), 2.0);
}

TEST(RunningMeanTest, MergeMatchesDirect) {
    auto merged = merge(aggregate_over<RunningMean>({0, 1, 2, 3, 4}),
                        aggregate_over<RunningMean>({5, 6, 7, 8, 9}));
    EXPECT_EQ(merged.count(), 10u);
    EXPECT_DOUBLE_EQ(merged.mean(), 4.5);
}

TEST(RunningExtremumTest, TracksMaxAndMin) {
    RunningMax max;
    RunningMin min;
    for (double v : {3.0, -1.0, 7.5, 2.0}) {
        max.update(v);
        min.update(v);
    }
    EXPECT_DOUBLE_EQ(max.value(), 7.5);
    EXPECT_DOUBLE_EQ(min.value(), -1.0);
    EXPECT_EQ(max.kind(), AggregateKind::MAX);
    EXPECT_EQ(min.kind(), AggregateKind::MIN);
}

TEST(RunningExtremumTest, UpdateReturnsCurrentExtreme) {
    RunningMax max;
    EXPECT_DOUBLE_EQ(max.update(-5.0), -5.0);
    EXPECT_DOUBLE_EQ(max.update(-7.0), -5.0);
    EXPECT_DOUBLE_EQ(max.update(1.0), 1.0);
}

TEST(RunningExtremumTest, MergeAndEmpty) {
    RunningMax empty;
    EXPECT_THROW(empty.value(), EmptyAggregateError);

    RunningMax a = aggregate_over<RunningMax>({1, 9});
    RunningMax b = aggregate_over<RunningMax>({4, 12});
    EXPECT_DOUBLE_EQ(merge(a, b).value(), 12.0);
    EXPECT_DOUBLE_EQ(merge(b, a).value(), 12.0);
    EXPECT_EQ(merge(a, b).count(), 4u);

    // Merging an empty side keeps the other extreme
    EXPECT_DOUBLE_EQ(merge(empty, a).value(), 9.0);
    EXPECT_DOUBLE_EQ(merge(a, empty).value(), 9.0);
}

TEST(CustomAggregateTest, SumOverStreamAndMerge) {
    CustomAggregate left = CustomAggregate::sum();
    CustomAggregate right = CustomAggregate::sum();
    for (double v : {1.0, 2.0, 3.0})
        left.update(v);
    for (double v : {10.0, 20.0})
        right.update(v);

    EXPECT_DOUBLE_EQ(left.value(), 6.0);
    left.merge(right);
    EXPECT_DOUBLE_EQ(left.value(), 36.0);
    EXPECT_EQ(left.count(), 5u);
}

TEST(CustomAggregateTest, ProductWithCallerMonoid) {
    CustomAggregate product(
        "product", 1.0, [](double acc, double v) { return acc * v; },
        [](double lhs, double rhs) { return lhs * rhs; });
    EXPECT_THROW(product.value(), EmptyAggregateError);
    product.update(2.0);
    EXPECT_DOUBLE_EQ(product.update(3.0), 6.0);
    product.reset();
    EXPECT_TRUE(product.empty());
}

TEST(CustomAggregateTest, RejectsMismatchedMerge) {
    CustomAggregate sum = CustomAggregate::sum();
    CustomAggregate product(
        "product", 1.0, [](double acc, double v) { return acc * v; },
        [](double lhs, double rhs) { return lhs * rhs; });
    EXPECT_THROW(sum.merge(product), std::invalid_argument);
    EXPECT_THROW(CustomAggregate("broken", 0.0, nullptr, nullptr),
                 std::invalid_argument);
}
