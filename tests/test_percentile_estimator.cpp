#include "core/errors.hpp"
#include "stats/percentile_estimator.hpp"
#include "stats/percentile_tracker.hpp"

#include <cmath>
#include <gtest/gtest.h>
#include <limits>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

using namespace stats;

namespace {

PercentileEstimator<double> estimator_over(const std::vector<double> &values) {
    PercentileEstimator<double> estimator;
    for (double v : values)
        estimator.update(v);
    return estimator;
}

const std::vector<double> SAMPLE = {1, 2, 2, 3, 4, 4, 4, 5};

} // namespace

TEST(PercentileEstimatorTest, MedianOfSample) {
    auto estimator = estimator_over(SAMPLE);
    EXPECT_DOUBLE_EQ(estimator.query(50), 3.0);
    EXPECT_DOUBLE_EQ(estimator.median(), 3.0);
}

TEST(PercentileEstimatorTest, FirstValueReachingPercentile) {
    auto estimator = estimator_over(SAMPLE);
    EXPECT_DOUBLE_EQ(estimator.query(12.5), 1.0);
    EXPECT_DOUBLE_EQ(estimator.query(13), 2.0);
    EXPECT_DOUBLE_EQ(estimator.query(25), 2.0);
    EXPECT_DOUBLE_EQ(estimator.query(87.5), 4.0);
    EXPECT_DOUBLE_EQ(estimator.query(90), 5.0);
}

TEST(PercentileEstimatorTest, BoundsAreMinAndMax) {
    auto estimator = estimator_over(SAMPLE);
    EXPECT_DOUBLE_EQ(estimator.query(0), estimator.min());
    EXPECT_DOUBLE_EQ(estimator.query(100), estimator.max());
    EXPECT_DOUBLE_EQ(estimator.min(), 1.0);
    EXPECT_DOUBLE_EQ(estimator.max(), 5.0);
}

TEST(PercentileEstimatorTest, HundredIsExactForAwkwardTotals) {
    // 1/3 style fractions must not leave the top value unreachable
    PercentileEstimator<double> estimator;
    for (int i = 0; i < 3; ++i)
        estimator.update(0.1 * i);
    for (int n = 0; n < 50; ++n) {
        estimator.update(0.5);
        EXPECT_DOUBLE_EQ(estimator.query(100), 0.5);
    }
}

TEST(PercentileEstimatorTest, CountsOccurrences) {
    auto estimator = estimator_over(SAMPLE);
    EXPECT_EQ(estimator.total_count(), 8u);
    EXPECT_EQ(estimator.distinct_count(), 5u);
    EXPECT_EQ(estimator.occurrences(4.0), 3u);
    EXPECT_EQ(estimator.occurrences(6.0), 0u);
    EXPECT_EQ(estimator.index().size(), estimator.table().distinct_count());
}

TEST(PercentileEstimatorTest, WeightedUpdate) {
    PercentileEstimator<double> estimator;
    estimator.update(10.0, 9);
    estimator.update(20.0, 1);
    estimator.update(30.0, 0);
    EXPECT_EQ(estimator.total_count(), 10u);
    EXPECT_EQ(estimator.distinct_count(), 2u);
    EXPECT_DOUBLE_EQ(estimator.query(90), 10.0);
    EXPECT_DOUBLE_EQ(estimator.query(91), 20.0);
}

TEST(PercentileEstimatorTest, InvalidPercentile) {
    auto estimator = estimator_over(SAMPLE);
    EXPECT_THROW(estimator.query(-0.1), InvalidPercentileError);
    EXPECT_THROW(estimator.query(100.5), InvalidPercentileError);
    EXPECT_THROW(estimator.query(std::nan("")), InvalidPercentileError);

    try {
        estimator.query(120);
        FAIL() << "expected InvalidPercentileError";
    } catch (const InvalidPercentileError &e) {
        EXPECT_DOUBLE_EQ(e.percentile(), 120.0);
    }
}

TEST(PercentileEstimatorTest, EmptyThrows) {
    PercentileEstimator<double> estimator;
    EXPECT_TRUE(estimator.empty());
    EXPECT_THROW(estimator.query(50), EmptyAggregateError);
    EXPECT_THROW(estimator.min(), EmptyAggregateError);
    EXPECT_THROW(estimator.max(), EmptyAggregateError);
    // The percentile is validated first
    EXPECT_THROW(estimator.query(200), InvalidPercentileError);
}

TEST(PercentileEstimatorTest, RejectsNaN) {
    PercentileEstimator<double> estimator;
    EXPECT_THROW(estimator.update(std::nan("")), std::invalid_argument);
    EXPECT_TRUE(estimator.empty());
}

TEST(PercentileEstimatorTest, MergeMatchesDirect) {
    auto left = estimator_over({1, 2, 2, 3});
    auto right = estimator_over({4, 4, 4, 5});
    auto direct = estimator_over(SAMPLE);

    left.merge(right);
    EXPECT_EQ(left.total_count(), direct.total_count());
    EXPECT_EQ(left.distinct_count(), direct.distinct_count());
    for (double p : {0.0, 10.0, 25.0, 50.0, 75.0, 90.0, 100.0})
        EXPECT_DOUBLE_EQ(left.query(p), direct.query(p)) << "p" << p;
}

TEST(PercentileEstimatorTest, MergeIsCommutative) {
    auto a = estimator_over({5, 1, 9, 9});
    auto b = estimator_over({3, 9, 2});
    auto ab = a;
    ab.merge(b);
    auto ba = b;
    ba.merge(a);
    for (double p : {0.0, 33.0, 50.0, 66.0, 100.0})
        EXPECT_DOUBLE_EQ(ab.query(p), ba.query(p));
}

TEST(PercentileEstimatorTest, WorksForOtherOrderedTypes) {
    PercentileEstimator<std::string> words;
    for (const char *w : {"pear", "apple", "fig", "apple", "kiwi"})
        words.update(w);
    EXPECT_EQ(words.query(0), "apple");
    EXPECT_EQ(words.query(40), "apple");
    EXPECT_EQ(words.query(60), "fig");
    EXPECT_EQ(words.query(100), "pear");
}

TEST(PercentileEstimatorTest, CustomComparatorReversesOrder) {
    PercentileEstimator<int, std::hash<int>, std::greater<int>> descending;
    for (int v : {1, 2, 3, 4})
        descending.update(v);
    EXPECT_EQ(descending.query(0), 4);
    EXPECT_EQ(descending.query(100), 1);
}

TEST(PercentileTrackerTest, RejectsInvalidPercentile) {
    EXPECT_THROW(PercentileTracker(120), InvalidPercentileError);
    EXPECT_THROW(PercentileTracker(-1), InvalidPercentileError);
    EXPECT_NO_THROW(PercentileTracker(0));
    EXPECT_NO_THROW(PercentileTracker(100));
}

TEST(PercentileTrackerTest, MedianOfSample) {
    PercentileTracker tracker(50);
    EXPECT_THROW(tracker.value(), EmptyAggregateError);
    double last = 0.0;
    for (double v : SAMPLE)
        last = tracker.update(v);
    EXPECT_DOUBLE_EQ(last, 3.0);
    EXPECT_DOUBLE_EQ(tracker.value(), 3.0);
    EXPECT_EQ(tracker.count(), 8u);
    EXPECT_EQ(tracker.kind(), AggregateKind::PERCENTILE);
}

TEST(PercentileTrackerTest, AgreesWithQueryAfterEveryUpdate) {
    std::mt19937 gen(1234);
    std::uniform_int_distribution<int> dist(0, 40);

    for (double p : {0.0, 1.0, 25.0, 50.0, 90.0, 99.0, 100.0}) {
        PercentileTracker tracker(p);
        for (int i = 0; i < 2000; ++i) {
            double returned = tracker.update(dist(gen) * 0.5);
            ASSERT_DOUBLE_EQ(returned, tracker.estimator().query(p))
                << "p" << p << " after " << i + 1 << " updates";
        }
    }
}

TEST(PercentileTrackerTest, AgreesOnMonotoneStreams) {
    PercentileTracker rising(75);
    PercentileTracker falling(75);
    for (int i = 0; i < 500; ++i) {
        ASSERT_DOUBLE_EQ(rising.update(i), rising.estimator().query(75));
        ASSERT_DOUBLE_EQ(falling.update(-i), falling.estimator().query(75));
    }
}

TEST(PercentileTrackerTest, CopiesTrackIndependently) {
    PercentileTracker original(50);
    for (double v : {1.0, 2.0, 3.0})
        original.update(v);

    PercentileTracker copy = original;
    copy.update(10.0);
    copy.update(11.0);
    original.update(0.0);

    EXPECT_DOUBLE_EQ(copy.value(), copy.estimator().query(50));
    EXPECT_DOUBLE_EQ(original.value(), original.estimator().query(50));
    EXPECT_DOUBLE_EQ(copy.value(), 3.0);
    EXPECT_DOUBLE_EQ(original.value(), 1.0);
}

TEST(PercentileTrackerTest, MergeRepositionsCursor) {
    PercentileTracker low(50);
    PercentileTracker high(50);
    for (double v : {1.0, 2.0, 2.0, 3.0})
        low.update(v);
    for (double v : {4.0, 4.0, 4.0, 5.0})
        high.update(v);

    low.merge(high);
    EXPECT_DOUBLE_EQ(low.value(), 3.0);
    EXPECT_EQ(low.count(), 8u);

    // Keeps tracking correctly after the merge
    EXPECT_DOUBLE_EQ(low.update(5.0), low.estimator().query(50));
    EXPECT_DOUBLE_EQ(low.update(5.0), low.estimator().query(50));

    PercentileTracker p90(90);
    EXPECT_THROW(low.merge(p90), std::invalid_argument);
}

TEST(PercentileTrackerTest, MergeIntoEmpty) {
    PercentileTracker empty(100);
    PercentileTracker full(100);
    for (double v : {7.0, 3.0, 9.0})
        full.update(v);
    empty.merge(full);
    EXPECT_DOUBLE_EQ(empty.value(), 9.0);
}
