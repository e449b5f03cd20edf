#ifndef RUNNING_VARIANCE_HPP
#define RUNNING_VARIANCE_HPP

#include "aggregate.hpp"
#include "compensated_sum.hpp"

#include <cstdint>

namespace stats {

/**
 * Population variance over a stream, kept as the sufficient statistics
 * {count, sum, sum_squares}. Merge adds the three fields, so the type is a
 * monoid whose identity is the default constructed instance.
 *
 * Both sums are accumulated with compensated summation. The variance is still
 * derived from raw moments, so very large means relative to the spread lose
 * precision against a two-pass batch computation; results are compared at a
 * tolerance, and a variance that rounds below zero is reported as zero.
 */
class RunningVariance : public IAggregate {
public:
  RunningVariance() = default;

  static RunningVariance from_fields(uint64_t count, double sum,
                                     double sum_squares);

  /**
   * Add a value
   * @return The population variance including `value`
   */
  double update(double value) override;

  void merge(const RunningVariance &other);

  double value() const override { return variance(); }
  double mean() const;
  double variance() const;
  double stddev() const;

  /**
   * Unbiased (n - 1) estimator
   * @throws StatsError with fewer than two observations
   */
  double sample_variance() const;

  double sum() const { return sum_.value(); }
  double sum_squares() const { return sum_squares_.value(); }
  uint64_t count() const override { return count_; }
  AggregateKind kind() const override { return AggregateKind::VARIANCE; }

  void reset();

private:
  double variance_unchecked() const;

  uint64_t count_ = 0;
  CompensatedSum sum_;
  CompensatedSum sum_squares_;
};

} // namespace stats

#endif // RUNNING_VARIANCE_HPP
