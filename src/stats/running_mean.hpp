#ifndef RUNNING_MEAN_HPP
#define RUNNING_MEAN_HPP

#include "aggregate.hpp"
#include "compensated_sum.hpp"

#include <cstdint>

namespace stats {

/**
 * Arithmetic mean over a stream, kept as the sufficient statistics
 * {count, sum}. Two instances built over disjoint data merge exactly.
 */
class RunningMean : public IAggregate {
public:
  RunningMean() = default;

  // Rebuilds an instance from its sufficient statistics (e.g. a snapshot)
  static RunningMean from_fields(uint64_t count, double sum);

  /**
   * Add a value to the running mean
   * @return The mean including `value`
   */
  double update(double value) override;

  void merge(const RunningMean &other);

  double value() const override { return mean(); }
  double mean() const;
  double sum() const { return sum_.value(); }
  uint64_t count() const override { return count_; }
  AggregateKind kind() const override { return AggregateKind::MEAN; }

  void reset();

private:
  uint64_t count_ = 0;
  CompensatedSum sum_;
};

} // namespace stats

#endif // RUNNING_MEAN_HPP
