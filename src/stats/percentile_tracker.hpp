#ifndef PERCENTILE_TRACKER_HPP
#define PERCENTILE_TRACKER_HPP

#include "aggregate.hpp"
#include "percentile_estimator.hpp"

#include <cstdint>

namespace stats {

/**
 * Follows one fixed percentile of a stream so it can be driven like any other
 * aggregate. A cursor on the ordered index marks the current answer together
 * with the number of observations strictly below it. Each update nudges the
 * cursor by an amortized constant number of steps instead of re-walking the
 * index, so update() stays O(log k).
 */
class PercentileTracker : public IAggregate {
public:
  /**
   * @param percentile In [0, 100]
   * @throws InvalidPercentileError outside [0, 100]
   */
  explicit PercentileTracker(double percentile);

  double update(double value) override;

  // Same result as estimator().query(percentile())
  double value() const override;
  uint64_t count() const override { return estimator_.total_count(); }
  AggregateKind kind() const override { return AggregateKind::PERCENTILE; }

  /**
   * @throws std::invalid_argument when the trackers follow different
   * percentiles
   */
  void merge(const PercentileTracker &other);

  double percentile() const { return percentile_; }
  const PercentileEstimator<double> &estimator() const { return estimator_; }

private:
  using Cursor = OrderedValueIndex<double>::const_iterator;

  void settle(Cursor cursor);
  void reposition();

  double percentile_;
  PercentileEstimator<double> estimator_;
  // Current answer; the iterator is looked up again on every update so the
  // tracker stays trivially copyable along with its estimator
  double cursor_value_ = 0.0;
  uint64_t below_cursor_ = 0;
};

} // namespace stats

#endif // PERCENTILE_TRACKER_HPP
