#ifndef RUNNING_EXTREMUM_HPP
#define RUNNING_EXTREMUM_HPP

#include "aggregate.hpp"
#include "core/errors.hpp"

#include <cstdint>
#include <functional>

namespace stats {

// Largest (Better = std::greater) or smallest (std::less) value seen so far.
// Merge keeps the better of the two extremes and adds the counts.
template <AggregateKind Kind, typename Better>
class RunningExtremum : public IAggregate {
public:
  RunningExtremum() = default;

  static RunningExtremum from_fields(uint64_t count, double extreme) {
    RunningExtremum extremum;
    extremum.count_ = count;
    extremum.extreme_ = extreme;
    return extremum;
  }

  double update(double value) override {
    if (count_ == 0 || Better()(value, extreme_))
      extreme_ = value;
    count_++;
    return extreme_;
  }

  void merge(const RunningExtremum &other) {
    if (other.count_ == 0)
      return;
    if (count_ == 0 || Better()(other.extreme_, extreme_))
      extreme_ = other.extreme_;
    count_ += other.count_;
  }

  double value() const override {
    if (count_ == 0)
      throw EmptyAggregateError(aggregate_kind_to_string(Kind));
    return extreme_;
  }

  uint64_t count() const override { return count_; }
  AggregateKind kind() const override { return Kind; }

  void reset() {
    count_ = 0;
    extreme_ = 0.0;
  }

private:
  uint64_t count_ = 0;
  double extreme_ = 0.0;
};

using RunningMax = RunningExtremum<AggregateKind::MAX, std::greater<double>>;
using RunningMin = RunningExtremum<AggregateKind::MIN, std::less<double>>;

} // namespace stats

#endif // RUNNING_EXTREMUM_HPP
