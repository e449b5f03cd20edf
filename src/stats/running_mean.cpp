#include "running_mean.hpp"
#include "core/errors.hpp"

namespace stats {

RunningMean RunningMean::from_fields(uint64_t count, double sum) {
  RunningMean mean;
  mean.count_ = count;
  mean.sum_ = CompensatedSum(sum);
  return mean;
}

double RunningMean::update(double value) {
  count_++;
  sum_.add(value);
  return sum_.value() / static_cast<double>(count_);
}

void RunningMean::merge(const RunningMean &other) {
  count_ += other.count_;
  sum_.merge(other.sum_);
}

double RunningMean::mean() const {
  if (count_ == 0)
    throw EmptyAggregateError("RunningMean");
  return sum_.value() / static_cast<double>(count_);
}

void RunningMean::reset() {
  count_ = 0;
  sum_.reset();
}

} // namespace stats
