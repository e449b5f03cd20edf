#include "running_variance.hpp"
#include "core/errors.hpp"

#include <cmath>

namespace stats {

RunningVariance RunningVariance::from_fields(uint64_t count, double sum,
                                             double sum_squares) {
  RunningVariance variance;
  variance.count_ = count;
  variance.sum_ = CompensatedSum(sum);
  variance.sum_squares_ = CompensatedSum(sum_squares);
  return variance;
}

double RunningVariance::update(double value) {
  count_++;
  sum_.add(value);
  sum_squares_.add(value * value);
  return variance_unchecked();
}

void RunningVariance::merge(const RunningVariance &other) {
  count_ += other.count_;
  sum_.merge(other.sum_);
  sum_squares_.merge(other.sum_squares_);
}

double RunningVariance::mean() const {
  if (count_ == 0)
    throw EmptyAggregateError("RunningVariance");
  return sum_.value() / static_cast<double>(count_);
}

double RunningVariance::variance() const {
  if (count_ == 0)
    throw EmptyAggregateError("RunningVariance");
  return variance_unchecked();
}

double RunningVariance::stddev() const { return std::sqrt(variance()); }

double RunningVariance::sample_variance() const {
  if (count_ < 2)
    throw StatsError(
        "sample variance needs at least two observations, have " +
        std::to_string(count_));
  double n = static_cast<double>(count_);
  return variance_unchecked() * n / (n - 1.0);
}

void RunningVariance::reset() {
  count_ = 0;
  sum_.reset();
  sum_squares_.reset();
}

// (sum_squares - 2 * mean * sum + n * mean^2) / n
double RunningVariance::variance_unchecked() const {
  double n = static_cast<double>(count_);
  double sum = sum_.value();
  double mean = sum / n;
  double variance =
      (sum_squares_.value() - 2.0 * mean * sum + n * mean * mean) / n;

  if (variance < 0.0)
    variance = 0.0;
  return variance;
}

} // namespace stats
