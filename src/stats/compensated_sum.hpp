#ifndef COMPENSATED_SUM_HPP
#define COMPENSATED_SUM_HPP

#include <cmath>

namespace stats {

// Neumaier summation: the rounding error lost by each addition is carried in
// a separate compensation term and added back when the value is read.
class CompensatedSum {
public:
  CompensatedSum() = default;
  explicit CompensatedSum(double initial) : sum_(initial) {}

  void add(double x) {
    double t = sum_ + x;
    if (std::fabs(sum_) >= std::fabs(x))
      compensation_ += (sum_ - t) + x;
    else
      compensation_ += (x - t) + sum_;
    sum_ = t;
  }

  void merge(const CompensatedSum &other) {
    add(other.sum_);
    compensation_ += other.compensation_;
  }

  double value() const { return sum_ + compensation_; }

  void reset() {
    sum_ = 0.0;
    compensation_ = 0.0;
  }

private:
  double sum_ = 0.0;
  double compensation_ = 0.0;
};

} // namespace stats

#endif // COMPENSATED_SUM_HPP
