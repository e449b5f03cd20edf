#ifndef CUSTOM_AGGREGATE_HPP
#define CUSTOM_AGGREGATE_HPP

#include "aggregate.hpp"

#include <cstdint>
#include <functional>
#include <string>

namespace stats {

/**
 * Caller defined reducer over doubles. The caller supplies a monoid:
 * `identity`, a `step` that folds one value into the accumulator, and a
 * `combine` that joins two accumulators. `combine` must be associative with
 * `identity` as its neutral element for parallel reduction to be order
 * independent.
 */
class CustomAggregate : public IAggregate {
public:
  using StepFn = std::function<double(double accumulator, double value)>;
  using CombineFn = std::function<double(double lhs, double rhs)>;

  CustomAggregate(std::string name, double identity, StepFn step,
                  CombineFn combine);

  // Plain sum of the observations
  static CustomAggregate sum();

  double update(double value) override;

  /**
   * @throws std::invalid_argument when `other` was built for a different
   * reducer (names differ)
   */
  void merge(const CustomAggregate &other);

  double value() const override;
  uint64_t count() const override { return count_; }
  AggregateKind kind() const override { return AggregateKind::CUSTOM; }

  const std::string &name() const { return name_; }
  void reset();

private:
  std::string name_;
  double identity_;
  double accumulator_;
  StepFn step_;
  CombineFn combine_;
  uint64_t count_ = 0;
};

} // namespace stats

#endif // CUSTOM_AGGREGATE_HPP
