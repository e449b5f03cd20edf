#include "custom_aggregate.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"

#include <stdexcept>
#include <utility>

namespace stats {

CustomAggregate::CustomAggregate(std::string name, double identity,
                                 StepFn step, CombineFn combine)
    : name_(std::move(name)), identity_(identity), accumulator_(identity),
      step_(std::move(step)), combine_(std::move(combine)) {
  if (!step_ || !combine_) {
    throw std::invalid_argument("CustomAggregate '" + name_ +
                                "' needs both a step and a combine function");
  }
}

CustomAggregate CustomAggregate::sum() {
  return CustomAggregate(
      "sum", 0.0, [](double acc, double value) { return acc + value; },
      [](double lhs, double rhs) { return lhs + rhs; });
}

double CustomAggregate::update(double value) {
  accumulator_ = step_(accumulator_, value);
  count_++;
  return accumulator_;
}

void CustomAggregate::merge(const CustomAggregate &other) {
  if (other.name_ != name_) {
    LOG(LogLevel::ERROR, LogComponent::STATS_AGGREGATE,
        "Refusing to merge custom aggregate '" << other.name_ << "' into '"
                                               << name_ << "'");
    throw std::invalid_argument("cannot merge custom aggregate '" +
                                other.name_ + "' into '" + name_ + "'");
  }
  accumulator_ = combine_(accumulator_, other.accumulator_);
  count_ += other.count_;
}

double CustomAggregate::value() const {
  if (count_ == 0)
    throw EmptyAggregateError(name_);
  return accumulator_;
}

void CustomAggregate::reset() {
  accumulator_ = identity_;
  count_ = 0;
}

} // namespace stats
