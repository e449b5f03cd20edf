#include "stream_driver.hpp"
#include "core/logger.hpp"
#include "core/metrics_registry.hpp"

#include <cmath>
#include <stdexcept>
#include <thread>
#include <utility>

namespace stream {

StreamDriver::StreamDriver(const std::atomic<bool> *stop_flag)
    : stop_flag_(stop_flag) {}

void StreamDriver::add_aggregate(const std::string &name,
                                 stats::IAggregate &aggregate) {
  for (const auto &registered : aggregates_) {
    if (registered.name == name)
      throw std::invalid_argument("aggregate '" + name +
                                  "' is already registered");
  }
  aggregates_.push_back({name, &aggregate, std::nullopt});
  LOG(LogLevel::DEBUG, LogComponent::STREAM_DRIVER,
      "Registered " << stats::aggregate_kind_to_string(aggregate.kind())
                    << " aggregate '" << name << "'");
}

void StreamDriver::set_observer(Observer observer) {
  observer_ = std::move(observer);
}

void StreamDriver::push(double value) {
  if (std::isnan(value))
    throw std::invalid_argument("cannot stream NaN");

  for (auto &registered : aggregates_)
    registered.latest = registered.aggregate->update(value);
  values_processed_++;

  if (observer_) {
    for (const auto &registered : aggregates_)
      observer_(registered.name, *registered.latest, values_processed_);
  }
}

uint64_t StreamDriver::run(IValueSource &source, uint64_t max_values) {
  static prometheus::Counter &values_counter =
      MetricsRegistry::instance().create_counter(
          "ss_driver_values_processed_total",
          "Values applied to aggregates by stream drivers.");

  if (aggregates_.empty())
    LOG(LogLevel::WARN, LogComponent::STREAM_DRIVER,
        "Driving '" << source.source_id()
                    << "' with no aggregates registered");

  uint64_t applied = 0;
  auto cap_reached = [&] { return max_values != 0 && applied >= max_values; };

  while (!stop_requested() && !cap_reached()) {
    std::vector<double> batch = source.get_next_batch();
    if (batch.empty()) {
      if (source.exhausted())
        break;
      std::this_thread::sleep_for(IDLE_WAIT);
      continue;
    }

    uint64_t applied_in_batch = 0;
    for (double value : batch) {
      if (stop_requested() || cap_reached())
        break;
      push(value);
      applied++;
      applied_in_batch++;
    }
    values_counter.Increment(static_cast<double>(applied_in_batch));
  }

  LOG(LogLevel::DEBUG, LogComponent::STREAM_DRIVER,
      "Applied " << applied << " values from '" << source.source_id() << "'"
                 << (stop_requested() ? " before a stop request" : ""));
  return applied;
}

std::optional<double> StreamDriver::latest(const std::string &name) const {
  for (const auto &registered : aggregates_) {
    if (registered.name == name)
      return registered.latest;
  }
  throw std::invalid_argument("no aggregate named '" + name + "'");
}

bool StreamDriver::stop_requested() const {
  return stop_flag_ != nullptr && stop_flag_->load();
}

} // namespace stream
