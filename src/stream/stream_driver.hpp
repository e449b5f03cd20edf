#ifndef STREAM_DRIVER_HPP
#define STREAM_DRIVER_HPP

#include "io/value_sources/base_value_source.hpp"
#include "stats/aggregate.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace stream {

/**
 * Feeds values, one at a time, to every registered aggregate in registration
 * order. Aggregates are borrowed: the caller keeps them alive for as long as
 * the driver is used.
 */
class StreamDriver {
public:
  // Called after every aggregate has seen a value, once per aggregate
  using Observer = std::function<void(const std::string &aggregate_name,
                                      double latest_value, uint64_t position)>;

  /**
   * @param stop_flag Polled before every value; nullptr means the driver can
   * only stop at the end of the source
   */
  explicit StreamDriver(const std::atomic<bool> *stop_flag = nullptr);

  /**
   * @throws std::invalid_argument when `name` is already registered
   */
  void add_aggregate(const std::string &name, stats::IAggregate &aggregate);

  void set_observer(Observer observer);

  /**
   * Apply one value to every aggregate
   * @throws std::invalid_argument for NaN, before any aggregate is touched
   */
  void push(double value);

  /**
   * Pull from `source` until it is exhausted, `max_values` values have been
   * applied (0 for no cap), or a stop is requested. Values fetched past the
   * cap or the stop are dropped with the rest of their batch.
   * @return Number of values applied by this call
   */
  uint64_t run(IValueSource &source, uint64_t max_values = 0);

  /**
   * Last value returned by the aggregate's update, nullopt before the first
   * @throws std::invalid_argument for a name that was never registered
   */
  std::optional<double> latest(const std::string &name) const;

  uint64_t values_processed() const { return values_processed_; }
  size_t aggregate_count() const { return aggregates_.size(); }
  bool stop_requested() const;

private:
  struct RegisteredAggregate {
    std::string name;
    stats::IAggregate *aggregate;
    std::optional<double> latest;
  };

  const std::atomic<bool> *stop_flag_;
  std::vector<RegisteredAggregate> aggregates_;
  Observer observer_;
  uint64_t values_processed_ = 0;

  static constexpr std::chrono::milliseconds IDLE_WAIT{10};
};

} // namespace stream

#endif // STREAM_DRIVER_HPP
