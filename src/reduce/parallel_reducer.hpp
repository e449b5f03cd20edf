#ifndef PARALLEL_REDUCER_HPP
#define PARALLEL_REDUCER_HPP

#include "core/errors.hpp"
#include "core/logger.hpp"
#include "core/metrics_registry.hpp"
#include "partition.hpp"
#include "stats/aggregate.hpp"
#include "stream/stream_driver.hpp"
#include "utils/scoped_timer.hpp"

#include <atomic>
#include <cstddef>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>
#include <type_traits>
#include <utility>
#include <vector>

namespace reduce {

template <typename Agg> struct ReduceResult {
  // Empty when no partition succeeded
  std::optional<Agg> merged;
  size_t partitions_total = 0;
  size_t partitions_succeeded = 0;
  // In partition order
  std::vector<PartitionFailure> failures;
  bool cancelled = false;

  bool ok() const { return merged.has_value() && failures.empty(); }
};

/**
 * Map-reduce over independent partitions. Each partition gets its own
 * std::async task, its own aggregate from the factory and its own stream
 * driver; nothing mutable is shared between tasks except the stop flag. Once
 * every task has been joined, the successful partials are merged in partition
 * order on the calling thread, so the result does not depend on which task
 * finished first.
 */
template <typename Agg> class ParallelReducer {
  static_assert(std::is_base_of_v<stats::IAggregate, Agg>,
                "ParallelReducer needs a stats::IAggregate");

public:
  using Factory = std::function<Agg()>;

  explicit ParallelReducer(Factory factory = [] { return Agg(); })
      : factory_(std::move(factory)) {}

  // Stop the remaining partitions as soon as one of them fails
  void set_fail_fast(bool fail_fast) { fail_fast_ = fail_fast; }

  // Safe from any thread. Running partitions stop at their next value and are
  // reported as cancelled. A request made before run() starts is discarded.
  void request_stop() { stop_requested_ = true; }

  ReduceResult<Agg> run(const std::vector<PartitionSpec> &partitions) {
    stop_requested_ = false;

    LOG(LogLevel::INFO, LogComponent::REDUCER_MAP,
        "Reducing " << partitions.size() << " partitions"
                    << (fail_fast_ ? " (fail fast)" : ""));

    std::vector<std::future<PartitionOutcome>> futures;
    futures.reserve(partitions.size());
    std::vector<std::optional<PartitionOutcome>> launch_failures(
        partitions.size());

    for (size_t i = 0; i < partitions.size(); ++i) {
      try {
        futures.push_back(std::async(std::launch::async,
                                     &ParallelReducer::map_partition, this,
                                     std::cref(partitions[i])));
      } catch (const std::system_error &e) {
        futures.emplace_back();
        launch_failures[i] = internal_failure(partitions[i].id, e.what());
      }
    }

    std::vector<PartitionOutcome> outcomes;
    outcomes.reserve(partitions.size());
    for (size_t i = 0; i < futures.size(); ++i) {
      if (launch_failures[i]) {
        outcomes.push_back(std::move(*launch_failures[i]));
        continue;
      }
      try {
        outcomes.push_back(futures[i].get());
      } catch (const std::exception &e) {
        outcomes.push_back(internal_failure(partitions[i].id, e.what()));
      }
    }

    return fold(std::move(outcomes));
  }

private:
  struct PartitionOutcome {
    std::optional<Agg> aggregate;
    std::optional<PartitionFailure> failure;
  };

  static PartitionOutcome internal_failure(const std::string &id,
                                           const std::string &what) {
    PartitionOutcome outcome;
    outcome.failure = PartitionFailure{id, FailureKind::INTERNAL, what};
    return outcome;
  }

  PartitionOutcome map_partition(const PartitionSpec &partition) {
    static prometheus::Histogram &duration_histogram =
        MetricsRegistry::instance().create_histogram(
            "ss_reducer_partition_duration_seconds",
            "Time spent reading and aggregating one partition.",
            {0.001, 0.01, 0.1, 1.0, 10.0, 60.0});
    ScopedTimer timer(duration_histogram);

    PartitionOutcome outcome;
    try {
      if (stop_requested_) {
        outcome.failure = PartitionFailure{partition.id, FailureKind::CANCELLED,
                                           "stopped before start"};
        return outcome;
      }

      std::unique_ptr<IValueSource> source = partition.open();
      if (!source)
        throw std::runtime_error("partition produced no value source");

      Agg local = factory_();
      stream::StreamDriver driver(&stop_requested_);
      driver.add_aggregate(partition.id, local);
      const uint64_t applied = driver.run(*source);

      if (!source->exhausted()) {
        outcome.failure =
            PartitionFailure{partition.id, FailureKind::CANCELLED,
                             "stopped after " + std::to_string(applied) +
                                 " values"};
        return outcome;
      }

      LOG(LogLevel::DEBUG, LogComponent::REDUCER_MAP,
          "Partition '" << partition.id << "' aggregated " << applied
                        << " values");
      outcome.aggregate = std::move(local);
      return outcome;
    } catch (const ParseError &e) {
      outcome.failure = PartitionFailure{partition.id, FailureKind::PARSE,
                                         e.what(), e.line(),
                                         e.offending_value()};
    } catch (const PartitionReadError &e) {
      outcome.failure =
          PartitionFailure{partition.id, FailureKind::READ, e.what()};
    } catch (const std::exception &e) {
      outcome.failure =
          PartitionFailure{partition.id, FailureKind::INTERNAL, e.what()};
    }

    LOG(LogLevel::WARN, LogComponent::REDUCER_MAP,
        "Partition '" << partition.id << "' failed: "
                      << outcome.failure->message);
    if (fail_fast_)
      stop_requested_ = true;
    return outcome;
  }

  ReduceResult<Agg> fold(std::vector<PartitionOutcome> outcomes) {
    static prometheus::Counter &completed_counter =
        MetricsRegistry::instance().create_counter(
            "ss_reducer_partitions_completed_total",
            "Partitions that contributed to a merged result.");
    static prometheus::Counter &failed_counter =
        MetricsRegistry::instance().create_counter(
            "ss_reducer_partitions_failed_total",
            "Partitions that failed or were cancelled.");

    ReduceResult<Agg> result;
    result.partitions_total = outcomes.size();

    for (auto &outcome : outcomes) {
      if (outcome.failure) {
        if (outcome.failure->kind == FailureKind::CANCELLED)
          result.cancelled = true;
        result.failures.push_back(std::move(*outcome.failure));
        failed_counter.Increment();
        continue;
      }

      if (result.merged)
        result.merged->merge(*outcome.aggregate);
      else
        result.merged = std::move(outcome.aggregate);
      result.partitions_succeeded++;
      completed_counter.Increment();
    }

    LOG(LogLevel::INFO, LogComponent::REDUCER_REDUCE,
        "Merged " << result.partitions_succeeded << " of "
                  << result.partitions_total << " partitions, "
                  << (result.merged ? result.merged->count() : 0)
                  << " observations" << (result.cancelled ? " (cancelled)" : ""));
    return result;
  }

  Factory factory_;
  bool fail_fast_ = false;
  std::atomic<bool> stop_requested_{false};
};

} // namespace reduce

#endif // PARALLEL_REDUCER_HPP
