#ifndef SNAPSHOT_COLLECTOR_HPP
#define SNAPSHOT_COLLECTOR_HPP

#include "core/logger.hpp"
#include "snapshot.hpp"

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <utility>

namespace stats {

struct SourceContribution {
  uint64_t snapshots = 0;
  uint64_t observations = 0;
};

/**
 * Running total of aggregates computed elsewhere. Each ingested payload is a
 * delta: it covers observations the collector has not seen yet and is merged
 * into the total as is. Callers from several threads may ingest concurrently.
 */
template <typename Agg> class SnapshotCollector {
public:
  SnapshotCollector() = default;
  explicit SnapshotCollector(Agg initial) : total_(std::move(initial)) {}

  /**
   * Decode and merge one snapshot
   * @throws ParseError when the payload cannot be decoded
   * @throws std::invalid_argument when the decoded aggregate cannot merge
   * with the total (e.g. a summary without percentiles)
   * The total is left unchanged when either is thrown.
   */
  void ingest(const std::string &source_id, const std::string &payload) {
    Agg delta = from_snapshot<Agg>(payload, source_id);
    ingest(source_id, delta);
  }

  void ingest(const std::string &source_id, const Agg &delta) {
    std::lock_guard<std::mutex> lock(mutex_);
    total_.merge(delta);
    auto &contribution = contributions_[source_id];
    contribution.snapshots++;
    contribution.observations += delta.count();
    LOG(LogLevel::DEBUG, LogComponent::STATS_SNAPSHOT,
        "Merged " << delta.count() << " observations from '" << source_id
                  << "', total now " << total_.count());
  }

  Agg total() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return total_;
  }

  std::string snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return to_snapshot(total_);
  }

  std::map<std::string, SourceContribution> contributions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return contributions_;
  }

private:
  Agg total_;
  std::map<std::string, SourceContribution> contributions_;
  mutable std::mutex mutex_;
};

} // namespace stats

#endif // SNAPSHOT_COLLECTOR_HPP
