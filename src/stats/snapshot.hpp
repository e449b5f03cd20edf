#ifndef SNAPSHOT_HPP
#define SNAPSHOT_HPP

#include "core/errors.hpp"
#include "percentile_estimator.hpp"
#include "running_extremum.hpp"
#include "running_mean.hpp"
#include "running_variance.hpp"
#include "stream_summary.hpp"

#include <nlohmann/json.hpp>

#include <stdexcept>
#include <string>

namespace stats {

// JSON form of each mergeable aggregate. Every object carries a "kind" field
// naming the aggregate; the remaining fields are its sufficient statistics.
void to_json(nlohmann::json &j, const RunningMean &mean);
void from_json(const nlohmann::json &j, RunningMean &mean);

void to_json(nlohmann::json &j, const RunningVariance &variance);
void from_json(const nlohmann::json &j, RunningVariance &variance);

void to_json(nlohmann::json &j, const RunningMin &min);
void from_json(const nlohmann::json &j, RunningMin &min);

void to_json(nlohmann::json &j, const RunningMax &max);
void from_json(const nlohmann::json &j, RunningMax &max);

// The distribution is stored as [value, occurrences] pairs in ascending order
void to_json(nlohmann::json &j, const PercentileEstimator<double> &estimator);
void from_json(const nlohmann::json &j,
               PercentileEstimator<double> &estimator);

void to_json(nlohmann::json &j, const StreamSummary &summary);
void from_json(const nlohmann::json &j, StreamSummary &summary);

ParseError snapshot_error(const std::string &source_id,
                          const std::string &payload, const char *reason);

template <typename Agg> std::string to_snapshot(const Agg &aggregate) {
  nlohmann::json j = aggregate;
  return j.dump();
}

/**
 * Decode a snapshot produced by to_snapshot, possibly in another process
 * @param source_id Names the sender in error reports
 * @throws ParseError when the payload is not valid JSON, names another kind of
 * aggregate, or holds inconsistent fields
 */
template <typename Agg>
Agg from_snapshot(const std::string &payload, const std::string &source_id) {
  try {
    return nlohmann::json::parse(payload).get<Agg>();
  } catch (const nlohmann::json::exception &e) {
    throw snapshot_error(source_id, payload, e.what());
  } catch (const std::invalid_argument &e) {
    throw snapshot_error(source_id, payload, e.what());
  }
}

} // namespace stats

#endif // SNAPSHOT_HPP
