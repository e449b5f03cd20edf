#ifndef STREAM_SUMMARY_HPP
#define STREAM_SUMMARY_HPP

#include "aggregate.hpp"
#include "percentile_estimator.hpp"
#include "running_extremum.hpp"
#include "running_variance.hpp"

#include <cstdint>
#include <optional>

namespace stats {

// Everything the command line reports about one stream: moments, extremes and,
// when enabled, the exact value distribution for percentile queries.
class StreamSummary : public IAggregate {
public:
  explicit StreamSummary(bool track_percentiles = true);

  // Returns the mean including `value`
  double update(double value) override;

  /**
   * @throws std::invalid_argument when only one side tracks percentiles
   */
  void merge(const StreamSummary &other);

  double value() const override { return moments_.mean(); }
  uint64_t count() const override { return moments_.count(); }
  AggregateKind kind() const override { return AggregateKind::SUMMARY; }

  double mean() const { return moments_.mean(); }
  double variance() const { return moments_.variance(); }
  double stddev() const { return moments_.stddev(); }
  double min() const { return min_.value(); }
  double max() const { return max_.value(); }

  /**
   * @throws StatsError when percentile tracking is disabled
   */
  double percentile(double p) const;

  bool tracks_percentiles() const { return distribution_.has_value(); }

  const RunningVariance &moments() const { return moments_; }
  const RunningMin &running_min() const { return min_; }
  const RunningMax &running_max() const { return max_; }
  const std::optional<PercentileEstimator<double>> &distribution() const {
    return distribution_;
  }

  // Rebuilds a summary from its parts, as stored in a snapshot
  static StreamSummary
  from_parts(const RunningVariance &moments, const RunningMin &min,
             const RunningMax &max,
             std::optional<PercentileEstimator<double>> distribution);

private:
  RunningVariance moments_;
  RunningMin min_;
  RunningMax max_;
  std::optional<PercentileEstimator<double>> distribution_;
};

} // namespace stats

#endif // STREAM_SUMMARY_HPP
