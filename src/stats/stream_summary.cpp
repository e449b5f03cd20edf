#include "stream_summary.hpp"
#include "core/errors.hpp"

#include <stdexcept>
#include <utility>

namespace stats {

StreamSummary::StreamSummary(bool track_percentiles) {
  if (track_percentiles)
    distribution_.emplace();
}

double StreamSummary::update(double value) {
  // The distribution rejects NaN, so it goes first to keep every part in step
  if (distribution_)
    distribution_->update(value);
  min_.update(value);
  max_.update(value);
  moments_.update(value);
  return moments_.mean();
}

void StreamSummary::merge(const StreamSummary &other) {
  if (tracks_percentiles() != other.tracks_percentiles()) {
    throw std::invalid_argument(
        "cannot merge summaries with different percentile tracking");
  }
  moments_.merge(other.moments_);
  min_.merge(other.min_);
  max_.merge(other.max_);
  if (distribution_)
    distribution_->merge(*other.distribution_);
}

double StreamSummary::percentile(double p) const {
  if (!distribution_)
    throw StatsError("percentile tracking is disabled for this summary");
  return distribution_->query(p);
}

StreamSummary
StreamSummary::from_parts(const RunningVariance &moments, const RunningMin &min,
                          const RunningMax &max,
                          std::optional<PercentileEstimator<double>> distribution) {
  StreamSummary summary(false);
  summary.moments_ = moments;
  summary.min_ = min;
  summary.max_ = max;
  summary.distribution_ = std::move(distribution);
  return summary;
}

} // namespace stats
