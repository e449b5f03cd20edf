#include "percentile_tracker.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"

#include <stdexcept>
#include <string>

namespace stats {

PercentileTracker::PercentileTracker(double percentile)
    : percentile_(percentile) {
  validate_percentile(percentile_);
}

double PercentileTracker::update(double value) {
  const bool first = estimator_.empty();
  estimator_.update(value);

  const auto &index = estimator_.index();
  if (first) {
    settle(index.begin());
    return cursor_value_;
  }

  if (value < cursor_value_)
    below_cursor_++;
  settle(index.find(cursor_value_));
  return cursor_value_;
}

double PercentileTracker::value() const {
  if (estimator_.empty())
    throw EmptyAggregateError("PercentileTracker");
  return cursor_value_;
}

void PercentileTracker::merge(const PercentileTracker &other) {
  if (other.percentile_ != percentile_) {
    throw std::invalid_argument(
        "cannot merge a p" + std::to_string(other.percentile_) +
        " tracker into a p" + std::to_string(percentile_) + " tracker");
  }
  estimator_.merge(other.estimator_);
  reposition();
  LOG(LogLevel::TRACE, LogComponent::STATS_PERCENTILE,
      "Merged p" << percentile_ << " tracker, cursor now at " << cursor_value_
                 << " over " << estimator_.total_count() << " observations");
}

// Moves the cursor to the first value whose cumulative share reaches the
// percentile. below_cursor_ must count the observations before `cursor`.
void PercentileTracker::settle(Cursor cursor) {
  const auto &index = estimator_.index();
  const uint64_t total = estimator_.total_count();

  // Everything up to the previous value already reaches the percentile
  while (cursor != index.begin() &&
         reaches_percentile(below_cursor_, total, percentile_)) {
    --cursor;
    below_cursor_ -= estimator_.occurrences(*cursor);
  }

  // The cursor value does not reach it yet
  while (!reaches_percentile(below_cursor_ + estimator_.occurrences(*cursor),
                             total, percentile_)) {
    below_cursor_ += estimator_.occurrences(*cursor);
    ++cursor;
  }

  cursor_value_ = *cursor;
}

void PercentileTracker::reposition() {
  below_cursor_ = 0;
  if (estimator_.empty())
    return;
  settle(estimator_.index().begin());
}

} // namespace stats
