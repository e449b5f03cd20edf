#ifndef PERCENTILE_ESTIMATOR_HPP
#define PERCENTILE_ESTIMATOR_HPP

#include "core/errors.hpp"
#include "frequency_table.hpp"
#include "ordered_value_index.hpp"

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <stdexcept>
#include <type_traits>

namespace stats {

// Throws InvalidPercentileError unless 0 <= percentile <= 100
inline void validate_percentile(double percentile) {
  if (std::isnan(percentile) || percentile < 0.0 || percentile > 100.0)
    throw InvalidPercentileError(percentile);
}

// True once `cumulative` of `total` observations make up at least
// `percentile` percent. Compared as cumulative * 100 >= p * total so that
// p = 100 is reached exactly at the last value.
inline bool reaches_percentile(uint64_t cumulative, uint64_t total,
                               double percentile) {
  return static_cast<double>(cumulative) * 100.0 >=
         percentile * static_cast<double>(total);
}

/**
 * Exact order statistics over a stream whose values come from a totally
 * ordered domain with few distinct values compared to the stream length.
 * Memory is O(k) for k distinct values; high cardinality continuous data
 * defeats the design and is not what this type is for.
 *
 * Tie-break: query(p) returns the first value, in ascending order, at which
 * the cumulative share of observations reaches or exceeds p percent.
 */
template <typename T, typename Hash = std::hash<T>,
          typename Compare = std::less<T>>
class PercentileEstimator {
public:
  using Table = FrequencyTable<T, Hash>;
  using Index = OrderedValueIndex<T, Compare>;

  /**
   * Count one occurrence of `value`, indexing it on first sight. O(log k).
   * @throws std::invalid_argument for NaN, which has no place in the order
   */
  void update(const T &value) { update(value, 1); }

  // Count `occurrences` sightings of `value` at once
  void update(const T &value, uint64_t occurrences) {
    if constexpr (std::is_floating_point_v<T>) {
      if (std::isnan(value))
        throw std::invalid_argument("cannot rank NaN in a percentile estimator");
    }
    if (occurrences == 0)
      return;
    if (table_.add(value, occurrences))
      index_.insert(value);
  }

  /**
   * Walk the index from the smallest value, accumulating each value's share
   * of the total, and return the value at which `percentile` is reached.
   * @param percentile In [0, 100]
   * @throws InvalidPercentileError outside [0, 100]
   * @throws EmptyAggregateError before the first update
   */
  const T &query(double percentile) const {
    validate_percentile(percentile);
    if (table_.empty())
      throw EmptyAggregateError("PercentileEstimator");

    const uint64_t total = table_.total_count();
    uint64_t cumulative = 0;
    for (auto cursor = index_.begin(); cursor != index_.end(); ++cursor) {
      cumulative += table_.occurrences(*cursor);
      if (reaches_percentile(cumulative, total, percentile))
        return *cursor;
    }
    // Unreachable: the last value always brings the total to 100%
    return index_.max();
  }

  const T &median() const { return query(50.0); }

  // Adds `other`'s occurrence counts; `other` is left untouched
  void merge(const PercentileEstimator &other) {
    for (const auto &[value, occurrences] : other.table_.entries()) {
      if (table_.add(value, occurrences))
        index_.insert(value);
    }
  }

  const T &min() const {
    if (index_.empty())
      throw EmptyAggregateError("PercentileEstimator");
    return index_.min();
  }

  const T &max() const {
    if (index_.empty())
      throw EmptyAggregateError("PercentileEstimator");
    return index_.max();
  }

  uint64_t occurrences(const T &value) const {
    return table_.occurrences(value);
  }
  uint64_t total_count() const { return table_.total_count(); }
  size_t distinct_count() const { return table_.distinct_count(); }
  bool empty() const { return table_.empty(); }

  const Table &table() const { return table_; }
  const Index &index() const { return index_; }

private:
  Table table_;
  Index index_;
};

} // namespace stats

#endif // PERCENTILE_ESTIMATOR_HPP
