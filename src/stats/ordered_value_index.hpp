#ifndef ORDERED_VALUE_INDEX_HPP
#define ORDERED_VALUE_INDEX_HPP

#include <cstddef>
#include <functional>
#include <set>

namespace stats {

// Sorted, append-only set of the distinct values seen by a percentile
// estimator. Iterators double as traversal cursors; since entries are never
// erased, a cursor stays valid for the lifetime of the index.
template <typename T, typename Compare = std::less<T>> class OrderedValueIndex {
public:
  using const_iterator = typename std::set<T, Compare>::const_iterator;

  // Returns false when the value was already indexed
  bool insert(const T &value) { return values_.insert(value).second; }

  const_iterator begin() const { return values_.begin(); }
  const_iterator end() const { return values_.end(); }
  const_iterator find(const T &value) const { return values_.find(value); }

  // Both require a non-empty index
  const T &min() const { return *values_.begin(); }
  const T &max() const { return *values_.rbegin(); }

  size_t size() const { return values_.size(); }
  bool empty() const { return values_.empty(); }

private:
  std::set<T, Compare> values_;
};

} // namespace stats

#endif // ORDERED_VALUE_INDEX_HPP
