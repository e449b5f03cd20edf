#ifndef FREQUENCY_TABLE_HPP
#define FREQUENCY_TABLE_HPP

#include <cstddef>
#include <cstdint>
#include <functional>
#include <unordered_map>

namespace stats {

// Distinct value -> occurrence count. The sum of all occurrence counts always
// equals total_count(); memory grows with the number of distinct values only.
template <typename T, typename Hash = std::hash<T>> class FrequencyTable {
public:
  using Entries = std::unordered_map<T, uint64_t, Hash>;

  /**
   * Record `occurrences` more sightings of `value`
   * @return true when `value` had not been seen before
   */
  bool add(const T &value, uint64_t occurrences = 1) {
    auto [it, inserted] = counts_.try_emplace(value, 0);
    it->second += occurrences;
    total_ += occurrences;
    return inserted;
  }

  uint64_t occurrences(const T &value) const {
    auto it = counts_.find(value);
    return it == counts_.end() ? 0 : it->second;
  }

  uint64_t total_count() const { return total_; }
  size_t distinct_count() const { return counts_.size(); }
  bool empty() const { return total_ == 0; }
  const Entries &entries() const { return counts_; }

private:
  Entries counts_;
  uint64_t total_ = 0;
};

} // namespace stats

#endif // FREQUENCY_TABLE_HPP
