#ifndef AGGREGATE_HPP
#define AGGREGATE_HPP

#include <cstdint>

namespace stats {

enum class AggregateKind { MEAN, VARIANCE, MAX, MIN, PERCENTILE, CUSTOM, SUMMARY };

inline const char *aggregate_kind_to_string(AggregateKind kind) {
  switch (kind) {
  case AggregateKind::MEAN:
    return "mean";
  case AggregateKind::VARIANCE:
    return "variance";
  case AggregateKind::MAX:
    return "max";
  case AggregateKind::MIN:
    return "min";
  case AggregateKind::PERCENTILE:
    return "percentile";
  case AggregateKind::CUSTOM:
    return "custom";
  case AggregateKind::SUMMARY:
    return "summary";
  }
  return "unknown";
}

/**
 * Uniform update contract shared by every streaming accumulator. The stream
 * driver only ever talks to this interface.
 */
class IAggregate {
public:
  virtual ~IAggregate() = default;

  /**
   * Fold one observation into the aggregate in O(1) (O(log k) for
   * percentiles) without revisiting earlier values.
   * @return The aggregate's value after the update
   */
  virtual double update(double value) = 0;

  /**
   * Current value of the aggregate
   * @throws EmptyAggregateError when no observation has been folded in yet
   */
  virtual double value() const = 0;

  virtual uint64_t count() const = 0;
  virtual AggregateKind kind() const = 0;

  bool empty() const { return count() == 0; }
};

// Combines two aggregates computed over disjoint data without touching either
template <typename Agg> Agg merge(const Agg &lhs, const Agg &rhs) {
  Agg result = lhs;
  result.merge(rhs);
  return result;
}

} // namespace stats

#endif // AGGREGATE_HPP
