#include "snapshot.hpp"
#include "core/logger.hpp"

#include <cstdint>
#include <optional>
#include <utility>

namespace stats {

namespace {

constexpr size_t MAX_QUOTED_PAYLOAD = 64;
// Relative slack allowed when checking count * sum_squares >= sum^2
constexpr double MOMENT_TOLERANCE = 1e-9;

void expect_kind(const nlohmann::json &j, AggregateKind expected) {
  const auto kind = j.at("kind").get<std::string>();
  if (kind != aggregate_kind_to_string(expected)) {
    throw std::invalid_argument("snapshot holds a '" + kind +
                                "' aggregate, expected '" +
                                aggregate_kind_to_string(expected) + "'");
  }
}

// Counts are written as unsigned integers; a negative or fractional count would
// otherwise be cast silently by get<uint64_t>()
uint64_t read_count(const nlohmann::json &j, const char *key) {
  const auto &field = j.at(key);
  if (!field.is_number_unsigned())
    throw std::invalid_argument(std::string(key) +
                                " must be a non-negative integer");
  return field.get<uint64_t>();
}

template <typename Extremum>
void extremum_to_json(nlohmann::json &j, const Extremum &extremum) {
  j = nlohmann::json{{"kind", aggregate_kind_to_string(extremum.kind())},
                     {"count", extremum.count()}};
  j["value"] = extremum.empty() ? nlohmann::json(nullptr)
                                : nlohmann::json(extremum.value());
}

template <typename Extremum>
void extremum_from_json(const nlohmann::json &j, Extremum &extremum) {
  expect_kind(j, Extremum().kind());
  const auto count = read_count(j, "count");
  if (count == 0) {
    if (!j.at("value").is_null())
      throw std::invalid_argument("empty extremum carries a value");
    extremum = Extremum();
    return;
  }
  extremum = Extremum::from_fields(count, j.at("value").get<double>());
}

} // namespace

void to_json(nlohmann::json &j, const RunningMean &mean) {
  j = nlohmann::json{{"kind", aggregate_kind_to_string(AggregateKind::MEAN)},
                     {"count", mean.count()},
                     {"sum", mean.sum()}};
}

void from_json(const nlohmann::json &j, RunningMean &mean) {
  expect_kind(j, AggregateKind::MEAN);
  const auto count = read_count(j, "count");
  const auto sum = j.at("sum").get<double>();
  if (count == 0 && sum != 0.0)
    throw std::invalid_argument("empty mean carries a nonzero sum");
  mean = RunningMean::from_fields(count, sum);
}

void to_json(nlohmann::json &j, const RunningVariance &variance) {
  j = nlohmann::json{
      {"kind", aggregate_kind_to_string(AggregateKind::VARIANCE)},
      {"count", variance.count()},
      {"sum", variance.sum()},
      {"sum_squares", variance.sum_squares()}};
}

void from_json(const nlohmann::json &j, RunningVariance &variance) {
  expect_kind(j, AggregateKind::VARIANCE);
  const auto count = read_count(j, "count");
  const auto sum = j.at("sum").get<double>();
  const auto sum_squares = j.at("sum_squares").get<double>();
  if (sum_squares < 0.0)
    throw std::invalid_argument("sum_squares cannot be negative");
  if (count == 0 && (sum != 0.0 || sum_squares != 0.0))
    throw std::invalid_argument("empty variance carries nonzero sums");

  // count * sum_squares >= sum^2 holds for any real sample
  const double squared_sum = sum * sum;
  if (squared_sum - static_cast<double>(count) * sum_squares >
      MOMENT_TOLERANCE * squared_sum)
    throw std::invalid_argument("sum_squares is too small for sum and count");

  variance = RunningVariance::from_fields(count, sum, sum_squares);
}

void to_json(nlohmann::json &j, const RunningMin &min) {
  extremum_to_json(j, min);
}

void from_json(const nlohmann::json &j, RunningMin &min) {
  extremum_from_json(j, min);
}

void to_json(nlohmann::json &j, const RunningMax &max) {
  extremum_to_json(j, max);
}

void from_json(const nlohmann::json &j, RunningMax &max) {
  extremum_from_json(j, max);
}

void to_json(nlohmann::json &j, const PercentileEstimator<double> &estimator) {
  auto distribution = nlohmann::json::array();
  for (auto it = estimator.index().begin(); it != estimator.index().end();
       ++it)
    distribution.push_back({*it, estimator.occurrences(*it)});

  j = nlohmann::json{
      {"kind", aggregate_kind_to_string(AggregateKind::PERCENTILE)},
      {"distribution", std::move(distribution)}};
}

void from_json(const nlohmann::json &j,
               PercentileEstimator<double> &estimator) {
  expect_kind(j, AggregateKind::PERCENTILE);

  PercentileEstimator<double> decoded;
  for (const auto &entry : j.at("distribution")) {
    if (!entry.is_array() || entry.size() != 2)
      throw std::invalid_argument("distribution entries are [value, count]");

    const auto value = entry.at(0).get<double>();
    if (!entry.at(1).is_number_unsigned())
      throw std::invalid_argument("occurrences must be a non-negative integer");
    const auto occurrences = entry.at(1).get<uint64_t>();
    if (occurrences == 0)
      throw std::invalid_argument("distribution entry with zero occurrences");
    if (decoded.occurrences(value) != 0)
      throw std::invalid_argument("distribution lists a value twice");
    decoded.update(value, occurrences);
  }
  estimator = std::move(decoded);
}

void to_json(nlohmann::json &j, const StreamSummary &summary) {
  j = nlohmann::json{{"kind", aggregate_kind_to_string(AggregateKind::SUMMARY)},
                     {"moments", summary.moments()},
                     {"min", summary.running_min()},
                     {"max", summary.running_max()}};
  if (summary.distribution())
    j["distribution"] = *summary.distribution();
}

void from_json(const nlohmann::json &j, StreamSummary &summary) {
  expect_kind(j, AggregateKind::SUMMARY);

  auto moments = j.at("moments").get<RunningVariance>();
  auto min = j.at("min").get<RunningMin>();
  auto max = j.at("max").get<RunningMax>();
  if (min.count() != moments.count() || max.count() != moments.count())
    throw std::invalid_argument("summary parts disagree on the count");

  std::optional<PercentileEstimator<double>> distribution;
  if (j.contains("distribution")) {
    distribution = j.at("distribution").get<PercentileEstimator<double>>();
    if (distribution->total_count() != moments.count())
      throw std::invalid_argument("distribution disagrees on the count");
  }

  summary = StreamSummary::from_parts(moments, min, max,
                                      std::move(distribution));
}

ParseError snapshot_error(const std::string &source_id,
                          const std::string &payload, const char *reason) {
  LOG(LogLevel::WARN, LogComponent::STATS_SNAPSHOT,
      "Rejected snapshot from '" << source_id << "': " << reason);
  std::string quoted = payload.substr(0, MAX_QUOTED_PAYLOAD);
  if (payload.size() > MAX_QUOTED_PAYLOAD)
    quoted += "...";
  return ParseError(source_id, 0, quoted);
}

} // namespace stats
