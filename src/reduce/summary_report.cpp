#include "summary_report.hpp"

#include <sstream>

namespace reduce {

std::string percentile_label(double percentile) {
  std::ostringstream label;
  label << "p" << percentile;
  return label.str();
}

nlohmann::json failure_to_json_object(const PartitionFailure &failure) {
  nlohmann::json j;
  j["partition"] = failure.partition_id;
  j["kind"] = failure_kind_to_string(failure.kind);
  j["message"] = failure.message;
  if (failure.kind == FailureKind::PARSE) {
    j["line"] = failure.line;
    j["offending_value"] = failure.offending_value;
  }
  return j;
}

nlohmann::json summary_to_json_object(const stats::StreamSummary &summary,
                                      const std::vector<double> &percentiles) {
  if (summary.empty())
    return nullptr;

  nlohmann::json j;
  j["count"] = summary.count();
  j["mean"] = summary.mean();
  j["variance"] = summary.variance();
  j["stddev"] = summary.stddev();
  j["min"] = summary.min();
  j["max"] = summary.max();

  if (summary.tracks_percentiles()) {
    nlohmann::json j_percentiles = nlohmann::json::object();
    for (double p : percentiles)
      j_percentiles[percentile_label(p)] = summary.percentile(p);
    j["percentiles"] = j_percentiles;
    j["distinct_values"] = summary.distribution()->distinct_count();
  }
  return j;
}

nlohmann::json build_report(
    const ReduceResult<stats::StreamSummary> &result,
    const stats::StreamSummary &total, const std::vector<double> &percentiles,
    const std::map<std::string, stats::SourceContribution> &snapshot_sources) {
  nlohmann::json report;

  report["partitions"] = {{"total", result.partitions_total},
                          {"succeeded", result.partitions_succeeded},
                          {"failed", result.failures.size()},
                          {"cancelled", result.cancelled}};

  nlohmann::json j_failures = nlohmann::json::array();
  for (const auto &failure : result.failures)
    j_failures.push_back(failure_to_json_object(failure));
  report["failures"] = j_failures;

  nlohmann::json j_snapshots = nlohmann::json::array();
  for (const auto &[source_id, contribution] : snapshot_sources) {
    j_snapshots.push_back({{"source", source_id},
                           {"snapshots", contribution.snapshots},
                           {"observations", contribution.observations}});
  }
  report["snapshots"] = j_snapshots;

  report["statistics"] = summary_to_json_object(total, percentiles);
  return report;
}

} // namespace reduce
