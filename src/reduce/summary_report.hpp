#ifndef SUMMARY_REPORT_HPP
#define SUMMARY_REPORT_HPP

#include "parallel_reducer.hpp"
#include "stats/snapshot_collector.hpp"
#include "stats/stream_summary.hpp"

#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace reduce {

nlohmann::json failure_to_json_object(const PartitionFailure &failure);

// count, mean, variance, stddev, min, max and one "p<percentile>" entry per
// requested percentile when the summary tracks them. null when empty.
nlohmann::json summary_to_json_object(const stats::StreamSummary &summary,
                                      const std::vector<double> &percentiles);

/**
 * Report printed by the command line. `total` is the merged partition result
 * plus every ingested snapshot; `snapshot_sources` lists those snapshots.
 */
nlohmann::json build_report(
    const ReduceResult<stats::StreamSummary> &result,
    const stats::StreamSummary &total, const std::vector<double> &percentiles,
    const std::map<std::string, stats::SourceContribution> &snapshot_sources);

std::string percentile_label(double percentile);

} // namespace reduce

#endif // SUMMARY_REPORT_HPP
