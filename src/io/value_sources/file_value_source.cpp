#include "file_value_source.hpp"
#include "core/logger.hpp"
#include "core/metrics_registry.hpp"
#include "utils/scoped_timer.hpp"
#include "utils/utils.hpp"

#include <string>
#include <utility>
#include <vector>

FileValueSource::FileValueSource(const std::string &filepath,
                                 ParseErrorPolicy policy,
                                 std::string source_id)
    : source_id_(source_id.empty() ? filepath : std::move(source_id)),
      policy_(policy) {
  value_file_stream_.open(filepath);
  if (!value_file_stream_.is_open()) {
    LOG(LogLevel::ERROR, LogComponent::IO_SOURCE,
        "Failed to open value file: " << filepath);
    throw PartitionReadError(source_id_, "cannot open file '" + filepath + "'");
  }
  LOG(LogLevel::DEBUG, LogComponent::IO_SOURCE,
      "Opened value file " << filepath << " as '" << source_id_
                           << "' (parse errors: "
                           << parse_error_policy_to_string(policy_) << ")");
}

FileValueSource::~FileValueSource() {
  if (value_file_stream_.is_open())
    value_file_stream_.close();
  LOG(LogLevel::DEBUG, LogComponent::IO_SOURCE,
      "FileValueSource '" << source_id_ << "' closed. Lines read: "
                          << line_number_ << ", skipped: " << lines_skipped_);
}

std::vector<double> FileValueSource::get_next_batch() {
  static prometheus::Histogram &batch_fetch_timer =
      MetricsRegistry::instance().create_histogram(
          "ss_source_batch_fetch_duration_seconds",
          "Latency of fetching a batch of values from a file.",
          {0.0001, 0.001, 0.01, 0.1, 1.0});
  static prometheus::Counter &lines_skipped_counter =
      MetricsRegistry::instance().create_counter(
          "ss_source_lines_skipped_total",
          "Malformed lines skipped under the skip parse policy.");
  ScopedTimer timer(batch_fetch_timer);

  std::vector<double> batch;
  if (exhausted_)
    return batch;

  batch.reserve(BATCH_SIZE);
  std::string line;

  while (batch.size() < BATCH_SIZE && std::getline(value_file_stream_, line)) {
    line_number_++;
    Utils::trim_inplace(line);
    if (line.empty() || line.front() == '#')
      continue;

    if (auto value = Utils::string_to_number<double>(line)) {
      batch.push_back(*value);
      continue;
    }

    if (policy_ == ParseErrorPolicy::ABORT) {
      LOG(LogLevel::ERROR, LogComponent::IO_SOURCE,
          "Malformed value '" << line << "' in '" << source_id_ << "' at line "
                              << line_number_ << ", aborting source");
      throw ParseError(source_id_, line_number_, line);
    }

    lines_skipped_++;
    lines_skipped_counter.Increment();
    LOG(LogLevel::WARN, LogComponent::IO_SOURCE,
        "Skipping malformed value '" << line << "' in '" << source_id_
                                     << "' at line " << line_number_);
  }

  if (value_file_stream_.bad())
    throw PartitionReadError(source_id_, "read failed after line " +
                                             std::to_string(line_number_));

  if (value_file_stream_.eof())
    exhausted_ = true;

  LOG(LogLevel::TRACE, LogComponent::IO_SOURCE,
      "Read " << batch.size() << " values from '" << source_id_
              << "' up to line " << line_number_);
  return batch;
}
