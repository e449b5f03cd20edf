#include "core/config.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "core/metrics_registry.hpp"
#include "reduce/parallel_reducer.hpp"
#include "reduce/partition.hpp"
#include "reduce/summary_report.hpp"
#include "stats/snapshot_collector.hpp"
#include "stats/stream_summary.hpp"
#include "utils/utils.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <functional>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

// Global atomic flag for signal handling
std::atomic<bool> g_shutdown_requested = false;

// A simple, safe signal handler function
void signal_handler(int signum) {
  if (signum == SIGINT || signum == SIGTERM)
    g_shutdown_requested = true;
}

namespace {

constexpr int EXIT_OK = 0;
constexpr int EXIT_CONFIG_ERROR = 1;
constexpr int EXIT_ALL_FAILED = 2;
constexpr int EXIT_PARTIAL_FAILURE = 3;

bool ends_with(const std::string &text, const std::string &suffix) {
  return text.size() >= suffix.size() &&
         text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

void print_usage(const char *program) {
  std::cerr << "Usage: " << program << " [config.ini] [partition files...]\n"
            << "  Partition files given on the command line replace "
               "partition_paths from the configuration."
            << std::endl;
}

// Forwards a signal to the reducer; the handler itself may only touch atomics.
// The request is repeated until the reducer finishes, since a request made
// before run() starts is discarded.
void stop_watcher_thread(reduce::ParallelReducer<stats::StreamSummary> &reducer,
                         const std::atomic<bool> &done) {
  bool logged = false;
  while (!done) {
    if (g_shutdown_requested) {
      if (!logged) {
        LOG(LogLevel::WARN, LogComponent::CORE,
            "Shutdown requested, stopping partitions.");
        logged = true;
      }
      reducer.request_stop();
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
  }
}

// Merges snapshot files written by other runs; a bad file is reported and
// left out of the total
void ingest_snapshots(const std::vector<std::string> &paths,
                      stats::SnapshotCollector<stats::StreamSummary> &collector) {
  for (const auto &path : paths) {
    auto payload = Utils::read_file(path);
    if (!payload) {
      LOG(LogLevel::ERROR, LogComponent::STATS_SNAPSHOT,
          "Cannot read snapshot file " << path << ", skipping it.");
      continue;
    }
    try {
      collector.ingest(path, *payload);
    } catch (const ParseError &e) {
      LOG(LogLevel::ERROR, LogComponent::STATS_SNAPSHOT,
          "Skipping snapshot " << path << ": " << e.what());
    } catch (const std::invalid_argument &e) {
      LOG(LogLevel::ERROR, LogComponent::STATS_SNAPSHOT,
          "Skipping snapshot " << path << ": " << e.what());
    }
  }
}

} // namespace

int main(int argc, char *argv[]) {
  std::ios_base::sync_with_stdio(false);

  struct sigaction action;
  action.sa_handler = signal_handler;
  sigemptyset(&action.sa_mask);
  action.sa_flags = 0;

  sigaction(SIGINT, &action, NULL);
  sigaction(SIGTERM, &action, NULL);

  // --- Parse Arguments ---
  std::string config_file_to_load;
  std::vector<std::string> cli_partitions;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "-h" || arg == "--help") {
      print_usage(argv[0]);
      return EXIT_OK;
    }
    if (i == 1 && ends_with(arg, ".ini"))
      config_file_to_load = arg;
    else
      cli_partitions.push_back(arg);
  }

  // --- Load Configuration ---
  Config::ConfigManager config_manager;
  if (!config_file_to_load.empty() &&
      !config_manager.load_configuration(config_file_to_load)) {
    std::cerr << "Refusing to run with an unusable configuration." << std::endl;
    return EXIT_CONFIG_ERROR;
  }
  auto current_config = config_manager.get_config();

  // --- Initialize Logging ---
  LogManager::instance().configure(current_config->logging);
  LOG(LogLevel::INFO, LogComponent::CORE, "streamstats starting up...");

  std::vector<std::string> partition_paths = current_config->partition_paths;
  if (!cli_partitions.empty())
    partition_paths = cli_partitions;

  if (partition_paths.empty() && current_config->snapshot.input_paths.empty()) {
    LOG(LogLevel::FATAL, LogComponent::CORE,
        "Nothing to reduce: no partitions and no snapshots configured.");
    print_usage(argv[0]);
    return EXIT_CONFIG_ERROR;
  }

  LOG(LogLevel::DEBUG, LogComponent::CONFIG,
      partition_paths.size()
          << " partitions, parse errors: "
          << parse_error_policy_to_string(current_config->parse_error_policy)
          << ", fail fast: " << std::boolalpha
          << current_config->reducer.fail_fast << ", snapshot inputs: "
          << current_config->snapshot.input_paths.size());

  const bool track_percentiles = current_config->percentiles.enabled;
  const std::vector<double> percentiles =
      track_percentiles ? current_config->percentiles.values
                        : std::vector<double>{};

  // --- Map and Reduce ---
  reduce::ParallelReducer<stats::StreamSummary> reducer(
      [track_percentiles] { return stats::StreamSummary(track_percentiles); });
  reducer.set_fail_fast(current_config->reducer.fail_fast);

  std::atomic<bool> reduce_done = false;
  std::thread watcher(stop_watcher_thread, std::ref(reducer),
                      std::cref(reduce_done));

  auto result = reducer.run(reduce::file_partitions(
      partition_paths, current_config->parse_error_policy));

  reduce_done = true;
  watcher.join();

  // --- Fold In Snapshots From Other Runs ---
  stats::SnapshotCollector<stats::StreamSummary> collector{
      stats::StreamSummary(track_percentiles)};
  if (result.merged)
    collector.ingest("partitions", *result.merged);
  ingest_snapshots(current_config->snapshot.input_paths, collector);

  auto snapshot_sources = collector.contributions();
  snapshot_sources.erase("partitions");

  // --- Outputs ---
  const auto total = collector.total();
  const auto report =
      reduce::build_report(result, total, percentiles, snapshot_sources);

  const std::string report_text = report.dump(2);
  if (current_config->report_output_path.empty()) {
    std::cout << report_text << std::endl;
  } else if (!Utils::write_file(current_config->report_output_path,
                                report_text + "\n")) {
    LOG(LogLevel::ERROR, LogComponent::CORE,
        "Failed to write report to " << current_config->report_output_path);
  }

  if (!current_config->snapshot.output_path.empty() &&
      !Utils::write_file(current_config->snapshot.output_path,
                         collector.snapshot())) {
    LOG(LogLevel::ERROR, LogComponent::STATS_SNAPSHOT,
        "Failed to write snapshot to " << current_config->snapshot.output_path);
  }

  if (current_config->metrics.enabled &&
      !current_config->metrics.output_path.empty() &&
      !MetricsRegistry::instance().write_text_file(
          current_config->metrics.output_path)) {
    LOG(LogLevel::ERROR, LogComponent::CORE,
        "Failed to write metrics to " << current_config->metrics.output_path);
  }

  LOG(LogLevel::INFO, LogComponent::CORE,
      "Processing finished: " << result.partitions_succeeded << "/"
                              << result.partitions_total
                              << " partitions merged.");

  if (result.partitions_total > 0 && result.partitions_succeeded == 0)
    return EXIT_ALL_FAILED;
  if (!result.failures.empty())
    return EXIT_PARTIAL_FAILURE;
  return EXIT_OK;
}
