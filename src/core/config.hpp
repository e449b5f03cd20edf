#ifndef CONFIG_HPP
#define CONFIG_HPP

#include "errors.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

enum class LogLevel;
enum class LogComponent;

namespace Config {

namespace Keys {

// General Settings
constexpr const char *PARTITION_PATHS = "partition_paths";
constexpr const char *PARSE_ERROR_POLICY = "parse_error_policy";
constexpr const char *REPORT_OUTPUT_PATH = "report_output_path";

// Reducer Settings
constexpr const char *RD_FAIL_FAST = "fail_fast";

// Percentile Settings
constexpr const char *PC_ENABLED = "enabled";
constexpr const char *PC_VALUES = "values";

// Metrics Settings
constexpr const char *MT_ENABLED = "enabled";
constexpr const char *MT_OUTPUT_PATH = "output_path";

// Snapshot Settings
constexpr const char *SN_OUTPUT_PATH = "output_path";
constexpr const char *SN_INPUT_PATHS = "input_paths";

// Logging Settings
constexpr const char *LOGGING_DEFAULT_LEVEL = "default_level";
} // namespace Keys

struct LoggingConfig {
  std::map<LogComponent, LogLevel> log_levels;
};

struct ReducerConfig {
  // Stop the remaining workers as soon as one partition fails
  bool fail_fast = false;
};

struct PercentileConfig {
  bool enabled = true;
  std::vector<double> values = {50.0, 90.0, 99.0};
};

struct MetricsConfig {
  bool enabled = true;
  // Prometheus text format; nothing is written when empty
  std::string output_path;
};

struct SnapshotConfig {
  std::string output_path;
  // Snapshots from other processes merged into the final result
  std::vector<std::string> input_paths;
};

struct AppConfig {
  std::vector<std::string> partition_paths;
  ParseErrorPolicy parse_error_policy = ParseErrorPolicy::ABORT;
  std::string report_output_path;

  ReducerConfig reducer;
  PercentileConfig percentiles;
  MetricsConfig metrics;
  SnapshotConfig snapshot;
  LoggingConfig logging;

  AppConfig();
};

// Validation functions for configuration parameters
bool validate_percentile_config(const PercentileConfig &config,
                                std::vector<std::string> &errors);
bool validate_app_config(const AppConfig &config,
                         std::vector<std::string> &errors);

LogLevel string_to_log_level(const std::string &level_str_raw);
bool string_to_parse_error_policy(const std::string &value,
                                  ParseErrorPolicy &policy);

class ConfigManager {
public:
  ConfigManager() = default;
  bool load_configuration(const std::string &filepath);
  std::shared_ptr<const AppConfig> get_config() const;

private:
  std::string config_filepath_;
  std::shared_ptr<const AppConfig> current_config_ =
      std::make_shared<AppConfig>();
  mutable std::mutex config_mutex_;
};

} // namespace Config

#endif // CONFIG_HPP
