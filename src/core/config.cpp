#include "config.hpp"
#include "logger.hpp"
#include "utils/utils.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace Config {

const std::map<std::string, LogComponent> key_to_component_map = {
    {"core", LogComponent::CORE},
    {"config", LogComponent::CONFIG},
    {"io.source", LogComponent::IO_SOURCE},
    {"stats.aggregate", LogComponent::STATS_AGGREGATE},
    {"stats.percentile", LogComponent::STATS_PERCENTILE},
    {"stats.snapshot", LogComponent::STATS_SNAPSHOT},
    {"stream.driver", LogComponent::STREAM_DRIVER},
    {"reducer.map", LogComponent::REDUCER_MAP},
    {"reducer.reduce", LogComponent::REDUCER_REDUCE}};

AppConfig::AppConfig() {
  // By default, everything is set to a high level (WARN)
  for (const auto &pair : key_to_component_map) {
    logging.log_levels[pair.second] = LogLevel::WARN;
  }
  // Except for CORE, which we want to see INFO messages from by default
  logging.log_levels[LogComponent::CORE] = LogLevel::INFO;
}

LogLevel string_to_log_level(const std::string &level_str_raw) {
  std::string level_str = Utils::trim_copy(level_str_raw);
  std::transform(level_str.begin(), level_str.end(), level_str.begin(),
                 ::toupper);
  if (level_str == "TRACE")
    return LogLevel::TRACE;
  if (level_str == "DEBUG")
    return LogLevel::DEBUG;
  if (level_str == "INFO")
    return LogLevel::INFO;
  if (level_str == "WARN")
    return LogLevel::WARN;
  if (level_str == "ERROR")
    return LogLevel::ERROR;
  if (level_str == "FATAL")
    return LogLevel::FATAL;
  return LogLevel::INFO; // A safe default
}

bool string_to_parse_error_policy(const std::string &value,
                                  ParseErrorPolicy &policy) {
  std::string lowered = Utils::trim_copy(value);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(), ::tolower);
  if (lowered == "abort") {
    policy = ParseErrorPolicy::ABORT;
    return true;
  }
  if (lowered == "skip") {
    policy = ParseErrorPolicy::SKIP;
    return true;
  }
  return false;
}

// Convert string to boolean using common truthy values
bool string_to_bool(const std::string &val_str_raw) {
  std::string val_str = Utils::trim_copy(val_str_raw);
  std::transform(val_str.begin(), val_str.end(), val_str.begin(), ::tolower);
  return (val_str == "true" || val_str == "1" || val_str == "yes" ||
          val_str == "on");
}

// Entries that are not numbers are reported as errors; the file is rejected
std::vector<double> string_to_percentiles(const std::string &value,
                                          int line_num,
                                          std::vector<std::string> &errors) {
  std::vector<double> percentiles;
  for (const auto &item : Utils::split_list(value, ',')) {
    if (auto parsed = Utils::string_to_number<double>(item))
      percentiles.push_back(*parsed);
    else
      errors.push_back("Line " + std::to_string(line_num) +
                       ": percentile '" + item + "' is not a number");
  }
  return percentiles;
}

void warn_unknown_key(int line_num, const std::string &section,
                      const std::string &key) {
  std::cerr << "Warning (Config Line " << line_num << "): Unknown key '" << key
            << "'";
  if (!section.empty())
    std::cerr << " in section [" << section << "]";
  std::cerr << std::endl;
}

bool validate_percentile_config(const PercentileConfig &config,
                                std::vector<std::string> &errors) {
  bool valid = true;

  if (config.enabled && config.values.empty()) {
    errors.push_back("Percentiles are enabled but no values are configured");
    valid = false;
  }

  for (double p : config.values) {
    if (std::isnan(p) || p < 0.0 || p > 100.0) {
      errors.push_back("Percentile " + std::to_string(p) +
                       " must be between 0 and 100");
      valid = false;
    }
  }

  return valid;
}

bool validate_app_config(const AppConfig &config,
                         std::vector<std::string> &errors) {
  bool valid = true;

  if (!validate_percentile_config(config.percentiles, errors)) {
    valid = false;
  }

  // The same file listed twice would be counted twice by the reducer
  std::vector<std::string> sorted_paths = config.partition_paths;
  std::sort(sorted_paths.begin(), sorted_paths.end());
  auto duplicate = std::adjacent_find(sorted_paths.begin(), sorted_paths.end());
  if (duplicate != sorted_paths.end()) {
    errors.push_back("Partition path listed more than once: " + *duplicate);
    valid = false;
  }

  if (!config.snapshot.output_path.empty() &&
      std::find(config.partition_paths.begin(), config.partition_paths.end(),
                config.snapshot.output_path) !=
          config.partition_paths.end()) {
    errors.push_back("Snapshot output path must not be a partition path");
    valid = false;
  }

  return valid;
}

bool parse_config_into(const std::string &filepath, AppConfig &config,
                       std::vector<std::string> &errors) {
  std::cerr << "Attempting to load configuration from " << filepath
            << std::endl;
  std::ifstream config_file(filepath);

  if (!config_file.is_open()) {
    std::cerr << "Warning: Could not open config file '" << filepath
              << "'. Using default configuration values." << std::endl;
    return false;
  }

  std::string line;
  std::string current_section;

  int line_num = 0;
  while (std::getline(config_file, line)) {
    line_num++;
    std::string trimmed_line = Utils::trim_copy(line);

    // Skip empty lines and comments
    if (trimmed_line.empty() || trimmed_line[0] == '#' ||
        trimmed_line[0] == ';')
      continue;

    // Section header [SectionName]
    if (trimmed_line[0] == '[' && trimmed_line.back() == ']') {
      current_section =
          Utils::trim_copy(trimmed_line.substr(1, trimmed_line.length() - 2));
      continue;
    }

    // Key-value pair parsing
    size_t delimiter_pos = trimmed_line.find('=');
    if (delimiter_pos == std::string::npos) {
      std::cerr << "Warning (Config Line " << line_num
                << "): Invalid format (missing '='): " << trimmed_line
                << std::endl;
      continue;
    }

    std::string key = Utils::trim_copy(trimmed_line.substr(0, delimiter_pos));
    std::string value =
        Utils::trim_copy(trimmed_line.substr(delimiter_pos + 1));

    if (key.empty()) {
      std::cerr << "Warning (Config Line " << line_num << "): Empty key found."
                << std::endl;
      continue;
    }

    // Global (non-section) keys
    if (current_section.empty()) {
      if (key == Keys::PARTITION_PATHS)
        config.partition_paths = Utils::split_list(value, ',');
      else if (key == Keys::PARSE_ERROR_POLICY) {
        if (!string_to_parse_error_policy(value, config.parse_error_policy))
          std::cerr << "Warning (Config Line " << line_num
                    << "): Unknown parse_error_policy '" << value
                    << "', keeping '"
                    << parse_error_policy_to_string(config.parse_error_policy)
                    << "'" << std::endl;
      } else if (key == Keys::REPORT_OUTPUT_PATH)
        config.report_output_path = value;
      else
        warn_unknown_key(line_num, current_section, key);

      // Reducer Settings
    } else if (current_section == "Reducer") {
      if (key == Keys::RD_FAIL_FAST)
        config.reducer.fail_fast = string_to_bool(value);
      else
        warn_unknown_key(line_num, current_section, key);

      // Percentile Settings
    } else if (current_section == "Percentiles") {
      if (key == Keys::PC_ENABLED)
        config.percentiles.enabled = string_to_bool(value);
      else if (key == Keys::PC_VALUES)
        config.percentiles.values =
            string_to_percentiles(value, line_num, errors);
      else
        warn_unknown_key(line_num, current_section, key);

      // Metrics Settings
    } else if (current_section == "Metrics") {
      if (key == Keys::MT_ENABLED)
        config.metrics.enabled = string_to_bool(value);
      else if (key == Keys::MT_OUTPUT_PATH)
        config.metrics.output_path = value;
      else
        warn_unknown_key(line_num, current_section, key);

      // Snapshot Settings
    } else if (current_section == "Snapshot") {
      if (key == Keys::SN_OUTPUT_PATH)
        config.snapshot.output_path = value;
      else if (key == Keys::SN_INPUT_PATHS)
        config.snapshot.input_paths = Utils::split_list(value, ',');
      else
        warn_unknown_key(line_num, current_section, key);

      // Logging Settings
    } else if (current_section == "Logging") {
      if (key == Keys::LOGGING_DEFAULT_LEVEL) {
        LogLevel default_level = string_to_log_level(value);
        for (auto &pair : config.logging.log_levels)
          pair.second = default_level;
      } else {
        auto comp_it = key_to_component_map.find(key);
        if (comp_it != key_to_component_map.end())
          config.logging.log_levels[comp_it->second] =
              string_to_log_level(value);
        else if (key.length() > 2 && key.substr(key.length() - 2) == ".*") {
          // Wildcard match, e.g., "stats.* = DEBUG"
          std::string prefix = key.substr(0, key.length() - 1);
          for (const auto &pair : key_to_component_map) {
            if (pair.first.rfind(prefix, 0) == 0)
              config.logging.log_levels[pair.second] =
                  string_to_log_level(value);
          }
        } else
          std::cerr << "Warning (Config Line " << line_num
                    << "): Unknown logging component '" << key << "'"
                    << std::endl;
      }
    } else {
      std::cerr << "Warning (Config Line " << line_num
                << "): Unknown section '" << current_section << "'"
                << std::endl;
    }
  }

  return true;
}

bool ConfigManager::load_configuration(const std::string &filepath) {
  config_filepath_ = filepath;
  auto new_config = std::make_shared<AppConfig>();

  // Use the parsing logic to fill the new config object. Values that cannot
  // be parsed are collected with the validation errors below.
  std::vector<std::string> validation_errors;
  if (!parse_config_into(filepath, *new_config, validation_errors)) {
    std::cerr << "Failed to parse configuration file: " << filepath
              << ". Keeping existing settings." << std::endl;
    return false;
  }

  // Validate the configuration
  const bool valid = validate_app_config(*new_config, validation_errors);
  if (!valid || !validation_errors.empty()) {
    std::cerr << "Configuration validation failed:" << std::endl;
    for (const auto &error : validation_errors) {
      std::cerr << "  - " << error << std::endl;
    }
    std::cerr << "Keeping existing settings." << std::endl;
    return false;
  }

  // Atomically swap the pointer
  std::lock_guard<std::mutex> lock(config_mutex_);
  current_config_ = new_config;
  std::cerr << "Configuration loaded and validated successfully from "
            << config_filepath_ << std::endl;
  return true;
}

std::shared_ptr<const AppConfig> ConfigManager::get_config() const {
  std::lock_guard<std::mutex> lock(config_mutex_);
  return current_config_;
}

} // namespace Config
