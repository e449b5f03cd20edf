#ifndef LOGGER_HPP
#define LOGGER_HPP

#include "config.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <map>
#include <mutex>
#include <sstream>

// Enum for standard log severity levels
enum class LogLevel { TRACE, DEBUG, INFO, WARN, ERROR, FATAL };

// Enum for all granular application components
enum class LogComponent {
  // Top-level components
  CORE,
  CONFIG,

  // IO sub-components
  IO_SOURCE,

  // Statistics sub-components
  STATS_AGGREGATE,
  STATS_PERCENTILE,
  STATS_SNAPSHOT,

  // Streaming and reduction
  STREAM_DRIVER,
  REDUCER_MAP,
  REDUCER_REDUCE
};

class LogManager {
public:
  static LogManager &instance() {
    static LogManager instance;
    return instance;
  }

  void configure(const Config::LoggingConfig &config) {
    std::lock_guard<std::mutex> lock(mutex_);
    log_levels_ = config.log_levels;
  }

  bool should_log(LogLevel level, LogComponent component) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = log_levels_.find(component);
    if (it == log_levels_.end())
      return level >= LogLevel::WARN;

    return level >= it->second;
  }

  // Serializes whole lines so that workers do not interleave output. Logs go
  // to stderr; stdout is reserved for the report.
  void write(const std::string &line) {
    std::lock_guard<std::mutex> lock(output_mutex_);
    std::cerr << line << std::endl;
  }

private:
  LogManager() = default; // Private constructor for singleton
  std::map<LogComponent, LogLevel> log_levels_;
  mutable std::mutex mutex_;
  std::mutex output_mutex_;
};

// --- The Core Logging Macro ---
// It's a macro so that if `should_log` returns false, the message and its
// arguments are never even evaluated.
#define LOG(level, component, message)                                         \
  do {                                                                         \
    if (LogManager::instance().should_log(level, component)) {                 \
      auto now = std::chrono::system_clock::now();                             \
      auto time_t_now = std::chrono::system_clock::to_time_t(now);             \
      auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(         \
                    now.time_since_epoch()) %                                  \
                1000;                                                          \
      std::tm tm_utc{};                                                        \
      gmtime_r(&time_t_now, &tm_utc);                                          \
      std::ostringstream oss;                                                  \
      oss << std::put_time(&tm_utc, "%Y-%m-%dT%H:%M:%S") << '.'                \
          << std::setw(3) << std::setfill('0') << ms.count() << "Z ";          \
      oss << "[" << level_to_string(level) << "] ";                            \
      oss << "[" << component_to_string(component) << "] ";                    \
      oss << "[" << __FILE__ << ":" << __LINE__ << "] ";                       \
      oss << message;                                                          \
      LogManager::instance().write(oss.str());                                 \
    }                                                                          \
  } while (0)

// --- Helper Functions to Convert Enums to Strings for Printing ---

inline const char *level_to_string(LogLevel level) {
  switch (level) {
  case LogLevel::TRACE:
    return "TRACE";
  case LogLevel::DEBUG:
    return "DEBUG";
  case LogLevel::INFO:
    return "INFO";
  case LogLevel::WARN:
    return "WARN";
  case LogLevel::ERROR:
    return "ERROR";
  case LogLevel::FATAL:
    return "FATAL";
  }
  return "UNKNOWN";
}

inline const char *component_to_string(LogComponent component) {
  switch (component) {
  case LogComponent::CORE:
    return "CORE";
  case LogComponent::CONFIG:
    return "CONFIG";
  case LogComponent::IO_SOURCE:
    return "IO.SOURCE";
  case LogComponent::STATS_AGGREGATE:
    return "STATS.AGGREGATE";
  case LogComponent::STATS_PERCENTILE:
    return "STATS.PERCENTILE";
  case LogComponent::STATS_SNAPSHOT:
    return "STATS.SNAPSHOT";
  case LogComponent::STREAM_DRIVER:
    return "STREAM.DRIVER";
  case LogComponent::REDUCER_MAP:
    return "REDUCER.MAP";
  case LogComponent::REDUCER_REDUCE:
    return "REDUCER.REDUCE";
  }
  return "GENERAL";
}

#endif // LOGGER_HPP
