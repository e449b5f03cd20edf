#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>

// What a value source does with a line it cannot convert to a number
enum class ParseErrorPolicy { ABORT, SKIP };

inline const char *parse_error_policy_to_string(ParseErrorPolicy policy) {
  switch (policy) {
  case ParseErrorPolicy::ABORT:
    return "abort";
  case ParseErrorPolicy::SKIP:
    return "skip";
  }
  return "unknown";
}

// Root of every error raised by the statistics core
class StatsError : public std::runtime_error {
public:
  explicit StatsError(const std::string &what) : std::runtime_error(what) {}
};

// A value was requested from an aggregate that has not seen any data
class EmptyAggregateError : public StatsError {
public:
  explicit EmptyAggregateError(const std::string &aggregate)
      : StatsError("no data: " + aggregate + " has no observations") {}
};

class InvalidPercentileError : public StatsError {
public:
  explicit InvalidPercentileError(double percentile)
      : StatsError("invalid percentile: " + std::to_string(percentile) +
                   " is outside [0, 100]"),
        percentile_(percentile) {}

  double percentile() const { return percentile_; }

private:
  double percentile_;
};

// A source value could not be converted to a number. `line` is 1-based and 0
// when the value did not come from a line oriented source.
class ParseError : public StatsError {
public:
  ParseError(std::string source_id, uint64_t line, std::string offending_value)
      : StatsError("parse error in '" + source_id + "' at line " +
                   std::to_string(line) + ": cannot convert '" +
                   offending_value + "'"),
        source_id_(std::move(source_id)), line_(line),
        offending_value_(std::move(offending_value)) {}

  const std::string &source_id() const { return source_id_; }
  uint64_t line() const { return line_; }
  const std::string &offending_value() const { return offending_value_; }

private:
  std::string source_id_;
  uint64_t line_;
  std::string offending_value_;
};

// The underlying data segment could not be opened or read
class PartitionReadError : public StatsError {
public:
  PartitionReadError(std::string source_id, const std::string &reason)
      : StatsError("cannot read '" + source_id + "': " + reason),
        source_id_(std::move(source_id)) {}

  const std::string &source_id() const { return source_id_; }

private:
  std::string source_id_;
};

#endif // ERRORS_HPP
