#ifndef PARTITION_HPP
#define PARTITION_HPP

#include "core/errors.hpp"
#include "io/value_sources/base_value_source.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace reduce {

enum class FailureKind { PARSE, READ, INTERNAL, CANCELLED };

inline const char *failure_kind_to_string(FailureKind kind) {
  switch (kind) {
  case FailureKind::PARSE:
    return "parse";
  case FailureKind::READ:
    return "read";
  case FailureKind::INTERNAL:
    return "internal";
  case FailureKind::CANCELLED:
    return "cancelled";
  }
  return "unknown";
}

// Why a partition did not contribute to the merged result. `line` and
// `offending_value` are only set for PARSE failures.
struct PartitionFailure {
  std::string partition_id;
  FailureKind kind;
  std::string message;
  uint64_t line = 0;
  std::string offending_value;
};

// One independently readable data segment. `open` is called on the worker
// thread and must return a source that shares no state with other partitions.
struct PartitionSpec {
  std::string id;
  std::function<std::unique_ptr<IValueSource>()> open;
};

// One partition per file, identified by its path
std::vector<PartitionSpec> file_partitions(const std::vector<std::string> &paths,
                                           ParseErrorPolicy policy);

// In-memory partitions, identified as "<prefix>-<index>"
std::vector<PartitionSpec>
memory_partitions(const std::vector<std::vector<double>> &chunks,
                  const std::string &prefix = "chunk");

} // namespace reduce

#endif // PARTITION_HPP
