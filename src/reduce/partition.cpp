#include "partition.hpp"
#include "io/value_sources/file_value_source.hpp"
#include "io/value_sources/memory_value_source.hpp"

namespace reduce {

std::vector<PartitionSpec> file_partitions(const std::vector<std::string> &paths,
                                           ParseErrorPolicy policy) {
  std::vector<PartitionSpec> partitions;
  partitions.reserve(paths.size());
  for (const auto &path : paths) {
    partitions.push_back({path, [path, policy]() -> std::unique_ptr<IValueSource> {
                            return std::make_unique<FileValueSource>(path,
                                                                     policy);
                          }});
  }
  return partitions;
}

std::vector<PartitionSpec>
memory_partitions(const std::vector<std::vector<double>> &chunks,
                  const std::string &prefix) {
  std::vector<PartitionSpec> partitions;
  partitions.reserve(chunks.size());
  for (size_t i = 0; i < chunks.size(); ++i) {
    std::string id = prefix + "-" + std::to_string(i);
    partitions.push_back(
        {id, [values = chunks[i], id]() -> std::unique_ptr<IValueSource> {
           return std::make_unique<VectorValueSource>(values, id);
         }});
  }
  return partitions;
}

} // namespace reduce
