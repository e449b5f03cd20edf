#ifndef FILE_VALUE_SOURCE_HPP
#define FILE_VALUE_SOURCE_HPP

#include "base_value_source.hpp"
#include "core/errors.hpp"

#include <cstddef>
#include <cstdint>
#include <fstream>
#include <string>
#include <vector>

// Reads one floating-point value per line from a text file. Blank lines and
// lines starting with '#' are ignored.
class FileValueSource : public IValueSource {
public:
  /**
   * @param source_id Name used in logs and errors; defaults to `filepath`
   * @throws PartitionReadError when the file cannot be opened
   */
  explicit FileValueSource(const std::string &filepath,
                           ParseErrorPolicy policy = ParseErrorPolicy::ABORT,
                           std::string source_id = "");
  ~FileValueSource() override;

  /**
   * @throws ParseError on a malformed line under ParseErrorPolicy::ABORT
   * @throws PartitionReadError when the stream fails mid-read
   */
  std::vector<double> get_next_batch() override;
  bool exhausted() const override { return exhausted_; }
  const std::string &source_id() const override { return source_id_; }

  uint64_t lines_read() const { return line_number_; }
  uint64_t lines_skipped() const { return lines_skipped_; }

private:
  std::string source_id_;
  ParseErrorPolicy policy_;
  std::ifstream value_file_stream_;
  uint64_t line_number_ = 0;
  uint64_t lines_skipped_ = 0;
  bool exhausted_ = false;
  static constexpr size_t BATCH_SIZE = 1000;
};

#endif // FILE_VALUE_SOURCE_HPP
