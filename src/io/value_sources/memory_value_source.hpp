#ifndef MEMORY_VALUE_SOURCE_HPP
#define MEMORY_VALUE_SOURCE_HPP

#include "base_value_source.hpp"

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

// Bounded source over values already in memory
class VectorValueSource : public IValueSource {
public:
  explicit VectorValueSource(std::vector<double> values,
                             std::string source_id = "memory");

  std::vector<double> get_next_batch() override;
  bool exhausted() const override { return position_ >= values_.size(); }
  const std::string &source_id() const override { return source_id_; }

private:
  std::vector<double> values_;
  std::string source_id_;
  size_t position_ = 0;
  static constexpr size_t BATCH_SIZE = 1000;
};

// Pulls values from a callback, one per batch; std::nullopt ends the stream.
// Without a nullopt the stream is unbounded.
class GeneratorValueSource : public IValueSource {
public:
  using Generator = std::function<std::optional<double>()>;

  explicit GeneratorValueSource(Generator generator,
                                std::string source_id = "generator");

  std::vector<double> get_next_batch() override;
  bool exhausted() const override { return exhausted_; }
  const std::string &source_id() const override { return source_id_; }

private:
  Generator generator_;
  std::string source_id_;
  bool exhausted_ = false;
};

#endif // MEMORY_VALUE_SOURCE_HPP
