#include "memory_value_source.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

VectorValueSource::VectorValueSource(std::vector<double> values,
                                     std::string source_id)
    : values_(std::move(values)), source_id_(std::move(source_id)) {}

std::vector<double> VectorValueSource::get_next_batch() {
  const size_t end = std::min(values_.size(), position_ + BATCH_SIZE);
  std::vector<double> batch(values_.begin() + position_, values_.begin() + end);
  position_ = end;
  return batch;
}

GeneratorValueSource::GeneratorValueSource(Generator generator,
                                           std::string source_id)
    : generator_(std::move(generator)), source_id_(std::move(source_id)) {
  if (!generator_)
    throw std::invalid_argument("GeneratorValueSource needs a generator");
}

std::vector<double> GeneratorValueSource::get_next_batch() {
  if (exhausted_)
    return {};
  if (auto value = generator_())
    return {*value};
  exhausted_ = true;
  return {};
}
