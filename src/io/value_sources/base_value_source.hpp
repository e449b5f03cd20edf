#ifndef BASE_VALUE_SOURCE_HPP
#define BASE_VALUE_SOURCE_HPP

#include <string>
#include <vector>

// A stream of numeric observations, bounded (a file, a vector) or unbounded
// (a generator, a channel)
class IValueSource {
public:
  virtual ~IValueSource() = default;

  // Fetches the next batch of values
  // The definition of a "batch" is implementation-specific
  // Returns an empty vector if no new values are available right now
  virtual std::vector<double> get_next_batch() = 0;

  // True once the source will never produce another value
  virtual bool exhausted() const = 0;

  virtual const std::string &source_id() const = 0;
};

#endif // BASE_VALUE_SOURCE_HPP
