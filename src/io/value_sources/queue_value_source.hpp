#ifndef QUEUE_VALUE_SOURCE_HPP
#define QUEUE_VALUE_SOURCE_HPP

#include "base_value_source.hpp"
#include "utils/thread_safe_queue.hpp"

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

// Consumer end of a channel fed by other threads. The stream ends once the
// queue has been closed and drained.
class QueueValueSource : public IValueSource {
public:
  /**
   * @param poll_timeout How long one get_next_batch() waits for the first
   * value. Bounded so that a driver can notice a stop request.
   */
  explicit QueueValueSource(
      ThreadSafeQueue<double> &queue, std::string source_id = "queue",
      std::chrono::milliseconds poll_timeout = std::chrono::milliseconds(50));

  std::vector<double> get_next_batch() override;
  bool exhausted() const override;
  const std::string &source_id() const override { return source_id_; }

private:
  ThreadSafeQueue<double> &queue_;
  std::string source_id_;
  std::chrono::milliseconds poll_timeout_;
  static constexpr size_t BATCH_SIZE = 1000;
};

#endif // QUEUE_VALUE_SOURCE_HPP
