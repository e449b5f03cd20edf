#include "queue_value_source.hpp"

#include <utility>

QueueValueSource::QueueValueSource(ThreadSafeQueue<double> &queue,
                                   std::string source_id,
                                   std::chrono::milliseconds poll_timeout)
    : queue_(queue), source_id_(std::move(source_id)),
      poll_timeout_(poll_timeout) {}

std::vector<double> QueueValueSource::get_next_batch() {
  std::vector<double> batch;
  auto first = queue_.wait_and_pop_for(poll_timeout_);
  if (!first)
    return batch;

  batch.push_back(*first);
  // Take whatever else is already queued without blocking again
  while (batch.size() < BATCH_SIZE) {
    auto next = queue_.try_pop();
    if (!next)
      break;
    batch.push_back(*next);
  }
  return batch;
}

bool QueueValueSource::exhausted() const {
  return queue_.is_closed() && queue_.empty();
}
