#include "batch_scheduler.hpp"

#include <stdexcept>

namespace relaynorm::pipeline {

void BatchScheduler::Enqueue(BatchTask task) {
  {
    std::lock_guard lock(mutex_);
    if (shutdown_) throw std::logic_error("batch scheduler is shut down");
    queue_.push(std::move(task));
  }
  cv_.notify_one();
}

std::optional<BatchTask> BatchScheduler::Dequeue() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

  if (shutdown_ && queue_.empty()) return std::nullopt;

  BatchTask task = std::move(queue_.front());
  queue_.pop();
  return task;
}

void BatchScheduler::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

std::size_t BatchScheduler::Pending() const {
  std::lock_guard lock(mutex_);
  return queue_.size();
}

} // namespace relaynorm::pipeline
