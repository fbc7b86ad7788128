#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <queue>

#include "batch_task.hpp"

namespace relaynorm::pipeline {

/*
  Thread-safe blocking queue feeding the batch workers.

  After Shutdown() workers drain what is left and then get nullopt.
*/
class BatchScheduler {
 public:
  void Enqueue(BatchTask task);

  // blocking wait
  std::optional<BatchTask> Dequeue();

  void Shutdown();

  std::size_t Pending() const;

 private:
  mutable std::mutex      mutex_;
  std::condition_variable cv_;
  std::queue<BatchTask>   queue_;
  bool                    shutdown_ = false;
};

} // namespace relaynorm::pipeline
