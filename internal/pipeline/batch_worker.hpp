#pragma once

#include <memory>
#include <thread>

#include "batch_scheduler.hpp"

namespace relaynorm::report {
class BatchReport;
}

namespace relaynorm::pipeline {

class DocumentProcessor;

/*
  One worker thread: takes documents off the scheduler, processes
  them and records the outcome. A failing document never stops the
  worker.
*/
class BatchWorker {
 public:
  BatchWorker(std::shared_ptr<BatchScheduler> scheduler, const DocumentProcessor& processor, report::BatchReport& report);
  ~BatchWorker();

  BatchWorker(const BatchWorker&)            = delete;
  BatchWorker& operator=(const BatchWorker&) = delete;

  void Start();

  // waits for the scheduler to drain; call Shutdown() on it first
  void Join();

 private:
  void Run();

  std::shared_ptr<BatchScheduler> scheduler_;
  const DocumentProcessor&        processor_;
  report::BatchReport&            report_;

  std::thread thread_;
};

} // namespace relaynorm::pipeline
