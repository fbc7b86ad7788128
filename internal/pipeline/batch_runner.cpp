#include "batch_runner.hpp"

#include <algorithm>
#include <cstdint>
#include <memory>
#include <vector>

#include "batch_scheduler.hpp"
#include "batch_worker.hpp"
#include "document_processor.hpp"
#include "internal/ingest/document_scanner.hpp"
#include "internal/observability/logging.hpp"
#include "internal/report/batch_report.hpp"

namespace relaynorm::pipeline {

using observability::IntField;
using observability::StringField;

BatchRunner::BatchRunner(const relaynorm::runtime::config::RuntimeConfig& config, const DocumentProcessor& processor)
    : config_(config), processor_(processor) {
}

relaynorm::v1::BatchReport BatchRunner::Run() const {
  const auto& batch = config_.batch();

  report::BatchReport report;

  ingest::DocumentScanner scanner(config_);
  const auto              files = scanner.Scan(batch.input_directory(), batch.recursive());

  const std::size_t threads = std::max<std::size_t>(1, std::min<std::size_t>(batch.worker_threads(), std::max<std::size_t>(1, files.size())));
  RELAYNORM_LOG_INFO("Batch started",
                     {StringField("input", batch.input_directory()), IntField("documents", static_cast<std::int64_t>(files.size())),
                      IntField("workers", static_cast<std::int64_t>(threads))});

  auto scheduler = std::make_shared<BatchScheduler>();

  std::vector<std::unique_ptr<BatchWorker>> workers;
  workers.reserve(threads);
  for (std::size_t i = 0; i < threads; ++i) {
    workers.push_back(std::make_unique<BatchWorker>(scheduler, processor_, report));
    workers.back()->Start();
  }

  for (std::size_t i = 0; i < files.size(); ++i) {
    scheduler->Enqueue({files[i], i});
  }
  scheduler->Shutdown();

  for (auto& worker : workers) worker->Join();

  auto out = report.Finish();
  report::BatchReport::LogSummary(out);
  if (!batch.report_path().empty()) {
    report::BatchReport::WriteFile(out, batch.report_path());
  }
  return out;
}

} // namespace relaynorm::pipeline
