#include "batch_worker.hpp"

#include "document_processor.hpp"
#include "internal/observability/logging.hpp"
#include "internal/report/batch_report.hpp"

namespace relaynorm::pipeline {

BatchWorker::BatchWorker(std::shared_ptr<BatchScheduler> scheduler, const DocumentProcessor& processor, report::BatchReport& report)
    : scheduler_(std::move(scheduler)), processor_(processor), report_(report) {
}

BatchWorker::~BatchWorker() {
  Join();
}

void BatchWorker::Start() {
  thread_ = std::thread(&BatchWorker::Run, this);
}

void BatchWorker::Join() {
  if (thread_.joinable()) thread_.join();
}

void BatchWorker::Run() {
  for (;;) {
    auto task = scheduler_->Dequeue();
    if (!task) break;

    ProcessResult result;
    try {
      result = processor_.Process(task->path);
    } catch (const std::exception& e) {
      // Process() reports document errors itself; only the unexpected lands here
      RELAYNORM_LOG_ERROR("Document processing aborted", {observability::StringField("file", task->path.string()),
                                                          observability::StringField("error", e.what())});
      result.outcome.set_path(task->path.string());
      result.outcome.set_status(relaynorm::v1::OUTCOME_STATUS_FAILED);
      result.outcome.set_detail(e.what());
      auto& item = result.review_items.emplace_back();
      item.set_path(task->path.string());
      item.set_kind(relaynorm::v1::REVIEW_KIND_PROCESSING_ERROR);
      item.set_detail(e.what());
    }
    report_.Record(std::move(result.outcome), std::move(result.review_items));
  }
}

} // namespace relaynorm::pipeline
