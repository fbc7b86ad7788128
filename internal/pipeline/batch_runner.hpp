#pragma once

#include "config/config.pb.h"
#include "relaynorm/v1/report.pb.h"

namespace relaynorm::pipeline {

class DocumentProcessor;

/*
  BatchRunner

  Scans batch.input_directory, fans the files out to
  batch.worker_threads workers and collects the batch report. The
  report is also written to batch.report_path when one is set.
*/
class BatchRunner {
 public:
  BatchRunner(const relaynorm::runtime::config::RuntimeConfig& config, const DocumentProcessor& processor);

  relaynorm::v1::BatchReport Run() const;

 private:
  const relaynorm::runtime::config::RuntimeConfig& config_;
  const DocumentProcessor&                         processor_;
};

} // namespace relaynorm::pipeline
