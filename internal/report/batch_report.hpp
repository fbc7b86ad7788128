#pragma once

#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

#include "internal/util/time.hpp"
#include "relaynorm/v1/report.pb.h"

namespace relaynorm::report {

/*
  BatchReport

  Accumulates per-document outcomes and review items from all workers.
  Record() is the only mutation and is safe to call concurrently.
  Finish() sorts outcomes and items by path so the report does not
  depend on worker scheduling.
*/
class BatchReport {
 public:
  explicit BatchReport(util::TimePoint started_at = util::Now());

  void Record(relaynorm::v1::DocumentOutcome outcome, std::vector<relaynorm::v1::ReviewItem> items);

  relaynorm::v1::BatchReport Finish(util::TimePoint finished_at = util::Now()) const;

  static std::string ToJson(const relaynorm::v1::BatchReport& report);

  // writes ToJson() to path, creating parent directories
  static void WriteFile(const relaynorm::v1::BatchReport& report, const std::filesystem::path& path);

  static void LogSummary(const relaynorm::v1::BatchReport& report);

 private:
  mutable std::mutex         mutex_;
  util::TimePoint            started_at_;
  relaynorm::v1::BatchReport report_;
};

} // namespace relaynorm::report
