#include "batch_report.hpp"

#include <algorithm>
#include <fstream>

#include <google/protobuf/util/json_util.h>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace relaynorm::report {

using observability::IntField;
using observability::StringField;

BatchReport::BatchReport(util::TimePoint started_at) : started_at_(started_at) {
}

void BatchReport::Record(relaynorm::v1::DocumentOutcome outcome, std::vector<relaynorm::v1::ReviewItem> items) {
  std::lock_guard lock(mutex_);

  report_.set_documents_total(report_.documents_total() + 1);
  switch (outcome.status()) {
    case relaynorm::v1::OUTCOME_STATUS_SUCCESS:
      report_.set_documents_succeeded(report_.documents_succeeded() + 1);
      report_.set_settings_written(report_.settings_written() + outcome.parameter_count());
      report_.set_active_functions_written(report_.active_functions_written() + outcome.active_function_count());
      break;
    case relaynorm::v1::OUTCOME_STATUS_SKIPPED:
      report_.set_documents_skipped(report_.documents_skipped() + 1);
      break;
    default:
      report_.set_documents_failed(report_.documents_failed() + 1);
      break;
  }

  *report_.add_outcomes() = std::move(outcome);
  for (auto& item : items) *report_.add_review_items() = std::move(item);
}

relaynorm::v1::BatchReport BatchReport::Finish(util::TimePoint finished_at) const {
  relaynorm::v1::BatchReport out;
  {
    std::lock_guard lock(mutex_);
    out = report_;
  }
  *out.mutable_started_at()  = util::ToProto(started_at_);
  *out.mutable_finished_at() = util::ToProto(finished_at);

  auto* outcomes = out.mutable_outcomes();
  std::stable_sort(outcomes->begin(), outcomes->end(),
                   [](const relaynorm::v1::DocumentOutcome& a, const relaynorm::v1::DocumentOutcome& b) { return a.path() < b.path(); });

  auto* items = out.mutable_review_items();
  std::stable_sort(items->begin(), items->end(), [](const relaynorm::v1::ReviewItem& a, const relaynorm::v1::ReviewItem& b) {
    if (a.path() != b.path()) return a.path() < b.path();
    return a.page_index() < b.page_index();
  });
  return out;
}

std::string BatchReport::ToJson(const relaynorm::v1::BatchReport& report) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace = true;
  options.preserve_proto_field_names = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(report, &json, options);
  if (!status.ok()) {
    throw std::runtime_error("batch report serialization failed: " + std::string(status.message()));
  }
  return json;
}

void BatchReport::WriteFile(const relaynorm::v1::BatchReport& report, const std::filesystem::path& path) {
  const auto json = ToJson(report);

  std::error_code ec;
  if (path.has_parent_path()) std::filesystem::create_directories(path.parent_path(), ec);

  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    throw util::InvalidInput("cannot write report '" + path.string() + "'");
  }
  out << json << '\n';
  if (!out) {
    throw util::InvalidInput("write error on report '" + path.string() + "'");
  }
  RELAYNORM_LOG_INFO("Batch report written", {StringField("path", path.string())});
}

void BatchReport::LogSummary(const relaynorm::v1::BatchReport& report) {
  RELAYNORM_LOG_INFO("Batch finished",
                     {IntField("documents", report.documents_total()), IntField("succeeded", report.documents_succeeded()),
                      IntField("skipped", report.documents_skipped()), IntField("failed", report.documents_failed()),
                      IntField("settings", static_cast<std::int64_t>(report.settings_written())),
                      IntField("active_functions", static_cast<std::int64_t>(report.active_functions_written())),
                      IntField("review_items", report.review_items_size())});
}

} // namespace relaynorm::report
