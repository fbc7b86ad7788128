#include "document_processor.hpp"

#include "internal/extract/page_bundle_loader.hpp"
#include "internal/normalize/setting_builder.hpp"
#include "internal/observability/logging.hpp"
#include "internal/strategy/ini_document.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/strings.hpp"
#include "internal/util/time.hpp"

namespace relaynorm::pipeline {

namespace fs = std::filesystem;

using observability::IntField;
using observability::StringField;
using relaynorm::runtime::config::RuntimeConfig;

namespace {

void AddReview(ProcessResult& result, relaynorm::v1::ReviewKind kind, const std::string& detail, std::uint32_t page_index = 0,
               const std::string& parameter_code = {}) {
  auto& item = result.review_items.emplace_back();
  item.set_path(result.outcome.path());
  item.set_kind(kind);
  item.set_detail(detail);
  item.set_page_index(page_index);
  item.set_parameter_code(parameter_code);
}

void Finish(ProcessResult& result, relaynorm::v1::OutcomeStatus status, relaynorm::v1::ReviewKind kind, const std::string& detail) {
  result.outcome.set_status(status);
  result.outcome.set_detail(detail);
  AddReview(result, kind, detail);
}

bool HasIniSections(const std::string& text) {
  return strategy::IniDocument::Parse(text).SectionCount() > 0;
}

} // namespace

DocumentProcessor::DocumentProcessor(const RuntimeConfig&                config,
                                     const config::ProfileRegistry&      registry,
                                     const strategy::StrategyDispatcher& strategies,
                                     std::shared_ptr<db::Repository>     repository)
    : config_(config),
      registry_(registry),
      strategies_(strategies),
      scanner_(config),
      models_(registry.Profiles()),
      decoder_({config.batch().encodings().begin(), config.batch().encodings().end()}),
      equipment_(config.equipment_patterns()),
      grouper_(config.multipart_patterns()),
      writer_(std::move(repository)) {
}

ProcessResult DocumentProcessor::Process(const fs::path& path) const {
  ProcessResult result;
  result.outcome.set_path(path.string());
  const auto started = util::Now();

  try {
    Run(path, result);
  } catch (const util::EncodingUnresolved& e) {
    Finish(result, relaynorm::v1::OUTCOME_STATUS_SKIPPED, relaynorm::v1::REVIEW_KIND_ENCODING_UNRESOLVED, e.what());
  } catch (const util::UnknownModel& e) {
    Finish(result, relaynorm::v1::OUTCOME_STATUS_SKIPPED, relaynorm::v1::REVIEW_KIND_UNKNOWN_MODEL, e.what());
  } catch (const util::UnresolvedEquipment& e) {
    Finish(result, relaynorm::v1::OUTCOME_STATUS_SKIPPED, relaynorm::v1::REVIEW_KIND_UNRESOLVED_EQUIPMENT, e.what());
  } catch (const util::IntegrityMismatch& e) {
    Finish(result, relaynorm::v1::OUTCOME_STATUS_FAILED, relaynorm::v1::REVIEW_KIND_INTEGRITY_MISMATCH, e.what());
  } catch (const std::exception& e) {
    Finish(result, relaynorm::v1::OUTCOME_STATUS_FAILED, relaynorm::v1::REVIEW_KIND_PROCESSING_ERROR, e.what());
  }

  result.outcome.set_duration_ms(util::MillisBetween(started, util::Now()));

  const auto& outcome = result.outcome;
  const auto  status  = relaynorm::v1::OutcomeStatus_Name(outcome.status());
  if (outcome.status() == relaynorm::v1::OUTCOME_STATUS_SUCCESS) {
    RELAYNORM_LOG_INFO("Document processed",
                       {StringField("file", path.filename().string()), StringField("model", outcome.model()),
                        StringField("equipment", outcome.equipment_tag()), IntField("settings", outcome.parameter_count()),
                        IntField("active_functions", outcome.active_function_count()), IntField("duration_ms", outcome.duration_ms())});
  } else {
    RELAYNORM_LOG_WARN("Document not processed",
                       {StringField("file", path.filename().string()), StringField("status", status), StringField("detail", outcome.detail())});
  }
  return result;
}

void DocumentProcessor::Run(const fs::path& path, ProcessResult& result) const {
  auto& outcome = result.outcome;

  const auto bytes    = ingest::DocumentScanner::ReadFile(path);
  const auto document = scanner_.Describe(path, bytes);
  if (document.kind == model::DocumentKind::kUnknown) {
    Finish(result, relaynorm::v1::OUTCOME_STATUS_SKIPPED, relaynorm::v1::REVIEW_KIND_UNRECOGNIZED_FILE,
           "unrecognized file type '" + document.extension + "'");
    return;
  }

  auto content = document.kind == model::DocumentKind::kPageBundle ? LoadBundle(document, bytes) : LoadText(document, bytes);

  // ---- model ----
  const auto  sample_size = static_cast<std::size_t>(config_.batch().sniff_bytes());
  const auto& profile     = models_.Resolve(content.document.file_name, content.document.extension, content.text.substr(0, sample_size));
  const auto& entry       = registry_.Get(profile.name());
  const auto& detector    = strategies_.For(profile.name());
  outcome.set_model(profile.name());
  outcome.set_strategy(std::string(model::ToString(detector.Method())));

  if (!CheckCalibration(entry, result)) return;

  if (content.document.kind == model::DocumentKind::kPlainText &&
      profile.strategy() == relaynorm::runtime::config::DETECTION_STRATEGY_KEYED_SECTION && !HasIniSections(content.text)) {
    auto decoded = decoder_.Decode(bytes, HasIniSections);
    if (!decoded) {
      throw util::EncodingUnresolved("no encoding of '" + content.document.file_name + "' yields a keyed-section document");
    }
    content.text     = std::move(decoded->text);
    content.encoding = std::move(decoded->encoding);
    content.pages.front().layer = extract::TextToPage(content.text, 0);
  }
  outcome.set_encoding(content.encoding);

  // ---- parameter lines ----
  if (auto structured = detector.StructuredLines(content)) {
    for (auto& line : *structured) {
      if (line.page_index < content.pages.size()) content.pages[line.page_index].lines.push_back(std::move(line));
    }
  } else {
    for (auto& page : content.pages) page.lines = entry.extractor->Extract(page.layer);
  }

  std::vector<model::ParameterLine> lines;
  std::uint32_t                     parametric = 0;
  for (const auto& page : content.pages) {
    if (page.lines.empty()) {
      AddReview(result, relaynorm::v1::REVIEW_KIND_NON_PARAMETRIC_PAGE, "no parameter codes on page", page.layer.index());
      continue;
    }
    ++parametric;
    lines.insert(lines.end(), page.lines.begin(), page.lines.end());
  }
  outcome.set_page_count(static_cast<std::uint32_t>(content.pages.size()));
  outcome.set_parametric_pages(parametric);

  // ---- active functions ----
  std::vector<strategy::ReviewNote> notes;
  const auto                        flags = detector.Detect(content, notes);
  for (const auto& note : notes) AddReview(result, note.kind, note.detail, note.page_index, note.parameter_code);

  // ---- equipment ----
  auto hint = detector.EquipmentHint(content);
  if (!hint) hint = registry_.EquipmentHint(entry, content.text);
  const auto identity = equipment_.Resolve(content.document.file_name, hint);
  if (!identity) {
    throw util::UnresolvedEquipment("no equipment pattern matches '" + content.document.file_name + "'");
  }
  outcome.set_equipment_tag(identity->tag);

  // ---- settings ----
  const auto& document_id = content.document.document_id;
  normalize::SettingBuilder builder(*entry.normalizer, grouper_);
  const auto contents = builder.Build(identity->tag, document_id, lines, flags);

  persist::DocumentRows rows;
  rows.relay_model.model_code       = profile.name();
  rows.relay_model.manufacturer     = profile.manufacturer();
  rows.relay_model.detection_method = outcome.strategy();

  rows.equipment.tag         = identity->tag;
  rows.equipment.substation  = identity->substation;
  rows.equipment.device_type = identity->device_type;
  rows.equipment.position    = identity->position;
  rows.equipment.model_code  = profile.name();

  rows.document.document_id     = document_id;
  rows.document.file_name       = content.document.file_name;
  rows.document.equipment_tag   = identity->tag;
  rows.document.model_code      = profile.name();
  rows.document.encoding        = content.encoding;
  rows.document.page_count      = outcome.page_count();
  rows.document.content_digest  = content.document.digest;
  rows.document.size_bytes      = content.document.size_bytes;
  rows.document.processed_at_ms = util::ToUnixMillis(util::Now());

  const auto summary = writer_.Write(rows, contents);

  outcome.set_parameter_count(static_cast<std::uint32_t>(summary.settings));
  outcome.set_active_function_count(static_cast<std::uint32_t>(summary.active_functions));
  outcome.set_status(relaynorm::v1::OUTCOME_STATUS_SUCCESS);
}

strategy::DocumentContent DocumentProcessor::LoadBundle(const model::SourceDocument& document, const std::string& bytes) const {
  const auto bundle = extract::PageBundleLoader::Parse(bytes, document.path.string());

  strategy::DocumentContent content;
  content.document = document;
  content.encoding = "utf-8";
  if (!bundle.source_file().empty()) {
    content.document.file_name = fs::path(bundle.source_file()).filename().string();
    content.document.extension = util::FoldCase(fs::path(content.document.file_name).extension().string());
  }

  for (const auto& page : bundle.pages()) {
    auto& out = content.pages.emplace_back();
    out.layer = page;
    if (!page.raster_path().empty()) out.raster_path = extract::PageBundleLoader::ResolveRaster(document.path, page);
  }
  content.text = extract::BundleText(bundle);
  return content;
}

strategy::DocumentContent DocumentProcessor::LoadText(const model::SourceDocument& document, const std::string& bytes) const {
  auto decoded = decoder_.Decode(bytes);
  if (!decoded) {
    throw util::EncodingUnresolved("none of " + util::Join(decoder_.Encodings(), ", ") + " decodes '" + document.file_name + "' cleanly");
  }

  strategy::DocumentContent content;
  content.document = document;
  content.text     = std::move(decoded->text);
  content.encoding = std::move(decoded->encoding);

  auto& page = content.pages.emplace_back();
  page.layer = extract::TextToPage(content.text, 0);
  return content;
}

bool DocumentProcessor::CheckCalibration(const config::ProfileEntry& entry, ProcessResult& result) const {
  switch (entry.calibration) {
    case config::CalibrationState::kFailed:
      Finish(result, relaynorm::v1::OUTCOME_STATUS_SKIPPED, relaynorm::v1::REVIEW_KIND_CALIBRATION_FAILED, entry.calibration_detail);
      return false;
    case config::CalibrationState::kUncalibrated:
      result.outcome.set_uncalibrated(true);
      if (config_.batch().strict_calibration()) {
        Finish(result, relaynorm::v1::OUTCOME_STATUS_SKIPPED, relaynorm::v1::REVIEW_KIND_UNCALIBRATED_PROFILE,
               entry.calibration_detail + "; strict calibration is on");
        return false;
      }
      AddReview(result, relaynorm::v1::REVIEW_KIND_UNCALIBRATED_PROFILE, entry.calibration_detail);
      return true;
    case config::CalibrationState::kNotApplicable:
    case config::CalibrationState::kPassed:
      break;
  }
  return true;
}

} // namespace relaynorm::pipeline
