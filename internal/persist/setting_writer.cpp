#include "setting_writer.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace relaynorm::persist {

using observability::IntField;
using observability::StringField;

void ThrowIfDbError(const db::Result& result, const std::string& what) {
  if (result) return;
  throw util::StorageError(what + ": " + db::ToString(result.code) + (result.message.empty() ? "" : " (" + result.message + ")"));
}

db::model::SettingRecord ToRecord(const model::NormalizedSetting& setting) {
  db::model::SettingRecord r;
  r.equipment_tag  = setting.equipment_tag;
  r.parameter_code = setting.parameter_code;
  r.description    = setting.description;

  const auto& value = setting.value;
  r.value_type      = std::string(model::ToString(value.type));
  r.value_numeric   = value.numeric;
  r.unit            = value.unit;
  r.raw_value       = value.raw;
  switch (value.type) {
    case model::ValueType::kNumeric:
      r.value_text = value.numeric_text;
      break;
    case model::ValueType::kText:
    case model::ValueType::kBoolean:
      r.value_text = value.text;
      break;
    case model::ValueType::kEmpty:
      break;
  }

  r.is_multipart = setting.is_multipart;
  if (setting.is_multipart) {
    r.multipart_base = setting.multipart_base;
    r.multipart_part = static_cast<std::int32_t>(setting.multipart_part);
  }

  r.is_active = setting.is_active;
  if (setting.detection_method) r.detection_method = std::string(model::ToString(*setting.detection_method));

  r.document_id = setting.source_document;
  r.page_index  = setting.page_index;
  return r;
}

db::model::MultipartGroupRecord ToRecord(const model::MultipartGroup& group, const std::string& document_id) {
  db::model::MultipartGroupRecord r;
  r.equipment_tag = group.equipment_tag;
  r.base          = group.base;
  r.part_count    = static_cast<std::int32_t>(group.part_count);
  if (group.declared_total) r.declared_total = static_cast<std::int32_t>(*group.declared_total);
  r.document_id = document_id;
  return r;
}

db::model::ActiveFunctionRecord ToRecord(const model::ActiveFlagResult& flag, const std::string& equipment_tag, const std::string& document_id) {
  db::model::ActiveFunctionRecord r;
  r.equipment_tag    = equipment_tag;
  r.function_code    = flag.function_code;
  r.description      = flag.description;
  r.detection_method = std::string(model::ToString(flag.method));
  if (flag.group_index) r.group_index = *flag.group_index;
  r.ambiguous   = flag.ambiguous;
  r.document_id = document_id;
  return r;
}

SettingWriter::SettingWriter(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

WriteSummary SettingWriter::Write(const DocumentRows& rows, const normalize::DocumentSettings& contents) const {
  const auto& tag         = rows.equipment.tag;
  const auto& document_id = rows.document.document_id;

  auto tx = repository_->Begin();

  ThrowIfDbError(repository_->UpsertRelayModel(*tx, rows.relay_model), "upsert relay model " + rows.relay_model.model_code);
  ThrowIfDbError(repository_->UpsertEquipment(*tx, rows.equipment), "upsert equipment " + tag);
  ThrowIfDbError(repository_->UpsertSourceDocument(*tx, rows.document), "upsert source document " + document_id);
  ThrowIfDbError(repository_->DeleteDocumentRows(*tx, document_id), "delete previous rows of " + document_id);

  for (const auto& setting : contents.settings) {
    ThrowIfDbError(repository_->UpsertSetting(*tx, ToRecord(setting)), "upsert setting " + setting.parameter_code);
  }
  for (const auto& group : contents.groups) {
    ThrowIfDbError(repository_->UpsertMultipartGroup(*tx, ToRecord(group, document_id)), "upsert multipart group " + group.base);
  }
  for (const auto& flag : contents.active_functions) {
    ThrowIfDbError(repository_->UpsertActiveFunction(*tx, ToRecord(flag, tag, document_id)), "upsert active function " + flag.function_code);
  }

  WriteSummary summary;
  summary.settings         = repository_->CountSettings(*tx, tag, document_id);
  summary.active_functions = repository_->CountActiveFunctions(*tx, tag, document_id);
  summary.multipart_groups = contents.groups.size();

  if (summary.settings != contents.settings.size() || summary.active_functions != contents.active_functions.size()) {
    RELAYNORM_LOG_ERROR("Stored row count differs from emitted rows",
                        {StringField("document", document_id), StringField("equipment", tag),
                         IntField("settings_emitted", static_cast<std::int64_t>(contents.settings.size())),
                         IntField("settings_stored", static_cast<std::int64_t>(summary.settings)),
                         IntField("active_emitted", static_cast<std::int64_t>(contents.active_functions.size())),
                         IntField("active_stored", static_cast<std::int64_t>(summary.active_functions))});
    tx->Rollback();
    throw util::IntegrityMismatch("document " + document_id + ": stored " + std::to_string(summary.settings) + " settings and " +
                                  std::to_string(summary.active_functions) + " active functions, emitted " +
                                  std::to_string(contents.settings.size()) + " and " + std::to_string(contents.active_functions.size()));
  }

  tx->Commit();

  RELAYNORM_LOG_DEBUG("Document persisted",
                      {StringField("document", document_id), StringField("equipment", tag), IntField("settings", static_cast<std::int64_t>(summary.settings)),
                       IntField("active_functions", static_cast<std::int64_t>(summary.active_functions))});
  return summary;
}

} // namespace relaynorm::persist
