#include "pg_repository.hpp"

namespace relaynorm::db::postgres {

namespace {

template <typename T>
std::optional<T> Opt(const pqxx::field& f) {
  if (f.is_null()) return std::nullopt;
  return f.as<T>();
}

std::string Text(const pqxx::field& f) {
  return f.is_null() ? std::string() : std::string(f.c_str());
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

// ------------------------------------------------------------------
// Reference rows
// ------------------------------------------------------------------

Result PgRepository::UpsertRelayModel(Transaction& t, const model::RelayModelRecord& r) {
  try {
    TX(t).Work().exec_prepared("upsert_relay_model", r.model_code, r.manufacturer, r.detection_method);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::UpsertEquipment(Transaction& t, const model::EquipmentRecord& r) {
  try {
    TX(t).Work().exec_prepared("upsert_equipment", r.tag, r.substation, r.device_type, r.position, r.model_code);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::EquipmentRecord> PgRepository::GetEquipment(Transaction& t, const std::string& tag) {
  auto res = TX(t).Work().exec_params("SELECT tag,substation,device_type,position,model_code FROM equipment WHERE tag=$1;", tag);
  if (res.empty()) return std::nullopt;

  model::EquipmentRecord r;
  r.tag         = Text(res[0][0]);
  r.substation  = Text(res[0][1]);
  r.device_type = Text(res[0][2]);
  r.position    = Text(res[0][3]);
  r.model_code  = Text(res[0][4]);
  return r;
}

Result PgRepository::UpsertSourceDocument(Transaction& t, const model::SourceDocumentRecord& r) {
  try {
    TX(t).Work().exec_prepared("upsert_source_document", r.document_id, r.file_name, r.equipment_tag, r.model_code, r.encoding,
                               static_cast<std::int64_t>(r.page_count), r.content_digest, static_cast<std::int64_t>(r.size_bytes),
                               static_cast<std::int64_t>(r.processed_at_ms));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::SourceDocumentRecord> PgRepository::GetSourceDocument(Transaction& t, const std::string& document_id) {
  auto res = TX(t).Work().exec_params(
      "SELECT document_id,file_name,equipment_tag,model_code,encoding,page_count,content_digest,size_bytes,processed_at_ms "
      "FROM source_documents WHERE document_id=$1;",
      document_id);
  if (res.empty()) return std::nullopt;

  const auto&                 row = res[0];
  model::SourceDocumentRecord r;
  r.document_id     = Text(row[0]);
  r.file_name       = Text(row[1]);
  r.equipment_tag   = Text(row[2]);
  r.model_code      = Text(row[3]);
  r.encoding        = Text(row[4]);
  r.page_count      = row[5].as<std::uint32_t>();
  r.content_digest  = Text(row[6]);
  r.size_bytes      = row[7].as<std::uint64_t>();
  r.processed_at_ms = row[8].as<std::uint64_t>();
  return r;
}

// ------------------------------------------------------------------
// Per-document rows
// ------------------------------------------------------------------

Result PgRepository::DeleteDocumentRows(Transaction& t, const std::string& document_id) {
  try {
    auto& work = TX(t).Work();
    work.exec_params("DELETE FROM settings WHERE document_id=$1;", document_id);
    work.exec_params("DELETE FROM multipart_groups WHERE document_id=$1;", document_id);
    work.exec_params("DELETE FROM active_functions WHERE document_id=$1;", document_id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::UpsertSetting(Transaction& t, const model::SettingRecord& r) {
  try {
    TX(t).Work().exec_prepared("upsert_setting", r.equipment_tag, r.parameter_code, r.description, r.value_type, r.value_numeric,
                               r.value_text, r.unit, r.raw_value, r.is_multipart, r.multipart_base, r.multipart_part, r.is_active,
                               r.detection_method, r.document_id, static_cast<std::int64_t>(r.page_index));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::UpsertMultipartGroup(Transaction& t, const model::MultipartGroupRecord& r) {
  try {
    TX(t).Work().exec_prepared("upsert_multipart_group", r.equipment_tag, r.base, r.part_count, r.declared_total, r.document_id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::UpsertActiveFunction(Transaction& t, const model::ActiveFunctionRecord& r) {
  try {
    TX(t).Work().exec_prepared("upsert_active_function", r.equipment_tag, r.function_code, r.description, r.detection_method,
                               r.group_index, r.ambiguous, r.document_id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::SettingRecord> PgRepository::ListSettings(Transaction& t, const std::string& equipment_tag) {
  auto res = TX(t).Work().exec_params(
      "SELECT equipment_tag,parameter_code,description,value_type,value_numeric,value_text,unit,raw_value,"
      "is_multipart,multipart_base,multipart_part,is_active,detection_method,document_id,page_index "
      "FROM settings WHERE equipment_tag=$1 ORDER BY parameter_code COLLATE \"C\";",
      equipment_tag);

  std::vector<model::SettingRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    model::SettingRecord r;
    r.equipment_tag    = Text(row[0]);
    r.parameter_code   = Text(row[1]);
    r.description      = Text(row[2]);
    r.value_type       = Text(row[3]);
    r.value_numeric    = Opt<double>(row[4]);
    r.value_text       = Opt<std::string>(row[5]);
    r.unit             = Opt<std::string>(row[6]);
    r.raw_value        = Text(row[7]);
    r.is_multipart     = row[8].as<bool>();
    r.multipart_base   = Opt<std::string>(row[9]);
    r.multipart_part   = Opt<std::int32_t>(row[10]);
    r.is_active        = row[11].as<bool>();
    r.detection_method = Opt<std::string>(row[12]);
    r.document_id      = Text(row[13]);
    r.page_index       = row[14].as<std::uint32_t>();
    out.push_back(std::move(r));
  }
  return out;
}

std::vector<model::MultipartGroupRecord> PgRepository::ListMultipartGroups(Transaction& t, const std::string& equipment_tag) {
  auto res = TX(t).Work().exec_params(
      "SELECT equipment_tag,base,part_count,declared_total,document_id FROM multipart_groups "
      "WHERE equipment_tag=$1 ORDER BY base COLLATE \"C\";",
      equipment_tag);

  std::vector<model::MultipartGroupRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    model::MultipartGroupRecord r;
    r.equipment_tag  = Text(row[0]);
    r.base           = Text(row[1]);
    r.part_count     = row[2].as<std::int32_t>();
    r.declared_total = Opt<std::int32_t>(row[3]);
    r.document_id    = Text(row[4]);
    out.push_back(std::move(r));
  }
  return out;
}

std::vector<model::ActiveFunctionRecord> PgRepository::ListActiveFunctions(Transaction& t, const std::string& equipment_tag) {
  auto res = TX(t).Work().exec_params(
      "SELECT equipment_tag,function_code,description,detection_method,group_index,ambiguous,document_id "
      "FROM active_functions WHERE equipment_tag=$1 ORDER BY function_code COLLATE \"C\";",
      equipment_tag);

  std::vector<model::ActiveFunctionRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    model::ActiveFunctionRecord r;
    r.equipment_tag    = Text(row[0]);
    r.function_code    = Text(row[1]);
    r.description      = Text(row[2]);
    r.detection_method = Text(row[3]);
    r.group_index      = Opt<std::int32_t>(row[4]);
    r.ambiguous        = row[5].as<bool>();
    r.document_id      = Text(row[6]);
    out.push_back(std::move(r));
  }
  return out;
}

std::uint64_t PgRepository::CountSettings(Transaction& t, const std::string& equipment_tag, const std::string& document_id) {
  auto res = TX(t).Work().exec_params("SELECT COUNT(*) FROM settings WHERE equipment_tag=$1 AND document_id=$2;", equipment_tag, document_id);
  return res[0][0].as<std::uint64_t>();
}

std::uint64_t PgRepository::CountActiveFunctions(Transaction& t, const std::string& equipment_tag, const std::string& document_id) {
  auto res = TX(t).Work().exec_params("SELECT COUNT(*) FROM active_functions WHERE equipment_tag=$1 AND document_id=$2;", equipment_tag,
                                      document_id);
  return res[0][0].as<std::uint64_t>();
}

} // namespace relaynorm::db::postgres
