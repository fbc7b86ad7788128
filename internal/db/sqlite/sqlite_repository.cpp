#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>

#include "internal/db/sql/sql_queries.hpp"

namespace relaynorm::db::sqlite {

using relaynorm::db::ErrorCode;
using relaynorm::db::Result;

namespace {

struct Finalize {
  void operator()(sqlite3_stmt* st) const {
    sqlite3_finalize(st);
  }
};

using Statement = std::unique_ptr<sqlite3_stmt, Finalize>;

Statement PrepareOrNull(sqlite3* db, const char* sql) {
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) return nullptr;
  return Statement(st);
}

// read paths have no Result to report through
Statement PrepareOrThrow(sqlite3* db, const char* sql) {
  auto st = PrepareOrNull(db, sql);
  if (!st) throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
  return st;
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindText(sqlite3_stmt* st, int idx, const std::optional<std::string>& s) {
  if (s) {
    BindText(st, idx, *s);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

void BindI64(sqlite3_stmt* st, int idx, std::int64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindI32(sqlite3_stmt* st, int idx, const std::optional<std::int32_t>& v) {
  if (v) {
    sqlite3_bind_int(st, idx, *v);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

void BindDouble(sqlite3_stmt* st, int idx, const std::optional<double>& v) {
  if (v) {
    sqlite3_bind_double(st, idx, *v);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

std::optional<std::string> ColOptText(sqlite3_stmt* st, int col) {
  if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
  return ColText(st, col);
}

std::optional<std::int32_t> ColOptI32(sqlite3_stmt* st, int col) {
  if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
  return sqlite3_column_int(st, col);
}

std::optional<double> ColOptDouble(sqlite3_stmt* st, int col) {
  if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
  return sqlite3_column_double(st, col);
}

std::uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<std::uint64_t>(sqlite3_column_int64(st, col));
}

std::uint64_t CountRows(sqlite3* db, const char* sql, const std::string& equipment_tag, const std::string& document_id) {
  auto st = PrepareOrThrow(db, sql);
  BindText(st.get(), 1, equipment_tag);
  BindText(st.get(), 2, document_id);
  if (sqlite3_step(st.get()) != SQLITE_ROW) {
    throw std::runtime_error(std::string("sqlite count: ") + sqlite3_errmsg(db));
  }
  return ColU64(st.get(), 0);
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
    return Result::Ok();

  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Reference rows
// ------------------------------------------------------------------

Result SqliteRepository::UpsertRelayModel(Transaction& t, const model::RelayModelRecord& r) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOrNull(db, sql::UPSERT_RELAY_MODEL);
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.model_code);
  BindText(st.get(), 2, r.manufacturer);
  BindText(st.get(), 3, r.detection_method);
  return Translate(db, sqlite3_step(st.get()));
}

Result SqliteRepository::UpsertEquipment(Transaction& t, const model::EquipmentRecord& r) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOrNull(db, sql::UPSERT_EQUIPMENT);
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.tag);
  BindText(st.get(), 2, r.substation);
  BindText(st.get(), 3, r.device_type);
  BindText(st.get(), 4, r.position);
  BindText(st.get(), 5, r.model_code);
  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::EquipmentRecord> SqliteRepository::GetEquipment(Transaction& t, const std::string& tag) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOrThrow(db, sql::SELECT_EQUIPMENT);
  BindText(st.get(), 1, tag);

  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;

  model::EquipmentRecord r;
  r.tag         = ColText(st.get(), 0);
  r.substation  = ColText(st.get(), 1);
  r.device_type = ColText(st.get(), 2);
  r.position    = ColText(st.get(), 3);
  r.model_code  = ColText(st.get(), 4);
  return r;
}

Result SqliteRepository::UpsertSourceDocument(Transaction& t, const model::SourceDocumentRecord& r) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOrNull(db, sql::UPSERT_SOURCE_DOCUMENT);
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.document_id);
  BindText(st.get(), 2, r.file_name);
  BindText(st.get(), 3, r.equipment_tag);
  BindText(st.get(), 4, r.model_code);
  BindText(st.get(), 5, r.encoding);
  BindI64(st.get(), 6, r.page_count);
  BindText(st.get(), 7, r.content_digest);
  BindI64(st.get(), 8, static_cast<std::int64_t>(r.size_bytes));
  BindI64(st.get(), 9, static_cast<std::int64_t>(r.processed_at_ms));
  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::SourceDocumentRecord> SqliteRepository::GetSourceDocument(Transaction& t, const std::string& document_id) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOrThrow(db, sql::SELECT_SOURCE_DOCUMENT);
  BindText(st.get(), 1, document_id);

  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;

  model::SourceDocumentRecord r;
  r.document_id     = ColText(st.get(), 0);
  r.file_name       = ColText(st.get(), 1);
  r.equipment_tag   = ColText(st.get(), 2);
  r.model_code      = ColText(st.get(), 3);
  r.encoding        = ColText(st.get(), 4);
  r.page_count      = static_cast<std::uint32_t>(sqlite3_column_int64(st.get(), 5));
  r.content_digest  = ColText(st.get(), 6);
  r.size_bytes      = ColU64(st.get(), 7);
  r.processed_at_ms = ColU64(st.get(), 8);
  return r;
}

// ------------------------------------------------------------------
// Per-document rows
// ------------------------------------------------------------------

Result SqliteRepository::DeleteDocumentRows(Transaction& t, const std::string& document_id) {
  auto* db = TX(t).Handle();
  for (const char* statement : {sql::DELETE_DOCUMENT_SETTINGS, sql::DELETE_DOCUMENT_GROUPS, sql::DELETE_DOCUMENT_ACTIVE}) {
    auto st = PrepareOrNull(db, statement);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    BindText(st.get(), 1, document_id);
    auto result = Translate(db, sqlite3_step(st.get()));
    if (!result) return result;
  }
  return Result::Ok();
}

Result SqliteRepository::UpsertSetting(Transaction& t, const model::SettingRecord& r) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOrNull(db, sql::UPSERT_SETTING);
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.equipment_tag);
  BindText(st.get(), 2, r.parameter_code);
  BindText(st.get(), 3, r.description);
  BindText(st.get(), 4, r.value_type);
  BindDouble(st.get(), 5, r.value_numeric);
  BindText(st.get(), 6, r.value_text);
  BindText(st.get(), 7, r.unit);
  BindText(st.get(), 8, r.raw_value);
  BindI64(st.get(), 9, r.is_multipart ? 1 : 0);
  BindText(st.get(), 10, r.multipart_base);
  BindI32(st.get(), 11, r.multipart_part);
  BindI64(st.get(), 12, r.is_active ? 1 : 0);
  BindText(st.get(), 13, r.detection_method);
  BindText(st.get(), 14, r.document_id);
  BindI64(st.get(), 15, r.page_index);
  return Translate(db, sqlite3_step(st.get()));
}

Result SqliteRepository::UpsertMultipartGroup(Transaction& t, const model::MultipartGroupRecord& r) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOrNull(db, sql::UPSERT_MULTIPART_GROUP);
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.equipment_tag);
  BindText(st.get(), 2, r.base);
  BindI64(st.get(), 3, r.part_count);
  BindI32(st.get(), 4, r.declared_total);
  BindText(st.get(), 5, r.document_id);
  return Translate(db, sqlite3_step(st.get()));
}

Result SqliteRepository::UpsertActiveFunction(Transaction& t, const model::ActiveFunctionRecord& r) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOrNull(db, sql::UPSERT_ACTIVE_FUNCTION);
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.equipment_tag);
  BindText(st.get(), 2, r.function_code);
  BindText(st.get(), 3, r.description);
  BindText(st.get(), 4, r.detection_method);
  BindI32(st.get(), 5, r.group_index);
  BindI64(st.get(), 6, r.ambiguous ? 1 : 0);
  BindText(st.get(), 7, r.document_id);
  return Translate(db, sqlite3_step(st.get()));
}

std::vector<model::SettingRecord> SqliteRepository::ListSettings(Transaction& t, const std::string& equipment_tag) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOrThrow(db, sql::SELECT_SETTINGS);
  BindText(st.get(), 1, equipment_tag);

  std::vector<model::SettingRecord> out;
  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    model::SettingRecord r;
    r.equipment_tag    = ColText(st.get(), 0);
    r.parameter_code   = ColText(st.get(), 1);
    r.description      = ColText(st.get(), 2);
    r.value_type       = ColText(st.get(), 3);
    r.value_numeric    = ColOptDouble(st.get(), 4);
    r.value_text       = ColOptText(st.get(), 5);
    r.unit             = ColOptText(st.get(), 6);
    r.raw_value        = ColText(st.get(), 7);
    r.is_multipart     = sqlite3_column_int(st.get(), 8) != 0;
    r.multipart_base   = ColOptText(st.get(), 9);
    r.multipart_part   = ColOptI32(st.get(), 10);
    r.is_active        = sqlite3_column_int(st.get(), 11) != 0;
    r.detection_method = ColOptText(st.get(), 12);
    r.document_id      = ColText(st.get(), 13);
    r.page_index       = static_cast<std::uint32_t>(sqlite3_column_int64(st.get(), 14));
    out.push_back(std::move(r));
  }
  return out;
}

std::vector<model::MultipartGroupRecord> SqliteRepository::ListMultipartGroups(Transaction& t, const std::string& equipment_tag) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOrThrow(db, sql::SELECT_MULTIPART_GROUPS);
  BindText(st.get(), 1, equipment_tag);

  std::vector<model::MultipartGroupRecord> out;
  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    model::MultipartGroupRecord r;
    r.equipment_tag  = ColText(st.get(), 0);
    r.base           = ColText(st.get(), 1);
    r.part_count     = sqlite3_column_int(st.get(), 2);
    r.declared_total = ColOptI32(st.get(), 3);
    r.document_id    = ColText(st.get(), 4);
    out.push_back(std::move(r));
  }
  return out;
}

std::vector<model::ActiveFunctionRecord> SqliteRepository::ListActiveFunctions(Transaction& t, const std::string& equipment_tag) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOrThrow(db, sql::SELECT_ACTIVE_FUNCTIONS);
  BindText(st.get(), 1, equipment_tag);

  std::vector<model::ActiveFunctionRecord> out;
  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    model::ActiveFunctionRecord r;
    r.equipment_tag    = ColText(st.get(), 0);
    r.function_code    = ColText(st.get(), 1);
    r.description      = ColText(st.get(), 2);
    r.detection_method = ColText(st.get(), 3);
    r.group_index      = ColOptI32(st.get(), 4);
    r.ambiguous        = sqlite3_column_int(st.get(), 5) != 0;
    r.document_id      = ColText(st.get(), 6);
    out.push_back(std::move(r));
  }
  return out;
}

std::uint64_t SqliteRepository::CountSettings(Transaction& t, const std::string& equipment_tag, const std::string& document_id) {
  return CountRows(TX(t).Handle(), sql::COUNT_SETTINGS, equipment_tag, document_id);
}

std::uint64_t SqliteRepository::CountActiveFunctions(Transaction& t, const std::string& equipment_tag, const std::string& document_id) {
  return CountRows(TX(t).Handle(), sql::COUNT_ACTIVE_FUNCTIONS, equipment_tag, document_id);
}

} // namespace relaynorm::db::sqlite
