#include "migrations.hpp"

#include "internal/observability/logging.hpp"

namespace relaynorm::db::sql {

void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql) {
  for (const auto& sql : ordered_sql) {
    executor.ExecuteSQL(sql);
  }
  RELAYNORM_LOG_DEBUG("Schema migrations applied", {observability::IntField("statements", static_cast<std::int64_t>(ordered_sql.size()))});
}

const std::vector<std::string>& SqliteSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS relay_models (model_code TEXT PRIMARY KEY, manufacturer TEXT, detection_method TEXT NOT NULL);",
      "CREATE TABLE IF NOT EXISTS equipment (tag TEXT PRIMARY KEY, substation TEXT, device_type TEXT, position TEXT, model_code TEXT NOT NULL REFERENCES relay_models(model_code));",
      "CREATE TABLE IF NOT EXISTS source_documents (document_id TEXT PRIMARY KEY, file_name TEXT NOT NULL, equipment_tag TEXT NOT NULL REFERENCES equipment(tag), model_code TEXT NOT NULL, encoding TEXT, page_count INTEGER NOT NULL, content_digest TEXT NOT NULL, size_bytes INTEGER NOT NULL, processed_at_ms INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS settings (equipment_tag TEXT NOT NULL REFERENCES equipment(tag), parameter_code TEXT NOT NULL, description TEXT NOT NULL, value_type TEXT NOT NULL, value_numeric REAL, value_text TEXT, unit TEXT, raw_value TEXT NOT NULL, is_multipart INTEGER NOT NULL, multipart_base TEXT, multipart_part INTEGER, is_active INTEGER NOT NULL, detection_method TEXT, document_id TEXT NOT NULL REFERENCES source_documents(document_id), page_index INTEGER NOT NULL, PRIMARY KEY (equipment_tag, parameter_code));",
      "CREATE TABLE IF NOT EXISTS multipart_groups (equipment_tag TEXT NOT NULL REFERENCES equipment(tag), base TEXT NOT NULL, part_count INTEGER NOT NULL, declared_total INTEGER, document_id TEXT NOT NULL, PRIMARY KEY (equipment_tag, base));",
      "CREATE TABLE IF NOT EXISTS active_functions (equipment_tag TEXT NOT NULL REFERENCES equipment(tag), function_code TEXT NOT NULL, description TEXT, detection_method TEXT NOT NULL, group_index INTEGER, ambiguous INTEGER NOT NULL, document_id TEXT NOT NULL, PRIMARY KEY (equipment_tag, function_code));",
      "CREATE INDEX IF NOT EXISTS settings_document ON settings(document_id);",
      "CREATE INDEX IF NOT EXISTS active_functions_document ON active_functions(document_id);"};
  return kSchema;
}

const std::vector<std::string>& PostgresSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS relay_models (model_code TEXT PRIMARY KEY, manufacturer TEXT, detection_method TEXT NOT NULL);",
      "CREATE TABLE IF NOT EXISTS equipment (tag TEXT PRIMARY KEY, substation TEXT, device_type TEXT, position TEXT, model_code TEXT NOT NULL REFERENCES relay_models(model_code));",
      "CREATE TABLE IF NOT EXISTS source_documents (document_id TEXT PRIMARY KEY, file_name TEXT NOT NULL, equipment_tag TEXT NOT NULL REFERENCES equipment(tag), model_code TEXT NOT NULL, encoding TEXT, page_count INTEGER NOT NULL, content_digest TEXT NOT NULL, size_bytes BIGINT NOT NULL, processed_at_ms BIGINT NOT NULL);",
      "CREATE TABLE IF NOT EXISTS settings (equipment_tag TEXT NOT NULL REFERENCES equipment(tag), parameter_code TEXT NOT NULL, description TEXT NOT NULL, value_type TEXT NOT NULL, value_numeric DOUBLE PRECISION, value_text TEXT, unit TEXT, raw_value TEXT NOT NULL, is_multipart BOOLEAN NOT NULL, multipart_base TEXT, multipart_part INTEGER, is_active BOOLEAN NOT NULL, detection_method TEXT, document_id TEXT NOT NULL REFERENCES source_documents(document_id), page_index INTEGER NOT NULL, PRIMARY KEY (equipment_tag, parameter_code));",
      "CREATE TABLE IF NOT EXISTS multipart_groups (equipment_tag TEXT NOT NULL REFERENCES equipment(tag), base TEXT NOT NULL, part_count INTEGER NOT NULL, declared_total INTEGER, document_id TEXT NOT NULL, PRIMARY KEY (equipment_tag, base));",
      "CREATE TABLE IF NOT EXISTS active_functions (equipment_tag TEXT NOT NULL REFERENCES equipment(tag), function_code TEXT NOT NULL, description TEXT, detection_method TEXT NOT NULL, group_index INTEGER, ambiguous BOOLEAN NOT NULL, document_id TEXT NOT NULL, PRIMARY KEY (equipment_tag, function_code));",
      "CREATE INDEX IF NOT EXISTS settings_document ON settings(document_id);",
      "CREATE INDEX IF NOT EXISTS active_functions_document ON active_functions(document_id);"};
  return kSchema;
}

} // namespace relaynorm::db::sql
