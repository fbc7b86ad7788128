#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace relaynorm::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  Result UpsertRelayModel(Transaction&, const model::RelayModelRecord&) override;
  Result UpsertEquipment(Transaction&, const model::EquipmentRecord&) override;
  std::optional<model::EquipmentRecord> GetEquipment(Transaction&, const std::string& tag) override;
  Result UpsertSourceDocument(Transaction&, const model::SourceDocumentRecord&) override;
  std::optional<model::SourceDocumentRecord> GetSourceDocument(Transaction&, const std::string& document_id) override;

  Result DeleteDocumentRows(Transaction&, const std::string& document_id) override;
  Result UpsertSetting(Transaction&, const model::SettingRecord&) override;
  Result UpsertMultipartGroup(Transaction&, const model::MultipartGroupRecord&) override;
  Result UpsertActiveFunction(Transaction&, const model::ActiveFunctionRecord&) override;

  std::vector<model::SettingRecord> ListSettings(Transaction&, const std::string& equipment_tag) override;
  std::vector<model::MultipartGroupRecord> ListMultipartGroups(Transaction&, const std::string& equipment_tag) override;
  std::vector<model::ActiveFunctionRecord> ListActiveFunctions(Transaction&, const std::string& equipment_tag) override;

  std::uint64_t CountSettings(Transaction&, const std::string& equipment_tag, const std::string& document_id) override;
  std::uint64_t CountActiveFunctions(Transaction&, const std::string& equipment_tag, const std::string& document_id) override;

private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

} // namespace relaynorm::db::sqlite
