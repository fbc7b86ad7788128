#pragma once

#include <exception>

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace relaynorm::db::postgres {

class PgRepository final : public db::Repository {
public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

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
  std::shared_ptr<PgPool> pool_;

  static PgTransaction& TX(Transaction& t);
  static Result Translate(const std::exception& e);
};

} // namespace relaynorm::db::postgres
