#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <utility>

#include "internal/db/api/repository.hpp"

namespace relaynorm::db::memory {

class MemoryTransaction;

/*
  In-memory backend for tests and dry runs.

  Transactions run one at a time; each works on a private copy of the
  committed state that replaces it on Commit().
*/
class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

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
  friend class MemoryTransaction;

  using Key = std::pair<std::string, std::string>; // (equipment_tag, code)

  struct State {
    std::map<std::string, model::RelayModelRecord>     relay_models;
    std::map<std::string, model::EquipmentRecord>      equipment;
    std::map<std::string, model::SourceDocumentRecord> documents;

    std::map<Key, model::SettingRecord>        settings;
    std::map<Key, model::MultipartGroupRecord> multipart_groups;
    std::map<Key, model::ActiveFunctionRecord> active_functions;
  };

  std::mutex    tx_mutex_; // held for a transaction's lifetime
  std::mutex    mutex_;    // guards committed_
  State         committed_;
  std::uint64_t committed_version_ = 0;
};

} // namespace relaynorm::db::memory
