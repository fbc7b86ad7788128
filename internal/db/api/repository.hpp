#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/active_function_record.hpp"
#include "internal/db/model/equipment_record.hpp"
#include "internal/db/model/multipart_group_record.hpp"
#include "internal/db/model/relay_model_record.hpp"
#include "internal/db/model/setting_record.hpp"
#include "internal/db/model/source_document_record.hpp"

namespace relaynorm::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - Every Upsert is keyed, so writing the same row twice leaves one row

  Keys:
    relay_models      model_code
    equipment         tag
    source_documents  document_id
    settings          (equipment_tag, parameter_code)
    multipart_groups  (equipment_tag, base)
    active_functions  (equipment_tag, function_code)

  List* results are ordered by key.
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Reference rows
  // ---------------------------------------------------------------------

  virtual Result UpsertRelayModel(Transaction&, const model::RelayModelRecord&) = 0;

  virtual Result UpsertEquipment(Transaction&, const model::EquipmentRecord&) = 0;

  virtual std::optional<model::EquipmentRecord> GetEquipment(Transaction&, const std::string& tag) = 0;

  virtual Result UpsertSourceDocument(Transaction&, const model::SourceDocumentRecord&) = 0;

  virtual std::optional<model::SourceDocumentRecord> GetSourceDocument(Transaction&, const std::string& document_id) = 0;

  // ---------------------------------------------------------------------
  // Per-document rows
  // ---------------------------------------------------------------------

  // Removes settings, multipart groups and active functions written by
  // a document, whatever equipment they were attached to.
  virtual Result DeleteDocumentRows(Transaction&, const std::string& document_id) = 0;

  virtual Result UpsertSetting(Transaction&, const model::SettingRecord&) = 0;

  virtual Result UpsertMultipartGroup(Transaction&, const model::MultipartGroupRecord&) = 0;

  virtual Result UpsertActiveFunction(Transaction&, const model::ActiveFunctionRecord&) = 0;

  virtual std::vector<model::SettingRecord> ListSettings(Transaction&, const std::string& equipment_tag) = 0;

  virtual std::vector<model::MultipartGroupRecord> ListMultipartGroups(Transaction&, const std::string& equipment_tag) = 0;

  virtual std::vector<model::ActiveFunctionRecord> ListActiveFunctions(Transaction&, const std::string& equipment_tag) = 0;

  // rows stored for (equipment, document); used for post-write validation
  virtual std::uint64_t CountSettings(Transaction&, const std::string& equipment_tag, const std::string& document_id) = 0;

  virtual std::uint64_t CountActiveFunctions(Transaction&, const std::string& equipment_tag, const std::string& document_id) = 0;
};

} // namespace relaynorm::db
