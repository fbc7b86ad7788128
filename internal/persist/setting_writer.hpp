#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "internal/db/api/repository.hpp"
#include "internal/normalize/setting_builder.hpp"

namespace relaynorm::persist {

// Throws util::StorageError when result is not OK.
void ThrowIfDbError(const db::Result& result, const std::string& what);

db::model::SettingRecord        ToRecord(const model::NormalizedSetting& setting);
db::model::MultipartGroupRecord ToRecord(const model::MultipartGroup& group, const std::string& document_id);
db::model::ActiveFunctionRecord ToRecord(const model::ActiveFlagResult& flag, const std::string& equipment_tag, const std::string& document_id);

// Reference rows written alongside a document's settings.
struct DocumentRows {
  db::model::RelayModelRecord     relay_model;
  db::model::EquipmentRecord      equipment;
  db::model::SourceDocumentRecord document;
};

struct WriteSummary {
  std::uint64_t settings         = 0;
  std::uint64_t active_functions = 0;
  std::uint64_t multipart_groups = 0;
};

/*
  SettingWriter

  Persists one document in one transaction:

    1. upsert relay model, equipment and source document
    2. delete rows the document wrote on a previous run
    3. upsert settings, multipart groups and active functions
    4. read back the counts for (equipment, document)

  A count that differs from what was emitted throws
  util::IntegrityMismatch and nothing is committed.
*/
class SettingWriter {
 public:
  explicit SettingWriter(std::shared_ptr<db::Repository> repository);

  WriteSummary Write(const DocumentRows& rows, const normalize::DocumentSettings& contents) const;

 private:
  std::shared_ptr<db::Repository> repository_;
};

} // namespace relaynorm::persist
