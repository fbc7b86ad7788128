#include <assert.h>

#include <atomic>
#include <cstdint>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/persist/setting_writer.hpp"
#include "internal/util/errors.hpp"

namespace {

using relaynorm::db::ErrorCode;
using relaynorm::db::Repository;
using relaynorm::db::Result;
using relaynorm::db::Transaction;
using relaynorm::db::memory::MemoryRepository;
using relaynorm::model::ActiveFlagResult;
using relaynorm::model::DetectionMethod;
using relaynorm::model::NormalizedSetting;
using relaynorm::model::ValueType;
using relaynorm::normalize::DocumentSettings;
using relaynorm::persist::DocumentRows;
using relaynorm::persist::SettingWriter;

namespace dbm = relaynorm::db::model;

// Forwards to a memory repository; counts and upserts can be made to misbehave.
class HookedRepository : public Repository {
 public:
  std::unique_ptr<Transaction> Begin() override {
    return inner_.Begin();
  }

  Result UpsertRelayModel(Transaction& tx, const dbm::RelayModelRecord& record) override {
    return inner_.UpsertRelayModel(tx, record);
  }

  Result UpsertEquipment(Transaction& tx, const dbm::EquipmentRecord& record) override {
    return inner_.UpsertEquipment(tx, record);
  }

  std::optional<dbm::EquipmentRecord> GetEquipment(Transaction& tx, const std::string& tag) override {
    return inner_.GetEquipment(tx, tag);
  }

  Result UpsertSourceDocument(Transaction& tx, const dbm::SourceDocumentRecord& record) override {
    return inner_.UpsertSourceDocument(tx, record);
  }

  std::optional<dbm::SourceDocumentRecord> GetSourceDocument(Transaction& tx, const std::string& document_id) override {
    return inner_.GetSourceDocument(tx, document_id);
  }

  Result DeleteDocumentRows(Transaction& tx, const std::string& document_id) override {
    return inner_.DeleteDocumentRows(tx, document_id);
  }

  Result UpsertSetting(Transaction& tx, const dbm::SettingRecord& record) override {
    if (fail_setting_code && *fail_setting_code == record.parameter_code) {
      return Result::Err(ErrorCode::IOError, "disk full");
    }
    return inner_.UpsertSetting(tx, record);
  }

  Result UpsertMultipartGroup(Transaction& tx, const dbm::MultipartGroupRecord& record) override {
    return inner_.UpsertMultipartGroup(tx, record);
  }

  Result UpsertActiveFunction(Transaction& tx, const dbm::ActiveFunctionRecord& record) override {
    return inner_.UpsertActiveFunction(tx, record);
  }

  std::vector<dbm::SettingRecord> ListSettings(Transaction& tx, const std::string& equipment_tag) override {
    return inner_.ListSettings(tx, equipment_tag);
  }

  std::vector<dbm::MultipartGroupRecord> ListMultipartGroups(Transaction& tx, const std::string& equipment_tag) override {
    return inner_.ListMultipartGroups(tx, equipment_tag);
  }

  std::vector<dbm::ActiveFunctionRecord> ListActiveFunctions(Transaction& tx, const std::string& equipment_tag) override {
    return inner_.ListActiveFunctions(tx, equipment_tag);
  }

  std::uint64_t CountSettings(Transaction& tx, const std::string& equipment_tag, const std::string& document_id) override {
    return inner_.CountSettings(tx, equipment_tag, document_id) + settings_count_skew.load();
  }

  std::uint64_t CountActiveFunctions(Transaction& tx, const std::string& equipment_tag, const std::string& document_id) override {
    return inner_.CountActiveFunctions(tx, equipment_tag, document_id);
  }

  std::atomic<std::uint64_t> settings_count_skew{0};
  std::optional<std::string> fail_setting_code;

 private:
  MemoryRepository inner_;
};

DocumentRows Rows(const std::string& tag, const std::string& document_id) {
  DocumentRows rows;
  rows.relay_model = {.model_code = "micom_p14x", .manufacturer = "Schneider", .detection_method = "labeled_field"};
  rows.equipment   = {.tag = tag, .substation = "SE-04", .device_type = "SL", .position = "12", .model_code = "micom_p14x"};

  rows.document.document_id    = document_id;
  rows.document.file_name      = document_id;
  rows.document.equipment_tag  = tag;
  rows.document.model_code     = "micom_p14x";
  rows.document.encoding       = "cp1252";
  rows.document.content_digest = "0d4c";
  return rows;
}

NormalizedSetting Setting(const std::string& tag, const std::string& code, const std::string& value, const std::string& document_id) {
  NormalizedSetting s;
  s.equipment_tag          = tag;
  s.parameter_code         = code;
  s.description            = "Setting " + code;
  s.value.type             = ValueType::kNumeric;
  s.value.numeric          = std::stod(value);
  s.value.numeric_text     = value;
  s.value.unit             = "A";
  s.value.raw              = value + "A";
  s.source_document        = document_id;
  s.page_index             = 0;
  return s;
}

ActiveFlagResult Active(const std::string& code) {
  ActiveFlagResult flag;
  flag.function_code = code;
  flag.active        = true;
  flag.method        = DetectionMethod::kLabeledField;
  flag.group_index   = 0;
  return flag;
}

DocumentSettings Contents(const std::string& tag, const std::string& document_id, const std::vector<std::string>& codes) {
  DocumentSettings contents;
  for (const auto& code : codes) contents.settings.push_back(Setting(tag, code, "1.5", document_id));
  contents.active_functions.push_back(Active("50/51-1"));
  contents.groups.push_back({.equipment_tag = tag, .base = "Opto Label", .part_count = 2, .declared_total = 4});
  return contents;
}

void TestWriteIsIdempotent() {
  auto          repo = std::make_shared<HookedRepository>();
  SettingWriter writer(repo);

  const auto rows     = Rows("SE-04-SL-12", "P143_12-SL-04.txt");
  const auto contents = Contents("SE-04-SL-12", "P143_12-SL-04.txt", {"0201", "0202", "0203"});

  const auto first = writer.Write(rows, contents);
  assert(first.settings == 3);
  assert(first.active_functions == 1);
  assert(first.multipart_groups == 1);

  const auto second = writer.Write(rows, contents);
  assert(second.settings == 3);

  auto tx       = repo->Begin();
  auto settings = repo->ListSettings(*tx, "SE-04-SL-12");
  assert(settings.size() == 3);
  assert(settings[0].value_text == std::optional<std::string>("1.5"));
  assert(settings[0].raw_value == "1.5A");
  assert(!settings[0].detection_method.has_value());

  auto functions = repo->ListActiveFunctions(*tx, "SE-04-SL-12");
  assert(functions.size() == 1);
  assert(functions[0].detection_method == "labeled_field");
  assert(functions[0].group_index == std::optional<std::int32_t>(0));

  auto groups = repo->ListMultipartGroups(*tx, "SE-04-SL-12");
  assert(groups.size() == 1);
  assert(groups[0].declared_total == std::optional<std::int32_t>(4));
  tx->Commit();
}

void TestReprocessingReplacesPreviousRows() {
  auto          repo = std::make_shared<HookedRepository>();
  SettingWriter writer(repo);

  const auto rows = Rows("SE-04-SL-12", "P143_12-SL-04.txt");
  writer.Write(rows, Contents("SE-04-SL-12", "P143_12-SL-04.txt", {"0201", "0202", "0203"}));

  // a later export of the same document drops a parameter
  const auto summary = writer.Write(rows, Contents("SE-04-SL-12", "P143_12-SL-04.txt", {"0201", "0203"}));
  assert(summary.settings == 2);

  // the same document now resolves to another equipment tag
  writer.Write(Rows("SE-04-SL-13", "P143_12-SL-04.txt"), Contents("SE-04-SL-13", "P143_12-SL-04.txt", {"0201"}));

  auto tx = repo->Begin();
  assert(repo->ListSettings(*tx, "SE-04-SL-12").empty());
  assert(repo->ListActiveFunctions(*tx, "SE-04-SL-12").empty());
  assert(repo->ListSettings(*tx, "SE-04-SL-13").size() == 1);
  tx->Commit();
}

void TestCountMismatchRollsBack() {
  auto          repo = std::make_shared<HookedRepository>();
  SettingWriter writer(repo);

  repo->settings_count_skew = 1;

  bool threw = false;
  try {
    writer.Write(Rows("SE-04-SL-12", "P143_12-SL-04.txt"), Contents("SE-04-SL-12", "P143_12-SL-04.txt", {"0201"}));
  } catch (const relaynorm::util::IntegrityMismatch& e) {
    threw = true;
    assert(std::string(e.what()).find("P143_12-SL-04.txt") != std::string::npos);
  }
  assert(threw);

  auto tx = repo->Begin();
  assert(!repo->GetEquipment(*tx, "SE-04-SL-12").has_value());
  assert(!repo->GetSourceDocument(*tx, "P143_12-SL-04.txt").has_value());
  assert(repo->ListSettings(*tx, "SE-04-SL-12").empty());
  tx->Commit();
}

void TestStorageErrorKeepsPreviousRows() {
  auto          repo = std::make_shared<HookedRepository>();
  SettingWriter writer(repo);

  const auto rows = Rows("SE-04-SL-12", "P143_12-SL-04.txt");
  writer.Write(rows, Contents("SE-04-SL-12", "P143_12-SL-04.txt", {"0201", "0202"}));

  repo->fail_setting_code = "0202";
  bool threw              = false;
  try {
    writer.Write(rows, Contents("SE-04-SL-12", "P143_12-SL-04.txt", {"0201", "0202", "0203"}));
  } catch (const relaynorm::util::StorageError& e) {
    threw = true;
    assert(std::string(e.what()).find("io_error") != std::string::npos);
  }
  assert(threw);

  auto tx = repo->Begin();
  assert(repo->ListSettings(*tx, "SE-04-SL-12").size() == 2);
  tx->Commit();
}

} // namespace

int main() {
  TestWriteIsIdempotent();
  TestReprocessingReplacesPreviousRows();
  TestCountMismatchRollsBack();
  TestStorageErrorKeepsPreviousRows();

  std::cout << "relaynorm_integration_setting_writer: pass\n";
  return 0;
}
