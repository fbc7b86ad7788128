#include "memory_repository.hpp"

#include "memory_tx.hpp"

namespace relaynorm::db::memory {

namespace {

template <typename Map>
void EraseDocument(Map& rows, const std::string& document_id) {
  for (auto it = rows.begin(); it != rows.end();) {
    if (it->second.document_id == document_id) {
      it = rows.erase(it);
    } else {
      ++it;
    }
  }
}

template <typename Map>
auto ListTag(const Map& rows, const std::string& equipment_tag) {
  std::vector<typename Map::mapped_type> out;
  for (auto it = rows.lower_bound({equipment_tag, std::string()}); it != rows.end() && it->first.first == equipment_tag; ++it) {
    out.push_back(it->second);
  }
  return out;
}

template <typename Map>
std::uint64_t CountTagDocument(const Map& rows, const std::string& equipment_tag, const std::string& document_id) {
  std::uint64_t n = 0;
  for (auto it = rows.lower_bound({equipment_tag, std::string()}); it != rows.end() && it->first.first == equipment_tag; ++it) {
    if (it->second.document_id == document_id) ++n;
  }
  return n;
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Reference rows
// ------------------------------------------------------------------

Result MemoryRepository::UpsertRelayModel(Transaction& t, const model::RelayModelRecord& r) {
  if (r.model_code.empty()) return Result::Err(ErrorCode::ConstraintViolation, "empty model_code");
  TX(t).Mutable().relay_models[r.model_code] = r;
  return Result::Ok();
}

Result MemoryRepository::UpsertEquipment(Transaction& t, const model::EquipmentRecord& r) {
  auto& s = TX(t).Mutable();
  if (r.tag.empty()) return Result::Err(ErrorCode::ConstraintViolation, "empty equipment tag");
  if (!s.relay_models.contains(r.model_code)) return Result::Err(ErrorCode::ConstraintViolation, "unknown relay model " + r.model_code);
  s.equipment[r.tag] = r;
  return Result::Ok();
}

std::optional<model::EquipmentRecord> MemoryRepository::GetEquipment(Transaction& t, const std::string& tag) {
  const auto& s  = TX(t).View();
  auto        it = s.equipment.find(tag);
  if (it == s.equipment.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpsertSourceDocument(Transaction& t, const model::SourceDocumentRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.equipment.contains(r.equipment_tag)) return Result::Err(ErrorCode::ConstraintViolation, "unknown equipment " + r.equipment_tag);
  s.documents[r.document_id] = r;
  return Result::Ok();
}

std::optional<model::SourceDocumentRecord> MemoryRepository::GetSourceDocument(Transaction& t, const std::string& document_id) {
  const auto& s  = TX(t).View();
  auto        it = s.documents.find(document_id);
  if (it == s.documents.end()) return std::nullopt;
  return it->second;
}

// ------------------------------------------------------------------
// Per-document rows
// ------------------------------------------------------------------

Result MemoryRepository::DeleteDocumentRows(Transaction& t, const std::string& document_id) {
  auto& s = TX(t).Mutable();
  EraseDocument(s.settings, document_id);
  EraseDocument(s.multipart_groups, document_id);
  EraseDocument(s.active_functions, document_id);
  return Result::Ok();
}

Result MemoryRepository::UpsertSetting(Transaction& t, const model::SettingRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.equipment.contains(r.equipment_tag)) return Result::Err(ErrorCode::ConstraintViolation, "unknown equipment " + r.equipment_tag);
  if (!s.documents.contains(r.document_id)) return Result::Err(ErrorCode::ConstraintViolation, "unknown document " + r.document_id);
  s.settings[{r.equipment_tag, r.parameter_code}] = r;
  return Result::Ok();
}

Result MemoryRepository::UpsertMultipartGroup(Transaction& t, const model::MultipartGroupRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.equipment.contains(r.equipment_tag)) return Result::Err(ErrorCode::ConstraintViolation, "unknown equipment " + r.equipment_tag);
  s.multipart_groups[{r.equipment_tag, r.base}] = r;
  return Result::Ok();
}

Result MemoryRepository::UpsertActiveFunction(Transaction& t, const model::ActiveFunctionRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.equipment.contains(r.equipment_tag)) return Result::Err(ErrorCode::ConstraintViolation, "unknown equipment " + r.equipment_tag);
  s.active_functions[{r.equipment_tag, r.function_code}] = r;
  return Result::Ok();
}

std::vector<model::SettingRecord> MemoryRepository::ListSettings(Transaction& t, const std::string& equipment_tag) {
  return ListTag(TX(t).View().settings, equipment_tag);
}

std::vector<model::MultipartGroupRecord> MemoryRepository::ListMultipartGroups(Transaction& t, const std::string& equipment_tag) {
  return ListTag(TX(t).View().multipart_groups, equipment_tag);
}

std::vector<model::ActiveFunctionRecord> MemoryRepository::ListActiveFunctions(Transaction& t, const std::string& equipment_tag) {
  return ListTag(TX(t).View().active_functions, equipment_tag);
}

std::uint64_t MemoryRepository::CountSettings(Transaction& t, const std::string& equipment_tag, const std::string& document_id) {
  return CountTagDocument(TX(t).View().settings, equipment_tag, document_id);
}

std::uint64_t MemoryRepository::CountActiveFunctions(Transaction& t, const std::string& equipment_tag, const std::string& document_id) {
  return CountTagDocument(TX(t).View().active_functions, equipment_tag, document_id);
}

} // namespace relaynorm::db::memory
