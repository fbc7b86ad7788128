#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace relaynorm::db::model {

struct MultipartGroupRecord {
  std::string                 equipment_tag;
  std::string                 base;
  std::int32_t                part_count = 0;
  std::optional<std::int32_t> declared_total;
  std::string                 document_id;

  bool operator==(const MultipartGroupRecord&) const = default;
};

} // namespace relaynorm::db::model
