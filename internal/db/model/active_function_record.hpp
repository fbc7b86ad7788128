#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace relaynorm::db::model {

// active_functions row; only functions detected as active are stored
struct ActiveFunctionRecord {
  std::string                 equipment_tag;
  std::string                 function_code;
  std::string                 description;
  std::string                 detection_method;
  std::optional<std::int32_t> group_index;
  bool                        ambiguous = false;
  std::string                 document_id;

  bool operator==(const ActiveFunctionRecord&) const = default;
};

} // namespace relaynorm::db::model
