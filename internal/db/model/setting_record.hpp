#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace relaynorm::db::model {

/*
  settings row, keyed by (equipment_tag, parameter_code).

  value_text holds the canonical numeric text for numeric values and
  the text itself for text and boolean values.
*/
struct SettingRecord {
  std::string equipment_tag;
  std::string parameter_code;
  std::string description;

  std::string                value_type; // numeric | text | boolean | empty
  std::optional<double>      value_numeric;
  std::optional<std::string> value_text;
  std::optional<std::string> unit;
  std::string                raw_value;

  bool                       is_multipart = false;
  std::optional<std::string> multipart_base;
  std::optional<std::int32_t> multipart_part;

  bool                       is_active = false;
  std::optional<std::string> detection_method;

  std::string   document_id;
  std::uint32_t page_index = 0;

  bool operator==(const SettingRecord&) const = default;
};

} // namespace relaynorm::db::model
