#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/model/active_flag.hpp"
#include "internal/model/normalized_value.hpp"

namespace relaynorm::model {

struct NormalizedSetting {
  std::string equipment_tag;
  std::string parameter_code;
  std::string description;

  NormalizedValue value;

  bool          is_multipart = false;
  std::string   multipart_base;
  std::uint32_t multipart_part = 0;

  bool                           is_active = false;
  std::optional<DetectionMethod> detection_method;

  std::string source_document;
  std::uint32_t page_index = 0;
};

struct MultipartGroup {
  std::string                  equipment_tag;
  std::string                  base;
  std::uint32_t                part_count = 0;
  std::optional<std::uint32_t> declared_total;
};

} // namespace relaynorm::model
