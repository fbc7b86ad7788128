#pragma once

#include <cstdint>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

#include <google/protobuf/repeated_ptr_field.h>

#include "internal/model/equipment.hpp"

namespace relaynorm::runtime::config {
class EquipmentPattern;
}

namespace relaynorm::normalize {

/*
  EquipmentResolver

  Derives the equipment identity of a document. Filename patterns are
  tried in configured order and the first match wins. A hint taken
  from the document content overrides the filename. When neither
  yields a tag the caller must treat the document as unresolved.
*/
class EquipmentResolver {
 public:
  explicit EquipmentResolver(const google::protobuf::RepeatedPtrField<relaynorm::runtime::config::EquipmentPattern>& patterns);

  std::optional<model::EquipmentIdentity> FromFileName(std::string_view file_name) const;

  std::optional<model::EquipmentIdentity> Resolve(std::string_view file_name, const std::optional<std::string>& content_hint) const;

 private:
  struct Pattern {
    std::string   name;
    std::regex    regex;
    std::string   tag_format;
    std::uint32_t substation_group  = 0;
    std::uint32_t device_type_group = 0;
    std::uint32_t position_group    = 0;
  };

  std::optional<model::EquipmentIdentity> MatchPatterns(std::string_view text, const char* source) const;

  std::vector<Pattern> patterns_;
};

} // namespace relaynorm::normalize
