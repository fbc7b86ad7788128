#pragma once

#include <string>

namespace relaynorm::model {

struct EquipmentIdentity {
  std::string tag;
  std::string substation;
  std::string device_type;
  std::string position;

  // "filename" or "content"
  std::string source;
};

} // namespace relaynorm::model
