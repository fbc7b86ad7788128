#pragma once

#include <string>

namespace relaynorm::db::model {

struct EquipmentRecord {
  std::string tag;
  std::string substation;
  std::string device_type;
  std::string position;
  std::string model_code;
};

} // namespace relaynorm::db::model
