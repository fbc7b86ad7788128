#pragma once

#include <string>

namespace relaynorm::db::model {

// relay_models row; one per configured profile that produced data
struct RelayModelRecord {
  std::string model_code; // profile name
  std::string manufacturer;
  std::string detection_method; // checkbox | labeled_field | keyed_section
};

} // namespace relaynorm::db::model
