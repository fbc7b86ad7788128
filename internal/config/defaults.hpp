#pragma once

#include <map>
#include <string>
#include <vector>

#include "config/config.pb.h"

namespace relaynorm::config {

/*
  Built-in vocabularies.

  Used whenever the corresponding list in the runtime config is empty.
  A non-empty list in the config replaces the default rather than
  extending it; per-profile known_units always extend.
*/

const std::vector<std::string>&           DefaultKnownUnits();
const std::map<std::string, std::string>& DefaultUnitAliases();
const std::vector<std::string>&           DefaultTrueMarkers();
const std::vector<std::string>&           DefaultFalseMarkers();
const std::vector<std::string>&           DefaultStatusPatterns();
const std::vector<std::string>&           DefaultEncodings();
const std::vector<std::string>&           DefaultBundleSuffixes();
const std::vector<std::string>&           DefaultCodePatterns();
const std::vector<std::string>&           DefaultDisabledMarkers();
const std::vector<std::string>&           DefaultEnabledMarkers();

std::vector<relaynorm::runtime::config::MultipartPattern> DefaultMultipartPatterns();
std::vector<relaynorm::runtime::config::EquipmentPattern> DefaultEquipmentPatterns();

/*
  Fills every unset knob of the config with its default, in place.
  Called once by the loader so downstream code never sees zeros.
*/
void ApplyDefaults(relaynorm::runtime::config::RuntimeConfig& config);

} // namespace relaynorm::config
