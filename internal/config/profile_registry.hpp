#pragma once

#include <map>
#include <memory>
#include <optional>
#include <regex>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "internal/extract/parameter_line_extractor.hpp"
#include "internal/normalize/unit_normalizer.hpp"

namespace relaynorm::config {

enum class CalibrationState {
  kNotApplicable, // not a checkbox profile
  kPassed,
  kUncalibrated, // checkbox profile without samples
  kFailed,
};

const char* ToString(CalibrationState state);

/*
  Everything a worker needs for one relay model, built once at start-up.
*/
struct ProfileEntry {
  const relaynorm::runtime::config::RelayModelProfile* profile = nullptr;

  std::unique_ptr<normalize::UnitNormalizer>       normalizer;
  std::unique_ptr<extract::ParameterLineExtractor> extractor;
  std::optional<std::regex>                        equipment_hint;

  CalibrationState calibration          = CalibrationState::kNotApplicable;
  double           calibration_accuracy = 1.0; // worst sample
  std::string      calibration_detail;
};

/*
  ProfileRegistry

  Validates the configured relay-model profiles and owns the per
  profile helpers. Any inconsistency throws util::InvalidConfig, so a
  batch never starts on a broken configuration.

  The registry keeps a pointer into the RuntimeConfig it was built
  from; the config must outlive it.
*/
class ProfileRegistry {
 public:
  explicit ProfileRegistry(const relaynorm::runtime::config::RuntimeConfig& config);

  const ProfileEntry& Get(const std::string& name) const;

  const std::vector<const relaynorm::runtime::config::RelayModelProfile*>& Profiles() const {
    return profiles_;
  }

  const normalize::UnitNormalizer& BaseNormalizer() const {
    return base_normalizer_;
  }

  // equipment tag found by the profile's hint pattern (first capture
  // group, else the whole match)
  std::optional<std::string> EquipmentHint(const ProfileEntry& entry, const std::string& text) const;

 private:
  void Validate(const relaynorm::runtime::config::RelayModelProfile& profile) const;
  void Calibrate(ProfileEntry& entry) const;

  normalize::UnitNormalizer                                   base_normalizer_;
  std::vector<const relaynorm::runtime::config::RelayModelProfile*> profiles_;
  std::map<std::string, ProfileEntry>                         entries_;
};

} // namespace relaynorm::config
